/**
 *   Copyright (C) 2012-2013 IFSTTAR (http://www.ifsttar.fr)
 *   Copyright (C) 2012-2013 Oslandia <infos@oslandia.com>
 *
 *   This library is free software; you can redistribute it and/or
 *   modify it under the terms of the GNU Library General Public
 *   License as published by the Free Software Foundation; either
 *   version 2 of the License, or (at your option) any later version.
 *
 *   This library is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 *   Library General Public License for more details.
 *   You should have received a copy of the GNU Library General Public
 *   License along with this library; if not, see <http://www.gnu.org/licenses/>.
 */

#ifndef RIDESHARE_MEMORY_STORE_HH
#define RIDESHARE_MEMORY_STORE_HH

#include <map>

#include <boost/thread.hpp>

#include "store.hh"

namespace Rideshare {

class MemoryTransaction;

/**
   In-process store.

   Transactions are serialized: a transaction holds the store lock from begin() to
   commit() or rollback(). Its writes are staged and only become visible on commit.
   Reads outside of a transaction see the last committed state.
*/
class MemoryStore : public Store
{
public:
    MemoryStore();
    virtual ~MemoryStore();

    virtual std::unique_ptr<Transaction> begin();

    virtual db_id_t insert_request( const RideRequest& request );
    virtual boost::optional<RideRequest> request( db_id_t id );
    virtual RideRequestList pending_requests_near( const Location& center, double radius_km, const DateTime& since, size_t limit );
    virtual int64_t count_pending_requests();
    virtual int64_t count_available_vehicles();
    virtual db_id_t insert_vehicle( const Vehicle& vehicle );
    virtual boost::optional<Vehicle> vehicle( db_id_t id );
    virtual boost::optional<Trip> trip( db_id_t id );
    virtual std::vector<db_id_t> expired_trips( const DateTime& now );

    ///
    /// Number of committed transactions
    size_t commits() const;

private:
    friend class MemoryTransaction;

    typedef std::map<db_id_t, RideRequest> RequestMap;
    typedef std::map<db_id_t, Vehicle> VehicleMap;
    typedef std::map<db_id_t, Trip> TripMap;

    // committed state
    RequestMap requests_;
    VehicleMap vehicles_;
    TripMap trips_;
    db_id_t next_request_id_;
    db_id_t next_vehicle_id_;
    db_id_t next_trip_id_;
    size_t commits_;

    // protects the committed state, held for short periods
    mutable boost::mutex data_mutex_;
    // held by the running transaction
    boost::mutex tx_mutex_;
};

} // Rideshare namespace

#endif
