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

#ifndef RIDESHARE_STORE_HH
#define RIDESHARE_STORE_HH

#include <memory>
#include <vector>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

#include "common.hh"
#include "ride_request.hh"
#include "trip.hh"
#include "route_optimizer.hh"

namespace Rideshare {

/**
   An atomic unit of work on the store.

   Reads ending with _for_update lock the entity until the end of the transaction.
   Versioned updates are compare and swap operations: they succeed only if the stored
   version equals the expected one, and increment it. A transaction destroyed without
   commit() is rolled back.
*/
class Transaction : boost::noncopyable
{
public:
    virtual ~Transaction() {}

    ///
    /// @throws NotFoundError
    virtual RideRequest request_for_update( db_id_t id ) = 0;

    ///
    /// @throws StaleVersion if the stored version differs from expected_version
    virtual void update_request_status( db_id_t id, RideStatus status, int64_t expected_version ) = 0;

    ///
    /// Locks the available vehicle of lowest id whose limits fit the given seats and luggage units
    virtual boost::optional<Vehicle> lock_available_vehicle( int passengers, int luggage_units ) = 0;

    ///
    /// @throws NotFoundError
    virtual Vehicle vehicle_for_update( db_id_t id ) = 0;

    ///
    /// Sets the availability of a vehicle, and its location if given
    /// @throws StaleVersion if the stored version differs from expected_version
    virtual void update_vehicle( db_id_t id, bool available, const boost::optional<Location>& location, int64_t expected_version ) = 0;

    ///
    /// Inserts a trip with its waypoints and legs
    /// @returns the id of the new trip
    virtual db_id_t insert_trip( const Trip& trip ) = 0;

    ///
    /// @throws NotFoundError
    virtual Trip trip_for_update( db_id_t id ) = 0;

    ///
    /// @throws StaleVersion if the stored version differs from expected_version
    virtual void update_trip_status( db_id_t id, RideStatus status, int64_t expected_version ) = 0;

    virtual void commit() = 0;
    virtual void rollback() = 0;
};

/**
   Durable state: requests, vehicles and trips.

   Implementations must be usable from several threads at the same time.
*/
class Store : boost::noncopyable
{
public:
    virtual ~Store() {}

    virtual std::unique_ptr<Transaction> begin() = 0;

    ///
    /// Persists a new request, with version 1
    /// @returns its id
    virtual db_id_t insert_request( const RideRequest& request ) = 0;

    virtual boost::optional<RideRequest> request( db_id_t id ) = 0;

    ///
    /// PENDING requests issued after since, whose pickup is within radius_km of center.
    /// Most recent first, at most limit of them.
    virtual RideRequestList pending_requests_near( const Location& center, double radius_km, const DateTime& since, size_t limit ) = 0;

    virtual int64_t count_pending_requests() = 0;

    virtual int64_t count_available_vehicles() = 0;

    ///
    /// Persists a new vehicle, with version 1
    /// @returns its id
    virtual db_id_t insert_vehicle( const Vehicle& vehicle ) = 0;

    virtual boost::optional<Vehicle> vehicle( db_id_t id ) = 0;

    virtual boost::optional<Trip> trip( db_id_t id ) = 0;

    ///
    /// CONFIRMED or IN_PROGRESS trips whose estimated end is before now
    virtual std::vector<db_id_t> expired_trips( const DateTime& now ) = 0;
};

} // Rideshare namespace

#endif
