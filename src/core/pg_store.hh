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

#ifndef RIDESHARE_PG_STORE_HH
#define RIDESHARE_PG_STORE_HH

#include "store.hh"
#include "db.hh"

namespace Rideshare {

/**
   Store backed by a PostgreSQL database (see sql/schema.sql).

   Each transaction borrows a connection of the pool for its whole lifetime.
   Vehicles are locked with SELECT ... FOR UPDATE SKIP LOCKED, so that concurrent
   bookings pick distinct vehicles instead of waiting for each other.
*/
class PgStore : public Store
{
public:
    PgStore( const std::string& db_options, size_t pool_size );

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

    Db::ConnectionPool& pool() { return pool_; }

private:
    Db::ConnectionPool pool_;
};

///
/// Executes the SQL statements of a file (the schema, typically)
/// @throws std::runtime_error if the file cannot be read or a statement fails
void execute_sql_file( Db::Connection& connection, const std::string& path );

} // Rideshare namespace

#endif
