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

#include <fstream>

#include "pg_store.hh"
#include "errors.hh"

namespace Rideshare {

namespace {

const std::string REQUEST_COLUMNS =
    "id, requester_id, pickup_lat, pickup_lon, pickup_label, dropoff_lat, dropoff_lon, dropoff_label, "
    "passengers, luggage, max_detour_minutes, status, requested_at, version";

const std::string VEHICLE_COLUMNS = "id, label, max_passengers, max_luggage, lat, lon, available, version";

const std::string TRIP_COLUMNS =
    "id, vehicle_id, total_distance, estimated_duration, base_price, surge_factor, status, created_at, version";

RideRequest request_from_row( const Db::RowValue& row )
{
    RideRequest r;
    r.set_db_id( row[0].as<db_id_t>() );
    r.set_requester_id( row[1].as<db_id_t>() );
    r.set_pickup( Location( row[2].as<double>(), row[3].as<double>(), row[4].as<std::string>() ) );
    r.set_dropoff( Location( row[5].as<double>(), row[6].as<double>(), row[7].as<std::string>() ) );
    r.set_passengers( row[8].as<int>() );
    r.set_luggage( row[9].as<std::vector<int> >() );
    r.set_max_detour_minutes( row[10].as<int>() );
    r.set_status( status_from_name( row[11].as<std::string>() ) );
    r.set_requested_at( row[12].as<DateTime>() );
    r.set_version( row[13].as<long long>() );
    return r;
}

Vehicle vehicle_from_row( const Db::RowValue& row )
{
    Vehicle v;
    v.set_db_id( row[0].as<db_id_t>() );
    v.set_label( row[1].as<std::string>() );
    v.set_max_passengers( row[2].as<int>() );
    v.set_max_luggage( row[3].as<int>() );
    v.set_location( Location( row[4].as<double>(), row[5].as<double>() ) );
    v.set_available( row[6].as<bool>() );
    v.set_version( row[7].as<long long>() );
    return v;
}

boost::optional<Trip> load_trip( Db::Connection& conn, db_id_t id, bool for_update )
{
    const Db::Params id_param( 1, to_string( id ) );
    Db::Result res( conn.exec( "SELECT " + TRIP_COLUMNS + " FROM trips WHERE id = $1" + ( for_update ? " FOR UPDATE" : "" ), id_param ) );
    if ( res.size() == 0 ) {
        return boost::optional<Trip>();
    }

    Trip t;
    t.set_db_id( res[0][0].as<db_id_t>() );
    t.set_vehicle_id( res[0][1].as<db_id_t>() );
    t.set_total_distance( res[0][2].as<double>() );
    t.set_estimated_duration( res[0][3].as<int>() );
    t.set_base_price( res[0][4].as<double>() );
    t.set_surge_factor( res[0][5].as<double>() );
    t.set_status( status_from_name( res[0][6].as<std::string>() ) );
    t.set_created_at( res[0][7].as<DateTime>() );
    t.set_version( res[0][8].as<long long>() );

    Db::Result wres( conn.exec( "SELECT kind, request_id, lat, lon, label, passengers FROM trip_waypoints "
                                "WHERE trip_id = $1 ORDER BY rank", id_param ) );
    WaypointList waypoints;
    for ( size_t i = 0; i < wres.size(); i++ ) {
        const Db::RowValue row = wres[i];
        waypoints.push_back( Waypoint( row[0].as<std::string>() == "PICKUP" ? Waypoint::Pickup : Waypoint::Dropoff,
                                       row[1].as<db_id_t>(),
                                       Location( row[2].as<double>(), row[3].as<double>(), row[4].as<std::string>() ),
                                       row[5].as<int>() ) );
    }
    t.set_waypoints( waypoints );

    Db::Result lres( conn.exec( "SELECT request_id, requester_id, passengers, luggage_units, pickup_index, dropoff_index, "
                                "distance_km, fare, detour_minutes FROM trip_legs WHERE trip_id = $1 ORDER BY rank", id_param ) );
    for ( size_t i = 0; i < lres.size(); i++ ) {
        const Db::RowValue row = lres[i];
        PassengerLeg leg;
        leg.set_request_id( row[0].as<db_id_t>() );
        leg.set_requester_id( row[1].as<db_id_t>() );
        leg.set_passengers( row[2].as<int>() );
        leg.set_luggage_units( row[3].as<int>() );
        leg.set_pickup_index( row[4].as<int>() );
        leg.set_dropoff_index( row[5].as<int>() );
        leg.set_distance_km( row[6].as<double>() );
        leg.set_fare( row[7].as<double>() );
        leg.set_detour_minutes( row[8].as<int>() );
        t.legs().push_back( leg );
    }
    return t;
}

///
/// A transaction running on a connection of the pool
class PgTransaction : public Transaction
{
public:
    explicit PgTransaction( std::unique_ptr<Db::ConnectionPool::Handle> handle ) : handle_( std::move( handle ) ), done_( false )
    {
        ( *handle_ )->exec( "BEGIN" );
    }

    virtual ~PgTransaction()
    {
        if ( !done_ ) {
            try {
                rollback();
            }
            catch ( std::exception& e ) {
                CERR << "[ERROR] rollback failed: " << e.what() << std::endl;
            }
        }
    }

    virtual RideRequest request_for_update( db_id_t id )
    {
        Db::Result res( conn().exec( "SELECT " + REQUEST_COLUMNS + " FROM ride_requests WHERE id = $1 FOR UPDATE",
                                     Db::Params( 1, to_string( id ) ) ) );
        if ( res.size() == 0 ) {
            throw NotFoundError( "Request", id );
        }
        return request_from_row( res[0] );
    }

    virtual void update_request_status( db_id_t id, RideStatus status, int64_t expected_version )
    {
        Db::Params p;
        p.push_back( status_name( status ) );
        p.push_back( to_string( id ) );
        p.push_back( to_string( expected_version ) );
        Db::Result res( conn().exec( "UPDATE ride_requests SET status = $1, version = version + 1 WHERE id = $2 AND version = $3", p ) );
        if ( res.affected_rows() == 0 ) {
            throw StaleVersion( "request " + to_string( id ) );
        }
    }

    virtual boost::optional<Vehicle> lock_available_vehicle( int passengers, int luggage_units )
    {
        Db::Params p;
        p.push_back( to_string( passengers ) );
        p.push_back( to_string( luggage_units ) );
        Db::Result res( conn().exec( "SELECT " + VEHICLE_COLUMNS + " FROM vehicles "
                                     "WHERE available AND max_passengers >= $1 AND max_luggage >= $2 "
                                     "ORDER BY id LIMIT 1 FOR UPDATE SKIP LOCKED", p ) );
        if ( res.size() == 0 ) {
            return boost::optional<Vehicle>();
        }
        return vehicle_from_row( res[0] );
    }

    virtual Vehicle vehicle_for_update( db_id_t id )
    {
        Db::Result res( conn().exec( "SELECT " + VEHICLE_COLUMNS + " FROM vehicles WHERE id = $1 FOR UPDATE",
                                     Db::Params( 1, to_string( id ) ) ) );
        if ( res.size() == 0 ) {
            throw NotFoundError( "Vehicle", id );
        }
        return vehicle_from_row( res[0] );
    }

    virtual void update_vehicle( db_id_t id, bool available, const boost::optional<Location>& location, int64_t expected_version )
    {
        Db::Params p;
        p.push_back( available ? "true" : "false" );
        p.push_back( to_string( id ) );
        p.push_back( to_string( expected_version ) );
        std::string query = "UPDATE vehicles SET available = $1, version = version + 1";
        if ( location ) {
            p.push_back( Db::to_db_string( location->latitude() ) );
            p.push_back( Db::to_db_string( location->longitude() ) );
            query += ", lat = $4, lon = $5";
        }
        query += " WHERE id = $2 AND version = $3";
        Db::Result res( conn().exec( query, p ) );
        if ( res.affected_rows() == 0 ) {
            throw StaleVersion( "vehicle " + to_string( id ) );
        }
    }

    virtual db_id_t insert_trip( const Trip& trip )
    {
        Db::Params p;
        p.push_back( to_string( trip.vehicle_id() ) );
        p.push_back( Db::to_db_string( trip.total_distance() ) );
        p.push_back( to_string( trip.estimated_duration() ) );
        p.push_back( Db::to_db_string( trip.base_price() ) );
        p.push_back( Db::to_db_string( trip.surge_factor() ) );
        p.push_back( status_name( trip.status() ) );
        p.push_back( Db::to_db_string( trip.created_at() ) );
        Db::Result res( conn().exec( "INSERT INTO trips (vehicle_id, total_distance, estimated_duration, base_price, surge_factor, status, created_at) "
                                     "VALUES ($1, $2, $3, $4, $5, $6, $7) RETURNING id", p ) );
        const db_id_t id = res[0][0].as<db_id_t>();
        const std::string trip_id = to_string( id );

        for ( size_t i = 0; i < trip.waypoints().size(); i++ ) {
            const Waypoint& w = trip.waypoints()[i];
            Db::Params wp;
            wp.push_back( trip_id );
            wp.push_back( to_string( i ) );
            wp.push_back( w.is_pickup() ? "PICKUP" : "DROPOFF" );
            wp.push_back( to_string( w.request_id() ) );
            wp.push_back( Db::to_db_string( w.location().latitude() ) );
            wp.push_back( Db::to_db_string( w.location().longitude() ) );
            wp.push_back( w.location().label() );
            wp.push_back( to_string( w.passengers() ) );
            conn().exec( "INSERT INTO trip_waypoints (trip_id, rank, kind, request_id, lat, lon, label, passengers) "
                         "VALUES ($1, $2, $3, $4, $5, $6, $7, $8)", wp );
        }

        for ( size_t i = 0; i < trip.legs().size(); i++ ) {
            const PassengerLeg& leg = trip.legs()[i];
            Db::Params lp;
            lp.push_back( trip_id );
            lp.push_back( to_string( i ) );
            lp.push_back( to_string( leg.request_id() ) );
            lp.push_back( to_string( leg.requester_id() ) );
            lp.push_back( to_string( leg.passengers() ) );
            lp.push_back( to_string( leg.luggage_units() ) );
            lp.push_back( to_string( leg.pickup_index() ) );
            lp.push_back( to_string( leg.dropoff_index() ) );
            lp.push_back( Db::to_db_string( leg.distance_km() ) );
            lp.push_back( Db::to_db_string( leg.fare() ) );
            lp.push_back( to_string( leg.detour_minutes() ) );
            conn().exec( "INSERT INTO trip_legs (trip_id, rank, request_id, requester_id, passengers, luggage_units, "
                         "pickup_index, dropoff_index, distance_km, fare, detour_minutes) "
                         "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11)", lp );
        }
        return id;
    }

    virtual Trip trip_for_update( db_id_t id )
    {
        boost::optional<Trip> t = load_trip( conn(), id, true );
        if ( !t ) {
            throw NotFoundError( "Trip", id );
        }
        return *t;
    }

    virtual void update_trip_status( db_id_t id, RideStatus status, int64_t expected_version )
    {
        Db::Params p;
        p.push_back( status_name( status ) );
        p.push_back( to_string( id ) );
        p.push_back( to_string( expected_version ) );
        Db::Result res( conn().exec( "UPDATE trips SET status = $1, version = version + 1 WHERE id = $2 AND version = $3", p ) );
        if ( res.affected_rows() == 0 ) {
            throw StaleVersion( "trip " + to_string( id ) );
        }
    }

    virtual void commit()
    {
        check_running();
        done_ = true;
        conn().exec( "COMMIT" );
    }

    virtual void rollback()
    {
        check_running();
        done_ = true;
        conn().exec( "ROLLBACK" );
    }

private:
    Db::Connection& conn()
    {
        return **handle_;
    }

    void check_running() const
    {
        if ( done_ ) {
            throw std::runtime_error( "Transaction already finished" );
        }
    }

    std::unique_ptr<Db::ConnectionPool::Handle> handle_;
    bool done_;
};

}

PgStore::PgStore( const std::string& db_options, size_t pool_size ) :
    pool_( db_options, pool_size )
{
}

std::unique_ptr<Transaction> PgStore::begin()
{
    return std::unique_ptr<Transaction>( new PgTransaction( pool_.acquire() ) );
}

db_id_t PgStore::insert_request( const RideRequest& r )
{
    Db::Params p;
    p.push_back( to_string( r.requester_id() ) );
    p.push_back( Db::to_db_string( r.pickup().latitude() ) );
    p.push_back( Db::to_db_string( r.pickup().longitude() ) );
    p.push_back( r.pickup().label() );
    p.push_back( Db::to_db_string( r.dropoff().latitude() ) );
    p.push_back( Db::to_db_string( r.dropoff().longitude() ) );
    p.push_back( r.dropoff().label() );
    p.push_back( to_string( r.passengers() ) );
    p.push_back( Db::to_db_array( r.luggage() ) );
    p.push_back( to_string( r.max_detour_minutes() ) );
    p.push_back( status_name( r.status() ) );
    p.push_back( Db::to_db_string( r.requested_at() ) );

    std::unique_ptr<Db::ConnectionPool::Handle> h( pool_.acquire() );
    Db::Result res( ( *h )->exec( "INSERT INTO ride_requests (requester_id, pickup_lat, pickup_lon, pickup_label, "
                                  "dropoff_lat, dropoff_lon, dropoff_label, passengers, luggage, max_detour_minutes, status, requested_at) "
                                  "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12) RETURNING id", p ) );
    return res[0][0].as<db_id_t>();
}

boost::optional<RideRequest> PgStore::request( db_id_t id )
{
    std::unique_ptr<Db::ConnectionPool::Handle> h( pool_.acquire() );
    Db::Result res( ( *h )->exec( "SELECT " + REQUEST_COLUMNS + " FROM ride_requests WHERE id = $1", Db::Params( 1, to_string( id ) ) ) );
    if ( res.size() == 0 ) {
        return boost::optional<RideRequest>();
    }
    return request_from_row( res[0] );
}

RideRequestList PgStore::pending_requests_near( const Location& center, double radius_km, const DateTime& since, size_t limit )
{
    Db::Params p;
    p.push_back( Db::to_db_string( center.latitude() ) );
    p.push_back( Db::to_db_string( center.longitude() ) );
    p.push_back( Db::to_db_string( radius_km ) );
    p.push_back( Db::to_db_string( since ) );
    p.push_back( to_string( limit ) );

    // great circle distance from the pickup, in km
    const std::string pickup_distance =
        "6371.0 * 2 * asin( sqrt( least( 1.0, "
        "power( sin( radians( pickup_lat - $1::float8 ) / 2 ), 2 ) + "
        "cos( radians( $1::float8 ) ) * cos( radians( pickup_lat ) ) * "
        "power( sin( radians( pickup_lon - $2::float8 ) / 2 ), 2 ) ) ) )";

    std::unique_ptr<Db::ConnectionPool::Handle> h( pool_.acquire() );
    Db::Result res( ( *h )->exec( "SELECT " + REQUEST_COLUMNS + " FROM ride_requests "
                                  "WHERE status = 'PENDING' AND requested_at > $4::timestamp "
                                  "AND " + pickup_distance + " <= $3::float8 "
                                  "ORDER BY requested_at DESC, id DESC LIMIT $5", p ) );
    RideRequestList requests;
    for ( size_t i = 0; i < res.size(); i++ ) {
        requests.push_back( request_from_row( res[i] ) );
    }
    return requests;
}

int64_t PgStore::count_pending_requests()
{
    std::unique_ptr<Db::ConnectionPool::Handle> h( pool_.acquire() );
    Db::Result res( ( *h )->exec( "SELECT count(*) FROM ride_requests WHERE status = 'PENDING'" ) );
    return res[0][0].as<long long>();
}

int64_t PgStore::count_available_vehicles()
{
    std::unique_ptr<Db::ConnectionPool::Handle> h( pool_.acquire() );
    Db::Result res( ( *h )->exec( "SELECT count(*) FROM vehicles WHERE available" ) );
    return res[0][0].as<long long>();
}

db_id_t PgStore::insert_vehicle( const Vehicle& v )
{
    Db::Params p;
    p.push_back( v.label() );
    p.push_back( to_string( v.max_passengers() ) );
    p.push_back( to_string( v.max_luggage() ) );
    p.push_back( Db::to_db_string( v.location().latitude() ) );
    p.push_back( Db::to_db_string( v.location().longitude() ) );
    p.push_back( v.available() ? "true" : "false" );

    std::unique_ptr<Db::ConnectionPool::Handle> h( pool_.acquire() );
    Db::Result res( ( *h )->exec( "INSERT INTO vehicles (label, max_passengers, max_luggage, lat, lon, available) "
                                  "VALUES ($1, $2, $3, $4, $5, $6) RETURNING id", p ) );
    return res[0][0].as<db_id_t>();
}

boost::optional<Vehicle> PgStore::vehicle( db_id_t id )
{
    std::unique_ptr<Db::ConnectionPool::Handle> h( pool_.acquire() );
    Db::Result res( ( *h )->exec( "SELECT " + VEHICLE_COLUMNS + " FROM vehicles WHERE id = $1", Db::Params( 1, to_string( id ) ) ) );
    if ( res.size() == 0 ) {
        return boost::optional<Vehicle>();
    }
    return vehicle_from_row( res[0] );
}

boost::optional<Trip> PgStore::trip( db_id_t id )
{
    std::unique_ptr<Db::ConnectionPool::Handle> h( pool_.acquire() );
    return load_trip( **h, id, false );
}

std::vector<db_id_t> PgStore::expired_trips( const DateTime& now )
{
    std::unique_ptr<Db::ConnectionPool::Handle> h( pool_.acquire() );
    Db::Result res( ( *h )->exec( "SELECT id FROM trips WHERE status IN ('CONFIRMED', 'IN_PROGRESS') "
                                  "AND created_at + estimated_duration * interval '1 minute' < $1::timestamp ORDER BY id",
                                  Db::Params( 1, Db::to_db_string( now ) ) ) );
    std::vector<db_id_t> ids;
    for ( size_t i = 0; i < res.size(); i++ ) {
        ids.push_back( res[i][0].as<db_id_t>() );
    }
    return ids;
}

void execute_sql_file( Db::Connection& connection, const std::string& path )
{
    std::ifstream ifs( path.c_str() );
    if ( !ifs ) {
        throw std::runtime_error( "Cannot open " + path );
    }
    std::stringstream sql;
    sql << ifs.rdbuf();
    connection.exec( sql.str() );
}

}
