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

#include <boost/test/unit_test.hpp>
#include <boost/thread.hpp>

#include <cstdlib>

#include "coordinator.hh"
#include "db.hh"
#include "errors.hh"
#include "pg_cache.hh"
#include "pg_store.hh"
#include "test_helpers.hh"

// These tests need an empty database, whose tables are dropped and created again:
// RIDESHARE_DB_OPTIONS="dbname=rideshare_test" ./rideshare_tests
static std::string g_db_options = getenv( "RIDESHARE_DB_OPTIONS" ) ? getenv( "RIDESHARE_DB_OPTIONS" ) : "";

using namespace boost::unit_test ;
using namespace Rideshare;

namespace {

boost::test_tools::assertion_result has_database( test_unit_id )
{
    boost::test_tools::assertion_result r( !g_db_options.empty() );
    r.message() << "RIDESHARE_DB_OPTIONS is not set";
    return r;
}

struct DbFixture
{
    DbFixture() : store( g_db_options, 4 ), cache( store.pool() )
    {
        Db::Connection connection( g_db_options );
        execute_sql_file( connection, RIDESHARE_SCHEMA_FILE );
    }

    RideRequest request_at( double lat, double lon, const DateTime& t, int passengers = 1 )
    {
        RideRequest r = make_request( 0, lat, lon, 48.88, 2.30, passengers );
        r.set_requested_at( t );
        r.set_db_id( store.insert_request( r ) );
        return r;
    }

    PgStore store;
    PgCache cache;
};

}

BOOST_AUTO_TEST_SUITE( pgsql )

BOOST_AUTO_TEST_CASE( test_connection, * precondition( has_database ) )
{
    BOOST_CHECK_THROW( Db::Connection( g_db_options + " dbname=zorglub_does_not_exist" ), std::runtime_error );

    Db::Connection connection( g_db_options );
    BOOST_CHECK( connection.is_ok() );
    BOOST_CHECK_THROW( connection.exec( "SELZECT * PHROM zorglub" ), std::runtime_error );

    Db::Params p;
    p.push_back( "41" );
    p.push_back( "O'Brien" );
    Db::Result res( connection.exec( "SELECT $1::integer + 1, $2::text, '{1,3}'::integer[], true, '2024-05-02 14:00:00'::timestamp", p ) );
    BOOST_REQUIRE_EQUAL( res.size(), 1 );
    BOOST_CHECK_EQUAL( res[0][0].as<int>(), 42 );
    BOOST_CHECK_EQUAL( res[0][1].as<std::string>(), "O'Brien" );
    BOOST_CHECK( res[0][2].as< std::vector<int> >() == std::vector<int>( { 1, 3 } ) );
    BOOST_CHECK( res[0][3].as<bool>() );
    BOOST_CHECK( res[0][4].as<DateTime>() == boost::posix_time::time_from_string( "2024-05-02 14:00:00" ) );
}

BOOST_FIXTURE_TEST_CASE( test_requests, DbFixture, * precondition( has_database ) )
{
    const DateTime t = boost::posix_time::time_from_string( "2024-05-02 14:00:00" );

    RideRequest r = make_request( 0, 48.8566, 2.3522, 48.88, 2.30, 2 );
    r.set_pickup( Location( 48.8566, 2.3522, "Hôtel de Ville, Paris" ) );
    std::vector<int> luggage;
    luggage.push_back( LuggageMedium );
    luggage.push_back( LuggageSmall );
    r.set_luggage( luggage );
    r.set_requested_at( t );
    const db_id_t id = store.insert_request( r );

    boost::optional<RideRequest> s = store.request( id );
    BOOST_REQUIRE( s );
    BOOST_CHECK_EQUAL( s->pickup().label(), "Hôtel de Ville, Paris" );
    BOOST_CHECK_EQUAL( s->pickup().latitude(), 48.8566 );
    BOOST_CHECK( s->luggage() == luggage );
    BOOST_CHECK_EQUAL( s->passengers(), 2 );
    BOOST_CHECK_EQUAL( s->version(), 1 );
    BOOST_CHECK_EQUAL( s->status(), StatusPending );
    BOOST_CHECK( s->requested_at() == t );
    BOOST_CHECK( !store.request( id + 100 ) );

    // versioned update
    {
        std::unique_ptr<Transaction> tx = store.begin();
        BOOST_CHECK_THROW( tx->update_request_status( id, StatusCancelled, 7 ), StaleVersion );
    }
    {
        std::unique_ptr<Transaction> tx = store.begin();
        tx->update_request_status( id, StatusCancelled, 1 );
        // rolled back on destruction
    }
    BOOST_CHECK_EQUAL( store.request( id )->status(), StatusPending );
    {
        std::unique_ptr<Transaction> tx = store.begin();
        tx->update_request_status( id, StatusCancelled, 1 );
        tx->commit();
    }
    BOOST_CHECK_EQUAL( store.request( id )->status(), StatusCancelled );
    BOOST_CHECK_EQUAL( store.request( id )->version(), 2 );
}

BOOST_FIXTURE_TEST_CASE( test_neighbours, DbFixture, * precondition( has_database ) )
{
    const DateTime t = boost::posix_time::time_from_string( "2024-05-02 14:00:00" );
    const Location center( 48.8566, 2.3522 );

    const RideRequest old = request_at( 48.8566, 2.3522, t - boost::posix_time::minutes( 11 ) );
    const RideRequest near1 = request_at( 48.8584, 2.3522, t - boost::posix_time::minutes( 2 ) );
    const RideRequest near2 = request_at( 48.8966, 2.3522, t - boost::posix_time::minutes( 1 ) );
    const RideRequest far = request_at( 48.9166, 2.3522, t );

    const RideRequestList found = store.pending_requests_near( center, 5.0, t - boost::posix_time::minutes( 10 ), 6 );
    BOOST_REQUIRE_EQUAL( found.size(), 2 );
    // most recent first
    BOOST_CHECK_EQUAL( found[0].db_id(), near2.db_id() );
    BOOST_CHECK_EQUAL( found[1].db_id(), near1.db_id() );

    BOOST_CHECK_EQUAL( store.pending_requests_near( center, 5.0, t - boost::posix_time::minutes( 10 ), 1 ).size(), 1 );
    BOOST_CHECK_EQUAL( store.pending_requests_near( center, 10.0, t - boost::posix_time::minutes( 20 ), 6 ).size(), 4 );
    BOOST_CHECK_EQUAL( store.count_pending_requests(), 4 );
    BOOST_CHECK( old.db_id() && far.db_id() );
}

BOOST_FIXTURE_TEST_CASE( test_cache, DbFixture, * precondition( has_database ) )
{
    cache.set( "a", "1", 60 );
    BOOST_CHECK_EQUAL( *cache.get( "a" ), "1" );
    BOOST_CHECK( !cache.set_if_absent( "a", "2", 60 ) );
    BOOST_CHECK( !cache.remove_if_equal( "a", "2" ) );
    BOOST_CHECK( cache.remove_if_equal( "a", "1" ) );
    BOOST_CHECK( !cache.get( "a" ) );

    // expired at once
    cache.set( "b", "1", 0 );
    BOOST_CHECK( !cache.get( "b" ) );
    BOOST_CHECK( cache.set_if_absent( "b", "2", 60 ) );
    BOOST_CHECK_EQUAL( *cache.get( "b" ), "2" );

    cache.set( "c", "1", 0 );
    BOOST_CHECK_EQUAL( cache.purge(), 1 );
    cache.remove( "b" );
    BOOST_CHECK( !cache.get( "b" ) );
}

BOOST_FIXTURE_TEST_CASE( test_trip_lifecycle, DbFixture, * precondition( has_database ) )
{
    Configuration config;
    Coordinator coordinator( store, cache, config );

    Vehicle v;
    v.set_label( "AB-123-CD" );
    v.set_location( Location( 48.85, 2.35 ) );
    const db_id_t vehicle_id = coordinator.register_vehicle( v );

    const RideRequest a = coordinator.submit_request( make_request( 0, 48.8566, 2.3522, 48.88, 2.30, 2 ) );
    const RideRequest b = coordinator.submit_request( make_request( 0, 48.8584, 2.3522, 48.88, 2.30, 2 ) );

    const MatchResultList results = coordinator.find_matches( b.db_id() );
    BOOST_REQUIRE( !results.empty() );
    BOOST_REQUIRE( !results[0].is_solo() );

    const Trip trip = coordinator.confirm_booking( b.db_id(), results[0] );
    const Trip stored = coordinator.trip( trip.db_id() );
    BOOST_CHECK_EQUAL( stored.status(), StatusConfirmed );
    BOOST_CHECK_EQUAL( stored.vehicle_id(), vehicle_id );
    BOOST_REQUIRE_EQUAL( stored.waypoints().size(), 4 );
    BOOST_REQUIRE_EQUAL( stored.legs().size(), 2 );
    BOOST_CHECK( stored.check_legs() );
    BOOST_CHECK_CLOSE( stored.base_price(), trip.base_price(), 1e-9 );
    BOOST_CHECK_EQUAL( stored.legs()[0].request_id(), trip.legs()[0].request_id() );
    BOOST_CHECK_EQUAL( coordinator.request( a.db_id() ).status(), StatusConfirmed );
    BOOST_CHECK( !coordinator.vehicle( vehicle_id ).available() );

    coordinator.start_trip( trip.db_id() );
    coordinator.complete_trip( trip.db_id() );
    BOOST_CHECK_THROW( coordinator.complete_trip( trip.db_id() ), InvalidTransition );
    BOOST_CHECK( coordinator.vehicle( vehicle_id ).available() );
    BOOST_CHECK_EQUAL( coordinator.vehicle( vehicle_id ).location().latitude(), 48.88 );
    BOOST_CHECK_EQUAL( coordinator.request( b.db_id() ).status(), StatusCompleted );
}

BOOST_FIXTURE_TEST_CASE( test_concurrent_bookings, DbFixture, * precondition( has_database ) )
{
    // two solo bookings for a single vehicle
    Configuration config;
    Coordinator coordinator( store, cache, config );
    Vehicle v;
    v.set_location( Location( 48.85, 2.35 ) );
    coordinator.register_vehicle( v );

    const RideRequest a = coordinator.submit_request( make_request( 0, 48.8566, 2.3522, 48.88, 2.30, 3 ) );
    const RideRequest b = coordinator.submit_request( make_request( 0, 48.8566, 2.3522, 48.88, 2.30, 3 ) );
    const MatchResultList ra = coordinator.find_matches( a.db_id() );
    const MatchResultList rb = coordinator.find_matches( b.db_id() );

    boost::mutex m;
    int booked = 0;
    int refused = 0;
    boost::barrier barrier( 2 );
    auto book = [&]( db_id_t id, const MatchResult& option ) {
        barrier.wait();
        try {
            coordinator.confirm_booking( id, option );
            boost::lock_guard<boost::mutex> lock( m );
            booked++;
        }
        catch ( NoVehicleAvailable& ) {
            boost::lock_guard<boost::mutex> lock( m );
            refused++;
        }
        catch ( std::exception& e ) {
            CERR << "booking of request " << id << " failed: " << e.what() << std::endl;
        }
    };
    boost::thread ta( book, a.db_id(), ra[0] );
    boost::thread tb( book, b.db_id(), rb[0] );
    ta.join();
    tb.join();

    BOOST_CHECK_EQUAL( booked, 1 );
    BOOST_CHECK_EQUAL( refused, 1 );
    BOOST_CHECK_EQUAL( store.count_available_vehicles(), 0 );
    BOOST_CHECK_EQUAL( store.count_pending_requests(), 1 );
}

BOOST_FIXTURE_TEST_CASE( test_single_connection, DbFixture, * precondition( has_database ) * timeout( 60 ) )
{
    // store and cache share one connection: every transaction must give it back before the cache is used
    PgStore single( g_db_options, 1 );
    PgCache single_cache( single.pool() );
    Configuration config;
    Coordinator coordinator( single, single_cache, config );

    Vehicle v;
    v.set_location( Location( 48.85, 2.35 ) );
    const db_id_t vehicle_id = coordinator.register_vehicle( v );

    const RideRequest a = coordinator.submit_request( make_request( 0, 48.8566, 2.3522, 48.88, 2.30, 2 ) );
    const MatchResultList ra = coordinator.find_matches( a.db_id() );
    BOOST_REQUIRE( !ra.empty() );
    const Trip ta = coordinator.confirm_booking( a.db_id(), ra[0] );
    BOOST_CHECK_EQUAL( coordinator.request( a.db_id() ).status(), StatusConfirmed );
    coordinator.start_trip( ta.db_id() );
    BOOST_CHECK_EQUAL( coordinator.request( a.db_id() ).status(), StatusInProgress );
    coordinator.complete_trip( ta.db_id() );
    BOOST_CHECK_EQUAL( coordinator.request( a.db_id() ).status(), StatusCompleted );

    const RideRequest b = coordinator.submit_request( make_request( 0, 48.8566, 2.3522, 48.88, 2.30, 1 ) );
    const Trip tb = coordinator.confirm_booking( b.db_id(), coordinator.find_matches( b.db_id() )[0] );
    coordinator.cancel_trip( tb.db_id() );
    BOOST_CHECK_EQUAL( coordinator.request( b.db_id() ).status(), StatusPending );
    BOOST_CHECK( coordinator.vehicle( vehicle_id ).available() );
    BOOST_CHECK_EQUAL( coordinator.complete_expired_trips( now_utc() ), 0 );

    Configuration no_option;
    no_option.set_option( "matching/max_results", Variant( 0 ) );
    Coordinator refusing( single, single_cache, no_option );
    BOOST_CHECK( refusing.find_matches( b.db_id() ).empty() );
    BOOST_CHECK_EQUAL( refusing.request( b.db_id() ).status(), StatusCancelled );
}

BOOST_AUTO_TEST_SUITE_END()
