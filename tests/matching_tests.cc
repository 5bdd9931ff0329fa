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

#include "matching.hh"
#include "test_helpers.hh"

using namespace boost::unit_test ;
using namespace Rideshare;

namespace {
// about 0.2 km of latitude
const double NEAR = 0.0018;

const double PICKUP_LAT = 48.8566;
const double PICKUP_LON = 2.3522;
const double DROPOFF_LAT = 48.8800;
const double DROPOFF_LON = 2.3000;

std::vector<int> luggage( int a, int b = 0 )
{
    std::vector<int> l( 1, a );
    if ( b ) {
        l.push_back( b );
    }
    return l;
}
}

BOOST_AUTO_TEST_SUITE( matching )

BOOST_AUTO_TEST_CASE( test_solo_only )
{
    MatchingEngine engine( ( Configuration() ) );
    RideRequest target = make_request( 1, PICKUP_LAT, PICKUP_LON, DROPOFF_LAT, DROPOFF_LON, 2 );

    MatchResultList results = engine.find_matches( target, RideRequestList(), 1.0, 12 );
    BOOST_REQUIRE_EQUAL( results.size(), 1 );
    const MatchResult& solo = results[0];
    BOOST_CHECK( solo.is_solo() );
    BOOST_CHECK_EQUAL( solo.score, 50.0 );
    BOOST_CHECK_EQUAL( solo.savings, 0.0 );
    BOOST_CHECK_EQUAL( solo.detour_minutes, 0 );
    BOOST_CHECK_EQUAL( solo.trip.status(), StatusPending );
    BOOST_CHECK_EQUAL( solo.trip.vehicle_id(), 0 );

    BOOST_REQUIRE_EQUAL( solo.trip.legs().size(), 1 );
    const PassengerLeg& leg = solo.trip.legs()[0];
    BOOST_CHECK_EQUAL( leg.request_id(), 1 );
    BOOST_CHECK_EQUAL( leg.requester_id(), 101 );
    BOOST_CHECK_EQUAL( leg.pickup_index(), 0 );
    BOOST_CHECK_EQUAL( leg.dropoff_index(), 1 );
    BOOST_CHECK_CLOSE( leg.distance_km(), target.direct_distance(), 1e-9 );
    BOOST_CHECK_CLOSE( leg.fare(), engine.pricing().fare( FareParameters( target.direct_distance(), 2, 2, 1.0, 12 ) ), 1e-9 );
    BOOST_CHECK_CLOSE( solo.trip.base_price(), leg.fare(), 1e-9 );

    // the target itself is not a candidate
    results = engine.find_matches( target, RideRequestList( 1, target ), 1.0, 12 );
    BOOST_CHECK_EQUAL( results.size(), 1 );
}

BOOST_AUTO_TEST_CASE( test_pooled_pair )
{
    // two requests of 2 passengers, pickups 0.2 km apart, same dropoff
    MatchingEngine engine( ( Configuration() ) );
    RideRequest target = make_request( 1, PICKUP_LAT, PICKUP_LON, DROPOFF_LAT, DROPOFF_LON, 2 );
    target.set_luggage( luggage( LuggageSmall, LuggageMedium ) );
    RideRequest neighbour = make_request( 2, PICKUP_LAT + NEAR, PICKUP_LON, DROPOFF_LAT, DROPOFF_LON, 2 );
    neighbour.set_luggage( luggage( LuggageLarge ) );

    const MatchResultList results = engine.find_matches( target, RideRequestList( 1, neighbour ), 1.0, 12 );
    BOOST_REQUIRE_EQUAL( results.size(), 2 );

    const MatchResult& pooled = results[0];
    BOOST_CHECK( !pooled.is_solo() );
    BOOST_CHECK_EQUAL( pooled.trip.total_passengers(), 4 );
    BOOST_CHECK_EQUAL( pooled.trip.total_luggage_units(), 6 );
    BOOST_CHECK_GT( pooled.savings, 0.0 );
    BOOST_CHECK_GT( pooled.score, 50.0 );
    BOOST_CHECK_LE( pooled.score, 100.0 );
    BOOST_CHECK_LE( pooled.detour_minutes, 15 );
    BOOST_CHECK( pooled.trip.check_legs() );
    BOOST_CHECK_EQUAL( pooled.trip.waypoints().size(), 4 );

    // the discount of a full trip applies to both legs
    double sum = 0.0;
    for ( const PassengerLeg& leg : pooled.trip.legs() ) {
        BOOST_CHECK_CLOSE( leg.fare(), engine.pricing().fare( FareParameters( leg.distance_km(), 2, 4, 1.0, 12 ) ), 1e-9 );
        sum += leg.fare();
    }
    BOOST_CHECK_CLOSE( pooled.trip.base_price(), round_cents( sum ), 1e-9 );

    BOOST_CHECK( results[1].is_solo() );
}

BOOST_AUTO_TEST_CASE( test_seat_cap )
{
    // 3 + 3 passengers never share a vehicle
    MatchingEngine engine( ( Configuration() ) );
    RideRequest target = make_request( 1, PICKUP_LAT, PICKUP_LON, DROPOFF_LAT, DROPOFF_LON, 3 );
    RideRequest neighbour = make_request( 2, PICKUP_LAT, PICKUP_LON, DROPOFF_LAT, DROPOFF_LON, 3 );

    MatchResultList results = engine.find_matches( target, RideRequestList( 1, neighbour ), 1.0, 12 );
    BOOST_REQUIRE_EQUAL( results.size(), 1 );
    BOOST_CHECK( results[0].is_solo() );

    results = engine.find_matches( neighbour, RideRequestList( 1, target ), 1.0, 12 );
    BOOST_REQUIRE_EQUAL( results.size(), 1 );
    BOOST_CHECK( results[0].is_solo() );
}

BOOST_AUTO_TEST_CASE( test_luggage_cap )
{
    MatchingEngine engine( ( Configuration() ) );
    RideRequest target = make_request( 1, PICKUP_LAT, PICKUP_LON, DROPOFF_LAT, DROPOFF_LON );
    target.set_luggage( luggage( LuggageLarge, LuggageMedium ) );
    RideRequest neighbour = make_request( 2, PICKUP_LAT, PICKUP_LON, DROPOFF_LAT, DROPOFF_LON );
    neighbour.set_luggage( luggage( LuggageMedium ) );

    RideRequestList group;
    group.push_back( target );
    group.push_back( neighbour );
    BOOST_CHECK( !engine.check_constraints( group ) );

    const MatchResultList results = engine.find_matches( target, RideRequestList( 1, neighbour ), 1.0, 12 );
    BOOST_CHECK_EQUAL( results.size(), 1 );
}

BOOST_AUTO_TEST_CASE( test_radius )
{
    MatchingEngine engine( ( Configuration() ) );
    RideRequest target = make_request( 1, PICKUP_LAT, PICKUP_LON, DROPOFF_LAT, DROPOFF_LON );
    RideRequestList candidates;
    // about 4.4 km and 6.7 km north
    candidates.push_back( make_request( 2, PICKUP_LAT + 0.04, PICKUP_LON, DROPOFF_LAT, DROPOFF_LON ) );
    candidates.push_back( make_request( 3, PICKUP_LAT + 0.06, PICKUP_LON, DROPOFF_LAT, DROPOFF_LON ) );
    candidates.push_back( target );

    const RideRequestList nearby = engine.filter_nearby( target, candidates );
    BOOST_REQUIRE_EQUAL( nearby.size(), 1 );
    BOOST_CHECK_EQUAL( nearby[0].db_id(), 2 );
}

BOOST_AUTO_TEST_CASE( test_detour_rejection )
{
    // the target goes 5 km east, the neighbour 3 km north: the shortest route drops the
    // neighbour first and the target loses more than 20% of its direct time
    MatchingEngine engine( ( Configuration() ) );
    RideRequest target = make_request( 1, PICKUP_LAT, PICKUP_LON, PICKUP_LAT, PICKUP_LON + 0.07 );
    target.set_max_detour_minutes( 0 );
    RideRequest neighbour = make_request( 2, PICKUP_LAT + NEAR, PICKUP_LON, PICKUP_LAT + 0.027, PICKUP_LON );
    neighbour.set_max_detour_minutes( 0 );

    RideRequestList group;
    group.push_back( neighbour );
    group.push_back( target );
    BOOST_CHECK( engine.check_constraints( group ) );

    const MatchResultList results = engine.find_matches( target, RideRequestList( 1, neighbour ), 1.0, 12 );
    BOOST_REQUIRE_EQUAL( results.size(), 1 );
    BOOST_CHECK( results[0].is_solo() );

    // the tolerance of the request is larger than the relative bound
    target.set_max_detour_minutes( 15 );
    const MatchResultList lenient = engine.find_matches( target, RideRequestList( 1, neighbour ), 1.0, 12 );
    BOOST_REQUIRE_EQUAL( lenient.size(), 2 );
    BOOST_CHECK( !lenient[0].is_solo() );
    BOOST_CHECK_GT( lenient[0].detour_minutes, 1 );
    BOOST_CHECK_LE( lenient[0].detour_minutes, 15 );
}

BOOST_AUTO_TEST_CASE( test_candidate_groups )
{
    MatchingEngine engine( ( Configuration() ) );
    RideRequestList candidates;
    for ( db_id_t i = 1; i <= 3; i++ ) {
        candidates.push_back( make_request( i, PICKUP_LAT, PICKUP_LON, DROPOFF_LAT, DROPOFF_LON ) );
    }
    std::vector<RideRequestList> groups = engine.candidate_groups( candidates );
    // 3 singles, 3 pairs, 1 triple
    BOOST_REQUIRE_EQUAL( groups.size(), 7 );
    BOOST_CHECK_EQUAL( groups[0].size(), 1 );
    BOOST_CHECK_EQUAL( groups[3].size(), 2 );
    BOOST_CHECK_EQUAL( groups[3][0].db_id(), 1 );
    BOOST_CHECK_EQUAL( groups[3][1].db_id(), 2 );
    BOOST_CHECK_EQUAL( groups[5][0].db_id(), 2 );
    BOOST_CHECK_EQUAL( groups[6].size(), 3 );

    for ( size_t i = 0; i < candidates.size(); i++ ) {
        candidates[i].set_passengers( 3 );
    }
    groups = engine.candidate_groups( candidates );
    BOOST_CHECK_EQUAL( groups.size(), 3 );
}

BOOST_AUTO_TEST_CASE( test_ranking )
{
    MatchingEngine engine( ( Configuration() ) );
    RideRequest target = make_request( 1, PICKUP_LAT, PICKUP_LON, DROPOFF_LAT, DROPOFF_LON );
    RideRequestList candidates;
    for ( db_id_t i = 2; i <= 7; i++ ) {
        RideRequest r = make_request( i, PICKUP_LAT + NEAR * ( i % 3 ), PICKUP_LON, DROPOFF_LAT, DROPOFF_LON - 0.001 * i );
        r.set_luggage( luggage( LuggageMedium ) );
        candidates.push_back( r );
    }

    const MatchResultList results = engine.find_matches( target, candidates, 1.4, 18 );
    BOOST_REQUIRE_EQUAL( results.size(), 5 );
    bool has_solo = false;
    for ( size_t i = 0; i < results.size(); i++ ) {
        BOOST_CHECK_LE( results[i].trip.total_passengers(), 4 );
        BOOST_CHECK_LE( results[i].trip.total_luggage_units(), 6 );
        BOOST_CHECK_LE( results[i].score, 100.0 );
        BOOST_CHECK_EQUAL( results[i].trip.surge_factor(), 1.4 );
        if ( i > 0 ) {
            BOOST_CHECK_GE( results[i-1].score, results[i].score );
        }
        has_solo = has_solo || results[i].is_solo();
    }
    BOOST_CHECK( has_solo );

    // same inputs, same output
    const MatchResultList again = engine.find_matches( target, candidates, 1.4, 18 );
    BOOST_REQUIRE_EQUAL( again.size(), results.size() );
    for ( size_t i = 0; i < results.size(); i++ ) {
        BOOST_CHECK_EQUAL( again[i].score, results[i].score );
        BOOST_CHECK( again[i].trip.request_ids() == results[i].trip.request_ids() );
    }
}

BOOST_AUTO_TEST_CASE( test_solo_kept_when_outranked )
{
    Configuration config;
    config.set_option( "matching/max_results", Variant( 2 ) );
    MatchingEngine engine( config );

    RideRequest target = make_request( 1, PICKUP_LAT, PICKUP_LON, DROPOFF_LAT, DROPOFF_LON );
    RideRequestList candidates;
    for ( db_id_t i = 2; i <= 4; i++ ) {
        candidates.push_back( make_request( i, PICKUP_LAT, PICKUP_LON, DROPOFF_LAT, DROPOFF_LON ) );
    }

    const MatchResultList results = engine.find_matches( target, candidates, 1.0, 12 );
    BOOST_REQUIRE_EQUAL( results.size(), 2 );
    BOOST_CHECK( !results[0].is_solo() );
    BOOST_CHECK_GT( results[0].score, 50.0 );
    BOOST_CHECK( results[1].is_solo() );
}

BOOST_AUTO_TEST_SUITE_END()
