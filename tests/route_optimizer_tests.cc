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

#include "route_optimizer.hh"
#include "test_helpers.hh"

using namespace boost::unit_test ;
using namespace Rideshare;

BOOST_AUTO_TEST_SUITE( route_optimizer )

BOOST_AUTO_TEST_CASE( test_single_request )
{
    RouteOptimizer optimizer;
    RideRequestList group( 1, make_request( 1, 48.85, 2.35, 48.87, 2.30, 2 ) );

    const Route route = optimizer.optimize( group );
    BOOST_REQUIRE_EQUAL( route.waypoints.size(), 2 );
    BOOST_CHECK( route.waypoints[0].is_pickup() );
    BOOST_CHECK( !route.waypoints[1].is_pickup() );
    BOOST_CHECK_EQUAL( route.waypoints[0].passengers(), 2 );
    BOOST_CHECK_CLOSE( route.total_distance, group[0].direct_distance(), 1e-9 );
    BOOST_CHECK_EQUAL( route.estimated_duration, travel_minutes( route.total_distance ) );

    BOOST_CHECK_THROW( optimizer.optimize( RideRequestList() ), std::invalid_argument );
}

BOOST_AUTO_TEST_CASE( test_collinear_pair )
{
    // both riders go east along the equator, B boards after A and leaves before A
    RouteOptimizer optimizer;
    RideRequestList group;
    group.push_back( make_request( 1, 0.0, 0.00, 0.0, 0.10 ) );
    group.push_back( make_request( 2, 0.0, 0.02, 0.0, 0.05 ) );

    const Route route = optimizer.optimize( group );
    BOOST_CHECK( pickups_first( group, route.waypoints ) );
    BOOST_CHECK_CLOSE( route.total_distance, group[0].direct_distance(), 1e-6 );

    BOOST_REQUIRE_EQUAL( route.waypoints.size(), 4 );
    BOOST_CHECK_EQUAL( route.waypoints[0].request_id(), 1 );
    BOOST_CHECK_EQUAL( route.waypoints[1].request_id(), 2 );
    BOOST_CHECK( route.waypoints[1].is_pickup() );
    BOOST_CHECK_EQUAL( route.waypoints[2].request_id(), 2 );
    BOOST_CHECK( !route.waypoints[2].is_pickup() );
    BOOST_CHECK_EQUAL( route.waypoints[3].request_id(), 1 );
}

BOOST_AUTO_TEST_CASE( test_not_worse_than_naive )
{
    RouteOptimizer optimizer;
    RideRequestList all;
    all.push_back( make_request( 1, 48.850, 2.350, 48.880, 2.290 ) );
    all.push_back( make_request( 2, 48.852, 2.360, 48.830, 2.370 ) );
    all.push_back( make_request( 3, 48.845, 2.340, 48.870, 2.310 ) );
    all.push_back( make_request( 4, 48.860, 2.355, 48.851, 2.351 ) );
    all.push_back( make_request( 5, 48.840, 2.330, 48.890, 2.400 ) );

    for ( size_t n = 2; n <= all.size(); n++ ) {
        const RideRequestList group( all.begin(), all.begin() + n );
        const Route route = optimizer.optimize( group );
        const Route naive = optimizer.naive_route( group );
        BOOST_CHECK( pickups_first( group, route.waypoints ) );
        BOOST_CHECK( pickups_first( group, naive.waypoints ) );
        if ( n <= RouteOptimizer::EXACT_SEARCH_LIMIT ) {
            BOOST_CHECK_LE( route.total_distance, naive.total_distance + 1e-9 );
        }
        BOOST_CHECK_CLOSE( route.total_distance, route_length( locations( route.waypoints ) ), 1e-9 );
        BOOST_CHECK_EQUAL( route.estimated_duration, travel_minutes( route.total_distance ) );
    }
}

BOOST_AUTO_TEST_CASE( test_deterministic )
{
    RouteOptimizer optimizer;
    RideRequestList group;
    // identical requests: both orderings boarding everybody first are optimal,
    // the first one in enumeration order is kept
    group.push_back( make_request( 1, 48.85, 2.35, 48.86, 2.36 ) );
    group.push_back( make_request( 2, 48.85, 2.35, 48.86, 2.36 ) );

    const Route route = optimizer.optimize( group );
    BOOST_REQUIRE_EQUAL( route.waypoints.size(), 4 );
    BOOST_CHECK_CLOSE( route.total_distance, group[0].direct_distance(), 1e-9 );
    BOOST_CHECK_EQUAL( route.waypoints[0].request_id(), 1 );
    BOOST_CHECK( route.waypoints[0].is_pickup() );
    BOOST_CHECK_EQUAL( route.waypoints[1].request_id(), 2 );
    BOOST_CHECK( route.waypoints[1].is_pickup() );
    BOOST_CHECK_EQUAL( route.waypoints[2].request_id(), 1 );
    BOOST_CHECK_EQUAL( route.waypoints[3].request_id(), 2 );

    const Route again = optimizer.optimize( group );
    BOOST_CHECK_EQUAL( again.total_distance, route.total_distance );
}

BOOST_AUTO_TEST_SUITE_END()
