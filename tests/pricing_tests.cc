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

#include "pricing.hh"

using namespace boost::unit_test ;
using namespace Rideshare;

BOOST_AUTO_TEST_SUITE( pricing )

BOOST_AUTO_TEST_CASE( test_fare )
{
    PricingEngine pricing( ( Configuration() ) );

    // 5 + 10 x 2.5
    BOOST_CHECK_CLOSE( pricing.fare( FareParameters( 10.0, 1, 1, 1.0, 12 ) ), 30.0, 1e-9 );
    // minimum fare
    BOOST_CHECK_CLOSE( pricing.fare( FareParameters( 0.0, 1, 1, 1.0, 12 ) ), 8.0, 1e-9 );
    BOOST_CHECK_CLOSE( pricing.fare( FareParameters( 1.0, 1, 1, 1.0, 12 ) ), 8.0, 1e-9 );
    // morning peak and surge
    BOOST_CHECK_CLOSE( pricing.fare( FareParameters( 10.0, 1, 1, 2.0, 8 ) ), 90.0, 1e-9 );
    // 2 seats of a 4 seats trip: 30 x 0.6 x 2
    BOOST_CHECK_CLOSE( pricing.fare( FareParameters( 10.0, 2, 4, 1.0, 12 ) ), 36.0, 1e-9 );
    // 3 seats trip, night: 30 x 1.3 x 0.7
    BOOST_CHECK_CLOSE( pricing.fare( FareParameters( 10.0, 1, 3, 1.0, 2 ) ), 27.3, 1e-9 );
}

BOOST_AUTO_TEST_CASE( test_fare_monotonicity )
{
    PricingEngine pricing( ( Configuration() ) );
    const int hours[] = { 0, 8, 12, 18, 23 };

    for ( size_t h = 0; h < sizeof( hours ) / sizeof( int ); h++ ) {
        for ( int total = 1; total <= 4; total++ ) {
            double previous = 0.0;
            for ( double d = 0.0; d < 30.0; d += 0.37 ) {
                const double f = pricing.fare( FareParameters( d, 1, total, 1.0, hours[h] ) );
                BOOST_CHECK_GE( f, previous );
                BOOST_CHECK_GE( f, pricing.minimum_fare() );
                previous = f;
            }
            previous = 0.0;
            for ( double s = 1.0; s <= 3.0; s += 0.1 ) {
                const double f = pricing.fare( FareParameters( 4.2, 1, total, s, hours[h] ) );
                BOOST_CHECK_GE( f, previous );
                previous = f;
            }
        }
    }
}

BOOST_AUTO_TEST_CASE( test_surge )
{
    PricingEngine pricing( ( Configuration() ) );

    BOOST_CHECK_CLOSE( pricing.surge_factor( 200, 100 ), 3.0, 1e-9 );
    BOOST_CHECK_CLOSE( pricing.surge_factor( 100, 100 ), 2.0, 1e-9 );
    BOOST_CHECK_CLOSE( pricing.surge_factor( 50, 100 ), 1.25, 1e-9 );
    BOOST_CHECK_CLOSE( pricing.surge_factor( 0, 100 ), 1.0, 1e-9 );
    BOOST_CHECK_CLOSE( pricing.surge_factor( 1000, 10 ), 3.0, 1e-9 );
    // no vehicle
    BOOST_CHECK_CLOSE( pricing.surge_factor( 10, 0 ), 3.0, 1e-9 );
    BOOST_CHECK_CLOSE( pricing.surge_factor( 0, 0 ), 3.0, 1e-9 );

    Configuration config;
    config.set_option( "pricing/max_surge", Variant( 1.5 ) );
    PricingEngine capped( config );
    BOOST_CHECK_CLOSE( capped.surge_factor( 100, 100 ), 1.5, 1e-9 );
}

BOOST_AUTO_TEST_CASE( test_multipliers )
{
    BOOST_CHECK_EQUAL( PricingEngine::time_multiplier( 6 ), 1.0 );
    BOOST_CHECK_EQUAL( PricingEngine::time_multiplier( 7 ), 1.5 );
    BOOST_CHECK_EQUAL( PricingEngine::time_multiplier( 8 ), 1.5 );
    BOOST_CHECK_EQUAL( PricingEngine::time_multiplier( 9 ), 1.0 );
    BOOST_CHECK_EQUAL( PricingEngine::time_multiplier( 12 ), 1.0 );
    BOOST_CHECK_EQUAL( PricingEngine::time_multiplier( 17 ), 1.5 );
    BOOST_CHECK_EQUAL( PricingEngine::time_multiplier( 18 ), 1.5 );
    BOOST_CHECK_EQUAL( PricingEngine::time_multiplier( 19 ), 1.0 );
    BOOST_CHECK_EQUAL( PricingEngine::time_multiplier( 22 ), 1.0 );
    BOOST_CHECK_EQUAL( PricingEngine::time_multiplier( 23 ), 1.3 );
    BOOST_CHECK_EQUAL( PricingEngine::time_multiplier( 0 ), 1.3 );
    BOOST_CHECK_EQUAL( PricingEngine::time_multiplier( 4 ), 1.3 );
    BOOST_CHECK_EQUAL( PricingEngine::time_multiplier( 5 ), 1.0 );

    BOOST_CHECK_EQUAL( PricingEngine::pooling_discount( 1 ), 0.0 );
    BOOST_CHECK_EQUAL( PricingEngine::pooling_discount( 2 ), 0.2 );
    BOOST_CHECK_EQUAL( PricingEngine::pooling_discount( 3 ), 0.3 );
    BOOST_CHECK_EQUAL( PricingEngine::pooling_discount( 4 ), 0.4 );
}

BOOST_AUTO_TEST_CASE( test_split_and_savings )
{
    PricingEngine pricing( ( Configuration() ) );

    std::vector<double> d;
    d.push_back( 1.0 );
    d.push_back( 3.0 );
    std::vector<double> shares = pricing.split_fare( 100.0, d );
    BOOST_REQUIRE_EQUAL( shares.size(), 2 );
    BOOST_CHECK_CLOSE( shares[0], 25.0, 1e-9 );
    BOOST_CHECK_CLOSE( shares[1], 75.0, 1e-9 );

    shares = pricing.split_fare( 100.0, std::vector<double>( 3, 0.0 ) );
    BOOST_REQUIRE_EQUAL( shares.size(), 3 );
    BOOST_CHECK_EQUAL( shares[0], 0.0 );
    BOOST_CHECK_EQUAL( shares[2], 0.0 );

    BOOST_CHECK_CLOSE( pricing.savings( 30.0, 20.5 ), 9.5, 1e-9 );
    BOOST_CHECK_CLOSE( pricing.savings( 10.0, 12.25 ), -2.25, 1e-9 );
    BOOST_CHECK_CLOSE( round_cents( 1.234 ), 1.23, 1e-9 );
    BOOST_CHECK_CLOSE( round_cents( 1.236 ), 1.24, 1e-9 );
}

BOOST_AUTO_TEST_SUITE_END()
