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

#include "configuration.hh"

using namespace boost::unit_test ;
using namespace Rideshare;

BOOST_AUTO_TEST_SUITE( configuration )

BOOST_AUTO_TEST_CASE( test_defaults )
{
    Configuration config;
    BOOST_CHECK_EQUAL( config.get_int_option( "matching/max_passengers" ), 4 );
    BOOST_CHECK_EQUAL( config.get_int_option( "matching/max_luggage" ), 6 );
    BOOST_CHECK_EQUAL( config.get_int_option( "matching/max_detour_percent" ), 20 );
    BOOST_CHECK_EQUAL( config.get_float_option( "matching/search_radius_km" ), 5.0 );
    BOOST_CHECK_EQUAL( config.get_int_option( "matching/max_results" ), 5 );
    BOOST_CHECK_EQUAL( config.get_int_option( "matching/candidate_limit" ), 6 );
    BOOST_CHECK_EQUAL( config.get_int_option( "matching/candidate_window_min" ), 10 );
    BOOST_CHECK_EQUAL( config.get_float_option( "pricing/base_fare" ), 5.0 );
    BOOST_CHECK_EQUAL( config.get_float_option( "pricing/rate_per_km" ), 2.5 );
    BOOST_CHECK_EQUAL( config.get_float_option( "pricing/minimum_fare" ), 8.0 );
    BOOST_CHECK_EQUAL( config.get_float_option( "pricing/max_surge" ), 3.0 );
    BOOST_CHECK_EQUAL( config.get_int_option( "coordinator/lease_ttl_s" ), 10 );
    BOOST_CHECK_EQUAL( config.get_int_option( "coordinator/cache_ttl_s" ), 60 );
    BOOST_CHECK_EQUAL( config.get_string_option( "store/backend" ), "pgsql" );
    BOOST_CHECK( config.options().empty() );
}

BOOST_AUTO_TEST_CASE( test_overrides )
{
    Configuration config;
    config.set_option( "pricing/base_fare", Variant( 6.5 ) );
    // converted to the declared type
    config.set_option( "matching/max_results", Variant( "3" ) );
    config.set_option( "pricing/minimum_fare", Variant( 10 ) );

    BOOST_CHECK_EQUAL( config.get_float_option( "pricing/base_fare" ), 6.5 );
    BOOST_CHECK_EQUAL( config.get_int_option( "matching/max_results" ), 3 );
    BOOST_CHECK_EQUAL( config.option( "matching/max_results" ).type(), IntVariant );
    BOOST_CHECK_EQUAL( config.get_float_option( "pricing/minimum_fare" ), 10.0 );
    BOOST_CHECK_EQUAL( config.option( "pricing/minimum_fare" ).type(), FloatVariant );
    BOOST_CHECK_EQUAL( config.options().size(), 3 );

    VariantMap m;
    m["store/backend"] = Variant( "memory" );
    Configuration from_map( m );
    BOOST_CHECK_EQUAL( from_map.get_string_option( "store/backend" ), "memory" );

    BOOST_CHECK_THROW( config.set_option( "pricing/unknown", Variant( 1 ) ), std::invalid_argument );
    BOOST_CHECK_THROW( config.option( "pricing/unknown" ), std::invalid_argument );
    BOOST_CHECK_THROW( config.set_option( "matching/max_results", Variant( "three" ) ), bad_lexical_cast );
}

BOOST_AUTO_TEST_CASE( test_variant )
{
    BOOST_CHECK_EQUAL( Variant::from_string( "true", BoolVariant ).as<bool>(), true );
    BOOST_CHECK_EQUAL( Variant::from_string( "0", BoolVariant ).as<bool>(), false );
    BOOST_CHECK_EQUAL( Variant::from_string( "42", IntVariant ).as<int64_t>(), 42 );
    BOOST_CHECK_EQUAL( Variant::from_string( "2.5", FloatVariant ).as<double>(), 2.5 );
    BOOST_CHECK_EQUAL( Variant( int64_t( 7 ) ).str(), "7" );
    BOOST_CHECK_EQUAL( Variant( false ).str(), "false" );
    BOOST_CHECK_EQUAL( Variant( 3.5 ).as<int64_t>(), 3 );
}

BOOST_AUTO_TEST_SUITE_END()
