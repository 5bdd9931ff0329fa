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

#include "configuration.hh"

namespace Rideshare {

Variant::Variant()
{
}

Variant::Variant( bool b ) : v_( b )
{
}

Variant::Variant( int i ) : v_( int64_t( i ) )
{
}

Variant::Variant( int64_t i ) : v_( i )
{
}

Variant::Variant( double f ) : v_( f )
{
}

Variant::Variant( const std::string& s ) : v_( s )
{
}

Variant::Variant( const char* s ) : v_( std::string( s ) )
{
}

Variant Variant::from_string( const std::string& s, VariantType t )
{
    switch ( t ) {
    case BoolVariant:
        return Variant( s == "true" || s == "1" );
    case IntVariant:
        return Variant( Rideshare::lexical_cast<int64_t>( s ) );
    case FloatVariant:
        return Variant( Rideshare::lexical_cast<double>( s ) );
    case StringVariant:
        return Variant( s );
    }
    return Variant( s );
}

VariantType Variant::type() const
{
    // the order of the variant is the same as the VariantType enum
    return VariantType( v_.which() );
}

std::string Variant::str() const
{
    if ( type() == StringVariant ) {
        return boost::get<std::string>( v_ );
    }
    if ( type() == BoolVariant ) {
        return boost::get<bool>( v_ ) ? "true" : "false";
    }
    std::ostringstream ostr;
    ostr << v_;
    return ostr.str();
}

void Variant::convert_to( bool& b ) const
{
    if ( type() == BoolVariant ) {
        b = *boost::get<bool>( &v_ );
    }
    else {
        const std::string s = str();
        b = s == "true" || s == "1";
    }
}

void Variant::convert_to( int64_t& i ) const
{
    if ( type() == IntVariant ) {
        i = *boost::get<int64_t>( &v_ );
    }
    else if ( type() == FloatVariant ) {
        i = static_cast<int64_t>( *boost::get<double>( &v_ ) );
    }
    else {
        i = Rideshare::lexical_cast<int64_t>( str() );
    }
}

void Variant::convert_to( double& f ) const
{
    if ( type() == FloatVariant ) {
        f = *boost::get<double>( &v_ );
    }
    else if ( type() == IntVariant ) {
        f = static_cast<double>( *boost::get<int64_t>( &v_ ) );
    }
    else {
        f = Rideshare::lexical_cast<double>( str() );
    }
}

void Variant::convert_to( std::string& s ) const
{
    s = str();
}

namespace {
OptionDescriptionList declare_options_()
{
    OptionDescriptionList list;
    list.declare_option( "matching/max_passengers", "Maximum number of seats taken by a pooled group", Variant( 4 ) );
    list.declare_option( "matching/max_luggage", "Maximum number of luggage units of a pooled group", Variant( 6 ) );
    list.declare_option( "matching/max_detour_percent", "Detour allowed, in percent of the direct travel time", Variant( 20 ) );
    list.declare_option( "matching/search_radius_km", "Radius around the pickup where neighbours are searched (km)", Variant( 5.0 ) );
    list.declare_option( "matching/max_results", "Number of ranked options returned", Variant( 5 ) );
    list.declare_option( "matching/candidate_limit", "Maximum number of neighbours loaded for a match", Variant( 6 ) );
    list.declare_option( "matching/candidate_window_min", "Only neighbours requested within this window are considered (min)", Variant( 10 ) );
    list.declare_option( "matching/solo_score", "Score of the solo option", Variant( 50.0 ) );
    list.declare_option( "pricing/base_fare", "Base fare per passenger", Variant( 5.0 ) );
    list.declare_option( "pricing/rate_per_km", "Distance rate per passenger and km", Variant( 2.5 ) );
    list.declare_option( "pricing/minimum_fare", "Minimum fare of a booking", Variant( 8.0 ) );
    list.declare_option( "pricing/max_surge", "Upper bound of the surge factor", Variant( 3.0 ) );
    list.declare_option( "pricing/utc_offset_h", "Offset of the service local time from UTC, for peak hours (h)", Variant( 0 ) );
    list.declare_option( "coordinator/max_concurrent_matches", "Number of match computations allowed to run at the same time", Variant( 100 ) );
    list.declare_option( "coordinator/lease_ttl_s", "Expiry of the per-request matching lease (s)", Variant( 10 ) );
    list.declare_option( "coordinator/cache_ttl_s", "Expiry of cached request snapshots and surge values (s)", Variant( 60 ) );
    list.declare_option( "store/backend", "Storage backend: pgsql or memory", Variant( "pgsql" ) );
    list.declare_option( "store/pool_size", "Number of database connections", Variant( 4 ) );
    list.declare_option( "db/options", "Database connection options", Variant( "dbname=rideshare" ) );
    return list;
}
}

const OptionDescriptionList& Configuration::option_descriptions()
{
    static const OptionDescriptionList list = declare_options_();
    return list;
}

Configuration::Configuration( const VariantMap& options )
{
    for ( VariantMap::const_iterator it = options.begin(); it != options.end(); ++it ) {
        set_option( it->first, it->second );
    }
}

void Configuration::set_option( const std::string& name, const Variant& value )
{
    const OptionDescriptionList& descs = option_descriptions();
    OptionDescriptionList::const_iterator it = descs.find( name );
    if ( it == descs.end() ) {
        throw std::invalid_argument( "Unknown option " + name );
    }
    // store the value with the declared type
    options_[name] = value.type() == it->second.type() ? value : Variant::from_string( value.str(), it->second.type() );
}

Variant Configuration::option( const std::string& name ) const
{
    VariantMap::const_iterator it = options_.find( name );
    if ( it != options_.end() ) {
        return it->second;
    }
    const OptionDescriptionList& descs = option_descriptions();
    OptionDescriptionList::const_iterator dit = descs.find( name );
    if ( dit == descs.end() ) {
        throw std::invalid_argument( "Unknown option " + name );
    }
    return dit->second.default_value;
}

bool Configuration::get_bool_option( const std::string& name ) const
{
    return option( name ).as<bool>();
}

int64_t Configuration::get_int_option( const std::string& name ) const
{
    return option( name ).as<int64_t>();
}

double Configuration::get_float_option( const std::string& name ) const
{
    return option( name ).as<double>();
}

std::string Configuration::get_string_option( const std::string& name ) const
{
    return option( name ).as<std::string>();
}

} // namespace Rideshare
