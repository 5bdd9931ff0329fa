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

#include "serializers.hh"

#include <sstream>

#include "geometry.hh"
#include "ride_request.hh"

namespace Rideshare
{

void serialize( std::ostream& ostr, const std::string& s, text_serialization_t )
{
    ostr << s.size() << ':' << s << ' ';
}
void unserialize( std::istream& istr, std::string& s, text_serialization_t )
{
    size_t len;
    char sep;
    if ( !( istr >> len ) || !istr.get( sep ) || sep != ':' ) {
        throw std::runtime_error( "unserialize: string expected" );
    }
    s.resize( len );
    if ( len && !istr.read( &s[0], len ) ) {
        throw std::runtime_error( "unserialize: truncated string" );
    }
}

void serialize( std::ostream& ostr, double d, text_serialization_t )
{
    const std::streamsize p = ostr.precision( 17 );
    ostr << d << ' ';
    ostr.precision( p );
}
void unserialize( std::istream& istr, double& d, text_serialization_t )
{
    if ( !( istr >> d ) ) {
        throw std::runtime_error( "unserialize: number expected" );
    }
}

void serialize( std::ostream& ostr, const DateTime& dt, text_serialization_t t )
{
    serialize( ostr, boost::posix_time::to_iso_string( dt ), t );
}
void unserialize( std::istream& istr, DateTime& dt, text_serialization_t t )
{
    std::string s;
    unserialize( istr, s, t );
    dt = boost::posix_time::from_iso_string( s );
}

void serialize( std::ostream& ostr, const Location& l, text_serialization_t t )
{
    serialize( ostr, l.latitude(), t );
    serialize( ostr, l.longitude(), t );
    serialize( ostr, l.label(), t );
}
void unserialize( std::istream& istr, Location& l, text_serialization_t t )
{
    double lat, lon;
    std::string label;
    unserialize( istr, lat, t );
    unserialize( istr, lon, t );
    unserialize( istr, label, t );
    l = Location( lat, lon, label );
}

void serialize( std::ostream& ostr, const RideRequest& r, text_serialization_t t )
{
    serialize( ostr, r.db_id(), t );
    serialize( ostr, r.version(), t );
    serialize( ostr, r.requester_id(), t );
    serialize( ostr, r.pickup(), t );
    serialize( ostr, r.dropoff(), t );
    serialize( ostr, r.passengers(), t );
    serialize( ostr, r.luggage(), t );
    serialize( ostr, r.max_detour_minutes(), t );
    serialize( ostr, status_name( r.status() ), t );
    serialize( ostr, r.requested_at(), t );
}
void unserialize( std::istream& istr, RideRequest& r, text_serialization_t t )
{
    db_id_t id, requester;
    int64_t version;
    Location pickup, dropoff;
    int passengers, detour;
    std::vector<int> luggage;
    std::string status;
    DateTime requested_at;

    unserialize( istr, id, t );
    unserialize( istr, version, t );
    unserialize( istr, requester, t );
    unserialize( istr, pickup, t );
    unserialize( istr, dropoff, t );
    unserialize( istr, passengers, t );
    unserialize( istr, luggage, t );
    unserialize( istr, detour, t );
    unserialize( istr, status, t );
    unserialize( istr, requested_at, t );

    r.set_db_id( id );
    r.set_version( version );
    r.set_requester_id( requester );
    r.set_pickup( pickup );
    r.set_dropoff( dropoff );
    r.set_passengers( passengers );
    r.set_luggage( luggage );
    r.set_max_detour_minutes( detour );
    r.set_status( status_from_name( status ) );
    r.set_requested_at( requested_at );
}

std::string to_cache_value( const RideRequest& r )
{
    std::ostringstream ostr;
    serialize( ostr, r, text_serialization_t() );
    return ostr.str();
}

RideRequest request_from_cache_value( const std::string& s )
{
    std::istringstream istr( s );
    RideRequest r;
    try {
        unserialize( istr, r, text_serialization_t() );
    }
    catch ( std::invalid_argument& e ) {
        // unknown status name
        throw std::runtime_error( std::string( "unserialize: " ) + e.what() );
    }
    return r;
}

}
