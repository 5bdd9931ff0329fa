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

#ifndef RIDESHARE_SERIALIZERS_HH
#define RIDESHARE_SERIALIZERS_HH

#include <iosfwd>
#include <string>
#include <vector>
#include <type_traits>

#include "common.hh"

namespace Rideshare
{

struct Location;
class RideRequest;

///
/// Printable serialization, used for cache values.
/// Fields are separated by a space, strings are prefixed by their length.
struct text_serialization_t {};

void serialize( std::ostream& ostr, const std::string& s, text_serialization_t );
void unserialize( std::istream& istr, std::string& s, text_serialization_t );
void serialize( std::ostream& ostr, double d, text_serialization_t );
void unserialize( std::istream& istr, double& d, text_serialization_t );
void serialize( std::ostream& ostr, const DateTime& dt, text_serialization_t );
void unserialize( std::istream& istr, DateTime& dt, text_serialization_t );
void serialize( std::ostream& ostr, const Location& l, text_serialization_t t );
void unserialize( std::istream& istr, Location& l, text_serialization_t t );
void serialize( std::ostream& ostr, const RideRequest& r, text_serialization_t t );
void unserialize( std::istream& istr, RideRequest& r, text_serialization_t t );

template <typename T>
typename std::enable_if<std::is_integral<T>::value, void>::type
serialize( std::ostream& ostr, const T& t, text_serialization_t )
{
    ostr << t << ' ';
}

template <typename T>
typename std::enable_if<std::is_integral<T>::value, void>::type
unserialize( std::istream& istr, T& t, text_serialization_t )
{
    if ( !( istr >> t ) ) {
        throw std::runtime_error( "unserialize: integer expected" );
    }
}

template <typename T>
void serialize( std::ostream& ostr, const std::vector<T>& v, text_serialization_t t )
{
    serialize( ostr, v.size(), t );
    for ( size_t i = 0; i < v.size(); i++ ) {
        serialize( ostr, v[i], t );
    }
}

template <typename T>
void unserialize( std::istream& istr, std::vector<T>& v, text_serialization_t t )
{
    size_t s;
    unserialize( istr, s, t );
    v.resize( s );
    for ( size_t i = 0; i < s; i++ ) {
        unserialize( istr, v[i], t );
    }
}

///
/// Snapshot of a request as stored in the cache
std::string to_cache_value( const RideRequest& r );

///
/// @throws std::runtime_error on a malformed value
RideRequest request_from_cache_value( const std::string& s );

}

#endif
