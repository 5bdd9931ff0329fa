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

#include <math.h>
#include "geometry.hh"

namespace Rideshare
{

static double to_radians( double degrees )
{
    return degrees * M_PI / 180.0;
}

bool Location::is_valid() const
{
    return latitude_ >= -90.0 && latitude_ <= 90.0 &&
           longitude_ >= -180.0 && longitude_ <= 180.0;
}

double distance( const Location& a, const Location& b )
{
    const double dlat = to_radians( b.latitude() - a.latitude() );
    const double dlon = to_radians( b.longitude() - a.longitude() );

    const double h = sin( dlat / 2 ) * sin( dlat / 2 ) +
                     cos( to_radians( a.latitude() ) ) * cos( to_radians( b.latitude() ) ) *
                     sin( dlon / 2 ) * sin( dlon / 2 );

    return EARTH_RADIUS_KM * 2 * atan2( sqrt( h ), sqrt( 1 - h ) );
}

double route_length( const std::vector<Location>& waypoints )
{
    double total = 0.0;
    for ( size_t i = 1; i < waypoints.size(); i++ ) {
        total += distance( waypoints[i-1], waypoints[i] );
    }
    return total;
}

int travel_minutes( double km )
{
    return int( ceil( km / AVERAGE_SPEED_KMH * 60.0 ) );
}

}
