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

#ifndef RIDESHARE_GEOMETRY_HH
#define RIDESHARE_GEOMETRY_HH

#include <vector>

#include "common.hh"

namespace Rideshare
{

///
/// Geographic location, WGS84 degrees, with an optional label (address)
struct Location {
    DECLARE_RW_PROPERTY( latitude, double );
    DECLARE_RW_PROPERTY( longitude, double );
    DECLARE_RW_PROPERTY( label, std::string );
public:
    Location() : latitude_( 0.0 ), longitude_( 0.0 ) {}
    Location( double lat, double lon, const std::string& l = "" ) : latitude_( lat ), longitude_( lon ), label_( l ) {}

    /// Latitude within [-90,90] and longitude within [-180,180]
    bool is_valid() const;
};

/// Earth radius, in km
const double EARTH_RADIUS_KM = 6371.0;

/// Average speed used for travel time estimations, in km/h
const double AVERAGE_SPEED_KMH = 40.0;

/** Great-circle distance between a and b, in km (haversine formula) */
double distance( const Location& a, const Location& b );

/** Sum of the distances between consecutive locations, in km */
double route_length( const std::vector<Location>& waypoints );

/** Travel time in minutes, rounded up, at the average speed */
int travel_minutes( double km );

}

#endif
