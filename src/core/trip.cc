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

#include "trip.hh"

namespace Rideshare {

std::vector<Location> locations( const WaypointList& waypoints )
{
    std::vector<Location> l;
    l.reserve( waypoints.size() );
    for ( size_t i = 0; i < waypoints.size(); i++ ) {
        l.push_back( waypoints[i].location() );
    }
    return l;
}

int waypoint_index( const WaypointList& waypoints, db_id_t request_id, Waypoint::WaypointType type )
{
    for ( size_t i = 0; i < waypoints.size(); i++ ) {
        if ( waypoints[i].request_id() == request_id && waypoints[i].type() == type ) {
            return int( i );
        }
    }
    return -1;
}

double distance_between( const WaypointList& waypoints, size_t from, size_t to )
{
    double d = 0.0;
    for ( size_t i = from; i < to && i + 1 < waypoints.size(); i++ ) {
        d += distance( waypoints[i].location(), waypoints[i+1].location() );
    }
    return d;
}

Trip::Trip() :
    vehicle_id_( 0 ),
    total_distance_( 0.0 ),
    estimated_duration_( 0 ),
    base_price_( 0.0 ),
    surge_factor_( 1.0 ),
    status_( StatusPending ),
    created_at_( now_utc() )
{
}

int Trip::total_passengers() const
{
    int n = 0;
    for ( size_t i = 0; i < legs_.size(); i++ ) {
        n += legs_[i].passengers();
    }
    return n;
}

int Trip::total_luggage_units() const
{
    int n = 0;
    for ( size_t i = 0; i < legs_.size(); i++ ) {
        n += legs_[i].luggage_units();
    }
    return n;
}

std::vector<db_id_t> Trip::request_ids() const
{
    std::vector<db_id_t> ids;
    for ( size_t i = 0; i < legs_.size(); i++ ) {
        ids.push_back( legs_[i].request_id() );
    }
    return ids;
}

const Location& Trip::final_location() const
{
    if ( waypoints_.empty() ) {
        throw std::out_of_range( "Trip has no waypoint" );
    }
    return waypoints_.back().location();
}

bool Trip::check_legs() const
{
    for ( size_t i = 0; i < legs_.size(); i++ ) {
        const PassengerLeg& leg = legs_[i];
        if ( leg.pickup_index() < 0 || leg.dropoff_index() >= int( waypoints_.size() ) ) {
            return false;
        }
        if ( leg.pickup_index() >= leg.dropoff_index() ) {
            return false;
        }
        const Waypoint& p = waypoints_[leg.pickup_index()];
        const Waypoint& d = waypoints_[leg.dropoff_index()];
        if ( !p.is_pickup() || d.is_pickup() || p.request_id() != leg.request_id() || d.request_id() != leg.request_id() ) {
            return false;
        }
    }
    return true;
}

}
