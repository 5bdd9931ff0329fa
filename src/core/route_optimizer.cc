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

#include <limits>

#include "route_optimizer.hh"

namespace Rideshare {

const size_t RouteOptimizer::EXACT_SEARCH_LIMIT;

namespace {

Waypoint pickup_of( const RideRequest& r )
{
    return Waypoint( Waypoint::Pickup, r.db_id(), r.pickup(), r.passengers() );
}

Waypoint dropoff_of( const RideRequest& r )
{
    return Waypoint( Waypoint::Dropoff, r.db_id(), r.dropoff(), r.passengers() );
}

Route make_route( const WaypointList& waypoints )
{
    Route route;
    route.waypoints = waypoints;
    route.total_distance = route_length( locations( waypoints ) );
    route.estimated_duration = travel_minutes( route.total_distance );
    return route;
}

///
/// Depth first search over the valid orderings.
/// Candidates are the 2n waypoints, an odd index is the dropoff of the preceding pickup.
struct BranchAndBound
{
    BranchAndBound( const WaypointList& c ) :
        candidates( c ),
        used( c.size(), false ),
        best_distance( std::numeric_limits<double>::max() )
    {
        current.reserve( c.size() );
    }

    void search( double partial )
    {
        if ( current.size() == candidates.size() ) {
            if ( partial < best_distance ) {
                best_distance = partial;
                best = current;
            }
            return;
        }

        for ( size_t j = 0; j < candidates.size(); j++ ) {
            if ( used[j] ) {
                continue;
            }
            // dropoff before its pickup
            if ( ( j % 2 ) == 1 && !used[j-1] ) {
                continue;
            }
            const double step = current.empty() ? 0.0 : distance( candidates[current.back()].location(), candidates[j].location() );
            // no completion can beat the best ordering found so far
            if ( partial + step >= best_distance ) {
                continue;
            }
            used[j] = true;
            current.push_back( j );
            search( partial + step );
            current.pop_back();
            used[j] = false;
        }
    }

    const WaypointList& candidates;
    std::vector<bool> used;
    std::vector<size_t> current;
    std::vector<size_t> best;
    double best_distance;
};

}

Route RouteOptimizer::optimize( const RideRequestList& group ) const
{
    if ( group.empty() ) {
        throw std::invalid_argument( "Cannot compute the route of an empty group" );
    }
    if ( group.size() == 1 ) {
        return single_route( group.front() );
    }
    if ( group.size() <= EXACT_SEARCH_LIMIT ) {
        return exact_route( group );
    }
    return greedy_route( group );
}

Route RouteOptimizer::naive_route( const RideRequestList& group ) const
{
    WaypointList waypoints;
    for ( size_t i = 0; i < group.size(); i++ ) {
        waypoints.push_back( pickup_of( group[i] ) );
    }
    for ( size_t i = 0; i < group.size(); i++ ) {
        waypoints.push_back( dropoff_of( group[i] ) );
    }
    return make_route( waypoints );
}

Route RouteOptimizer::single_route( const RideRequest& request ) const
{
    WaypointList waypoints;
    waypoints.push_back( pickup_of( request ) );
    waypoints.push_back( dropoff_of( request ) );
    return make_route( waypoints );
}

Route RouteOptimizer::exact_route( const RideRequestList& group ) const
{
    WaypointList candidates;
    for ( size_t i = 0; i < group.size(); i++ ) {
        candidates.push_back( pickup_of( group[i] ) );
        candidates.push_back( dropoff_of( group[i] ) );
    }

    BranchAndBound bb( candidates );
    bb.search( 0.0 );
    REQUIRE( bb.best.size() == candidates.size() );

    WaypointList waypoints;
    for ( size_t i = 0; i < bb.best.size(); i++ ) {
        waypoints.push_back( candidates[bb.best[i]] );
    }
    return make_route( waypoints );
}

Route RouteOptimizer::greedy_route( const RideRequestList& group ) const
{
    const size_t n = group.size();
    std::vector<bool> picked( n, false );
    std::vector<bool> onboard( n, false );
    size_t remaining_pickups = n;
    size_t riders = 0;

    WaypointList waypoints;
    Location current = group.front().pickup();

    while ( remaining_pickups > 0 || riders > 0 ) {
        double nearest = std::numeric_limits<double>::max();
        size_t nearest_idx = 0;
        bool is_pickup = false;

        for ( size_t i = 0; i < n; i++ ) {
            if ( picked[i] ) {
                continue;
            }
            const double d = distance( current, group[i].pickup() );
            if ( d < nearest ) {
                nearest = d;
                nearest_idx = i;
                is_pickup = true;
            }
        }
        // a dropoff has to be strictly nearer to win over a pickup
        for ( size_t i = 0; i < n; i++ ) {
            if ( !onboard[i] ) {
                continue;
            }
            const double d = distance( current, group[i].dropoff() );
            if ( d < nearest ) {
                nearest = d;
                nearest_idx = i;
                is_pickup = false;
            }
        }

        const RideRequest& r = group[nearest_idx];
        if ( is_pickup ) {
            waypoints.push_back( pickup_of( r ) );
            picked[nearest_idx] = true;
            onboard[nearest_idx] = true;
            remaining_pickups--;
            riders++;
            current = r.pickup();
        }
        else {
            waypoints.push_back( dropoff_of( r ) );
            onboard[nearest_idx] = false;
            riders--;
            current = r.dropoff();
        }
    }

    return make_route( waypoints );
}

}
