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

#ifndef RIDESHARE_ROUTE_OPTIMIZER_HH
#define RIDESHARE_ROUTE_OPTIMIZER_HH

#include <vector>

#include "ride_request.hh"
#include "trip.hh"

namespace Rideshare {

typedef std::vector<RideRequest> RideRequestList;

///
/// An ordered visit of the pickups and dropoffs of a group
struct Route {
    WaypointList waypoints;
    double total_distance;
    int estimated_duration;

    Route() : total_distance( 0.0 ), estimated_duration( 0 ) {}
};

/**
   Orders the waypoints of a group of requests so that the total distance is minimal
   and every pickup comes before the dropoff of the same request.

   Groups of up to EXACT_SEARCH_LIMIT requests are solved exactly by a depth-first
   branch and bound. The first ordering reaching the minimum, in enumeration order,
   is kept: request i contributes waypoints 2i (pickup) and 2i+1 (dropoff), and
   waypoints are tried by increasing index at each depth.

   Larger groups use a nearest neighbour heuristic.
*/
class RouteOptimizer
{
public:
    static const size_t EXACT_SEARCH_LIMIT = 4;

    ///
    /// Computes the route of a group
    /// @throws std::invalid_argument on an empty group
    Route optimize( const RideRequestList& group ) const;

    ///
    /// Route visiting all pickups in order, then all dropoffs in order
    Route naive_route( const RideRequestList& group ) const;

private:
    Route single_route( const RideRequest& request ) const;
    Route exact_route( const RideRequestList& group ) const;
    Route greedy_route( const RideRequestList& group ) const;
};

} // Rideshare namespace

#endif
