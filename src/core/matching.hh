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

#ifndef RIDESHARE_MATCHING_HH
#define RIDESHARE_MATCHING_HH

#include <vector>

#include "configuration.hh"
#include "pricing.hh"
#include "route_optimizer.hh"
#include "trip.hh"

namespace Rideshare {

/**
   Builds and ranks the candidate trips of a request.

   The request is tried alone and with every group of one, two or three neighbours
   (within the search radius of its pickup) that satisfies the seat and luggage caps.
   A group is kept only if every member's detour stays under its tolerance.
   Results are sorted by decreasing score, ties keep the enumeration order:
   the solo option, then single neighbours, pairs and triples, each by increasing
   candidate index. The solo option is always part of the result, in last position if
   max_results pooled options outrank it.
*/
class MatchingEngine
{
public:
    explicit MatchingEngine( const Configuration& config );

    ///
    /// Ranked options for a request, the solo option is always computed.
    /// @param target the request to match
    /// @param candidates pending neighbours, the target may be among them
    /// @param surge_factor surge applied to the fares
    /// @param hour hour of the day used by the fares
    MatchResultList find_matches( const RideRequest& target, const RideRequestList& candidates, double surge_factor, int hour ) const;

    ///
    /// Candidates whose pickup is within the search radius of the target's pickup, the target excluded
    RideRequestList filter_nearby( const RideRequest& target, const RideRequestList& candidates ) const;

    ///
    /// Single candidates, then pairs and triples satisfying the caps
    std::vector<RideRequestList> candidate_groups( const RideRequestList& candidates ) const;

    ///
    /// Seat and luggage caps of a group
    bool check_constraints( const RideRequestList& group ) const;

    ///
    /// Minutes lost by each member compared to a direct trip
    std::vector<int> detours( const RideRequestList& group, const Route& route ) const;

    bool validate_detours( const RideRequestList& group, const std::vector<int>& detours ) const;

    ///
    /// Score from 0 to 100 of a pooled group
    double score( const RideRequestList& group, const Route& route, const std::vector<int>& detours ) const;

    ///
    /// Distance cost difference between solo trips and the shared route
    double savings( const RideRequestList& group, const Route& route ) const;

    ///
    /// Trip of a group along a route, legs are priced
    Trip build_trip( const RideRequestList& group, const Route& route, const std::vector<int>& detours, double surge_factor, int hour ) const;

    const PricingEngine& pricing() const { return pricing_; }

private:
    PricingEngine pricing_;
    RouteOptimizer optimizer_;

    int max_passengers_;
    int max_luggage_;
    int max_detour_percent_;
    double search_radius_;
    size_t max_results_;
    double solo_score_;
};

} // Rideshare namespace

#endif
