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

#include <algorithm>

#include "matching.hh"

namespace Rideshare {

namespace {

bool score_greater( const MatchResult& a, const MatchResult& b )
{
    return a.score > b.score;
}

bool is_solo_result( const MatchResult& m )
{
    return m.is_solo();
}

int total_passengers( const RideRequestList& group )
{
    int n = 0;
    for ( size_t i = 0; i < group.size(); i++ ) {
        n += group[i].passengers();
    }
    return n;
}

}

MatchingEngine::MatchingEngine( const Configuration& config ) :
    pricing_( config ),
    max_passengers_( int( config.get_int_option( "matching/max_passengers" ) ) ),
    max_luggage_( int( config.get_int_option( "matching/max_luggage" ) ) ),
    max_detour_percent_( int( config.get_int_option( "matching/max_detour_percent" ) ) ),
    search_radius_( config.get_float_option( "matching/search_radius_km" ) ),
    max_results_( size_t( config.get_int_option( "matching/max_results" ) ) ),
    solo_score_( config.get_float_option( "matching/solo_score" ) )
{
}

RideRequestList MatchingEngine::filter_nearby( const RideRequest& target, const RideRequestList& candidates ) const
{
    RideRequestList nearby;
    for ( size_t i = 0; i < candidates.size(); i++ ) {
        if ( candidates[i].db_id() == target.db_id() ) {
            continue;
        }
        if ( distance( target.pickup(), candidates[i].pickup() ) <= search_radius_ ) {
            nearby.push_back( candidates[i] );
        }
    }
    return nearby;
}

bool MatchingEngine::check_constraints( const RideRequestList& group ) const
{
    int luggage = 0;
    for ( size_t i = 0; i < group.size(); i++ ) {
        luggage += group[i].luggage_units();
    }
    return total_passengers( group ) <= max_passengers_ && luggage <= max_luggage_;
}

std::vector<RideRequestList> MatchingEngine::candidate_groups( const RideRequestList& c ) const
{
    std::vector<RideRequestList> groups;
    const size_t n = c.size();

    for ( size_t i = 0; i < n; i++ ) {
        groups.push_back( RideRequestList( 1, c[i] ) );
    }

    for ( size_t i = 0; i < n; i++ ) {
        for ( size_t j = i + 1; j < n; j++ ) {
            RideRequestList g;
            g.push_back( c[i] );
            g.push_back( c[j] );
            if ( check_constraints( g ) ) {
                groups.push_back( g );
            }
        }
    }

    for ( size_t i = 0; i < n; i++ ) {
        for ( size_t j = i + 1; j < n; j++ ) {
            for ( size_t k = j + 1; k < n; k++ ) {
                RideRequestList g;
                g.push_back( c[i] );
                g.push_back( c[j] );
                g.push_back( c[k] );
                if ( check_constraints( g ) ) {
                    groups.push_back( g );
                }
            }
        }
    }
    return groups;
}

std::vector<int> MatchingEngine::detours( const RideRequestList& group, const Route& route ) const
{
    std::vector<int> d;
    for ( size_t i = 0; i < group.size(); i++ ) {
        const int direct = travel_minutes( group[i].direct_distance() );
        const int p = waypoint_index( route.waypoints, group[i].db_id(), Waypoint::Pickup );
        const int q = waypoint_index( route.waypoints, group[i].db_id(), Waypoint::Dropoff );
        REQUIRE( p >= 0 && p < q );
        const int actual = travel_minutes( distance_between( route.waypoints, p, q ) );
        d.push_back( actual - direct );
    }
    return d;
}

bool MatchingEngine::validate_detours( const RideRequestList& group, const std::vector<int>& d ) const
{
    for ( size_t i = 0; i < group.size(); i++ ) {
        const int direct = travel_minutes( group[i].direct_distance() );
        const double relative_bound = double( direct * max_detour_percent_ ) / 100.0;
        // the more lenient of both bounds applies
        const double bound = std::max( relative_bound, double( group[i].max_detour_minutes() ) );
        if ( d[i] > bound ) {
            return false;
        }
    }
    return true;
}

double MatchingEngine::score( const RideRequestList& group, const Route& route, const std::vector<int>& d ) const
{
    double detour_sum = 0.0;
    double direct_sum = 0.0;
    for ( size_t i = 0; i < group.size(); i++ ) {
        detour_sum += d[i];
        direct_sum += group[i].direct_distance();
    }
    const double avg_detour = detour_sum / double( group.size() );
    const double efficiency = route.total_distance > 0.0 ? direct_sum / route.total_distance : 1.0;

    const double size_score = double( group.size() ) / double( max_passengers_ ) * 40.0;
    const double efficiency_score = efficiency * 40.0;
    const double detour_score = std::max( 0.0, 20.0 - avg_detour );

    return std::min( 100.0, size_score + efficiency_score + detour_score );
}

double MatchingEngine::savings( const RideRequestList& group, const Route& route ) const
{
    double direct_sum = 0.0;
    for ( size_t i = 0; i < group.size(); i++ ) {
        direct_sum += group[i].direct_distance();
    }
    return pricing_.savings( direct_sum * pricing_.rate_per_km(), route.total_distance * pricing_.rate_per_km() );
}

Trip MatchingEngine::build_trip( const RideRequestList& group, const Route& route, const std::vector<int>& d, double surge_factor, int hour ) const
{
    Trip trip;
    trip.set_waypoints( route.waypoints );
    trip.set_total_distance( route.total_distance );
    trip.set_estimated_duration( route.estimated_duration );
    trip.set_surge_factor( surge_factor );
    trip.set_status( StatusPending );

    const int seats = total_passengers( group );
    double price = 0.0;
    for ( size_t i = 0; i < group.size(); i++ ) {
        const RideRequest& r = group[i];
        PassengerLeg leg;
        leg.set_request_id( r.db_id() );
        leg.set_requester_id( r.requester_id() );
        leg.set_passengers( r.passengers() );
        leg.set_luggage_units( r.luggage_units() );
        leg.set_pickup_index( waypoint_index( route.waypoints, r.db_id(), Waypoint::Pickup ) );
        leg.set_dropoff_index( waypoint_index( route.waypoints, r.db_id(), Waypoint::Dropoff ) );
        leg.set_distance_km( distance_between( route.waypoints, leg.pickup_index(), leg.dropoff_index() ) );
        leg.set_detour_minutes( d[i] );
        leg.set_fare( pricing_.fare( FareParameters( leg.distance_km(), r.passengers(), seats, surge_factor, hour ) ) );
        price += leg.fare();
        trip.legs().push_back( leg );
    }
    trip.set_base_price( round_cents( price ) );
    return trip;
}

MatchResultList MatchingEngine::find_matches( const RideRequest& target, const RideRequestList& candidates, double surge_factor, int hour ) const
{
    MatchResultList results;

    {
        const RideRequestList solo( 1, target );
        const Route route = optimizer_.optimize( solo );
        MatchResult m;
        m.trip = build_trip( solo, route, std::vector<int>( 1, 0 ), surge_factor, hour );
        m.score = solo_score_;
        m.savings = 0.0;
        m.detour_minutes = 0;
        results.push_back( m );
    }

    const RideRequestList nearby = filter_nearby( target, candidates );
    const std::vector<RideRequestList> groups = candidate_groups( nearby );

    for ( size_t g = 0; g < groups.size(); g++ ) {
        if ( total_passengers( groups[g] ) + target.passengers() > max_passengers_ ) {
            continue;
        }
        RideRequestList combined( groups[g] );
        combined.push_back( target );
        if ( !check_constraints( combined ) ) {
            continue;
        }

        const Route route = optimizer_.optimize( combined );
        const std::vector<int> d = detours( combined, route );
        if ( !validate_detours( combined, d ) ) {
            continue;
        }

        MatchResult m;
        m.trip = build_trip( combined, route, d, surge_factor, hour );
        m.score = score( combined, route, d );
        m.savings = savings( combined, route );
        m.detour_minutes = *std::max_element( d.begin(), d.end() );
        results.push_back( m );
    }

    std::stable_sort( results.begin(), results.end(), score_greater );
    if ( results.size() > max_results_ ) {
        MatchResultList::iterator solo = std::find_if( results.begin(), results.end(), is_solo_result );
        const bool solo_dropped = size_t( solo - results.begin() ) >= max_results_;
        // the solo option takes the last place when outranked by the pooled ones
        const MatchResult solo_result = *solo;
        results.resize( max_results_ );
        if ( solo_dropped && !results.empty() ) {
            results.back() = solo_result;
        }
    }
    return results;
}

}
