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

#ifndef RIDESHARE_TRIP_HH
#define RIDESHARE_TRIP_HH

#include <vector>

#include "common.hh"
#include "geometry.hh"

namespace Rideshare {

///
/// A stop of a trip: where a request is picked up or dropped off
struct Waypoint {
    enum WaypointType {
        Pickup,
        Dropoff
    };
    DECLARE_RW_PROPERTY( type, WaypointType );
    /// The request this stop serves
    DECLARE_RW_PROPERTY( request_id, db_id_t );
    DECLARE_RW_PROPERTY( location, Location );
    /// Seats boarding or leaving here
    DECLARE_RW_PROPERTY( passengers, int );
public:
    Waypoint() : type_( Pickup ), request_id_( 0 ), passengers_( 0 ) {}
    Waypoint( WaypointType t, db_id_t id, const Location& l, int p ) : type_( t ), request_id_( id ), location_( l ), passengers_( p ) {}

    bool is_pickup() const { return type_ == Pickup; }
};

typedef std::vector<Waypoint> WaypointList;

///
/// The locations of a waypoint list, in order
std::vector<Location> locations( const WaypointList& waypoints );

///
/// Index of the pickup (resp. dropoff) waypoint of a request, -1 if absent
int waypoint_index( const WaypointList& waypoints, db_id_t request_id, Waypoint::WaypointType type );

///
/// Distance travelled between two waypoint indices, in km
double distance_between( const WaypointList& waypoints, size_t from, size_t to );

///
/// The part of a trip that belongs to one request.
/// pickup_index < dropoff_index always holds.
struct PassengerLeg {
    DECLARE_RW_PROPERTY( request_id, db_id_t );
    DECLARE_RW_PROPERTY( requester_id, db_id_t );
    /// Seats taken by the booking
    DECLARE_RW_PROPERTY( passengers, int );
    DECLARE_RW_PROPERTY( luggage_units, int );
    DECLARE_RW_PROPERTY( pickup_index, int );
    DECLARE_RW_PROPERTY( dropoff_index, int );
    /// Distance travelled on board, in km
    DECLARE_RW_PROPERTY( distance_km, double );
    DECLARE_RW_PROPERTY( fare, double );
    DECLARE_RW_PROPERTY( detour_minutes, int );
public:
    PassengerLeg() : request_id_( 0 ), requester_id_( 0 ), passengers_( 0 ), luggage_units_( 0 ),
        pickup_index_( -1 ), dropoff_index_( -1 ), distance_km_( 0.0 ), fare_( 0.0 ), detour_minutes_( 0 ) {}
};

/**
   A Trip (or ride) is a vehicle serving an ordered list of waypoints for 1 to 4 requests.

   Trips built by the matching engine are not persisted and have no vehicle.
   The coordinator assigns a vehicle and an id when the trip is booked.
*/
class Trip : public Base
{
public:
    Trip();

    DECLARE_RW_PROPERTY( vehicle_id, db_id_t );
    DECLARE_RW_PROPERTY( waypoints, WaypointList );
    DECLARE_RW_PROPERTY( legs, std::vector<PassengerLeg> );
    /// Length of the route, in km
    DECLARE_RW_PROPERTY( total_distance, double );
    /// Estimated duration, in minutes
    DECLARE_RW_PROPERTY( estimated_duration, int );
    /// Sum of the leg fares
    DECLARE_RW_PROPERTY( base_price, double );
    DECLARE_RW_PROPERTY( surge_factor, double );
    DECLARE_RW_PROPERTY( status, RideStatus );
    DECLARE_RW_PROPERTY( created_at, DateTime );

    /// Write access to the legs
    std::vector<PassengerLeg>& legs() { return legs_; }

    ///
    /// Seats used by all the legs
    int total_passengers() const;

    ///
    /// Luggage units of all the legs
    int total_luggage_units() const;

    ///
    /// Ids of the requests served
    std::vector<db_id_t> request_ids() const;

    ///
    /// Location of the last waypoint
    /// @throws std::out_of_range if the trip has no waypoint
    const Location& final_location() const;

    ///
    /// Checks that every leg references existing waypoints, pickup first
    bool check_legs() const;
};

///
/// A candidate trip for a request, as returned by the matching engine
struct MatchResult {
    Trip trip;
    /// From 0 to 100, higher is better
    double score;
    /// Estimated savings compared to solo trips
    double savings;
    /// Maximum detour of a member of the trip, in minutes
    int detour_minutes;

    MatchResult() : score( 0.0 ), savings( 0.0 ), detour_minutes( 0 ) {}

    ///
    /// Is this the single-request option ?
    bool is_solo() const { return trip.legs().size() == 1; }
};

typedef std::vector<MatchResult> MatchResultList;

} // Rideshare namespace

#endif
