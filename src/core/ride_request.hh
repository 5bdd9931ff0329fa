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

#ifndef RIDESHARE_RIDE_REQUEST_HH
#define RIDESHARE_RIDE_REQUEST_HH

#include <vector>

#include "common.hh"
#include "geometry.hh"

namespace Rideshare {

///
/// Luggage item sizes, the value is the number of luggage units taken
enum LuggageSize {
    LuggageSmall = 1,
    LuggageMedium = 2,
    LuggageLarge = 3
};

/**
   A RideRequest models a user asking to be transported from a pickup to a dropoff location.

   It is created PENDING by the coordinator and only changes through status transitions,
   each of them incrementing its version.
*/
class RideRequest : public Base
{
public:
    RideRequest();

    ///
    /// Identifier of the user who made the request
    DECLARE_RW_PROPERTY( requester_id, db_id_t );

    DECLARE_RW_PROPERTY( pickup, Location );
    DECLARE_RW_PROPERTY( dropoff, Location );

    ///
    /// Number of seats taken by this booking, from 1 to 4
    DECLARE_RW_PROPERTY( passengers, int );

    ///
    /// Luggage items, each one is a number of units (see LuggageSize)
    DECLARE_RW_PROPERTY( luggage, std::vector<int> );

    ///
    /// Maximum tolerated detour, in minutes
    DECLARE_RW_PROPERTY( max_detour_minutes, int );

    DECLARE_RW_PROPERTY( status, RideStatus );
    DECLARE_RW_PROPERTY( requested_at, DateTime );

    ///
    /// Sum of the luggage units
    int luggage_units() const;

    ///
    /// Direct distance from pickup to dropoff, in km
    double direct_distance() const;

    ///
    /// Checks the values given by a user.
    /// @throws ValidationError on the first inconsistent field
    void check_consistency() const;
};

///
/// Default tolerated detour of a request, in minutes
const int DEFAULT_MAX_DETOUR_MINUTES = 15;

///
/// A vehicle of the fleet
class Vehicle : public Base
{
public:
    Vehicle() : max_passengers_( 4 ), max_luggage_( 6 ), available_( true ) {}

    DECLARE_RW_PROPERTY( label, std::string );
    DECLARE_RW_PROPERTY( max_passengers, int );
    DECLARE_RW_PROPERTY( max_luggage, int );
    DECLARE_RW_PROPERTY( location, Location );

    ///
    /// False while a trip references the vehicle
    DECLARE_RW_PROPERTY( available, bool );
};

} // Rideshare namespace

#endif
