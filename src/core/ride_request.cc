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

#include "ride_request.hh"
#include "errors.hh"

namespace Rideshare {

RideRequest::RideRequest() :
    requester_id_( 0 ),
    passengers_( 1 ),
    max_detour_minutes_( DEFAULT_MAX_DETOUR_MINUTES ),
    status_( StatusPending ),
    requested_at_( now_utc() )
{
}

int RideRequest::luggage_units() const
{
    int units = 0;
    for ( size_t i = 0; i < luggage_.size(); i++ ) {
        units += luggage_[i];
    }
    return units;
}

double RideRequest::direct_distance() const
{
    return distance( pickup_, dropoff_ );
}

void RideRequest::check_consistency() const
{
    if ( !pickup_.is_valid() ) {
        throw ValidationError( "Invalid pickup coordinates" );
    }
    if ( !dropoff_.is_valid() ) {
        throw ValidationError( "Invalid dropoff coordinates" );
    }
    if ( passengers_ < 1 || passengers_ > 4 ) {
        throw ValidationError( "Passenger count must be between 1 and 4, got " + to_string( passengers_ ) );
    }
    for ( size_t i = 0; i < luggage_.size(); i++ ) {
        if ( luggage_[i] < LuggageSmall || luggage_[i] > LuggageLarge ) {
            throw ValidationError( "Invalid luggage size " + to_string( luggage_[i] ) );
        }
    }
    if ( max_detour_minutes_ < 0 || max_detour_minutes_ > 30 ) {
        throw ValidationError( "Detour tolerance must be between 0 and 30 minutes" );
    }
}

}
