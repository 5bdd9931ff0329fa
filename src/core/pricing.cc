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
#include <algorithm>

#include "pricing.hh"

namespace Rideshare {

double round_cents( double amount )
{
    // halves are rounded up, as floor( x + 0.5 )
    return floor( amount * 100.0 + 0.5 ) / 100.0;
}

PricingEngine::PricingEngine( const Configuration& config ) :
    base_fare_( config.get_float_option( "pricing/base_fare" ) ),
    rate_per_km_( config.get_float_option( "pricing/rate_per_km" ) ),
    minimum_fare_( config.get_float_option( "pricing/minimum_fare" ) ),
    max_surge_( config.get_float_option( "pricing/max_surge" ) )
{
}

double PricingEngine::time_multiplier( int hour )
{
    if ( ( hour >= 7 && hour < 9 ) || ( hour >= 17 && hour < 19 ) ) {
        return 1.5;
    }
    if ( hour >= 23 || hour < 5 ) {
        return 1.3;
    }
    return 1.0;
}

double PricingEngine::pooling_discount( int total_passengers )
{
    switch ( total_passengers ) {
    case 0:
    case 1:
        return 0.0;
    case 2:
        return 0.20;
    case 3:
        return 0.30;
    default:
        return 0.40;
    }
}

double PricingEngine::fare( const FareParameters& p ) const
{
    double per_passenger = ( base_fare_ + p.distance_km * rate_per_km_ ) * p.surge_factor * time_multiplier( p.hour );
    per_passenger *= 1.0 - pooling_discount( p.total_passengers );

    const double total = per_passenger * p.passengers;
    return std::max( minimum_fare_, round_cents( total ) );
}

double PricingEngine::surge_factor( int64_t active_requests, int64_t available_vehicles ) const
{
    if ( available_vehicles <= 0 ) {
        return max_surge_;
    }
    const double ratio = std::min( double( active_requests ) / double( available_vehicles ), 2.0 );
    const double surge = 1.0 + ratio * ratio;
    return std::min( max_surge_, std::max( 1.0, surge ) );
}

std::vector<double> PricingEngine::split_fare( double total_fare, const std::vector<double>& distances ) const
{
    double sum = 0.0;
    for ( size_t i = 0; i < distances.size(); i++ ) {
        sum += distances[i];
    }

    std::vector<double> shares;
    for ( size_t i = 0; i < distances.size(); i++ ) {
        shares.push_back( sum > 0.0 ? round_cents( total_fare * distances[i] / sum ) : 0.0 );
    }
    return shares;
}

double PricingEngine::savings( double solo_fare, double pooled_fare ) const
{
    return round_cents( solo_fare - pooled_fare );
}

}
