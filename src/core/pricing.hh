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

#ifndef RIDESHARE_PRICING_HH
#define RIDESHARE_PRICING_HH

#include <vector>

#include "configuration.hh"

namespace Rideshare {

///
/// Inputs of a fare computation
struct FareParameters {
    /// Distance travelled by the booking, in km
    double distance_km;
    /// Seats of this booking
    int passengers;
    /// Seats of the whole trip, selects the pooling discount
    int total_passengers;
    double surge_factor;
    /// Hour of the day, from 0 to 23
    int hour;

    FareParameters() : distance_km( 0.0 ), passengers( 1 ), total_passengers( 1 ), surge_factor( 1.0 ), hour( 12 ) {}
    FareParameters( double d, int p, int total, double surge, int h ) :
        distance_km( d ), passengers( p ), total_passengers( total ), surge_factor( surge ), hour( h ) {}
};

///
/// Rounds an amount to cents
double round_cents( double amount );

/**
   Fare and surge formulas.

   fare = max( minimum_fare, round( (base_fare + distance x rate_per_km) x surge x time_multiplier x (1 - discount) x passengers ) )

   The discount depends on the seats of the whole trip, while the product by the seats
   of the booking scales the amount. Parameters come from the pricing/ options.
*/
class PricingEngine
{
public:
    explicit PricingEngine( const Configuration& config );

    double fare( const FareParameters& p ) const;

    ///
    /// Demand based multiplier, max_surge when no vehicle is available
    double surge_factor( int64_t active_requests, int64_t available_vehicles ) const;

    ///
    /// 1.5 during the morning and evening peaks, 1.3 at night, 1.0 otherwise
    static double time_multiplier( int hour );

    ///
    /// Discount for 1, 2, 3 and 4 or more seats in a trip
    static double pooling_discount( int total_passengers );

    ///
    /// Splits an amount proportionally to distances.
    /// All shares are 0 if the distances sum to 0.
    std::vector<double> split_fare( double total_fare, const std::vector<double>& distances ) const;

    double savings( double solo_fare, double pooled_fare ) const;

    double base_fare() const { return base_fare_; }
    double rate_per_km() const { return rate_per_km_; }
    double minimum_fare() const { return minimum_fare_; }
    double max_surge() const { return max_surge_; }

private:
    double base_fare_;
    double rate_per_km_;
    double minimum_fare_;
    double max_surge_;
};

} // Rideshare namespace

#endif
