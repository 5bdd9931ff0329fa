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
#include <map>

#include <boost/format.hpp>

#include "coordinator.hh"
#include "errors.hh"
#include "lease.hh"
#include "serializers.hh"
#include "utils/timer.hh"

namespace Rideshare {

const std::string Coordinator::SURGE_KEY = "surge:current";

std::string Coordinator::lease_key( db_id_t request_id )
{
    return "lock:matching:" + to_string( request_id );
}

std::string Coordinator::request_key( db_id_t request_id )
{
    return "request:" + to_string( request_id );
}

Coordinator::Coordinator( Store& store, Cache& cache, const Configuration& config, Clock clock ) :
    store_( store ),
    cache_( cache ),
    clock_( clock ),
    matching_( config ),
    gate_( size_t( config.get_int_option( "coordinator/max_concurrent_matches" ) ) ),
    lease_ttl_( int( config.get_int_option( "coordinator/lease_ttl_s" ) ) ),
    cache_ttl_( int( config.get_int_option( "coordinator/cache_ttl_s" ) ) ),
    search_radius_( config.get_float_option( "matching/search_radius_km" ) ),
    candidate_limit_( size_t( config.get_int_option( "matching/candidate_limit" ) ) ),
    candidate_window_( int( config.get_int_option( "matching/candidate_window_min" ) ) ),
    max_passengers_( int( config.get_int_option( "matching/max_passengers" ) ) ),
    utc_offset_( int( config.get_int_option( "pricing/utc_offset_h" ) ) )
{
    if ( utc_offset_ < -12 || utc_offset_ > 14 ) {
        throw std::invalid_argument( "pricing/utc_offset_h must be within [-12, 14]" );
    }
}

DateTime Coordinator::now() const
{
    return clock_ ? clock_() : now_utc();
}

int Coordinator::local_hour( const DateTime& t ) const
{
    return int( ( t + boost::posix_time::hours( utc_offset_ ) ).time_of_day().hours() );
}

void Coordinator::invalidate_requests( const std::vector<db_id_t>& ids )
{
    for ( size_t i = 0; i < ids.size(); i++ ) {
        cache_.remove( request_key( ids[i] ) );
    }
}

RideRequest Coordinator::submit_request( const RideRequest& request )
{
    request.check_consistency();

    RideRequest r( request );
    r.set_status( StatusPending );
    r.set_version( 1 );
    r.set_requested_at( now() );
    r.set_db_id( store_.insert_request( r ) );

    cache_.set( request_key( r.db_id() ), to_cache_value( r ), cache_ttl_ );
    return r;
}

RideRequest Coordinator::request( db_id_t request_id )
{
    boost::optional<std::string> cached = cache_.get( request_key( request_id ) );
    if ( cached ) {
        try {
            return request_from_cache_value( *cached );
        }
        catch ( std::runtime_error& e ) {
            CERR << "[WARNING] dropping cache entry of request " << request_id << ": " << e.what() << std::endl;
            cache_.remove( request_key( request_id ) );
        }
    }

    boost::optional<RideRequest> r = store_.request( request_id );
    if ( !r ) {
        throw NotFoundError( "Request", request_id );
    }
    cache_.set( request_key( request_id ), to_cache_value( *r ), cache_ttl_ );
    return *r;
}

Trip Coordinator::trip( db_id_t trip_id )
{
    boost::optional<Trip> t = store_.trip( trip_id );
    if ( !t ) {
        throw NotFoundError( "Trip", trip_id );
    }
    return *t;
}

Vehicle Coordinator::vehicle( db_id_t vehicle_id )
{
    boost::optional<Vehicle> v = store_.vehicle( vehicle_id );
    if ( !v ) {
        throw NotFoundError( "Vehicle", vehicle_id );
    }
    return *v;
}

db_id_t Coordinator::register_vehicle( const Vehicle& vehicle )
{
    if ( !vehicle.location().is_valid() ) {
        throw ValidationError( "Invalid vehicle coordinates" );
    }
    if ( vehicle.max_passengers() < 1 || vehicle.max_luggage() < 0 ) {
        throw ValidationError( "Invalid vehicle capacity" );
    }
    return store_.insert_vehicle( vehicle );
}

double Coordinator::current_surge_factor()
{
    boost::optional<std::string> cached = cache_.get( SURGE_KEY );
    if ( cached ) {
        try {
            return lexical_cast<double>( *cached );
        }
        catch ( bad_lexical_cast& e ) {
            CERR << "[WARNING] " << e.what() << std::endl;
        }
    }

    const double surge = matching_.pricing().surge_factor( store_.count_pending_requests(), store_.count_available_vehicles() );
    cache_.set( SURGE_KEY, ( boost::format( "%.17g" ) % surge ).str(), cache_ttl_ );
    return surge;
}

MatchResultList Coordinator::find_matches( db_id_t request_id )
{
    MatchGate::Slot slot( gate_ );

    Lease lease( cache_, lease_key( request_id ), lease_ttl_ );
    if ( !lease.try_acquire() ) {
        COUT << "matching of request " << request_id << " refused, lease held" << std::endl;
        throw MatchingInProgress( request_id );
    }

    Timer timer;
    const RideRequest r = request( request_id );
    if ( r.status() != StatusPending ) {
        throw InvalidTransition( "Request " + to_string( request_id ) + " is " + status_name( r.status() ) + ", not PENDING" );
    }

    const DateTime t = now();
    const RideRequestList neighbours = store_.pending_requests_near( r.pickup(), search_radius_,
                                                                     t - boost::posix_time::minutes( candidate_window_ ),
                                                                     candidate_limit_ );
    const double surge = current_surge_factor();
    const MatchResultList results = matching_.find_matches( r, neighbours, surge, local_hour( t ) );

    if ( results.empty() ) {
        mark_no_vehicle_available( request_id );
    }
    COUT << "request " << request_id << ": " << results.size() << " option(s) from " << neighbours.size()
         << " neighbour(s) in " << timer.elapsed_ms() << "ms" << std::endl;

    lease.release();
    return results;
}

Trip Coordinator::confirm_booking( db_id_t request_id, const MatchResult& option )
{
    const Trip& proposal = option.trip;
    if ( proposal.legs().empty() || !proposal.check_legs() ) {
        throw ValidationError( "Malformed trip option" );
    }
    std::vector<db_id_t> ids = proposal.request_ids();
    if ( std::find( ids.begin(), ids.end(), request_id ) == ids.end() ) {
        throw ValidationError( "Request " + to_string( request_id ) + " is not part of the trip option" );
    }
    if ( proposal.total_passengers() > max_passengers_ ) {
        throw ValidationError( "Trip option exceeds the seat limit" );
    }
    // rows are locked by increasing id
    std::sort( ids.begin(), ids.end() );
    if ( std::adjacent_find( ids.begin(), ids.end() ) != ids.end() ) {
        throw ValidationError( "A request appears twice in the trip option" );
    }

    std::unique_ptr<Transaction> tx = store_.begin();

    std::map<db_id_t, RideRequest> members;
    for ( size_t i = 0; i < ids.size(); i++ ) {
        members[ids[i]] = tx->request_for_update( ids[i] );
    }

    if ( members[request_id].status() != StatusPending ) {
        throw InvalidTransition( "Request " + to_string( request_id ) + " already processed (" + status_name( members[request_id].status() ) + ")" );
    }
    for ( size_t i = 0; i < proposal.legs().size(); i++ ) {
        const PassengerLeg& leg = proposal.legs()[i];
        const RideRequest& m = members[leg.request_id()];
        if ( m.status() != StatusPending ) {
            throw InvalidTransition( "Request " + to_string( m.db_id() ) + " of the trip option is " + status_name( m.status() ) );
        }
        if ( m.passengers() != leg.passengers() || m.luggage_units() != leg.luggage_units() ) {
            throw ValidationError( "Trip option does not match request " + to_string( m.db_id() ) );
        }
    }

    boost::optional<Vehicle> v = tx->lock_available_vehicle( proposal.total_passengers(), proposal.total_luggage_units() );
    if ( !v ) {
        throw NoVehicleAvailable();
    }
    tx->update_vehicle( v->db_id(), false, boost::optional<Location>(), v->version() );

    Trip trip( proposal );
    trip.set_vehicle_id( v->db_id() );
    trip.set_status( StatusConfirmed );
    trip.set_created_at( now() );
    trip.set_version( 1 );
    trip.set_db_id( tx->insert_trip( trip ) );

    for ( std::map<db_id_t, RideRequest>::const_iterator it = members.begin(); it != members.end(); ++it ) {
        tx->update_request_status( it->first, StatusConfirmed, it->second.version() );
    }

    tx->commit();
    // the connection of the transaction goes back to the pool before the cache is used
    tx.reset();
    invalidate_requests( ids );

    COUT << "trip " << trip.db_id() << " booked for request " << request_id << " on vehicle " << v->db_id()
         << " (" << ids.size() << " request(s), " << trip.base_price() << ")" << std::endl;
    return trip;
}

Trip Coordinator::cancel_trip( db_id_t trip_id )
{
    std::unique_ptr<Transaction> tx = store_.begin();

    Trip t = tx->trip_for_update( trip_id );
    if ( is_terminal( t.status() ) ) {
        throw InvalidTransition( "Cannot cancel trip " + to_string( trip_id ) + ", it is " + status_name( t.status() ) );
    }
    tx->update_trip_status( trip_id, StatusCancelled, t.version() );

    const Vehicle v = tx->vehicle_for_update( t.vehicle_id() );
    tx->update_vehicle( v.db_id(), true, boost::optional<Location>(), v.version() );

    std::vector<db_id_t> ids = t.request_ids();
    std::sort( ids.begin(), ids.end() );
    for ( size_t i = 0; i < ids.size(); i++ ) {
        const RideRequest r = tx->request_for_update( ids[i] );
        tx->update_request_status( ids[i], StatusPending, r.version() );
    }

    tx->commit();
    tx.reset();
    invalidate_requests( ids );
    COUT << "trip " << trip_id << " cancelled, vehicle " << v.db_id() << " freed" << std::endl;

    t.set_status( StatusCancelled );
    t.set_version( t.version() + 1 );
    return t;
}

Trip Coordinator::complete_trip( db_id_t trip_id )
{
    std::unique_ptr<Transaction> tx = store_.begin();

    Trip t = tx->trip_for_update( trip_id );
    if ( is_terminal( t.status() ) ) {
        throw InvalidTransition( "Cannot complete trip " + to_string( trip_id ) + ", it is " + status_name( t.status() ) );
    }
    tx->update_trip_status( trip_id, StatusCompleted, t.version() );

    boost::optional<Location> final_location;
    if ( !t.waypoints().empty() ) {
        final_location = t.final_location();
    }
    const Vehicle v = tx->vehicle_for_update( t.vehicle_id() );
    tx->update_vehicle( v.db_id(), true, final_location, v.version() );

    std::vector<db_id_t> ids = t.request_ids();
    std::sort( ids.begin(), ids.end() );
    for ( size_t i = 0; i < ids.size(); i++ ) {
        const RideRequest r = tx->request_for_update( ids[i] );
        tx->update_request_status( ids[i], StatusCompleted, r.version() );
    }

    tx->commit();
    tx.reset();
    invalidate_requests( ids );
    COUT << "trip " << trip_id << " completed, vehicle " << v.db_id() << " freed" << std::endl;

    t.set_status( StatusCompleted );
    t.set_version( t.version() + 1 );
    return t;
}

Trip Coordinator::start_trip( db_id_t trip_id )
{
    std::unique_ptr<Transaction> tx = store_.begin();

    Trip t = tx->trip_for_update( trip_id );
    if ( t.status() != StatusConfirmed ) {
        throw InvalidTransition( "Trip " + to_string( trip_id ) + " is " + status_name( t.status() ) + ", only a CONFIRMED trip can start" );
    }
    tx->update_trip_status( trip_id, StatusInProgress, t.version() );

    std::vector<db_id_t> ids = t.request_ids();
    std::sort( ids.begin(), ids.end() );
    for ( size_t i = 0; i < ids.size(); i++ ) {
        const RideRequest r = tx->request_for_update( ids[i] );
        tx->update_request_status( ids[i], StatusInProgress, r.version() );
    }

    tx->commit();
    tx.reset();
    invalidate_requests( ids );
    COUT << "trip " << trip_id << " started" << std::endl;

    t.set_status( StatusInProgress );
    t.set_version( t.version() + 1 );
    return t;
}

size_t Coordinator::complete_expired_trips( const DateTime& t )
{
    const std::vector<db_id_t> ids = store_.expired_trips( t );
    size_t completed = 0;
    for ( size_t i = 0; i < ids.size(); i++ ) {
        try {
            complete_trip( ids[i] );
            completed++;
        }
        catch ( ConflictError& e ) {
            CERR << "[WARNING] trip " << ids[i] << " skipped: " << e.what() << std::endl;
        }
    }
    const size_t purged = cache_.purge();
    if ( completed > 0 || purged > 0 ) {
        COUT << "auto-completed " << completed << " trip(s), " << purged << " expired cache entries purged" << std::endl;
    }
    return completed;
}

void Coordinator::mark_no_vehicle_available( db_id_t request_id )
{
    std::unique_ptr<Transaction> tx = store_.begin();
    const RideRequest r = tx->request_for_update( request_id );
    if ( r.status() != StatusPending ) {
        tx->rollback();
        return;
    }
    tx->update_request_status( request_id, StatusCancelled, r.version() );
    tx->commit();
    tx.reset();
    cache_.remove( request_key( request_id ) );
    COUT << "request " << request_id << " cancelled, no vehicle available" << std::endl;
}

}
