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

#ifndef RIDESHARE_COORDINATOR_HH
#define RIDESHARE_COORDINATOR_HH

#include <string>

#include <boost/noncopyable.hpp>

#include "common.hh"
#include "configuration.hh"
#include "cache.hh"
#include "store.hh"
#include "matching.hh"
#include "match_gate.hh"

namespace Rideshare {

/**
   The Coordinator owns every state transition of requests, vehicles and trips.

   Request lifecycle:
   PENDING -> CONFIRMED -> IN_PROGRESS -> COMPLETED, CANCELLED being reachable from
   any non terminal state. A trip cancellation puts its requests back to PENDING.

   Match computations go through a counting gate and a per request lease.
   Each write operation is a single store transaction, rolled back on any failure.
   Cache entries are invalidated after the transaction is committed.

   Errors are reported with the exceptions of errors.hh.
*/
class Coordinator : boost::noncopyable
{
public:
    ///
    /// @param store durable state, not owned
    /// @param cache volatile state, not owned
    /// @param config options, read at construction
    /// @param clock time source, now_utc() if empty
    Coordinator( Store& store, Cache& cache, const Configuration& config, Clock clock = Clock() );

    ///
    /// Validates and persists a new PENDING request
    /// @throws ValidationError
    RideRequest submit_request( const RideRequest& request );

    ///
    /// Ranked trip options for a pending request.
    /// The request is cancelled if no option exists.
    /// @throws MatchingInProgress if another computation holds the lease of the request
    /// @throws NotFoundError
    /// @throws InvalidTransition if the request is not PENDING
    MatchResultList find_matches( db_id_t request_id );

    ///
    /// Books an option: reserves a vehicle, creates the trip and confirms every request of the trip.
    /// @returns the persisted trip
    /// @throws ValidationError if the option is malformed or does not contain the request
    /// @throws InvalidTransition if a request of the option is not PENDING
    /// @throws NoVehicleAvailable
    /// @throws NotFoundError
    Trip confirm_booking( db_id_t request_id, const MatchResult& option );

    ///
    /// Cancels a trip, frees its vehicle and puts its requests back to PENDING
    /// @throws InvalidTransition if the trip is COMPLETED or CANCELLED
    Trip cancel_trip( db_id_t trip_id );

    ///
    /// Completes a trip, frees its vehicle at the last dropoff and completes its requests
    /// @throws InvalidTransition if the trip is COMPLETED or CANCELLED
    Trip complete_trip( db_id_t trip_id );

    ///
    /// CONFIRMED -> IN_PROGRESS, for the trip and its requests
    /// @throws InvalidTransition from any other status
    Trip start_trip( db_id_t trip_id );

    ///
    /// Completes every trip whose estimated end is before now.
    /// Trips that reached a terminal status in the meantime are skipped.
    /// Expired cache entries are purged as well.
    /// @returns the number of completed trips
    size_t complete_expired_trips( const DateTime& now );

    ///
    /// PENDING -> CANCELLED, does nothing on a request in another status
    void mark_no_vehicle_available( db_id_t request_id );

    ///
    /// Request snapshot, from the cache if present
    /// @throws NotFoundError
    RideRequest request( db_id_t request_id );

    ///
    /// @throws NotFoundError
    Trip trip( db_id_t trip_id );

    ///
    /// @throws NotFoundError
    Vehicle vehicle( db_id_t vehicle_id );

    db_id_t register_vehicle( const Vehicle& vehicle );

    ///
    /// Surge factor from the pending requests and the available vehicles, cached for a short time
    double current_surge_factor();

    const MatchingEngine& matching() const { return matching_; }
    MatchGate& gate() { return gate_; }

    static std::string lease_key( db_id_t request_id );
    static std::string request_key( db_id_t request_id );
    static const std::string SURGE_KEY;

private:
    DateTime now() const;
    // hour of the day at the service location
    int local_hour( const DateTime& t ) const;
    void invalidate_requests( const std::vector<db_id_t>& ids );

    Store& store_;
    Cache& cache_;
    Clock clock_;
    MatchingEngine matching_;
    MatchGate gate_;

    int lease_ttl_;
    int cache_ttl_;
    double search_radius_;
    size_t candidate_limit_;
    int candidate_window_;
    int max_passengers_;
    int utc_offset_;
};

} // Rideshare namespace

#endif
