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

#include "memory_store.hh"
#include "errors.hh"

namespace Rideshare {

namespace {

bool more_recent( const RideRequest& a, const RideRequest& b )
{
    if ( a.requested_at() != b.requested_at() ) {
        return a.requested_at() > b.requested_at();
    }
    return a.db_id() > b.db_id();
}

}

///
/// A transaction of a MemoryStore, holding the store lock during its lifetime
class MemoryTransaction : public Transaction
{
public:
    explicit MemoryTransaction( MemoryStore& store ) : store_( store ), lock_( store.tx_mutex_ ), done_( false ) {}

    virtual ~MemoryTransaction()
    {
        if ( !done_ ) {
            rollback();
        }
    }

    virtual RideRequest request_for_update( db_id_t id )
    {
        check_running();
        MemoryStore::RequestMap::const_iterator it = requests_.find( id );
        if ( it != requests_.end() ) {
            return it->second;
        }
        boost::lock_guard<boost::mutex> lock( store_.data_mutex_ );
        it = store_.requests_.find( id );
        if ( it == store_.requests_.end() ) {
            throw NotFoundError( "Request", id );
        }
        return it->second;
    }

    virtual void update_request_status( db_id_t id, RideStatus status, int64_t expected_version )
    {
        RideRequest r = request_for_update( id );
        if ( r.version() != expected_version ) {
            throw StaleVersion( "request " + to_string( id ) );
        }
        r.set_status( status );
        r.set_version( r.version() + 1 );
        requests_[id] = r;
    }

    virtual boost::optional<Vehicle> lock_available_vehicle( int passengers, int luggage_units )
    {
        check_running();
        // staged vehicles shadow the committed ones
        MemoryStore::VehicleMap merged;
        {
            boost::lock_guard<boost::mutex> lock( store_.data_mutex_ );
            merged = store_.vehicles_;
        }
        for ( MemoryStore::VehicleMap::const_iterator it = vehicles_.begin(); it != vehicles_.end(); ++it ) {
            merged[it->first] = it->second;
        }
        for ( MemoryStore::VehicleMap::const_iterator it = merged.begin(); it != merged.end(); ++it ) {
            const Vehicle& v = it->second;
            if ( v.available() && v.max_passengers() >= passengers && v.max_luggage() >= luggage_units ) {
                return v;
            }
        }
        return boost::optional<Vehicle>();
    }

    virtual Vehicle vehicle_for_update( db_id_t id )
    {
        check_running();
        MemoryStore::VehicleMap::const_iterator it = vehicles_.find( id );
        if ( it != vehicles_.end() ) {
            return it->second;
        }
        boost::lock_guard<boost::mutex> lock( store_.data_mutex_ );
        it = store_.vehicles_.find( id );
        if ( it == store_.vehicles_.end() ) {
            throw NotFoundError( "Vehicle", id );
        }
        return it->second;
    }

    virtual void update_vehicle( db_id_t id, bool available, const boost::optional<Location>& location, int64_t expected_version )
    {
        Vehicle v = vehicle_for_update( id );
        if ( v.version() != expected_version ) {
            throw StaleVersion( "vehicle " + to_string( id ) );
        }
        v.set_available( available );
        if ( location ) {
            v.set_location( *location );
        }
        v.set_version( v.version() + 1 );
        vehicles_[id] = v;
    }

    virtual db_id_t insert_trip( const Trip& trip )
    {
        check_running();
        db_id_t id;
        {
            boost::lock_guard<boost::mutex> lock( store_.data_mutex_ );
            id = store_.next_trip_id_++;
        }
        Trip t( trip );
        t.set_db_id( id );
        t.set_version( 1 );
        trips_[id] = t;
        return id;
    }

    virtual Trip trip_for_update( db_id_t id )
    {
        check_running();
        MemoryStore::TripMap::const_iterator it = trips_.find( id );
        if ( it != trips_.end() ) {
            return it->second;
        }
        boost::lock_guard<boost::mutex> lock( store_.data_mutex_ );
        it = store_.trips_.find( id );
        if ( it == store_.trips_.end() ) {
            throw NotFoundError( "Trip", id );
        }
        return it->second;
    }

    virtual void update_trip_status( db_id_t id, RideStatus status, int64_t expected_version )
    {
        Trip t = trip_for_update( id );
        if ( t.version() != expected_version ) {
            throw StaleVersion( "trip " + to_string( id ) );
        }
        t.set_status( status );
        t.set_version( t.version() + 1 );
        trips_[id] = t;
    }

    virtual void commit()
    {
        check_running();
        {
            boost::lock_guard<boost::mutex> lock( store_.data_mutex_ );
            for ( MemoryStore::RequestMap::const_iterator it = requests_.begin(); it != requests_.end(); ++it ) {
                store_.requests_[it->first] = it->second;
            }
            for ( MemoryStore::VehicleMap::const_iterator it = vehicles_.begin(); it != vehicles_.end(); ++it ) {
                store_.vehicles_[it->first] = it->second;
            }
            for ( MemoryStore::TripMap::const_iterator it = trips_.begin(); it != trips_.end(); ++it ) {
                store_.trips_[it->first] = it->second;
            }
            store_.commits_++;
        }
        finish();
    }

    virtual void rollback()
    {
        check_running();
        finish();
    }

private:
    void check_running() const
    {
        if ( done_ ) {
            throw std::runtime_error( "Transaction already finished" );
        }
    }

    void finish()
    {
        requests_.clear();
        vehicles_.clear();
        trips_.clear();
        done_ = true;
        lock_.unlock();
    }

    MemoryStore& store_;
    boost::unique_lock<boost::mutex> lock_;
    bool done_;

    // staged writes
    MemoryStore::RequestMap requests_;
    MemoryStore::VehicleMap vehicles_;
    MemoryStore::TripMap trips_;
};

MemoryStore::MemoryStore() :
    next_request_id_( 1 ),
    next_vehicle_id_( 1 ),
    next_trip_id_( 1 ),
    commits_( 0 )
{
}

MemoryStore::~MemoryStore()
{
}

std::unique_ptr<Transaction> MemoryStore::begin()
{
    return std::unique_ptr<Transaction>( new MemoryTransaction( *this ) );
}

db_id_t MemoryStore::insert_request( const RideRequest& request )
{
    boost::lock_guard<boost::mutex> lock( data_mutex_ );
    const db_id_t id = next_request_id_++;
    RideRequest r( request );
    r.set_db_id( id );
    r.set_version( 1 );
    requests_[id] = r;
    return id;
}

boost::optional<RideRequest> MemoryStore::request( db_id_t id )
{
    boost::lock_guard<boost::mutex> lock( data_mutex_ );
    RequestMap::const_iterator it = requests_.find( id );
    if ( it == requests_.end() ) {
        return boost::optional<RideRequest>();
    }
    return it->second;
}

RideRequestList MemoryStore::pending_requests_near( const Location& center, double radius_km, const DateTime& since, size_t limit )
{
    RideRequestList found;
    {
        boost::lock_guard<boost::mutex> lock( data_mutex_ );
        for ( RequestMap::const_iterator it = requests_.begin(); it != requests_.end(); ++it ) {
            const RideRequest& r = it->second;
            if ( r.status() == StatusPending && r.requested_at() > since && distance( center, r.pickup() ) <= radius_km ) {
                found.push_back( r );
            }
        }
    }
    std::sort( found.begin(), found.end(), more_recent );
    if ( found.size() > limit ) {
        found.resize( limit );
    }
    return found;
}

int64_t MemoryStore::count_pending_requests()
{
    boost::lock_guard<boost::mutex> lock( data_mutex_ );
    int64_t n = 0;
    for ( RequestMap::const_iterator it = requests_.begin(); it != requests_.end(); ++it ) {
        if ( it->second.status() == StatusPending ) {
            n++;
        }
    }
    return n;
}

int64_t MemoryStore::count_available_vehicles()
{
    boost::lock_guard<boost::mutex> lock( data_mutex_ );
    int64_t n = 0;
    for ( VehicleMap::const_iterator it = vehicles_.begin(); it != vehicles_.end(); ++it ) {
        if ( it->second.available() ) {
            n++;
        }
    }
    return n;
}

db_id_t MemoryStore::insert_vehicle( const Vehicle& vehicle )
{
    boost::lock_guard<boost::mutex> lock( data_mutex_ );
    const db_id_t id = next_vehicle_id_++;
    Vehicle v( vehicle );
    v.set_db_id( id );
    v.set_version( 1 );
    vehicles_[id] = v;
    return id;
}

boost::optional<Vehicle> MemoryStore::vehicle( db_id_t id )
{
    boost::lock_guard<boost::mutex> lock( data_mutex_ );
    VehicleMap::const_iterator it = vehicles_.find( id );
    if ( it == vehicles_.end() ) {
        return boost::optional<Vehicle>();
    }
    return it->second;
}

boost::optional<Trip> MemoryStore::trip( db_id_t id )
{
    boost::lock_guard<boost::mutex> lock( data_mutex_ );
    TripMap::const_iterator it = trips_.find( id );
    if ( it == trips_.end() ) {
        return boost::optional<Trip>();
    }
    return it->second;
}

std::vector<db_id_t> MemoryStore::expired_trips( const DateTime& now )
{
    boost::lock_guard<boost::mutex> lock( data_mutex_ );
    std::vector<db_id_t> ids;
    for ( TripMap::const_iterator it = trips_.begin(); it != trips_.end(); ++it ) {
        const Trip& t = it->second;
        if ( t.status() != StatusConfirmed && t.status() != StatusInProgress ) {
            continue;
        }
        if ( t.created_at() + boost::posix_time::minutes( t.estimated_duration() ) < now ) {
            ids.push_back( it->first );
        }
    }
    return ids;
}

size_t MemoryStore::commits() const
{
    boost::lock_guard<boost::mutex> lock( data_mutex_ );
    return commits_;
}

}
