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

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "lease.hh"
#include "common.hh"

namespace Rideshare {

std::string random_token()
{
    // the generator is not thread safe
    static boost::mutex mutex;
    static boost::uuids::random_generator gen;
    boost::lock_guard<boost::mutex> lock( mutex );
    return boost::uuids::to_string( gen() );
}

Lease::Lease( Cache& cache, const std::string& key, int ttl_s ) :
    cache_( cache ),
    key_( key ),
    token_( random_token() ),
    ttl_s_( ttl_s ),
    held_( false )
{
}

Lease::~Lease()
{
    if ( !held_ ) {
        return;
    }
    try {
        release();
    }
    catch ( std::exception& e ) {
        // the entry will expire by itself
        CERR << "[WARNING] cannot release lease " << key_ << ": " << e.what() << std::endl;
    }
}

bool Lease::try_acquire()
{
    if ( held_ ) {
        return true;
    }
    held_ = cache_.set_if_absent( key_, token_, ttl_s_ );
    return held_;
}

bool Lease::release()
{
    if ( !held_ ) {
        return false;
    }
    held_ = false;
    return cache_.remove_if_equal( key_, token_ );
}

}
