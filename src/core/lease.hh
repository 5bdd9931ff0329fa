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

#ifndef RIDESHARE_LEASE_HH
#define RIDESHARE_LEASE_HH

#include <string>

#include <boost/noncopyable.hpp>

#include "cache.hh"

namespace Rideshare {

/**
   Short lived mutual exclusion marker stored in a cache.

   The lease is taken with an atomic set-if-absent of a random token, and given back
   with a compare-and-delete on that token, so that a lease reclaimed by expiry and
   taken by someone else is never released by its former holder.
*/
class Lease : boost::noncopyable
{
public:
    Lease( Cache& cache, const std::string& key, int ttl_s );

    ///
    /// Releases the lease if it is still held
    ~Lease();

    ///
    /// Tries to take the lease, does not block
    /// @returns true if the lease is now held by this object
    bool try_acquire();

    ///
    /// @returns false if the lease had expired, or was not held
    bool release();

    bool held() const { return held_; }
    const std::string& key() const { return key_; }
    const std::string& token() const { return token_; }

private:
    Cache& cache_;
    std::string key_;
    std::string token_;
    int ttl_s_;
    bool held_;
};

///
/// Random token, an UUID string
std::string random_token();

} // Rideshare namespace

#endif
