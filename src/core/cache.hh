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

#ifndef RIDESHARE_CACHE_HH
#define RIDESHARE_CACHE_HH

#include <string>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

namespace Rideshare {

/**
   Volatile key/value store with expiring entries.

   Values are advisory: nothing read from a cache is trusted for a booking decision.
   Every operation is atomic with respect to the others.
*/
class Cache : boost::noncopyable
{
public:
    virtual ~Cache() {}

    ///
    /// Value of a live entry
    virtual boost::optional<std::string> get( const std::string& key ) = 0;

    ///
    /// Creates or replaces an entry, expiring after ttl_s seconds
    virtual void set( const std::string& key, const std::string& value, int ttl_s ) = 0;

    ///
    /// Creates an entry only if there is no live one for this key
    /// @returns true if the entry has been created
    virtual bool set_if_absent( const std::string& key, const std::string& value, int ttl_s ) = 0;

    virtual void remove( const std::string& key ) = 0;

    ///
    /// Removes an entry only if it holds the given value
    /// @returns true if the entry has been removed
    virtual bool remove_if_equal( const std::string& key, const std::string& value ) = 0;

    ///
    /// Deletes the expired entries
    /// @returns the number of entries deleted
    virtual size_t purge() = 0;
};

} // Rideshare namespace

#endif
