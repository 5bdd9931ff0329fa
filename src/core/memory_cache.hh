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

#ifndef RIDESHARE_MEMORY_CACHE_HH
#define RIDESHARE_MEMORY_CACHE_HH

#include <map>

#include <boost/thread.hpp>

#include "common.hh"
#include "cache.hh"

namespace Rideshare {

///
/// In-process cache. Expired entries are dropped when they are accessed,
/// and all of them every PURGE_PERIOD writes.
class MemoryCache : public Cache
{
public:
    ///
    /// @param clock time source used for expiry, now_utc() if empty
    explicit MemoryCache( Clock clock = Clock() );

    virtual boost::optional<std::string> get( const std::string& key );
    virtual void set( const std::string& key, const std::string& value, int ttl_s );
    virtual bool set_if_absent( const std::string& key, const std::string& value, int ttl_s );
    virtual void remove( const std::string& key );
    virtual bool remove_if_equal( const std::string& key, const std::string& value );
    virtual size_t purge();

    static const size_t PURGE_PERIOD = 256;

    ///
    /// Number of entries, expired ones included
    size_t size() const;

private:
    struct Entry {
        std::string value;
        DateTime expires_at;
    };
    typedef std::map<std::string, Entry> EntryMap;

    DateTime now() const;
    // live entry or end(), drops the entry if expired
    EntryMap::iterator find_live( const std::string& key );
    size_t purge_locked();
    void store_locked( const std::string& key, const std::string& value, int ttl_s );

    Clock clock_;
    EntryMap entries_;
    size_t writes_;
    mutable boost::mutex mutex_;
};

} // Rideshare namespace

#endif
