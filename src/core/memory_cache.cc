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

#include "memory_cache.hh"

namespace Rideshare {

const size_t MemoryCache::PURGE_PERIOD;

MemoryCache::MemoryCache( Clock clock ) : clock_( clock ), writes_( 0 )
{
}

DateTime MemoryCache::now() const
{
    return clock_ ? clock_() : now_utc();
}

MemoryCache::EntryMap::iterator MemoryCache::find_live( const std::string& key )
{
    EntryMap::iterator it = entries_.find( key );
    if ( it != entries_.end() && it->second.expires_at <= now() ) {
        entries_.erase( it );
        return entries_.end();
    }
    return it;
}

size_t MemoryCache::purge_locked()
{
    const DateTime t = now();
    size_t n = 0;
    EntryMap::iterator it = entries_.begin();
    while ( it != entries_.end() ) {
        if ( it->second.expires_at <= t ) {
            entries_.erase( it++ );
            n++;
        }
        else {
            ++it;
        }
    }
    return n;
}

void MemoryCache::store_locked( const std::string& key, const std::string& value, int ttl_s )
{
    if ( ++writes_ % PURGE_PERIOD == 0 ) {
        purge_locked();
    }
    Entry& e = entries_[key];
    e.value = value;
    e.expires_at = now() + boost::posix_time::seconds( ttl_s );
}

boost::optional<std::string> MemoryCache::get( const std::string& key )
{
    boost::lock_guard<boost::mutex> lock( mutex_ );
    EntryMap::iterator it = find_live( key );
    if ( it == entries_.end() ) {
        return boost::optional<std::string>();
    }
    return it->second.value;
}

void MemoryCache::set( const std::string& key, const std::string& value, int ttl_s )
{
    boost::lock_guard<boost::mutex> lock( mutex_ );
    store_locked( key, value, ttl_s );
}

bool MemoryCache::set_if_absent( const std::string& key, const std::string& value, int ttl_s )
{
    boost::lock_guard<boost::mutex> lock( mutex_ );
    if ( find_live( key ) != entries_.end() ) {
        return false;
    }
    store_locked( key, value, ttl_s );
    return true;
}

void MemoryCache::remove( const std::string& key )
{
    boost::lock_guard<boost::mutex> lock( mutex_ );
    entries_.erase( key );
}

bool MemoryCache::remove_if_equal( const std::string& key, const std::string& value )
{
    boost::lock_guard<boost::mutex> lock( mutex_ );
    EntryMap::iterator it = find_live( key );
    if ( it == entries_.end() || it->second.value != value ) {
        return false;
    }
    entries_.erase( it );
    return true;
}

size_t MemoryCache::purge()
{
    boost::lock_guard<boost::mutex> lock( mutex_ );
    return purge_locked();
}

size_t MemoryCache::size() const
{
    boost::lock_guard<boost::mutex> lock( mutex_ );
    return entries_.size();
}

}
