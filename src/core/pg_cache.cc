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

#include "pg_cache.hh"

namespace Rideshare {

PgCache::PgCache( Db::ConnectionPool& pool ) : pool_( pool )
{
}

boost::optional<std::string> PgCache::get( const std::string& key )
{
    std::unique_ptr<Db::ConnectionPool::Handle> h( pool_.acquire() );
    Db::Result res( ( *h )->exec( "SELECT value FROM cache_entries WHERE key = $1 AND expires_at > clock_timestamp()",
                                  Db::Params( 1, key ) ) );
    if ( res.size() == 0 ) {
        return boost::optional<std::string>();
    }
    return res[0][0].as<std::string>();
}

void PgCache::set( const std::string& key, const std::string& value, int ttl_s )
{
    Db::Params p;
    p.push_back( key );
    p.push_back( value );
    p.push_back( to_string( ttl_s ) );
    std::unique_ptr<Db::ConnectionPool::Handle> h( pool_.acquire() );
    ( *h )->exec( "INSERT INTO cache_entries (key, value, expires_at) "
                  "VALUES ($1, $2, clock_timestamp() + $3::integer * interval '1 second') "
                  "ON CONFLICT (key) DO UPDATE SET value = EXCLUDED.value, expires_at = EXCLUDED.expires_at", p );
}

bool PgCache::set_if_absent( const std::string& key, const std::string& value, int ttl_s )
{
    Db::Params p;
    p.push_back( key );
    p.push_back( value );
    p.push_back( to_string( ttl_s ) );
    std::unique_ptr<Db::ConnectionPool::Handle> h( pool_.acquire() );
    // an expired entry is replaced, a live one is kept
    Db::Result res( ( *h )->exec( "INSERT INTO cache_entries (key, value, expires_at) "
                                  "VALUES ($1, $2, clock_timestamp() + $3::integer * interval '1 second') "
                                  "ON CONFLICT (key) DO UPDATE SET value = EXCLUDED.value, expires_at = EXCLUDED.expires_at "
                                  "WHERE cache_entries.expires_at <= clock_timestamp() "
                                  "RETURNING key", p ) );
    return res.size() == 1;
}

void PgCache::remove( const std::string& key )
{
    std::unique_ptr<Db::ConnectionPool::Handle> h( pool_.acquire() );
    ( *h )->exec( "DELETE FROM cache_entries WHERE key = $1", Db::Params( 1, key ) );
}

bool PgCache::remove_if_equal( const std::string& key, const std::string& value )
{
    Db::Params p;
    p.push_back( key );
    p.push_back( value );
    std::unique_ptr<Db::ConnectionPool::Handle> h( pool_.acquire() );
    Db::Result res( ( *h )->exec( "DELETE FROM cache_entries WHERE key = $1 AND value = $2 AND expires_at > clock_timestamp()", p ) );
    return res.affected_rows() == 1;
}

size_t PgCache::purge()
{
    std::unique_ptr<Db::ConnectionPool::Handle> h( pool_.acquire() );
    Db::Result res( ( *h )->exec( "DELETE FROM cache_entries WHERE expires_at <= clock_timestamp()" ) );
    return res.affected_rows();
}

}
