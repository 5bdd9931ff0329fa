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

#ifndef RIDESHARE_PG_CACHE_HH
#define RIDESHARE_PG_CACHE_HH

#include "cache.hh"
#include "db.hh"

namespace Rideshare {

/**
   Cache stored in the UNLOGGED table cache_entries, shared by every process
   connected to the same database. Expiry uses the clock of the database server.
*/
class PgCache : public Cache
{
public:
    ///
    /// @param pool connections to use, not owned
    explicit PgCache( Db::ConnectionPool& pool );

    virtual boost::optional<std::string> get( const std::string& key );
    virtual void set( const std::string& key, const std::string& value, int ttl_s );
    virtual bool set_if_absent( const std::string& key, const std::string& value, int ttl_s );
    virtual void remove( const std::string& key );
    virtual bool remove_if_equal( const std::string& key, const std::string& value );
    virtual size_t purge();

private:
    Db::ConnectionPool& pool_;
};

} // Rideshare namespace

#endif
