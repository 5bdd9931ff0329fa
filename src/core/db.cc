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

#include <stdio.h>
#include <stdlib.h>
#include <iostream>

#include "db.hh"

#include <libpq-fe.h>

namespace Db {
boost::mutex Connection::mutex;

template <>
bool Value::as<bool>() const
{
    return std::string( value_, len_ ) == "t" ? true : false;
}

template <>
std::string Value::as<std::string>() const
{
    return std::string( value_, len_ );
}

template <>
Rideshare::DateTime Value::as<Rideshare::DateTime>() const
{
    // 'YYYY-MM-DD HH:MM:SS[.ffffff]'
    return boost::posix_time::time_from_string( std::string( value_, len_ ) );
}

template <>
long long Value::as<long long>() const
{
    long long v = 0;
    sscanf( value_, "%lld", &v );
    return v;
}
template <>
unsigned long long Value::as<unsigned long long>() const
{
    unsigned long long v = 0;
    sscanf( value_, "%llu", &v );
    return v;
}
template <>
int Value::as<int>() const
{
    int v = 0;
    sscanf( value_, "%d", &v );
    return v;
}
template <>
double Value::as<double>() const
{
    double v = 0.0;
    sscanf( value_, "%lf", &v );
    return v;
}

template <>
std::vector<int> Value::as< std::vector<int> >() const
{
    std::vector<int> res;
    std::string array_str( value_, len_ );
    if ( array_str.size() < 2 ) {
        return res;
    }
    // trim '{}'
    std::istringstream array_sub( array_str.substr( 1, array_str.size()-2 ) );

    // parse each array element
    std::string n_str;
    while ( std::getline( array_sub, n_str, ',' ) ) {
        res.push_back( atoi( n_str.c_str() ) );
    }
    return res;
}

std::string to_db_string( const Rideshare::DateTime& t )
{
    return boost::posix_time::to_iso_extended_string( t );
}

std::string to_db_string( double v )
{
    std::ostringstream ostr;
    ostr.precision( 17 );
    ostr << v;
    return ostr.str();
}

std::string to_db_array( const std::vector<int>& v )
{
    std::ostringstream ostr;
    ostr << "{";
    for ( size_t i = 0; i < v.size(); i++ ) {
        ostr << ( i ? "," : "" ) << v[i];
    }
    ostr << "}";
    return ostr.str();
}

RowValue::RowValue( pg_result* res, size_t nrow )
    : res_( res ), nrow_( nrow )
{
}

///
/// Access to a value by column number
Value RowValue::operator [] ( size_t fn ) const {
    BOOST_ASSERT( fn < ( size_t )PQnfields( res_ ) );
    return Value( PQgetvalue( res_, nrow_, fn ),
                  ( size_t )PQgetlength( res_, nrow_, fn ) );
}

Result::Result( pg_result* res ) : res_( res )
{
    BOOST_ASSERT( res_ );
}

Result::Result( Result&& other )
{
    res_ = other.res_;
    other.res_ = 0;
}

Result& Result::operator=( Result&& other )
{
    if ( res_ && res_ != other.res_ ) {
        PQclear( res_ );
    }
    res_ = other.res_;
    other.res_ = 0;
    return *this;
}

Result::~Result()
{
    if ( res_ ) {
        PQclear( res_ );
    }
}

size_t Result::size() const
{
    return PQntuples( res_ );
}

size_t Result::affected_rows() const
{
    const char* n = PQcmdTuples( res_ );
    return ( n && *n ) ? strtoul( n, 0, 10 ) : 0;
}

RowValue Result::operator [] ( size_t idx ) const
{
    BOOST_ASSERT( idx < size() );
    return RowValue( res_, idx );
}

Connection::Connection()
    : conn_( 0 )
{
}

Connection::Connection( const std::string& db_options )
    : conn_( 0 )
{
    connect( db_options );
}

void Connection::connect( const std::string& db_options )
{
    boost::lock_guard<boost::mutex> lock( mutex );
    conn_ = PQconnectdb( db_options.c_str() );

    if ( conn_ == NULL || PQstatus( conn_ ) != CONNECTION_OK ) {
        std::string msg = "Database connection problem: ";
        msg += PQerrorMessage( conn_ );
        PQfinish( conn_ ); // otherwise leak
        conn_ = 0;
        throw std::runtime_error( msg.c_str() );
    }
}

Connection::~Connection()
{
    if ( conn_ ) {
        PQfinish( conn_ );
    }
}

bool Connection::is_ok() const
{
    return conn_ != 0 && PQstatus( conn_ ) == CONNECTION_OK;
}

namespace {
Result check_result( pg_result* res )
{
    ExecStatusType ret = PQresultStatus( res );

    if ( ( ret != PGRES_COMMAND_OK ) && ( ret != PGRES_TUPLES_OK ) ) {
        std::string msg = "Problem on database query: ";
        msg += PQresultErrorMessage( res );
        PQclear( res );
        throw std::runtime_error( msg.c_str() );
    }
    return Result( res );
}
}

Result Connection::exec( const std::string& query )
{
    if ( !conn_ ) {
        throw std::runtime_error( "Not connected to a database" );
    }
    return check_result( PQexec( conn_, query.c_str() ) );
}

Result Connection::exec( const std::string& query, const Params& params )
{
    if ( !conn_ ) {
        throw std::runtime_error( "Not connected to a database" );
    }
    std::vector<const char*> values( params.size() );
    for ( size_t i = 0; i < params.size(); i++ ) {
        values[i] = params[i].c_str();
    }
    pg_result* res = PQexecParams( conn_, query.c_str(), int( params.size() ),
                                   /* types */ NULL,
                                   values.empty() ? NULL : &values[0],
                                   /* lengths */ NULL,
                                   /* formats */ NULL,
                                   /* text result */ 0 );
    return check_result( res );
}

ConnectionPool::ConnectionPool( const std::string& db_options, size_t size )
    : db_options_( db_options ), size_( size ? size : 1 ), opened_( 0 )
{
}

ConnectionPool::Handle::Handle( ConnectionPool& pool, std::unique_ptr<Connection> conn )
    : pool_( pool ), conn_( std::move( conn ) )
{
}

ConnectionPool::Handle::~Handle()
{
    pool_.release( std::move( conn_ ) );
}

std::unique_ptr<ConnectionPool::Handle> ConnectionPool::acquire()
{
    boost::unique_lock<boost::mutex> lock( mutex_ );
    while ( idle_.empty() && opened_ >= size_ ) {
        available_.wait( lock );
    }

    if ( !idle_.empty() ) {
        std::unique_ptr<Connection> conn( std::move( idle_.back() ) );
        idle_.pop_back();
        return std::unique_ptr<Handle>( new Handle( *this, std::move( conn ) ) );
    }

    // reserve the slot, then connect without holding the lock
    opened_++;
    lock.unlock();
    std::unique_ptr<Connection> conn;
    try {
        conn.reset( new Connection( db_options_ ) );
    }
    catch ( std::runtime_error& ) {
        lock.lock();
        opened_--;
        available_.notify_one();
        throw;
    }
    return std::unique_ptr<Handle>( new Handle( *this, std::move( conn ) ) );
}

void ConnectionPool::release( std::unique_ptr<Connection> conn )
{
    boost::lock_guard<boost::mutex> lock( mutex_ );
    if ( conn && conn->is_ok() ) {
        idle_.push_back( std::move( conn ) );
    }
    else {
        // broken connection, a new one will be opened on demand
        opened_--;
    }
    available_.notify_one();
}

} // namespace Db
