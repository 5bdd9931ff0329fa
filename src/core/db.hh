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

#ifndef RIDESHARE_DB_HH
#define RIDESHARE_DB_HH

/**
   Database access is modeled by means of the following classes, inspired by pqxx:
   * A Db::Connection objet represents a connection to a database.
   * A Db::ConnectionPool owns a bounded set of connections, lent through Db::ConnectionPool::Handle objects.
   * A Db::Result objet represents result of a query. It is only movable.
   * A Db::RowValue object represents a row of a result and is obtained by Db::Result::operator[]
   * A Db::Value object represent a basic value. It is obtained by Db::RowValue::operator[]. It has templated conversion operators for common data types.

   These classes throw std::runtime_error on problem.
 */

#include <memory>
#include <string>
#include <vector>
#include <stdexcept>

#include <boost/assert.hpp>
#include <boost/noncopyable.hpp>
#include <boost/thread.hpp>

#include "common.hh"

struct pg_result;
struct pg_conn;

namespace Db {
///
/// Class representing an atomic value stored in a database.
class Value {
public:
    Value( const char* value, size_t len ) : value_( value ), len_( len ) {
    }

    ///
    /// This is the generic conversion operator.
    /// It calls stringstream conversion operators (slow!).
    /// Specialization can be introduced, or via a specialization of the stringstream::operator>>()
    template <class T>
    T as() const {
        T obj;
        std::istringstream istr( value_ );
        istr >> obj;
        return obj;
    }
protected:
    const char* value_;
    size_t len_;
};

//
// List of conversion specializations
template <>
bool Value::as<bool>() const;
template <>
std::string Value::as<std::string>() const;
template <>
Rideshare::DateTime Value::as<Rideshare::DateTime>() const;
template <>
long long Value::as<long long>() const;
template <>
unsigned long long Value::as<unsigned long long>() const;
template <>
int Value::as<int>() const;
template <>
double Value::as<double>() const;
template <>
std::vector<int> Value::as<std::vector<int> >() const;

///
/// Class used to represent a row in a result.
class RowValue {
public:
    RowValue( pg_result* res, size_t nrow );

    ///
    /// Access to a value by column number
    Value operator [] ( size_t fn ) const;

protected:
    pg_result* res_;
    size_t nrow_;
};

///
/// Class representing result of a query
class Result {
public:
    Result( pg_result* res );

    // Result is only movable
    Result( Result&& other );
    Result& operator=( Result&& other );

    ~Result();

    ///
    /// Number of rows
    size_t size() const;

    ///
    /// Number of rows touched by an UPDATE, INSERT or DELETE
    size_t affected_rows() const;

    ///
    /// Access to a row of a result, by row number
    RowValue operator [] ( size_t idx ) const;

protected:
    pg_result* res_;
private:
    // non copyable
    Result( const Result& other );
    Result& operator=( const Result& );
};

///
/// Positional parameters of a query ($1, $2, ...), in text format
typedef std::vector<std::string> Params;

///
/// Formats a timestamp the way PostgreSQL reads it
std::string to_db_string( const Rideshare::DateTime& t );

///
/// Formats a floating point value without loss
std::string to_db_string( double v );

///
/// Formats an integer array literal, '{1,2,3}'
std::string to_db_array( const std::vector<int>& v );

///
/// Class representing connection to a database.
class Connection: boost::noncopyable {
public:
    Connection();
    Connection( const std::string& db_options );
    ~Connection();

    void connect( const std::string& db_options );

    ///
    /// Query execution. Returns a Db::Result. Throws a std::runtime_error on problem
    Result exec( const std::string& query );

    ///
    /// Query execution with positional parameters. Throws a std::runtime_error on problem
    Result exec( const std::string& query, const Params& params );

    ///
    /// Is the connection still usable ?
    bool is_ok() const;

protected:
    pg_conn* conn_;
    static boost::mutex mutex;
};

///
/// A bounded set of connections to the same database.
/// Connections are opened on demand, up to the pool size, and a caller waits when they are all lent.
class ConnectionPool: boost::noncopyable {
public:
    ConnectionPool( const std::string& db_options, size_t size );

    ///
    /// A connection lent by the pool, given back on destruction
    class Handle: boost::noncopyable {
    public:
        Handle( ConnectionPool& pool, std::unique_ptr<Connection> conn );
        ~Handle();
        Connection& operator*() { return *conn_; }
        Connection* operator->() { return conn_.get(); }
    private:
        ConnectionPool& pool_;
        std::unique_ptr<Connection> conn_;
    };

    ///
    /// Borrows a connection, waits if none is available
    /// @throws std::runtime_error if a new connection cannot be opened
    std::unique_ptr<Handle> acquire();

    const std::string& db_options() const { return db_options_; }
    size_t size() const { return size_; }

private:
    void release( std::unique_ptr<Connection> conn );

    std::string db_options_;
    size_t size_;
    size_t opened_;
    std::vector<std::unique_ptr<Connection> > idle_;
    boost::mutex mutex_;
    boost::condition_variable available_;
};
}

#endif
