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

//
// This file contains common declarations and constants used by all the objects inside the "Rideshare" namespace
//

#ifndef RIDESHARE_COMMON_HH
#define RIDESHARE_COMMON_HH

#include <map>
#include <string>
#include <functional>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <typeinfo>
#include <boost/date_time.hpp>
#include <boost/thread.hpp>

///
/// @brief Macro for mutex protected cerr and cout
/// @detailled Macro creates a temporary responsible
/// for freeing the mutex at the end of the line (temporaries are destroyed at the ";")
/// the use of a macro allows to print __FILE__ and __LINE__ to
/// find easilly where a given print is done.
///

#define IOSTREAM_OUTPUT_LOCATION
#ifdef IOSTREAM_OUTPUT_LOCATION
#   define RIDESHARE_LOCATION __FILE__ << ":" << __LINE__ << " "
#else
#   define RIDESHARE_LOCATION ""
#endif

#define CERR if(1) (boost::lock_guard<boost::mutex>( Rideshare::iostream_mutex ), std::cerr << RIDESHARE_LOCATION )
#define COUT if(1) (boost::lock_guard<boost::mutex>( Rideshare::iostream_mutex ), std::cout << RIDESHARE_LOCATION )

///
/// @mainpage Rideshare API
///
/// Rideshare assigns transportation requests to shared vehicle trips.
///
/// Main classes are:
/// - Rideshare::RideRequest, Rideshare::Vehicle and Rideshare::Trip, the persisted entities
/// - Rideshare::RouteOptimizer, which orders pickups and dropoffs of a small group
/// - Rideshare::PricingEngine, the fare and surge formulas
/// - Rideshare::MatchingEngine, which builds and ranks candidate trips for a request
/// - Rideshare::Coordinator, which owns every state transition and the booking transactions
///
/// Durable state lives behind the Rideshare::Store interface (PostgreSQL or in-memory),
/// volatile state behind the Rideshare::Cache interface.
///

namespace Rideshare {
extern boost::mutex iostream_mutex; // its a plain old global variable

// because boost::lexical_cast calls locale, which is not thread safe
struct bad_lexical_cast : public std::exception {
    bad_lexical_cast( const std::string& msg ) : std::exception(), msg_( msg ) {}
    virtual const char* what() const throw() {
        return msg_.c_str();
    }
    virtual ~bad_lexical_cast() throw() {}
    std::string msg_;
};
template <typename TOUT>
struct lexical_cast_aux_ {
    TOUT operator()( const std::string& in ) {
        TOUT out;

        if( !( std::istringstream( in ) >> out ) ) {
            throw bad_lexical_cast( "cannot cast " + in + " to " + typeid( TOUT ).name() );
        }

        return out;
    }
};
template <>
struct lexical_cast_aux_<std::string> {
    std::string operator()( const std::string& in ) {
        return in;
    }
};

template <typename TOUT>
TOUT lexical_cast( const std::string& in )
{
    return lexical_cast_aux_<TOUT>()( in );
}

template <typename TIN>
std::string to_string( const TIN& in )
{
    std::stringstream ss;
    ss << in;
    return ss.str();
}

///
/// Type used inside the DB to store IDs.
/// O means NULL.
///
typedef unsigned long long int db_id_t;

#ifndef NDEBUG
///
/// Assertion, will throw if the condition is false
#define REQUIRE( expr ) {if (!(expr)) { std::stringstream ss; ss << __FILE__ << ":" << __LINE__ << ": Assertion " << #expr << " failed"; throw std::invalid_argument( ss.str() ); }}
#else
#define REQUIRE( expr ) ((void)0)
#endif


template <typename T>
struct remove_const
{
    typedef T type;
};
template <typename T>
struct remove_const<T const>
{
    typedef T type;
};

///
/// Macro used to declare a class property as well as its getter and setter
#define DECLARE_RW_PROPERTY(NAME, TYPE)                \
private:                                               \
  TYPE NAME ## _;                                      \
public:                                                \
  const remove_const<TYPE>::type& NAME() const { return NAME ## _; } \
  void set_##NAME( const remove_const<TYPE>::type& a ) { NAME ## _ = a; }

class Base
{
public:
    Base() : db_id_(0), version_(1) {}
    explicit Base( db_id_t id ) : db_id_(id), version_(1) {}
    db_id_t db_id() const { return db_id_; }
    void    set_db_id( const db_id_t& id ) { db_id_ = id; }

    ///
    /// Optimistic concurrency counter, incremented by the store on each versioned update
    int64_t version() const { return version_; }
    void    set_version( int64_t v ) { version_ = v; }

private:
    ///
    /// Persistant ID relative to the storage database.
    /// Common to many classes.
    db_id_t db_id_;
    int64_t version_;
};

///
/// DateTime stores a date and a time
typedef boost::posix_time::ptime DateTime;

///
/// Current UTC time, second resolution
DateTime now_utc();

///
/// Function returning the current time
typedef std::function<DateTime ()> Clock;

///
/// Lifecycle status shared by requests and trips
enum RideStatus {
    StatusPending,
    StatusMatched,
    StatusConfirmed,
    StatusInProgress,
    StatusCompleted,
    StatusCancelled
};

///
/// Returns the name of a status, as stored in the database
std::string status_name( RideStatus status );

///
/// Parses a status name
/// @throws std::invalid_argument on an unknown name
RideStatus status_from_name( const std::string& name );

///
/// COMPLETED and CANCELLED are terminal
bool is_terminal( RideStatus status );

} // Rideshare namespace

#endif
