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

#ifndef RIDESHARE_ERRORS_HH
#define RIDESHARE_ERRORS_HH

/**
   Exceptions raised by the coordinator.

   * ValidationError: the input is malformed, retrying will not help
   * ConflictError and its subclasses: expected concurrent conditions, the caller may retry
   * NotFoundError: unknown identifier

   Database and connection problems are reported by the Db layer as std::runtime_error.
 */

#include <string>
#include <stdexcept>

#include "common.hh"

namespace Rideshare {

class ValidationError : public std::invalid_argument
{
public:
    explicit ValidationError( const std::string& msg ) : std::invalid_argument( msg ) {}
};

class ConflictError : public std::runtime_error
{
public:
    explicit ConflictError( const std::string& msg ) : std::runtime_error( msg ) {}
};

///
/// Another match computation holds the lease of the request
class MatchingInProgress : public ConflictError
{
public:
    explicit MatchingInProgress( db_id_t request_id )
        : ConflictError( "Matching already in progress for request " + to_string( request_id ) + ", please retry" ) {}
};

class NoVehicleAvailable : public ConflictError
{
public:
    NoVehicleAvailable() : ConflictError( "No available vehicles at the moment" ) {}
};

///
/// An optimistic version check failed
class StaleVersion : public ConflictError
{
public:
    explicit StaleVersion( const std::string& what_ ) : ConflictError( "Stale version on " + what_ ) {}
};

///
/// The entity is not in a status allowing the operation
class InvalidTransition : public ConflictError
{
public:
    explicit InvalidTransition( const std::string& msg ) : ConflictError( msg ) {}
};

class NotFoundError : public std::out_of_range
{
public:
    NotFoundError( const std::string& entity, db_id_t id )
        : std::out_of_range( entity + " " + to_string( id ) + " not found" ) {}
};

} // Rideshare namespace

#endif
