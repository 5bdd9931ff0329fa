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

#include "common.hh"

namespace Rideshare {

boost::mutex iostream_mutex;

DateTime now_utc()
{
    return boost::posix_time::second_clock::universal_time();
}

std::string status_name( RideStatus status )
{
    switch ( status ) {
    case StatusPending:
        return "PENDING";
    case StatusMatched:
        return "MATCHED";
    case StatusConfirmed:
        return "CONFIRMED";
    case StatusInProgress:
        return "IN_PROGRESS";
    case StatusCompleted:
        return "COMPLETED";
    case StatusCancelled:
        return "CANCELLED";
    }
    return "?";
}

RideStatus status_from_name( const std::string& name )
{
    if ( name == "PENDING" ) {
        return StatusPending;
    }
    if ( name == "MATCHED" ) {
        return StatusMatched;
    }
    if ( name == "CONFIRMED" ) {
        return StatusConfirmed;
    }
    if ( name == "IN_PROGRESS" ) {
        return StatusInProgress;
    }
    if ( name == "COMPLETED" ) {
        return StatusCompleted;
    }
    if ( name == "CANCELLED" ) {
        return StatusCancelled;
    }
    throw std::invalid_argument( "Unknown status " + name );
}

bool is_terminal( RideStatus status )
{
    return status == StatusCompleted || status == StatusCancelled;
}

}
