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

#include <stdexcept>

#include "match_gate.hh"

namespace Rideshare {

MatchGate::MatchGate( size_t capacity ) :
    capacity_( capacity ),
    in_flight_( 0 ),
    next_ticket_( 0 ),
    now_serving_( 0 )
{
    if ( capacity_ == 0 ) {
        throw std::invalid_argument( "The capacity of a gate must be positive" );
    }
}

void MatchGate::acquire()
{
    boost::unique_lock<boost::mutex> lock( mutex_ );
    const unsigned long long ticket = next_ticket_++;
    while ( ticket != now_serving_ || in_flight_ >= capacity_ ) {
        cond_.wait( lock );
    }
    now_serving_++;
    in_flight_++;
    // the next ticket may be admitted as well
    cond_.notify_all();
}

void MatchGate::release()
{
    {
        boost::lock_guard<boost::mutex> lock( mutex_ );
        in_flight_--;
    }
    cond_.notify_all();
}

size_t MatchGate::in_flight() const
{
    boost::lock_guard<boost::mutex> lock( mutex_ );
    return in_flight_;
}

size_t MatchGate::waiting() const
{
    boost::lock_guard<boost::mutex> lock( mutex_ );
    return size_t( next_ticket_ - now_serving_ );
}

MatchGate::Slot::Slot( MatchGate& gate ) : gate_( gate )
{
    gate_.acquire();
}

MatchGate::Slot::~Slot()
{
    gate_.release();
}

}
