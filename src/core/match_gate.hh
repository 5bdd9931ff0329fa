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

#ifndef RIDESHARE_MATCH_GATE_HH
#define RIDESHARE_MATCH_GATE_HH

#include <boost/noncopyable.hpp>
#include <boost/thread.hpp>

namespace Rideshare {

/**
   Counting gate bounding the number of match computations running at the same time.

   Callers beyond the capacity wait, and are let in by order of arrival.
*/
class MatchGate : boost::noncopyable
{
public:
    explicit MatchGate( size_t capacity );

    ///
    /// A slot of the gate, held until destruction
    class Slot : boost::noncopyable
    {
    public:
        explicit Slot( MatchGate& gate );
        ~Slot();
    private:
        MatchGate& gate_;
    };

    ///
    /// Blocks until a slot is free and it is the caller's turn
    void acquire();
    void release();

    size_t capacity() const { return capacity_; }

    ///
    /// Number of callers holding a slot
    size_t in_flight() const;

    ///
    /// Number of callers waiting for a slot
    size_t waiting() const;

private:
    const size_t capacity_;
    size_t in_flight_;
    // tickets are served in increasing order
    unsigned long long next_ticket_;
    unsigned long long now_serving_;
    mutable boost::mutex mutex_;
    boost::condition_variable cond_;
};

} // Rideshare namespace

#endif
