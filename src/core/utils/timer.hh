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

#ifndef RIDESHARE_UTILS_TIMER_HH
#define RIDESHARE_UTILS_TIMER_HH

#include <chrono>

namespace Rideshare {

///
/// Wall clock stopwatch, started on construction
class Timer
{
public:
    Timer()
    {
        restart();
    }

    void restart()
    {
        t_start_ = std::chrono::steady_clock::now();
    }

    ///
    /// Elapsed number of milliseconds since construction or the last restart
    double elapsed_ms() const
    {
        const std::chrono::steady_clock::duration d = std::chrono::steady_clock::now() - t_start_;
        return std::chrono::duration_cast<std::chrono::microseconds>( d ).count() / 1000.0;
    }
private:
    std::chrono::steady_clock::time_point t_start_;
};

}

#endif
