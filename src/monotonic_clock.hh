/*
 * Copyright (C) 2026  T+A elektroakustik GmbH & Co. KG
 *
 * This file is part of COVERPLAYD.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA  02110-1301, USA.
 */

#ifndef MONOTONIC_CLOCK_HH
#define MONOTONIC_CLOCK_HH

#include <chrono>

namespace Clock
{

using TimePoint = std::chrono::steady_clock::time_point;

/*!
 * Source of monotonic time stamps.
 *
 * All debounce, cooldown and timeout decisions are taken against this
 * interface so that they can be tested without waiting.
 */
class MonotonicIface
{
  protected:
    explicit MonotonicIface() {}

  public:
    MonotonicIface(const MonotonicIface &) = delete;
    MonotonicIface &operator=(const MonotonicIface &) = delete;

    virtual ~MonotonicIface() {}

    virtual TimePoint now() const = 0;
};

class Monotonic: public MonotonicIface
{
  public:
    Monotonic(const Monotonic &) = delete;
    Monotonic &operator=(const Monotonic &) = delete;

    explicit Monotonic() {}

    TimePoint now() const final override
    {
        return std::chrono::steady_clock::now();
    }
};

template <typename DurationT>
static inline bool has_elapsed(const MonotonicIface &clock,
                               const TimePoint &since, const DurationT &d)
{
    return clock.now() - since >= d;
}

}

#endif /* !MONOTONIC_CLOCK_HH */
