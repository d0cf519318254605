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

#ifndef SLEEP_MANAGER_HH
#define SLEEP_MANAGER_HH

#include <functional>

#include "system_control.hh"
#include "async_executor.hh"
#include "monotonic_clock.hh"

namespace Sleep
{

/*!
 * Screen sleep after inactivity.
 *
 * The backlight is turned off when nothing has been played and nobody has
 * touched the screen for a while. Owned by the main loop.
 */
class Manager
{
  public:
    using WakeFn = std::function<void()>;

  private:
    const Clock::MonotonicIface &clock_;
    SystemControl::Iface &system_;
    Async::ExecutorIface &executor_;
    const std::chrono::milliseconds timeout_;
    WakeFn on_wake_;

    bool is_sleeping_;
    Clock::TimePoint last_activity_;

  public:
    Manager(const Manager &) = delete;
    Manager &operator=(const Manager &) = delete;

    explicit Manager(const Clock::MonotonicIface &clock,
                     SystemControl::Iface &system,
                     Async::ExecutorIface &executor,
                     std::chrono::milliseconds timeout, WakeFn &&on_wake):
        clock_(clock),
        system_(system),
        executor_(executor),
        timeout_(timeout),
        on_wake_(std::move(on_wake)),
        is_sleeping_(false),
        last_activity_(clock.now())
    {}

    /*!
     * Turn on backlight in case we went down while sleeping.
     */
    void init();

    /*!
     * User activity, wakes up if sleeping.
     */
    void reset_timer();

    /*!
     * Enter sleep mode if inactive for too long.
     *
     * \returns
     *     True if sleeping.
     */
    bool check(bool is_playing);

    void enter_sleep();
    void wake_up();

    bool is_sleeping() const { return is_sleeping_; }

  private:
    void set_backlight(bool is_on);
};

}

#endif /* !SLEEP_MANAGER_HH */
