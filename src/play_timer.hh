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

#ifndef PLAY_TIMER_HH
#define PLAY_TIMER_HH

#include <string>

#include "monotonic_clock.hh"

namespace Selection
{

/*!
 * Auto-play of the item the carousel has settled on.
 *
 * At most one item is armed at a time. After firing, the timer remembers
 * the context it has fired for and when, so that the selection is not
 * yanked back and forth while the player catches up.
 */
class PlayTimer
{
  private:
    const Clock::MonotonicIface &clock_;
    const std::chrono::milliseconds delay_;
    const std::chrono::milliseconds cooldown_;

    std::string armed_uri_;
    Clock::TimePoint armed_at_;

    std::string last_played_uri_;
    bool has_fired_;
    Clock::TimePoint last_fired_at_;

  public:
    PlayTimer(const PlayTimer &) = delete;
    PlayTimer &operator=(const PlayTimer &) = delete;

    explicit PlayTimer(const Clock::MonotonicIface &clock,
                       std::chrono::milliseconds delay,
                       std::chrono::milliseconds cooldown):
        clock_(clock),
        delay_(delay),
        cooldown_(cooldown),
        has_fired_(false)
    {}

    /*!
     * Arm timer for given context, no-op if already armed for it.
     */
    void start(const std::string &uri);

    void cancel();

    /*!
     * Check if the timer has expired.
     *
     * \param[out] uri
     *     The context to play if the timer has fired.
     *
     * \returns
     *     True if the timer has fired. It is disarmed in this case.
     */
    bool check(std::string &uri);

    bool is_armed() const { return !armed_uri_.empty(); }
    const std::string &get_armed_uri() const { return armed_uri_; }

    bool is_in_cooldown() const;

    const std::string &get_last_played_uri() const { return last_played_uri_; }
    void clear_last_played_uri() { last_played_uri_.clear(); }
};

}

#endif /* !PLAY_TIMER_HH */
