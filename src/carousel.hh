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

#ifndef CAROUSEL_HH
#define CAROUSEL_HH

#include <cstddef>

#include "monotonic_clock.hh"

namespace Selection
{

/*!
 * Where the carousel is heading, and whether it has arrived.
 *
 * The animation itself is done by the renderer, which reports when it has
 * come to rest. In case that report gets lost, the carousel is considered
 * settled after a fixed time.
 */
class Carousel
{
  private:
    const Clock::MonotonicIface &clock_;
    const std::chrono::milliseconds settle_time_;

    size_t target_index_;
    bool is_settled_;
    Clock::TimePoint moved_at_;

  public:
    Carousel(const Carousel &) = delete;
    Carousel &operator=(const Carousel &) = delete;

    explicit Carousel(const Clock::MonotonicIface &clock,
                      std::chrono::milliseconds settle_time):
        clock_(clock),
        settle_time_(settle_time),
        target_index_(0),
        is_settled_(true)
    {}

    void set_target(size_t idx)
    {
        target_index_ = idx;
        is_settled_ = false;
        moved_at_ = clock_.now();
    }

    /*!
     * Renderer reports end of animation.
     *
     * \returns
     *     True if the carousel was moving.
     */
    bool settle()
    {
        if(is_settled_)
            return false;

        is_settled_ = true;
        return true;
    }

    /*!
     * Settle on timeout.
     *
     * \returns
     *     True if the carousel has settled just now.
     */
    bool update()
    {
        if(is_settled_ || !Clock::has_elapsed(clock_, moved_at_, settle_time_))
            return false;

        return settle();
    }

    size_t get_target_index() const { return target_index_; }
    bool is_settled() const { return is_settled_; }
};

}

#endif /* !CAROUSEL_HH */
