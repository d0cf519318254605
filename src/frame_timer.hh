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
#ifndef FRAME_TIMER_HH
#define FRAME_TIMER_HH

#include <functional>
#include <chrono>
#include <cstdint>

namespace UI
{

/*!
 * Drives the frame loop of the user interface from the GLib main loop.
 *
 * The frame function returns the interval until the next frame. The
 * underlying GLib source is only replaced when that interval changes, so
 * a steady animation keeps a single source for its whole duration.
 */
class FrameTimer
{
  public:
    /*!
     * Type of the function called for each frame.
     *
     * \retval std::chrono::milliseconds::zero()
     *         Keep the current frame interval.
     * \retval t  Frame interval to use from now on.
     */
    using FrameFn = std::function<std::chrono::milliseconds()>;

    static constexpr const std::chrono::milliseconds MINIMUM_INTERVAL =
        std::chrono::milliseconds(10);

  private:
    unsigned int event_source_id_;
    std::chrono::milliseconds interval_;
    FrameFn frame_fn_;
    uint64_t frames_;
    uint64_t interval_changes_;

  public:
    FrameTimer(const FrameTimer &) = delete;
    FrameTimer &operator=(const FrameTimer &) = delete;

    explicit FrameTimer():
        event_source_id_(0),
        interval_(0),
        frames_(0),
        interval_changes_(0)
    {}

    ~FrameTimer() { stop(); }

    bool start(std::chrono::milliseconds interval, FrameFn &&frame_fn);
    void stop();

    bool is_running() const { return event_source_id_ != 0; }
    std::chrono::milliseconds get_interval() const { return interval_; }
    uint64_t get_frame_count() const { return frames_; }

  private:
    bool attach_source(std::chrono::milliseconds interval);
    static int frame_due(void *user_data);
};

}

#endif /* !FRAME_TIMER_HH */
