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
#if HAVE_CONFIG_H
#include <config.h>
#endif /* HAVE_CONFIG_H */

#include <glib.h>
#include <errno.h>
#include <cinttypes>

#include "frame_timer.hh"
#include "messages.h"

constexpr const std::chrono::milliseconds UI::FrameTimer::MINIMUM_INTERVAL;

bool UI::FrameTimer::attach_source(std::chrono::milliseconds interval)
{
    if(interval < MINIMUM_INTERVAL)
        interval = MINIMUM_INTERVAL;

    GSource *src = g_timeout_source_new(interval.count());

    if(src == nullptr)
    {
        msg_error(ENOMEM, LOG_EMERG, "Failed allocating frame timer source");
        return false;
    }

    g_source_set_callback(src, UI::FrameTimer::frame_due, this, nullptr);
    event_source_id_ = g_source_attach(src, nullptr);
    g_source_unref(src);

    interval_ = interval;

    return true;
}

bool UI::FrameTimer::start(std::chrono::milliseconds interval,
                           FrameFn &&frame_fn)
{
    msg_log_assert(frame_fn != nullptr);

    if(event_source_id_ != 0)
    {
        MSG_BUG("Frame timer already running");
        return false;
    }

    frame_fn_ = std::move(frame_fn);
    frames_ = 0;
    interval_changes_ = 0;

    return attach_source(interval);
}

void UI::FrameTimer::stop()
{
    if(event_source_id_ == 0)
        return;

    g_source_remove(event_source_id_);
    event_source_id_ = 0;

    msg_vinfo(MESSAGE_LEVEL_DIAG,
              "Frame timer stopped after %" PRIu64
              " frames, %" PRIu64 " interval changes",
              frames_, interval_changes_);
}

int UI::FrameTimer::frame_due(void *user_data)
{
    auto *const timer = static_cast<UI::FrameTimer *>(user_data);

    if(timer == nullptr || timer->event_source_id_ == 0)
        return G_SOURCE_REMOVE;

    ++timer->frames_;

    auto next = timer->frame_fn_();

    if(next < MINIMUM_INTERVAL && next != next.zero())
        next = MINIMUM_INTERVAL;

    if(next == next.zero() || next == timer->interval_)
        return G_SOURCE_CONTINUE;

    /* returning G_SOURCE_REMOVE destroys the current source */
    ++timer->interval_changes_;
    timer->event_source_id_ = 0;

    if(!timer->attach_source(next))
        msg_error(0, LOG_ERR, "Frame loop stopped");

    return G_SOURCE_REMOVE;
}
