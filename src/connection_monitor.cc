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

#include "connection_monitor.hh"
#include "messages.h"

Connection::Monitor::Transition Connection::Monitor::feed(bool success)
{
    const bool was_connected = is_connected_;

    if(success)
    {
        const unsigned int failures = failure_count_.exchange(0);

        if(failures > 0)
            msg_vinfo(MESSAGE_LEVEL_DEBUG,
                      "Connection recovered after %u failures", failures);

        is_connected_ = true;
    }
    else
    {
        const unsigned int failures = ++failure_count_;

        if(failures >= grace_threshold_)
            is_connected_ = false;
        else if(was_connected)
            msg_vinfo(MESSAGE_LEVEL_DEBUG,
                      "Status poll failed (%u of %u)", failures, grace_threshold_);
    }

    if(was_connected == is_connected_)
        return Transition::NONE;

    if(is_connected_)
    {
        msg_info("CONNECTION RESTORED");
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "Normal polling mode (connected)");
        return Transition::RESTORED;
    }

    msg_error(0, LOG_WARNING, "CONNECTION LOST after %u failures",
              failure_count_.load());
    msg_vinfo(MESSAGE_LEVEL_DEBUG, "Fast polling mode (disconnected)");

    return Transition::LOST;
}

Connection::Monitor::Transition Connection::Monitor::assume_reachable()
{
    failure_count_ = 0;

    if(is_connected_.exchange(true))
        return Transition::NONE;

    msg_vinfo(MESSAGE_LEVEL_DIAG, "Assuming connection is available");

    return Transition::RESTORED;
}

std::chrono::milliseconds
Connection::Monitor::get_startup_backoff(unsigned int attempt,
                                         std::chrono::milliseconds base,
                                         std::chrono::milliseconds cap)
{
    std::chrono::milliseconds result(base);

    for(unsigned int i = 0; i < attempt && result < cap; ++i)
        result *= 2;

    return result < cap ? result : cap;
}
