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

#ifndef BUSY_HH
#define BUSY_HH

#include <functional>
#include <inttypes.h>

/*!
 * The global "show loading" state.
 *
 * Several independent conditions make the screen show a loading indicator.
 * Each of them is a source here, and the state is busy while any source is
 * set. An explicit pause by the user mutes the busy state as a whole, without
 * touching the sources.
 */
namespace Busy
{

enum class Source
{
    /* a play command sequence is being executed or waiting to be */
    PLAY_REQUEST_IN_FLIGHT,

    /* an item is waiting for auto-play after the carousel has settled */
    PLAY_TIMER_ARMED,

    /* we have paused playback because the user swiped away */
    PAUSED_FOR_NAVIGATION,

    /* internal */
    FIRST_SOURCE = PLAY_REQUEST_IN_FLIGHT,
    LAST_SOURCE = PAUSED_FOR_NAVIGATION,
};

void init(const std::function<void(bool)> &state_changed_callback);
bool set(Source src);
bool clear(Source src);
bool set_muted(bool is_muted);
bool is_set(Source src);
bool is_busy();

}

#endif /* !BUSY_HH */
