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

#include "play_timer.hh"
#include "messages.h"

void Selection::PlayTimer::start(const std::string &uri)
{
    if(uri.empty())
    {
        cancel();
        return;
    }

    if(uri == armed_uri_)
        return;

    armed_uri_ = uri;
    armed_at_ = clock_.now();

    msg_vinfo(MESSAGE_LEVEL_DIAG, "PlayTimer armed for %s", uri.c_str());
}

void Selection::PlayTimer::cancel()
{
    if(armed_uri_.empty())
        return;

    msg_vinfo(MESSAGE_LEVEL_DEBUG, "PlayTimer cancelled for %s",
              armed_uri_.c_str());
    armed_uri_.clear();
}

bool Selection::PlayTimer::check(std::string &uri)
{
    if(armed_uri_.empty())
        return false;

    if(!Clock::has_elapsed(clock_, armed_at_, delay_))
        return false;

    uri.swap(armed_uri_);
    armed_uri_.clear();

    last_played_uri_ = uri;
    last_fired_at_ = clock_.now();
    has_fired_ = true;

    return true;
}

bool Selection::PlayTimer::is_in_cooldown() const
{
    return has_fired_ && !Clock::has_elapsed(clock_, last_fired_at_, cooldown_);
}
