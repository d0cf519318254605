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

#include "sleep_manager.hh"
#include "messages.h"

void Sleep::Manager::init()
{
    set_backlight(true);
}

void Sleep::Manager::reset_timer()
{
    last_activity_ = clock_.now();

    if(is_sleeping_)
        wake_up();
}

bool Sleep::Manager::check(bool is_playing)
{
    if(is_sleeping_)
        return true;

    if(is_playing)
    {
        last_activity_ = clock_.now();
        return false;
    }

    if(!Clock::has_elapsed(clock_, last_activity_, timeout_))
        return false;

    enter_sleep();

    return true;
}

void Sleep::Manager::enter_sleep()
{
    if(is_sleeping_)
        return;

    msg_info("Entering sleep mode");
    is_sleeping_ = true;
    set_backlight(false);
}

void Sleep::Manager::wake_up()
{
    if(!is_sleeping_)
        return;

    msg_info("Waking up");
    is_sleeping_ = false;
    last_activity_ = clock_.now();
    set_backlight(true);

    if(on_wake_ != nullptr)
        on_wake_();
}

void Sleep::Manager::set_backlight(bool is_on)
{
    SystemControl::Iface &system(system_);

    executor_.submit([&system, is_on] () { system.set_backlight(is_on); },
                     is_on ? "backlight on" : "backlight off");
}
