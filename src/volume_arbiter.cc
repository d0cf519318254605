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

#include "volume_arbiter.hh"
#include "messages.h"

static std::vector<unsigned int> sanitize(std::vector<unsigned int> &&levels)
{
    if(levels.empty())
    {
        msg_error(0, LOG_NOTICE, "No volume levels, using built-in defaults");
        return {60, 70, 80};
    }

    return std::move(levels);
}

Volume::Arbiter::Arbiter(const Clock::MonotonicIface &clock,
                         SystemControl::Iface &system,
                         RemotePlayer::CommandSinkIface &sink,
                         Async::ExecutorIface &executor, Policy &&policy):
    clock_(clock),
    system_(system),
    sink_(sink),
    executor_(executor),
    policy_{sanitize(std::move(policy.levels_)), policy.echo_window_,
            policy.takeover_threshold_},
    mode_(Mode::LOCAL),
    index_(policy_.levels_.size() > 1 ? 1 : 0),
    local_index_(index_),
    has_local_change_(false),
    is_remote_initialized_(false)
{}

void Volume::Arbiter::init()
{
    mode_ = Mode::LOCAL;
    apply_local_level(level());
}

void Volume::Arbiter::toggle()
{
    has_local_change_ = true;
    last_local_change_ = clock_.now();

    if(mode_ == Mode::REMOTE)
    {
        msg_info("Volume: taking back control from remote controller");
        mode_ = Mode::LOCAL;
        reset_remote_volume();
    }

    index_ = (index_ + 1) % policy_.levels_.size();
    local_index_ = index_;

    msg_info("Volume: local level %u%%", level());
    apply_local_level(level());
}

void Volume::Arbiter::handle_remote_change(int remote_volume)
{
    if(remote_volume < 0)
        return;

    if(has_local_change_ &&
       !Clock::has_elapsed(clock_, last_local_change_, policy_.echo_window_))
        return;

    switch(mode_)
    {
      case Mode::LOCAL:
        if(static_cast<unsigned int>(remote_volume) < policy_.takeover_threshold_)
        {
            msg_info("Volume: remote controller took control (%d%%)",
                     remote_volume);
            mode_ = Mode::REMOTE;
            index_ = policy_.levels_.size() - 1;
            apply_local_level(100);
        }

        break;

      case Mode::REMOTE:
        if(static_cast<unsigned int>(remote_volume) >= policy_.takeover_threshold_)
            switch_to_local_mode();

        break;
    }
}

void Volume::Arbiter::on_wake()
{
    if(mode_ == Mode::REMOTE)
        switch_to_local_mode();
}

bool Volume::Arbiter::ensure_remote_at_full()
{
    if(is_remote_initialized_.exchange(true))
        return false;

    if(!sink_.set_volume(100))
    {
        msg_error(0, LOG_NOTICE, "Failed setting remote volume to 100%%");
        return false;
    }

    msg_info("Remote volume set to 100%%");

    return true;
}

const char *Volume::Arbiter::get_icon_name() const
{
    if(index_ == 0)
        return "volume_none";

    if(index_ + 1 < policy_.levels_.size())
        return "volume_low";

    return "volume_high";
}

unsigned int Volume::Arbiter::level() const
{
    if(mode_ == Mode::REMOTE)
        return 100;

    const unsigned int l = policy_.levels_[index_];

    return l <= 100 ? l : 100;
}

void Volume::Arbiter::switch_to_local_mode()
{
    msg_info("Volume: switching to local mode");

    /* our own reset of the remote volume must not look like a foreign change */
    has_local_change_ = true;
    last_local_change_ = clock_.now();

    mode_ = Mode::LOCAL;
    index_ = local_index_;
    apply_local_level(level());
    reset_remote_volume();
}

void Volume::Arbiter::apply_local_level(unsigned int percent)
{
    SystemControl::Iface &system(system_);

    executor_.submit([&system, percent] () { system.set_local_volume(percent); },
                     "set local volume");
}

void Volume::Arbiter::reset_remote_volume()
{
    RemotePlayer::CommandSinkIface &sink(sink_);

    executor_.submit([&sink] ()
                     {
                         if(!sink.set_volume(100))
                             msg_error(0, LOG_NOTICE,
                                       "Failed resetting remote volume");
                     },
                     "reset remote volume");
}
