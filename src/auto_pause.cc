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

#include <system_error>

#include "auto_pause.hh"
#include "messages.h"

void AutoPause::Timer::reset__unlocked()
{
    state_ = State::IDLE;
    context_uri_.clear();
}

void AutoPause::Timer::join_finished_fade()
{
    if(state_ != State::FADING && fade_thread_.joinable())
        fade_thread_.join();
}

void AutoPause::Timer::on_play(const std::string &context_uri)
{
    std::lock_guard<LoggedLock::Mutex> lock(lock_);

    if(state_ == State::FADING)
        return;

    join_finished_fade();

    if(context_uri.empty())
    {
        reset__unlocked();
        return;
    }

    if(state_ == State::ARMED && context_uri == context_uri_)
        return;

    context_uri_ = context_uri;
    play_start_ = clock_.now();
    state_ = State::ARMED;

    msg_info("Auto-pause: new context, timer reset (%lld min)",
             static_cast<long long>(std::chrono::duration_cast<std::chrono::minutes>(policy_.timeout_).count()));
}

void AutoPause::Timer::on_stop()
{
    std::lock_guard<LoggedLock::Mutex> lock(lock_);

    /* the fade returns to idle by itself */
    if(state_ == State::FADING)
        return;

    join_finished_fade();
    reset__unlocked();
}

bool AutoPause::Timer::check(bool is_playing)
{
    std::lock_guard<LoggedLock::Mutex> lock(lock_);

    if(!is_playing || state_ != State::ARMED)
        return false;

    if(!Clock::has_elapsed(clock_, play_start_, policy_.timeout_))
        return false;

    join_finished_fade();

    msg_info("Auto-pause: timeout reached, fading out");

    state_ = State::FADING;
    saved_volume_ = get_volume_();
    is_aborting_ = false;

    try
    {
        fade_thread_ = std::thread(&Timer::fade_out_and_pause, this, saved_volume_);
    }
    catch(const std::system_error &e)
    {
        msg_error(0, LOG_ERR, "Failed starting fade thread: %s", e.what());
        reset__unlocked();
        return false;
    }

    return true;
}

void AutoPause::Timer::restore_volume_if_needed()
{
    unsigned int volume;

    {
        std::lock_guard<LoggedLock::Mutex> lock(lock_);

        if(!should_restore_volume_)
            return;

        should_restore_volume_ = false;
        volume = saved_volume_;
    }

    msg_info("Auto-pause: restoring volume to %u%%", volume);

    const SetVolumeFn set_volume(set_volume_);
    executor_.submit([set_volume, volume] () { set_volume(volume); },
                     "restore volume after auto-pause");
}

bool AutoPause::Timer::get_remaining(std::chrono::milliseconds &remaining) const
{
    std::lock_guard<LoggedLock::Mutex> lock(lock_);

    switch(state_)
    {
      case State::IDLE:
        return false;

      case State::ARMED:
        {
            const auto elapsed =
                std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - play_start_);
            remaining = elapsed < policy_.timeout_
                ? policy_.timeout_ - elapsed
                : std::chrono::milliseconds::zero();
        }

        return true;

      case State::FADING:
        remaining = std::chrono::milliseconds::zero();
        return true;
    }

    MSG_UNREACHABLE();
    return false;
}

AutoPause::State AutoPause::Timer::get_state() const
{
    std::lock_guard<LoggedLock::Mutex> lock(lock_);
    return state_;
}

void AutoPause::Timer::shutdown()
{
    {
        std::lock_guard<LoggedLock::Mutex> lock(lock_);
        is_aborting_ = true;
    }

    abort_fade_.notify_all();

    if(fade_thread_.joinable())
        fade_thread_.join();
}

void AutoPause::Timer::fade_out_and_pause(unsigned int original_volume)
{
    const unsigned int steps = policy_.fade_steps_ > 0 ? policy_.fade_steps_ : 1;
    const auto step_duration = policy_.fade_duration_ / steps;
    bool is_aborted = false;

    for(unsigned int i = 1; i <= steps && !is_aborted; ++i)
    {
        set_volume_(original_volume * (steps - i) / steps);

        LoggedLock::UniqueLock<LoggedLock::Mutex> lock(lock_);
        is_aborted = abort_fade_.wait_for(lock, step_duration,
                                          [this] { return is_aborting_; });
    }

    if(!is_aborted)
    {
        {
            std::lock_guard<LoggedLock::Mutex> lock(lock_);
            should_restore_volume_ = true;
        }

        msg_info("Auto-pause: pausing playback");

        if(!pause_())
            msg_error(0, LOG_ERR, "Auto-pause: pause command failed");

        LoggedLock::UniqueLock<LoggedLock::Mutex> lock(lock_);
        abort_fade_.wait_for(lock, policy_.restore_delay_,
                             [this] { return is_aborting_; });
    }

    {
        std::lock_guard<LoggedLock::Mutex> lock(lock_);
        should_restore_volume_ = false;
    }

    /* so that the next play is at normal level */
    set_volume_(original_volume);

    {
        std::lock_guard<LoggedLock::Mutex> lock(lock_);
        reset__unlocked();
    }

    msg_info("Auto-pause: complete, volume restored to %u%%", original_volume);
}
