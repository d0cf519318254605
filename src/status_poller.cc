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

#include "status_poller.hh"
#include "messages.h"

void Playback::StatusPoller::start()
{
    if(thread_.joinable())
    {
        MSG_BUG("Status poller already running");
        return;
    }

    {
        std::lock_guard<LoggedLock::Mutex> lock(lock_);
        is_shutting_down_ = false;
        is_poll_forced_ = false;
    }

    thread_ = std::thread([this] { run(); });
}

void Playback::StatusPoller::stop()
{
    if(!thread_.joinable())
        return;

    {
        std::lock_guard<LoggedLock::Mutex> lock(lock_);
        is_shutting_down_ = true;
    }

    wakeup_.notify_all();
    thread_.join();
}

void Playback::StatusPoller::force_poll()
{
    {
        std::lock_guard<LoggedLock::Mutex> lock(lock_);
        is_poll_forced_ = true;
    }

    wakeup_.notify_all();
}

bool Playback::StatusPoller::poll_once()
{
    std::unique_ptr<Snapshot> status(source_.get_status());
    const bool have_status = status != nullptr;
    const bool is_reachable = have_status || source_.is_connected();
    const auto transition = monitor_.feed(is_reachable);

    Result result;

    if(have_status)
    {
        if(status->context_uri_.empty() && get_event_context_ != nullptr)
            status->context_uri_ = get_event_context_();

        result = Result::STATUS;
        cell_.publish(std::move(status));
    }
    else if(is_reachable)
    {
        result = Result::NO_STATUS;
        cell_.publish(nullptr);
    }
    else
        result = Result::UNREACHABLE;

    if(poll_done_ != nullptr)
        poll_done_(result, transition);

    return is_reachable;
}

/*!
 * Wait for timeout, forced poll, or shutdown.
 *
 * \returns
 *     False if the poller is shutting down, true otherwise.
 */
bool Playback::StatusPoller::wait(std::chrono::milliseconds timeout)
{
    LoggedLock::UniqueLock<LoggedLock::Mutex> lock(lock_);

    wakeup_.wait_for(lock, timeout,
                     [this] { return is_poll_forced_ || is_shutting_down_; });
    is_poll_forced_ = false;

    return !is_shutting_down_;
}

void Playback::StatusPoller::run()
{
    msg_vinfo(MESSAGE_LEVEL_DIAG, "Status poller started");

    bool is_in_startup_phase = startup_.retries_ > 0;

    for(unsigned int attempt = 0;
        is_in_startup_phase && attempt < startup_.retries_;
        ++attempt)
    {
        poll_once();

        if(monitor_.is_connected())
        {
            msg_info("Connected to player (attempt %u)", attempt + 1);
            is_in_startup_phase = false;
            break;
        }

        const auto delay =
            Connection::Monitor::get_startup_backoff(attempt, startup_.backoff_base_,
                                                     startup_.backoff_cap_);

        msg_info("Connection attempt %u/%u failed, retrying in %lld ms",
                 attempt + 1, startup_.retries_,
                 static_cast<long long>(delay.count()));

        if(!wait(delay))
        {
            msg_vinfo(MESSAGE_LEVEL_DIAG, "Status poller stopped");
            return;
        }
    }

    if(is_in_startup_phase)
        msg_error(0, LOG_ERR, "Failed to connect to player after %u attempts",
                  startup_.retries_);

    while(wait(monitor_.get_poll_interval()))
        poll_once();

    msg_vinfo(MESSAGE_LEVEL_DIAG, "Status poller stopped");
}
