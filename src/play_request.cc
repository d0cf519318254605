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

#include "play_request.hh"
#include "messages.h"

void Playback::PlayRequestCoordinator::start()
{
    if(worker_.joinable())
    {
        MSG_BUG("Play request worker already running");
        return;
    }

    {
        std::lock_guard<LoggedLock::Mutex> lock(lock_);
        is_shutting_down_ = false;
    }

    worker_ = std::thread([this] { run(); });
}

void Playback::PlayRequestCoordinator::shutdown()
{
    if(!worker_.joinable())
        return;

    {
        std::lock_guard<LoggedLock::Mutex> lock(lock_);
        is_shutting_down_ = true;
    }

    wakeup_.notify_all();
    worker_.join();
}

void Playback::PlayRequestCoordinator::request_play(const std::string &context_uri,
                                                    bool from_beginning)
{
    if(context_uri.empty())
    {
        MSG_BUG("Cannot play empty context");
        return;
    }

    if(save_progress_ != nullptr)
    {
        const auto np(now_playing_.get());

        if(!np->context_uri_.empty() && np->context_uri_ != context_uri)
            save_progress_(*np);
    }

    std::unique_ptr<Request> req(new Request(context_uri, from_beginning));

    {
        LOGGED_LOCK_CONTEXT_HINT;
        std::lock_guard<LoggedLock::Mutex> lock(lock_);

        if(is_shutting_down_)
        {
            msg_error(0, LOG_NOTICE, "Ignoring play request for %s, shutting down",
                      context_uri.c_str());
            return;
        }

        if(is_in_flight_)
            msg_vinfo(MESSAGE_LEVEL_DEBUG, "Queued play request: %s",
                      context_uri.c_str());
        else
        {
            msg_vinfo(MESSAGE_LEVEL_DIAG, "Play request: %s", context_uri.c_str());
            is_in_flight_ = true;
        }

        pending_ = std::move(req);
    }

    wakeup_.notify_all();
}

bool Playback::PlayRequestCoordinator::is_in_flight() const
{
    std::lock_guard<LoggedLock::Mutex> lock(lock_);
    return is_in_flight_;
}

/*!
 * Wait for given duration with lock released.
 *
 * \returns
 *     False if woken up for shutdown.
 */
bool Playback::PlayRequestCoordinator::sleep_unless_shutting_down(
        LoggedLock::UniqueLock<LoggedLock::Mutex> &lock,
        std::chrono::milliseconds duration)
{
    wakeup_.wait_for(lock, duration, [this] { return is_shutting_down_; });
    return !is_shutting_down_;
}

void Playback::PlayRequestCoordinator::run()
{
    LoggedLock::UniqueLock<LoggedLock::Mutex> lock(lock_);

    while(true)
    {
        wakeup_.wait(lock,
                     [this] { return pending_ != nullptr || is_shutting_down_; });

        if(is_shutting_down_)
            break;

        std::unique_ptr<Request> req(std::move(pending_));

        lock.unlock();
        execute(*req);
        lock.lock();

        if(pending_ == nullptr)
        {
            is_in_flight_ = false;

            if(idle_ != nullptr)
            {
                lock.unlock();
                idle_();
                lock.lock();
            }

            continue;
        }

        /* let even newer requests overwrite the pending one */
        if(!sleep_unless_shutting_down(lock, timing_.settle_delay_))
            break;

        msg_vinfo(MESSAGE_LEVEL_DEBUG, "Executing queued request: %s",
                  pending_->context_uri_.c_str());
    }

    if(pending_ != nullptr)
        msg_vinfo(MESSAGE_LEVEL_DIAG, "Dropping pending play request for %s",
                  pending_->context_uri_.c_str());

    pending_.reset();
    is_in_flight_ = false;
}

void Playback::PlayRequestCoordinator::execute(const Request &req)
{
    msg_info("Execute play: %s, from beginning: %s",
             req.context_uri_.c_str(), req.from_beginning_ ? "yes" : "no");

    if(!has_played_)
    {
        has_played_ = true;

        if(first_play_ != nullptr)
            first_play_();
    }

    std::unique_ptr<Progress::Saved> saved;

    if(!req.from_beginning_)
    {
        saved = store_.get_progress(req.context_uri_);

        if(saved == nullptr)
            msg_vinfo(MESSAGE_LEVEL_DIAG, "No saved progress for %s",
                      req.context_uri_.c_str());
    }

    if(!sink_.play(req.context_uri_,
                   saved != nullptr ? saved->track_uri_ : std::string()))
    {
        msg_error(0, LOG_ERR, "Play request for %s failed",
                  req.context_uri_.c_str());
        return;
    }

    if(saved == nullptr || saved->position_ms_ == 0)
        return;

    {
        LoggedLock::UniqueLock<LoggedLock::Mutex> lock(lock_);

        if(!sleep_unless_shutting_down(lock, timing_.resume_seek_delay_))
            return;
    }

    if(sink_.seek(saved->position_ms_))
        msg_info("Seeked to %us", saved->position_ms_ / 1000U);
    else
        msg_error(0, LOG_ERR, "Seek to %u ms failed", saved->position_ms_);
}
