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

#ifndef UI_EVENT_QUEUE_HH
#define UI_EVENT_QUEUE_HH

#include "ui_events.hh"
#include "logged_lock.hh"
#include "messages.h"

#include <functional>
#include <memory>
#include <deque>
#include <algorithm>

namespace UI
{

/*!
 * Events posted by background threads, processed by the main loop.
 *
 * The trigger function is called when an event is posted to an empty
 * queue. It is expected to schedule processing of all queued events in the
 * main loop.
 *
 * Events which carry no information beyond their ID are merged: posting
 * such an event while an equal one is still queued has no effect. A status
 * report without connection transition replaces a queued report which has
 * no transition either, so a slow main loop sees only the latest one.
 */
class EventQueue
{
  private:
    const std::function<void()> trigger_processing_fn_;

    LoggedLock::Mutex lock_;
    std::deque<std::unique_ptr<Events::BaseEvent>> queue_;
    unsigned int merged_count_;

  public:
    EventQueue(const EventQueue &) = delete;
    EventQueue &operator=(const EventQueue &) = delete;

    explicit EventQueue(const std::function<void()> &trigger_processing_fn):
        trigger_processing_fn_(trigger_processing_fn),
        merged_count_(0)
    {
        LoggedLock::configure(lock_, "UIEventQueue", MESSAGE_LEVEL_DEBUG);
    }

    void post(std::unique_ptr<Events::BaseEvent> event)
    {
        msg_log_assert(event != nullptr);

        bool need_trigger;

        {
            LOGGED_LOCK_CONTEXT_HINT;
            std::lock_guard<LoggedLock::Mutex> lock(lock_);

            need_trigger = queue_.empty();

            auto it = std::find_if(queue_.begin(), queue_.end(),
                [&event] (const std::unique_ptr<Events::BaseEvent> &queued)
                {
                    return queued->event_id_ == event->event_id_ &&
                           queued->can_be_replaced_by(*event);
                });

            if(it == queue_.end())
                queue_.emplace_back(std::move(event));
            else
            {
                *it = std::move(event);
                ++merged_count_;
            }
        }

        if(need_trigger && trigger_processing_fn_ != nullptr)
            trigger_processing_fn_();
    }

    std::unique_ptr<Events::BaseEvent> take()
    {
        LOGGED_LOCK_CONTEXT_HINT;
        std::lock_guard<LoggedLock::Mutex> lock(lock_);

        if(queue_.empty())
            return nullptr;

        std::unique_ptr<Events::BaseEvent> ret = std::move(queue_.front());
        queue_.pop_front();

        return ret;
    }

    unsigned int get_merged_count()
    {
        LOGGED_LOCK_CONTEXT_HINT;
        std::lock_guard<LoggedLock::Mutex> lock(lock_);
        return merged_count_;
    }
};

}

#endif /* !UI_EVENT_QUEUE_HH */
