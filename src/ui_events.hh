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

#ifndef UI_EVENTS_HH
#define UI_EVENTS_HH

#include "status_poller.hh"

namespace UI
{

/*!
 * Things that happen outside the main loop, but must be handled in it.
 */
enum class EventID
{
    STATUS_POLLED,
    PLAY_REQUEST_DONE,
    FEED_UPDATED,
    FEED_RECONNECTED,

    LAST_EVENT_ID = FEED_RECONNECTED,
};

namespace Events
{

class BaseEvent
{
  public:
    const EventID event_id_;

  protected:
    explicit BaseEvent(EventID event_id):
        event_id_(event_id)
    {}

  public:
    BaseEvent(const BaseEvent &) = delete;
    BaseEvent &operator=(const BaseEvent &) = delete;

    virtual ~BaseEvent() {}

    /*!
     * Whether or not this queued event may be dropped in favor of the
     * given, newer event of the same ID.
     */
    virtual bool can_be_replaced_by(const BaseEvent &newer) const = 0;
};

class StatusPolled: public BaseEvent
{
  public:
    const Playback::StatusPoller::Result result_;
    const Connection::Monitor::Transition transition_;

    StatusPolled(const StatusPolled &) = delete;
    StatusPolled &operator=(const StatusPolled &) = delete;

    explicit StatusPolled(Playback::StatusPoller::Result result,
                          Connection::Monitor::Transition transition):
        BaseEvent(EventID::STATUS_POLLED),
        result_(result),
        transition_(transition)
    {}

    bool can_be_replaced_by(const BaseEvent &newer) const final override
    {
        const auto &n(static_cast<const StatusPolled &>(newer));
        if(transition_ != Connection::Monitor::Transition::NONE ||
           n.transition_ != Connection::Monitor::Transition::NONE)
            return false;

        /* a failed poll must not hide a status still waiting for processing */
        return n.result_ != Playback::StatusPoller::Result::UNREACHABLE ||
               result_ == Playback::StatusPoller::Result::UNREACHABLE;
    }
};

/*!
 * Event without any data attached.
 */
class Notification: public BaseEvent
{
  public:
    Notification(const Notification &) = delete;
    Notification &operator=(const Notification &) = delete;

    explicit Notification(EventID event_id):
        BaseEvent(event_id)
    {}

    bool can_be_replaced_by(const BaseEvent &) const final override
    {
        return true;
    }
};

}

}

#endif /* !UI_EVENTS_HH */
