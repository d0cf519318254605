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

#ifndef EVENT_FEED_HH
#define EVENT_FEED_HH

#include <string>
#include <thread>
#include <functional>

#include "logged_lock.hh"

namespace Librespot
{

/*!
 * Listener for the go-librespot WebSocket event stream.
 *
 * The events themselves are only used as a hint to poll the status soon,
 * except for "playing" events which tell us the context being played. The
 * connection is re-established after a short delay whenever it is lost.
 */
class EventFeed
{
  public:
    enum class EventKind
    {
        INVALID,
        PLAYING,
        OTHER,
    };

    /*! Called from the feed thread for each event received. */
    using UpdateFn = std::function<void()>;

    /*! Called from the feed thread when the connection was re-established. */
    using ReconnectFn = std::function<void()>;

  private:
    const std::string url_;
    UpdateFn on_update_;
    ReconnectFn on_reconnect_;

    mutable LoggedLock::Mutex lock_;
    LoggedLock::ConditionVariable wakeup_;
    std::string context_uri_;
    bool is_running_;
    bool was_connected_;
    std::thread thread_;

  public:
    EventFeed(const EventFeed &) = delete;
    EventFeed &operator=(const EventFeed &) = delete;

    explicit EventFeed(std::string &&url, UpdateFn &&on_update,
                       ReconnectFn &&on_reconnect):
        url_(std::move(url)),
        on_update_(std::move(on_update)),
        on_reconnect_(std::move(on_reconnect)),
        is_running_(false),
        was_connected_(false)
    {
        LoggedLock::configure(lock_, "EventFeed", MESSAGE_LEVEL_DEBUG);
    }

    ~EventFeed() { stop(); }

    void start();
    void stop();

    /*!
     * Context URI announced by the most recent "playing" event.
     */
    std::string get_context_uri() const;

    /*!
     * Process one event message.
     */
    EventKind handle_message(const std::string &message);

    /*!
     * Classify event message, extract context URI from "playing" events.
     */
    static EventKind parse_event(const std::string &message,
                                 std::string &context_uri);

  private:
    void run();
    void connect_and_listen();
    bool keep_running() const;
};

}

#endif /* !EVENT_FEED_HH */
