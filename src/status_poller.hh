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

#ifndef STATUS_POLLER_HH
#define STATUS_POLLER_HH

#include <thread>
#include <functional>

#include "remote_player.hh"
#include "connection_monitor.hh"
#include "playback_snapshot.hh"
#include "logged_lock.hh"

namespace Playback
{

/*!
 * Dedicated thread which polls the remote player for its status.
 *
 * Each poll result is fed into the connection monitor. If the player
 * answered, the result is published into the snapshot cell, otherwise the
 * previous snapshot stays in place. After that, the poll-done callback is
 * invoked from the polling thread, so it must hand over its work to the
 * main loop.
 *
 * On start, a bounded number of attempts with exponential backoff is made
 * until the player becomes reachable, after that the poll interval is taken
 * from the connection monitor.
 */
class StatusPoller
{
  public:
    struct StartupPolicy
    {
        unsigned int retries_;
        std::chrono::milliseconds backoff_base_;
        std::chrono::milliseconds backoff_cap_;
    };

    enum class Result
    {
        /* player answered with a status */
        STATUS,

        /* player answered, but has nothing to report (or garbage) */
        NO_STATUS,

        /* player did not answer; snapshot has not been touched */
        UNREACHABLE,
    };

    /*!
     * Invoked after each poll.
     *
     * The second parameter reports changes of the connection state.
     */
    using PollDoneFn = std::function<void(Result, Connection::Monitor::Transition)>;

    /*!
     * Last context URI announced by the event feed, used if the status does
     * not contain a context.
     */
    using EventContextFn = std::function<std::string()>;

  private:
    RemotePlayer::StatusSourceIface &source_;
    Connection::Monitor &monitor_;
    SnapshotCell &cell_;
    const StartupPolicy startup_;
    EventContextFn get_event_context_;
    PollDoneFn poll_done_;

    LoggedLock::Mutex lock_;
    LoggedLock::ConditionVariable wakeup_;
    bool is_poll_forced_;
    bool is_shutting_down_;
    std::thread thread_;

  public:
    StatusPoller(const StatusPoller &) = delete;
    StatusPoller &operator=(const StatusPoller &) = delete;

    explicit StatusPoller(RemotePlayer::StatusSourceIface &source,
                          Connection::Monitor &monitor, SnapshotCell &cell,
                          const StartupPolicy &startup,
                          EventContextFn &&get_event_context,
                          PollDoneFn &&poll_done):
        source_(source),
        monitor_(monitor),
        cell_(cell),
        startup_(startup),
        get_event_context_(std::move(get_event_context)),
        poll_done_(std::move(poll_done)),
        is_poll_forced_(false),
        is_shutting_down_(false)
    {
        LoggedLock::configure(lock_, "StatusPoller", MESSAGE_LEVEL_DEBUG);
    }

    ~StatusPoller() { stop(); }

    void start();
    void stop();

    /*!
     * Request an out-of-cycle poll as soon as possible, non-blocking.
     */
    void force_poll();

    /*!
     * Poll once, synchronously.
     *
     * \returns
     *     True if the player is reachable.
     */
    bool poll_once();

  private:
    void run();
    bool wait(std::chrono::milliseconds timeout);
};

}

#endif /* !STATUS_POLLER_HH */
