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

#ifndef PLAY_REQUEST_HH
#define PLAY_REQUEST_HH

#include <string>
#include <memory>
#include <thread>
#include <chrono>
#include <functional>

#include "remote_player.hh"
#include "progress_store.hh"
#include "playback_snapshot.hh"
#include "logged_lock.hh"

namespace Playback
{

class PlayRequestIface
{
  protected:
    explicit PlayRequestIface() {}

  public:
    PlayRequestIface(const PlayRequestIface &) = delete;
    PlayRequestIface &operator=(const PlayRequestIface &) = delete;

    virtual ~PlayRequestIface() {}

    /*!
     * Ask for playing a context, non-blocking.
     */
    virtual void request_play(const std::string &context_uri,
                              bool from_beginning = false) = 0;

    virtual bool is_in_flight() const = 0;
};

/*!
 * Serialization of requests for playing a context.
 *
 * There is at most one play command sequence in flight, executed by a
 * dedicated worker thread, and at most one pending request which is
 * overwritten by each new request. When a sequence is done, the worker waits
 * a short settle time to allow even newer requests to come in, then executes
 * the freshest pending request. In-flight network calls are never aborted.
 */
class PlayRequestCoordinator: public PlayRequestIface
{
  public:
    struct Timing
    {
        std::chrono::milliseconds settle_delay_;
        std::chrono::milliseconds resume_seek_delay_;
    };

    /*! Called by the worker thread before the very first play command. */
    using FirstPlayFn = std::function<void()>;

    /*! Called with the last snapshot of the context being left, in caller's
     *  context. */
    using SaveProgressFn = std::function<void(const Snapshot &)>;

    /*! Called by the worker thread when nothing is in flight anymore. */
    using IdleFn = std::function<void()>;

  private:
    class Request
    {
      public:
        const std::string context_uri_;
        const bool from_beginning_;

        Request(const Request &) = delete;
        Request &operator=(const Request &) = delete;

        explicit Request(const std::string &context_uri, bool from_beginning):
            context_uri_(context_uri),
            from_beginning_(from_beginning)
        {}
    };

    RemotePlayer::CommandSinkIface &sink_;
    Progress::StoreIface &store_;
    const SnapshotCell &now_playing_;
    const Timing timing_;

    FirstPlayFn first_play_;
    SaveProgressFn save_progress_;
    IdleFn idle_;

    mutable LoggedLock::Mutex lock_;
    LoggedLock::ConditionVariable wakeup_;
    std::unique_ptr<Request> pending_;
    bool is_in_flight_;
    bool has_played_;
    bool is_shutting_down_;
    std::thread worker_;

  public:
    PlayRequestCoordinator(const PlayRequestCoordinator &) = delete;
    PlayRequestCoordinator &operator=(const PlayRequestCoordinator &) = delete;

    explicit PlayRequestCoordinator(RemotePlayer::CommandSinkIface &sink,
                                    Progress::StoreIface &store,
                                    const SnapshotCell &now_playing,
                                    const Timing &timing,
                                    FirstPlayFn &&first_play,
                                    SaveProgressFn &&save_progress,
                                    IdleFn &&idle):
        sink_(sink),
        store_(store),
        now_playing_(now_playing),
        timing_(timing),
        first_play_(std::move(first_play)),
        save_progress_(std::move(save_progress)),
        idle_(std::move(idle)),
        is_in_flight_(false),
        has_played_(false),
        is_shutting_down_(false)
    {
        LoggedLock::configure(lock_, "PlayRequestCoordinator", MESSAGE_LEVEL_DEBUG);
    }

    ~PlayRequestCoordinator() { shutdown(); }

    void start();

    /*!
     * Stop the worker thread, dropping any pending request.
     *
     * A command sequence in flight is completed first.
     */
    void shutdown();

    void request_play(const std::string &context_uri,
                      bool from_beginning = false) final override;

    bool is_in_flight() const final override;

  private:
    void run();
    void execute(const Request &req);
    bool sleep_unless_shutting_down(LoggedLock::UniqueLock<LoggedLock::Mutex> &lock,
                                    std::chrono::milliseconds duration);
};

}

#endif /* !PLAY_REQUEST_HH */
