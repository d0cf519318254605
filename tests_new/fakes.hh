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

#ifndef FAKES_HH
#define FAKES_HH

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <condition_variable>

#include "monotonic_clock.hh"
#include "async_executor.hh"
#include "system_control.hh"
#include "remote_player.hh"
#include "progress_store.hh"
#include "play_request.hh"

/*!
 * Fakes shared by the unit tests.
 */
namespace Fake
{

class Clock: public ::Clock::MonotonicIface
{
  private:
    mutable std::mutex lock_;
    ::Clock::TimePoint now_;

  public:
    Clock(const Clock &) = delete;
    Clock &operator=(const Clock &) = delete;

    explicit Clock():
        now_(std::chrono::hours(1000))
    {}

    ::Clock::TimePoint now() const final override
    {
        std::lock_guard<std::mutex> lock(lock_);
        return now_;
    }

    void advance(std::chrono::milliseconds ms)
    {
        std::lock_guard<std::mutex> lock(lock_);
        now_ += ms;
    }
};

/*!
 * Runs submitted work right away in the caller's context.
 */
class Executor: public Async::ExecutorIface
{
  public:
    std::vector<std::string> submitted_;

    Executor(const Executor &) = delete;
    Executor &operator=(const Executor &) = delete;

    explicit Executor() {}

    bool submit(Work &&work, const char *what) final override
    {
        submitted_.emplace_back(what);
        work();
        return true;
    }
};

class SystemControl: public ::SystemControl::Iface
{
  private:
    mutable std::mutex lock_;
    std::vector<unsigned int> volumes_;
    std::vector<bool> backlight_;

  public:
    SystemControl(const SystemControl &) = delete;
    SystemControl &operator=(const SystemControl &) = delete;

    explicit SystemControl() {}

    bool set_local_volume(unsigned int percent) final override
    {
        std::lock_guard<std::mutex> lock(lock_);
        volumes_.push_back(percent);
        return true;
    }

    bool set_backlight(bool is_on) final override
    {
        std::lock_guard<std::mutex> lock(lock_);
        backlight_.push_back(is_on);
        return true;
    }

    std::vector<unsigned int> get_volumes() const
    {
        std::lock_guard<std::mutex> lock(lock_);
        return volumes_;
    }

    std::vector<bool> get_backlight() const
    {
        std::lock_guard<std::mutex> lock(lock_);
        return backlight_;
    }
};

/*!
 * Records commands as strings, can hold back play commands.
 */
class Sink: public RemotePlayer::CommandSinkIface
{
  private:
    mutable std::mutex lock_;
    std::condition_variable cv_;
    std::vector<std::string> calls_;
    bool is_play_blocked_;
    bool is_inside_play_;

  public:
    Sink(const Sink &) = delete;
    Sink &operator=(const Sink &) = delete;

    explicit Sink():
        is_play_blocked_(false),
        is_inside_play_(false)
    {}

    bool play(const std::string &context_uri,
              const std::string &skip_to_uri) final override
    {
        std::unique_lock<std::mutex> lock(lock_);

        calls_.push_back(skip_to_uri.empty()
                         ? "play " + context_uri
                         : "play " + context_uri + " " + skip_to_uri);
        is_inside_play_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return !is_play_blocked_; });
        is_inside_play_ = false;

        return true;
    }

    bool pause() final override { return record("pause"); }
    bool resume() final override { return record("resume"); }
    bool next() final override { return record("next"); }
    bool prev() final override { return record("prev"); }

    bool seek(uint32_t position_ms) final override
    {
        return record("seek " + std::to_string(position_ms));
    }

    bool set_volume(unsigned int percent) final override
    {
        return record("volume " + std::to_string(percent));
    }

    void block_play()
    {
        std::lock_guard<std::mutex> lock(lock_);
        is_play_blocked_ = true;
    }

    void unblock_play()
    {
        {
            std::lock_guard<std::mutex> lock(lock_);
            is_play_blocked_ = false;
        }

        cv_.notify_all();
    }

    bool wait_until_inside_play(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(lock_);
        return cv_.wait_for(lock, timeout, [this] { return is_inside_play_; });
    }

    std::vector<std::string> get_calls() const
    {
        std::lock_guard<std::mutex> lock(lock_);
        return calls_;
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(lock_);
        calls_.clear();
    }

  private:
    bool record(std::string &&what)
    {
        std::lock_guard<std::mutex> lock(lock_);
        calls_.emplace_back(std::move(what));
        return true;
    }
};

/*!
 * Status source with scripted poll outcomes.
 *
 * A failed status poll reports the player reachable if
 * #StatusSource::set_idle_reachable() has been called with \c true, which
 * simulates a player that answers without playback information.
 */
class StatusSource: public RemotePlayer::StatusSourceIface
{
  private:
    mutable std::mutex lock_;
    std::vector<bool> results_;
    size_t next_result_;
    bool is_idle_reachable_;
    Playback::Snapshot status_;

  public:
    StatusSource(const StatusSource &) = delete;
    StatusSource &operator=(const StatusSource &) = delete;

    explicit StatusSource():
        next_result_(0),
        is_idle_reachable_(false)
    {}

    /*!
     * Sequence of poll outcomes, last one repeats.
     */
    void set_results(std::vector<bool> &&results)
    {
        std::lock_guard<std::mutex> lock(lock_);
        results_ = std::move(results);
        next_result_ = 0;
    }

    void set_idle_reachable(bool is_reachable)
    {
        std::lock_guard<std::mutex> lock(lock_);
        is_idle_reachable_ = is_reachable;
    }

    void set_status(const Playback::Snapshot &status)
    {
        std::lock_guard<std::mutex> lock(lock_);
        status_ = status;
    }

    std::unique_ptr<Playback::Snapshot> get_status() final override
    {
        std::lock_guard<std::mutex> lock(lock_);

        bool result = true;

        if(!results_.empty())
        {
            result = results_[next_result_];

            if(next_result_ + 1 < results_.size())
                ++next_result_;
        }

        if(!result)
            return nullptr;

        std::unique_ptr<Playback::Snapshot> snapshot(new Playback::Snapshot);
        *snapshot = status_;
        return snapshot;
    }

    bool is_connected() final override
    {
        std::lock_guard<std::mutex> lock(lock_);
        return is_idle_reachable_;
    }
};

class Store: public Progress::StoreIface
{
  private:
    mutable std::mutex lock_;
    std::map<std::string, Progress::Saved> saved_;

  public:
    std::vector<std::string> cleared_;

    Store(const Store &) = delete;
    Store &operator=(const Store &) = delete;

    explicit Store() {}

    std::unique_ptr<Progress::Saved> get_progress(const std::string &context_uri) final override
    {
        std::lock_guard<std::mutex> lock(lock_);
        const auto it(saved_.find(context_uri));

        if(it == saved_.end())
            return nullptr;

        std::unique_ptr<Progress::Saved> result(new Progress::Saved);
        *result = it->second;
        return result;
    }

    bool save_progress(const std::string &context_uri,
                       const std::string &track_uri, uint32_t position_ms,
                       const std::string &track_name,
                       const std::string &artist) final override
    {
        std::lock_guard<std::mutex> lock(lock_);
        auto &s(saved_[context_uri]);

        s.context_uri_ = context_uri;
        s.track_uri_ = track_uri;
        s.position_ms_ = position_ms;
        s.track_name_ = track_name;
        s.artist_ = artist;

        return true;
    }

    void clear_progress(const std::string &context_uri) final override
    {
        std::lock_guard<std::mutex> lock(lock_);
        saved_.erase(context_uri);
        cleared_.push_back(context_uri);
    }

    bool has_progress(const std::string &context_uri) const
    {
        std::lock_guard<std::mutex> lock(lock_);
        return saved_.find(context_uri) != saved_.end();
    }
};

class PlayRequest: public Playback::PlayRequestIface
{
  public:
    std::vector<std::string> requests_;
    bool is_in_flight_;

    PlayRequest(const PlayRequest &) = delete;
    PlayRequest &operator=(const PlayRequest &) = delete;

    explicit PlayRequest():
        is_in_flight_(false)
    {}

    void request_play(const std::string &context_uri,
                      bool from_beginning) final override
    {
        requests_.push_back(from_beginning ? context_uri + " (from beginning)"
                                           : context_uri);
        is_in_flight_ = true;
    }

    bool is_in_flight() const final override { return is_in_flight_; }
};

}

#endif /* !FAKES_HH */
