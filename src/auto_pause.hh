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

#ifndef AUTO_PAUSE_HH
#define AUTO_PAUSE_HH

#include <string>
#include <thread>
#include <functional>

#include "monotonic_clock.hh"
#include "async_executor.hh"
#include "logged_lock.hh"

namespace AutoPause
{

enum class State
{
    IDLE,
    ARMED,
    FADING,
};

/*!
 * Pause playback after a long time of listening to the same context.
 *
 * The timer is armed when playback of a context is observed, and it is reset
 * when the context changes or playback stops. When the timeout expires, the
 * local volume is ramped down to zero in a number of steps, then playback is
 * paused and the original volume is restored.
 *
 * All functions except the fade itself are called from the main loop. The
 * fade runs on its own thread, a volume restore requested from the main loop
 * is handed over to the executor.
 */
class Timer
{
  public:
    struct Policy
    {
        std::chrono::milliseconds timeout_;
        std::chrono::milliseconds fade_duration_;
        unsigned int fade_steps_;
        std::chrono::milliseconds restore_delay_;
    };

    using GetVolumeFn = std::function<unsigned int()>;
    using SetVolumeFn = std::function<void(unsigned int)>;
    using PauseFn = std::function<bool()>;

  private:
    const Clock::MonotonicIface &clock_;
    Async::ExecutorIface &executor_;
    const Policy policy_;
    const GetVolumeFn get_volume_;
    const SetVolumeFn set_volume_;
    const PauseFn pause_;

    mutable LoggedLock::Mutex lock_;
    LoggedLock::ConditionVariable abort_fade_;
    State state_;
    std::string context_uri_;
    Clock::TimePoint play_start_;
    unsigned int saved_volume_;
    bool should_restore_volume_;
    bool is_aborting_;
    std::thread fade_thread_;

  public:
    Timer(const Timer &) = delete;
    Timer &operator=(const Timer &) = delete;

    explicit Timer(const Clock::MonotonicIface &clock,
                   Async::ExecutorIface &executor, const Policy &policy,
                   GetVolumeFn &&get_volume, SetVolumeFn &&set_volume,
                   PauseFn &&pause):
        clock_(clock),
        executor_(executor),
        policy_(policy),
        get_volume_(std::move(get_volume)),
        set_volume_(std::move(set_volume)),
        pause_(std::move(pause)),
        state_(State::IDLE),
        saved_volume_(100),
        should_restore_volume_(false),
        is_aborting_(false)
    {
        LoggedLock::configure(lock_, "AutoPause", MESSAGE_LEVEL_DEBUG);
    }

    ~Timer() { shutdown(); }

    /*!
     * Playback of given context observed, arms the timer.
     *
     * Only a change of context restarts the timer, an empty context is
     * treated like a stop.
     */
    void on_play(const std::string &context_uri);

    /*!
     * Playback pause or stop observed, disarms the timer.
     */
    void on_stop();

    /*!
     * Check for timeout, call periodically while playing.
     *
     * \returns
     *     True if the fade has been started.
     */
    bool check(bool is_playing);

    /*!
     * User resumes playback manually, restore volume if still faded out.
     *
     * This is the case between the pause command and the delayed restore
     * done by the fade thread. The volume is set through the executor.
     */
    void restore_volume_if_needed();

    /*!
     * Time left until auto-pause.
     *
     * \returns
     *     False if the timer is not armed.
     */
    bool get_remaining(std::chrono::milliseconds &remaining) const;

    State get_state() const;

    /*!
     * Abort a running fade, restore volume, and wait for the fade thread.
     */
    void shutdown();

  private:
    void fade_out_and_pause(unsigned int original_volume);
    void reset__unlocked();
    void join_finished_fade();
};

}

#endif /* !AUTO_PAUSE_HH */
