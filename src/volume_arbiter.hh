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

#ifndef VOLUME_ARBITER_HH
#define VOLUME_ARBITER_HH

#include <vector>
#include <atomic>

#include "system_control.hh"
#include "remote_player.hh"
#include "async_executor.hh"
#include "monotonic_clock.hh"

namespace Volume
{

/*!
 * Who owns the volume.
 *
 * In local mode, the remote volume is held at 100% and the local mixer is
 * set to one of a few fixed levels. In remote mode, the local mixer is held
 * at 100% and some other controller sets the remote volume.
 */
enum class Mode
{
    LOCAL,
    REMOTE,
};

/*!
 * Arbitration between local and remote volume control.
 *
 * All functions except #Volume::Arbiter::ensure_remote_at_full() are called
 * from the main loop.
 */
class Arbiter
{
  public:
    struct Policy
    {
        std::vector<unsigned int> levels_;
        std::chrono::milliseconds echo_window_;
        unsigned int takeover_threshold_;
    };

  private:
    const Clock::MonotonicIface &clock_;
    SystemControl::Iface &system_;
    RemotePlayer::CommandSinkIface &sink_;
    Async::ExecutorIface &executor_;
    const Policy policy_;

    Mode mode_;
    size_t index_;
    size_t local_index_;
    bool has_local_change_;
    Clock::TimePoint last_local_change_;

    std::atomic<bool> is_remote_initialized_;

  public:
    Arbiter(const Arbiter &) = delete;
    Arbiter &operator=(const Arbiter &) = delete;

    explicit Arbiter(const Clock::MonotonicIface &clock,
                     SystemControl::Iface &system,
                     RemotePlayer::CommandSinkIface &sink,
                     Async::ExecutorIface &executor, Policy &&policy);

    /*!
     * Apply current level to the local mixer.
     */
    void init();

    /*!
     * Advance to next local level, taking back control if necessary.
     */
    void toggle();

    /*!
     * Remote volume as reported by the player.
     */
    void handle_remote_change(int remote_volume);

    /*!
     * Return to local mode.
     */
    void on_wake();

    /*!
     * Set the remote volume to 100%, but only on first call.
     *
     * May be called from any thread, blocks while talking to the player.
     *
     * \returns
     *     True if the volume has been set by this call.
     */
    bool ensure_remote_at_full();

    Mode get_mode() const { return mode_; }
    size_t get_index() const { return index_; }
    const char *get_icon_name() const;

    /*!
     * Effective local mixer level in percent.
     */
    unsigned int level() const;

  private:
    void switch_to_local_mode();
    void apply_local_level(unsigned int percent);
    void reset_remote_volume();
};

}

#endif /* !VOLUME_ARBITER_HH */
