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

#ifndef CONNECTION_MONITOR_HH
#define CONNECTION_MONITOR_HH

#include <atomic>
#include <chrono>

namespace Connection
{

/*!
 * Debounced connectivity state of the remote player.
 *
 * Results of status polls are fed in by the polling thread. Connectivity is
 * lost only after a number of consecutive failures, and it is regained with
 * the first success. The state may be read from any thread.
 */
class Monitor
{
  public:
    enum class Transition
    {
        NONE,
        LOST,
        RESTORED,
    };

  private:
    const unsigned int grace_threshold_;
    const std::chrono::milliseconds normal_interval_;
    const std::chrono::milliseconds fast_interval_;

    std::atomic<unsigned int> failure_count_;
    std::atomic<bool> is_connected_;

  public:
    Monitor(const Monitor &) = delete;
    Monitor &operator=(const Monitor &) = delete;

    explicit Monitor(unsigned int grace_threshold,
                     std::chrono::milliseconds normal_interval,
                     std::chrono::milliseconds fast_interval):
        grace_threshold_(grace_threshold > 0 ? grace_threshold : 1),
        normal_interval_(normal_interval),
        fast_interval_(fast_interval),
        failure_count_(0),
        is_connected_(false)
    {}

    /*!
     * Account for the outcome of one poll.
     */
    Transition feed(bool success);

    /*!
     * Assume the player is reachable.
     *
     * Used on wake-up and after the event feed has reconnected, followed by
     * an immediate poll which corrects the assumption if it was wrong.
     */
    Transition assume_reachable();

    bool is_connected() const { return is_connected_; }
    unsigned int get_failure_count() const { return failure_count_; }

    /*!
     * Interval to wait before the next regular poll.
     */
    std::chrono::milliseconds get_poll_interval() const
    {
        return is_connected_ ? normal_interval_ : fast_interval_;
    }

    /*!
     * Delay after failed startup attempt \p attempt (counting from 0).
     */
    static std::chrono::milliseconds
    get_startup_backoff(unsigned int attempt, std::chrono::milliseconds base,
                        std::chrono::milliseconds cap);
};

}

#endif /* !CONNECTION_MONITOR_HH */
