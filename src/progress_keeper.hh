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

#ifndef PROGRESS_KEEPER_HH
#define PROGRESS_KEEPER_HH

#include "progress_store.hh"
#include "remote_player.hh"
#include "async_executor.hh"
#include "monotonic_clock.hh"

namespace Progress
{

/*!
 * Decides when to save the resume position of the playing context.
 *
 * Positions are taken from a fresh status fetch, not from the last poll, so
 * that the saved position is as accurate as possible. Owned by the main
 * loop, the actual work is done by the executor.
 */
class Keeper
{
  private:
    RemotePlayer::StatusSourceIface &source_;
    StoreIface &store_;
    Async::ExecutorIface &executor_;
    const Clock::MonotonicIface &clock_;
    const std::chrono::milliseconds interval_;

    Clock::TimePoint last_save_;

  public:
    Keeper(const Keeper &) = delete;
    Keeper &operator=(const Keeper &) = delete;

    explicit Keeper(RemotePlayer::StatusSourceIface &source, StoreIface &store,
                    Async::ExecutorIface &executor,
                    const Clock::MonotonicIface &clock,
                    std::chrono::milliseconds interval):
        source_(source),
        store_(store),
        executor_(executor),
        clock_(clock),
        interval_(interval),
        last_save_(clock.now())
    {}

    /*!
     * Save progress in the background.
     *
     * \param fallback_context_uri
     *     Context to save the position for if the status does not tell.
     */
    void save_async(const std::string &fallback_context_uri);

    /*!
     * Save progress of a context we are switching away from.
     *
     * The position is taken from the given snapshot because by the time a
     * fresh status could be fetched, the player may already report the new
     * context.
     */
    void save_left_context(const Playback::Snapshot &left);

    /*!
     * Periodic save while playing.
     */
    void tick(const Playback::Snapshot &now_playing);

    /*!
     * Context has finished playing naturally, drop its resume position.
     */
    void forget(const std::string &context_uri);

    /*!
     * Blocking save for use during shutdown.
     */
    bool save_now(const Playback::Snapshot &now_playing);

  private:
    static bool save_from_status(RemotePlayer::StatusSourceIface &source,
                                 StoreIface &store,
                                 const std::string &fallback_context_uri);
};

}

#endif /* !PROGRESS_KEEPER_HH */
