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

#ifndef REMOTE_PLAYER_HH
#define REMOTE_PLAYER_HH

#include <string>
#include <memory>
#include <cinttypes>

#include "playback_snapshot.hh"

/*!
 * Interfaces of the remote player we are controlling.
 *
 * All functions block for at most a short, fixed time. They are called from
 * background threads only.
 */
namespace RemotePlayer
{

class StatusSourceIface
{
  protected:
    explicit StatusSourceIface() {}

  public:
    StatusSourceIface(const StatusSourceIface &) = delete;
    StatusSourceIface &operator=(const StatusSourceIface &) = delete;

    virtual ~StatusSourceIface() {}

    /*!
     * Fetch current status.
     *
     * \returns
     *     The status, or \c nullptr if there is no active playback, the
     *     player could not be reached, or it sent garbage.
     */
    virtual std::unique_ptr<Playback::Snapshot> get_status() = 0;

    /*!
     * Whether or not the player is reachable at all.
     */
    virtual bool is_connected() = 0;
};

class CommandSinkIface
{
  protected:
    explicit CommandSinkIface() {}

  public:
    CommandSinkIface(const CommandSinkIface &) = delete;
    CommandSinkIface &operator=(const CommandSinkIface &) = delete;

    virtual ~CommandSinkIface() {}

    /*!
     * Start playing context, optionally starting at given track.
     *
     * \param context_uri
     *     The album or playlist to play.
     * \param skip_to_uri
     *     Track inside the context to start with, empty for first track.
     */
    virtual bool play(const std::string &context_uri,
                      const std::string &skip_to_uri) = 0;
    virtual bool pause() = 0;
    virtual bool resume() = 0;
    virtual bool next() = 0;
    virtual bool prev() = 0;
    virtual bool seek(uint32_t position_ms) = 0;
    virtual bool set_volume(unsigned int percent) = 0;
};

}

#endif /* !REMOTE_PLAYER_HH */
