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

#ifndef LIBRESPOT_CLIENT_HH
#define LIBRESPOT_CLIENT_HH

#include <string>
#include <chrono>

#include "remote_player.hh"

/*!
 * Access to go-librespot via its REST API.
 */
namespace Librespot
{

/*!
 * Map status payload to snapshot.
 *
 * \returns
 *     The snapshot, or \c nullptr if the payload is empty or malformed.
 */
std::unique_ptr<Playback::Snapshot> parse_status(const std::string &payload);

/*!
 * REST client for one go-librespot instance.
 *
 * Each call uses its own connection with a short, fixed timeout, so an
 * object may be used from several threads at the same time.
 */
class Client: public RemotePlayer::StatusSourceIface,
              public RemotePlayer::CommandSinkIface
{
  private:
    const std::string base_url_;

  public:
    Client(const Client &) = delete;
    Client &operator=(const Client &) = delete;

    explicit Client(std::string &&base_url):
        base_url_(std::move(base_url))
    {}

    std::unique_ptr<Playback::Snapshot> get_status() final override;
    bool is_connected() final override;

    bool play(const std::string &context_uri,
              const std::string &skip_to_uri) final override;
    bool pause() final override;
    bool resume() final override;
    bool next() final override;
    bool prev() final override;
    bool seek(uint32_t position_ms) final override;
    bool set_volume(unsigned int percent) final override;

  private:
    bool get(const char *path, std::chrono::milliseconds timeout,
             long &status_code, std::string &body);
    bool post(const char *path, const std::string &json_body,
              std::chrono::milliseconds timeout);
    bool perform(const char *path, const std::string *json_body,
                 std::chrono::milliseconds timeout,
                 long &status_code, std::string &body);
};

}

#endif /* !LIBRESPOT_CLIENT_HH */
