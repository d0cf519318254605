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

#if HAVE_CONFIG_H
#include <config.h>
#endif /* HAVE_CONFIG_H */

#include <nlohmann/json.hpp>

#include "screen_state.hh"
#include "messages.h"

std::string Screen::render(const State &state, const Catalog::List &catalog,
                           const Playback::Snapshot &now_playing)
{
    nlohmann::json items = nlohmann::json::array();

    for(size_t i = 0; i < catalog.size(); ++i)
    {
        const Catalog::Item *item = catalog.at(i);

        items.push_back({
            { "uri",  item->uri_ },
            { "name", item->name_ },
            { "temp", item->is_temp_ },
        });
    }

    nlohmann::json np = {
        { "context",  now_playing.context_uri_ },
        { "track",    now_playing.track_name_ },
        { "artist",   now_playing.artist_ },
        { "album",    now_playing.album_ },
        { "cover",    now_playing.cover_url_ },
        { "position", now_playing.position_ms_ },
        { "duration", now_playing.duration_ms_ },
        { "progress", now_playing.progress() },
    };

    const nlohmann::json screen = {
        { "connected",   state.is_connected_ },
        { "sleeping",    state.is_sleeping_ },
        { "loading",     state.is_loading_ },
        { "playing",     state.is_playing_ },
        { "selected",    state.selected_index_ },
        { "delete_mode", state.is_delete_mode_ },
        { "items",       std::move(items) },
        { "volume_icon", state.volume_icon_ },
        { "now_playing", std::move(np) },
    };

    /* replace invalid UTF-8 rather than throwing */
    return screen.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool Screen::Output::update(const std::string &line)
{
    if(line == last_line_)
        return false;

    os_ << line << '\n';
    os_.flush();

    if(!os_)
    {
        msg_error(0, LOG_ERR, "Failed writing screen state");
        os_.clear();
        last_line_.clear();
        return false;
    }

    last_line_ = line;

    return true;
}
