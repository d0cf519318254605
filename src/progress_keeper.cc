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

#include "progress_keeper.hh"
#include "messages.h"

bool Progress::Keeper::save_from_status(RemotePlayer::StatusSourceIface &source,
                                        StoreIface &store,
                                        const std::string &fallback_context_uri)
{
    const auto status(source.get_status());

    if(status == nullptr || status->track_uri_.empty())
    {
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "No track info available for saving progress");
        return false;
    }

    const std::string &context_uri(status->context_uri_.empty()
                                   ? fallback_context_uri
                                   : status->context_uri_);

    if(context_uri.empty())
        return false;

    return store.save_progress(context_uri, status->track_uri_,
                               status->position_ms_, status->track_name_,
                               status->artist_);
}

void Progress::Keeper::save_async(const std::string &fallback_context_uri)
{
    /* stamp now so that we don't queue duplicates */
    last_save_ = clock_.now();

    auto &source(source_);
    auto &store(store_);

    executor_.submit(
        [&source, &store, fallback_context_uri] ()
        {
            save_from_status(source, store, fallback_context_uri);
        },
        "save progress");
}

void Progress::Keeper::save_left_context(const Playback::Snapshot &left)
{
    if(left.context_uri_.empty() || left.track_uri_.empty())
    {
        msg_vinfo(MESSAGE_LEVEL_DEBUG,
                  "No track info for context being left, not saving progress");
        return;
    }

    last_save_ = clock_.now();

    auto &store(store_);
    const std::string context_uri(left.context_uri_);
    const std::string track_uri(left.track_uri_);
    const uint32_t position_ms(left.position_ms_);
    const std::string track_name(left.track_name_);
    const std::string artist(left.artist_);

    executor_.submit(
        [&store, context_uri, track_uri, position_ms, track_name, artist] ()
        {
            if(!store.save_progress(context_uri, track_uri, position_ms,
                                    track_name, artist))
                msg_error(0, LOG_WARNING, "Failed saving progress for %s",
                          context_uri.c_str());
        },
        "save progress of left context");
}

void Progress::Keeper::tick(const Playback::Snapshot &now_playing)
{
    if(now_playing.is_playing() &&
       Clock::has_elapsed(clock_, last_save_, interval_))
        save_async(now_playing.context_uri_);
}

void Progress::Keeper::forget(const std::string &context_uri)
{
    auto &store(store_);

    executor_.submit([&store, context_uri] () { store.clear_progress(context_uri); },
                     "clear progress");
}

bool Progress::Keeper::save_now(const Playback::Snapshot &now_playing)
{
    if(!now_playing.is_playing() && now_playing.context_uri_.empty())
    {
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "No active playback to save on shutdown");
        return false;
    }

    if(!save_from_status(source_, store_, now_playing.context_uri_))
    {
        msg_error(0, LOG_WARNING, "Could not save progress on shutdown");
        return false;
    }

    msg_info("Saved progress on shutdown");

    return true;
}
