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

#include <cinttypes>

#include <glib.h>

#include "progress_store.hh"
#include "messages.h"

static const char KEY_TRACK_URI[]   = "track_uri";
static const char KEY_POSITION_MS[] = "position_ms";
static const char KEY_TRACK_NAME[]  = "track_name";
static const char KEY_ARTIST[]      = "artist";
static const char KEY_UPDATED_AT[]  = "updated_at";

static int64_t system_wall_clock()
{
    return g_get_real_time() / G_USEC_PER_SEC;
}

static bool is_usable_group_name(const std::string &context_uri)
{
    if(context_uri.empty())
        return false;

    for(const char ch : context_uri)
        if(ch == '[' || ch == ']' || ch == '\n' || ch == '\r')
            return false;

    return true;
}

static std::string get_string(GKeyFile *kf, const char *group, const char *key)
{
    gchar *temp = g_key_file_get_string(kf, group, key, nullptr);

    if(temp == nullptr)
        return "";

    std::string result(temp);
    g_free(temp);

    return result;
}

Progress::Store::Store(std::string &&file_name, std::chrono::hours expiry,
                       WallClock &&wall_clock):
    file_name_(std::move(file_name)),
    expiry_(expiry),
    wall_clock_(wall_clock != nullptr ? std::move(wall_clock) : system_wall_clock),
    key_file_(g_key_file_new())
{
    LoggedLock::configure(lock_, "ProgressStore", MESSAGE_LEVEL_DEBUG);

    GError *error = nullptr;

    if(!g_key_file_load_from_file(key_file_, file_name_.c_str(),
                                  G_KEY_FILE_NONE, &error))
    {
        if(!g_error_matches(error, G_FILE_ERROR, G_FILE_ERROR_NOENT))
            msg_error(0, LOG_WARNING,
                      "Failed reading resume file \"%s\", starting empty: %s",
                      file_name_.c_str(), error->message);

        g_error_free(error);
    }
}

Progress::Store::~Store()
{
    g_key_file_free(key_file_);
}

std::unique_ptr<Progress::Saved>
Progress::Store::get_progress(const std::string &context_uri)
{
    if(!is_usable_group_name(context_uri))
        return nullptr;

    std::lock_guard<LoggedLock::Mutex> lock(lock_);

    const char *const group = context_uri.c_str();

    if(!g_key_file_has_group(key_file_, group))
        return nullptr;

    std::unique_ptr<Saved> result(new Saved);

    GError *error = nullptr;
    const gint64 updated_at =
        g_key_file_get_int64(key_file_, group, KEY_UPDATED_AT, &error);

    if(error != nullptr)
    {
        msg_error(0, LOG_WARNING, "Discarding broken resume data for %s: %s",
                  group, error->message);
        g_error_free(error);
        g_key_file_remove_group(key_file_, group, nullptr);
        write_back();
        return nullptr;
    }

    const int64_t age = wall_clock_() - updated_at;

    if(age > std::chrono::duration_cast<std::chrono::seconds>(expiry_).count())
    {
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "Progress for %s expired (%" PRId64 " h old)",
                  group, age / 3600);
        g_key_file_remove_group(key_file_, group, nullptr);
        write_back();
        return nullptr;
    }

    const gint64 position =
        g_key_file_get_int64(key_file_, group, KEY_POSITION_MS, nullptr);

    result->context_uri_ = context_uri;
    result->track_uri_ = get_string(key_file_, group, KEY_TRACK_URI);
    result->position_ms_ = position > 0 && position <= G_MAXUINT32 ? position : 0;
    result->track_name_ = get_string(key_file_, group, KEY_TRACK_NAME);
    result->artist_ = get_string(key_file_, group, KEY_ARTIST);
    result->updated_at_ = updated_at;

    msg_info("Resume: \"%s\" @ %us",
             result->track_name_.c_str(), result->position_ms_ / 1000U);

    return result;
}

bool Progress::Store::save_progress(const std::string &context_uri,
                                    const std::string &track_uri,
                                    uint32_t position_ms,
                                    const std::string &track_name,
                                    const std::string &artist)
{
    if(!is_usable_group_name(context_uri) || track_uri.empty())
        return false;

    std::lock_guard<LoggedLock::Mutex> lock(lock_);

    const char *const group = context_uri.c_str();

    g_key_file_set_string(key_file_, group, KEY_TRACK_URI, track_uri.c_str());
    g_key_file_set_int64(key_file_, group, KEY_POSITION_MS, position_ms);
    g_key_file_set_string(key_file_, group, KEY_TRACK_NAME, track_name.c_str());
    g_key_file_set_string(key_file_, group, KEY_ARTIST, artist.c_str());
    g_key_file_set_int64(key_file_, group, KEY_UPDATED_AT, wall_clock_());

    msg_vinfo(MESSAGE_LEVEL_DEBUG, "Saved progress: %s @ %us",
              track_name.c_str(), position_ms / 1000U);

    return write_back();
}

void Progress::Store::clear_progress(const std::string &context_uri)
{
    if(!is_usable_group_name(context_uri))
        return;

    std::lock_guard<LoggedLock::Mutex> lock(lock_);

    if(!g_key_file_remove_group(key_file_, context_uri.c_str(), nullptr))
        return;

    msg_vinfo(MESSAGE_LEVEL_DEBUG, "Cleared progress for %s", context_uri.c_str());
    write_back();
}

bool Progress::Store::write_back()
{
    GError *error = nullptr;

    if(g_key_file_save_to_file(key_file_, file_name_.c_str(), &error))
        return true;

    msg_error(0, LOG_WARNING, "Failed writing resume file \"%s\": %s",
              file_name_.c_str(), error->message);
    g_error_free(error);

    return false;
}
