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

#include <cmath>
#include <limits>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "librespot_client.hh"
#include "messages.h"

static const std::chrono::milliseconds STATUS_TIMEOUT(2000);
static const std::chrono::milliseconds PROBE_TIMEOUT(1000);
static const std::chrono::milliseconds COMMAND_TIMEOUT(2000);
static const std::chrono::milliseconds PLAY_TIMEOUT(5000);

static std::string join_artists(const nlohmann::json &track)
{
    const auto it = track.find("artist_names");

    if(it == track.end() || !it->is_array())
        return "";

    std::string result;

    for(const auto &name : *it)
    {
        if(!name.is_string())
            continue;

        if(!result.empty())
            result += ", ";

        result += name.get<std::string>();
    }

    return result;
}

static std::string get_string(const nlohmann::json &obj, const char *key)
{
    const auto it = obj.find(key);

    return (it != obj.end() && it->is_string()) ? it->get<std::string>() : "";
}

static double clamped_number(const nlohmann::json &value, double max)
{
    const double d = value.get<double>();

    if(!std::isfinite(d) || d <= 0.0)
        return 0.0;

    return d < max ? d : max;
}

static uint32_t get_milliseconds(const nlohmann::json &obj, const char *key)
{
    const auto it = obj.find(key);

    if(it == obj.end() || !it->is_number())
        return 0;

    return static_cast<uint32_t>(
        clamped_number(*it, std::numeric_limits<uint32_t>::max()));
}

std::unique_ptr<Playback::Snapshot> Librespot::parse_status(const std::string &payload)
{
    if(payload.empty())
        return nullptr;

    try
    {
        const auto status(nlohmann::json::parse(payload));

        if(!status.is_object())
        {
            msg_error(0, LOG_NOTICE, "Status is not a JSON object");
            return nullptr;
        }

        std::unique_ptr<Playback::Snapshot> result(new Playback::Snapshot);

        result->stopped_ = status.value("stopped", true);
        result->paused_ = status.value("paused", false);
        result->context_uri_ = get_string(status, "context_uri");

        const auto vol = status.find("volume");

        if(vol != status.end() && vol->is_number())
        {
            result->volume_ =
                static_cast<int>(std::lround(clamped_number(*vol, 100.0)));
        }

        const auto track = status.find("track");

        if(track != status.end() && track->is_object())
        {
            result->track_uri_ = get_string(*track, "uri");
            result->track_name_ = get_string(*track, "name");
            result->artist_ = join_artists(*track);
            result->album_ = get_string(*track, "album_name");
            result->cover_url_ = get_string(*track, "album_cover_url");
            result->position_ms_ = get_milliseconds(*track, "position");
            result->duration_ms_ = get_milliseconds(*track, "duration");
        }

        return result;
    }
    catch(const std::exception &e)
    {
        msg_error(0, LOG_NOTICE, "Failed parsing status: %s", e.what());
    }

    return nullptr;
}

static size_t append_to_string(char *ptr, size_t size, size_t nmemb,
                               void *userdata)
{
    static_cast<std::string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

bool Librespot::Client::perform(const char *path, const std::string *json_body,
                                std::chrono::milliseconds timeout,
                                long &status_code, std::string &body)
{
    CURL *curl = curl_easy_init();

    if(curl == nullptr)
    {
        msg_out_of_memory("CURL handle");
        return false;
    }

    const std::string url(base_url_ + path);
    struct curl_slist *headers = nullptr;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

    if(json_body != nullptr)
    {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body->size()));
    }

    const CURLcode res = curl_easy_perform(curl);

    if(res == CURLE_OK)
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
    else
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "Request %s failed: %s",
                  path, curl_easy_strerror(res));

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    return res == CURLE_OK;
}

bool Librespot::Client::get(const char *path, std::chrono::milliseconds timeout,
                            long &status_code, std::string &body)
{
    return perform(path, nullptr, timeout, status_code, body);
}

bool Librespot::Client::post(const char *path, const std::string &json_body,
                             std::chrono::milliseconds timeout)
{
    long status_code = 0;
    std::string body;

    if(!perform(path, &json_body, timeout, status_code, body))
    {
        msg_error(0, LOG_ERR, "Command %s failed", path);
        return false;
    }

    msg_vinfo(MESSAGE_LEVEL_DEBUG, "Command %s: %ld", path, status_code);

    if(status_code >= 200 && status_code < 300)
        return true;

    msg_error(0, LOG_WARNING, "Command %s failed: %ld %s",
              path, status_code, body.c_str());

    return false;
}

std::unique_ptr<Playback::Snapshot> Librespot::Client::get_status()
{
    long status_code = 0;
    std::string body;

    if(!get("/status", STATUS_TIMEOUT, status_code, body))
        return nullptr;

    /* 204 means the player is idle */
    if(status_code != 200)
        return nullptr;

    return parse_status(body);
}

bool Librespot::Client::is_connected()
{
    long status_code = 0;
    std::string body;

    if(!get("/status", PROBE_TIMEOUT, status_code, body))
        return false;

    return status_code == 200 || status_code == 204;
}

bool Librespot::Client::play(const std::string &context_uri,
                             const std::string &skip_to_uri)
{
    nlohmann::json body;

    body["uri"] = context_uri;

    if(!skip_to_uri.empty())
    {
        msg_info("Resuming at track: %s", skip_to_uri.c_str());
        body["skip_to_uri"] = skip_to_uri;
    }

    const bool ok = post("/player/play", body.dump(), PLAY_TIMEOUT);

    if(ok)
        msg_info("Play request sent");

    return ok;
}

bool Librespot::Client::pause()
{
    return post("/player/pause", "", COMMAND_TIMEOUT);
}

bool Librespot::Client::resume()
{
    return post("/player/resume", "", COMMAND_TIMEOUT);
}

bool Librespot::Client::next()
{
    return post("/player/next", "", COMMAND_TIMEOUT);
}

bool Librespot::Client::prev()
{
    return post("/player/prev", "", COMMAND_TIMEOUT);
}

bool Librespot::Client::seek(uint32_t position_ms)
{
    const nlohmann::json body = { { "position", position_ms } };
    return post("/player/seek", body.dump(), COMMAND_TIMEOUT);
}

bool Librespot::Client::set_volume(unsigned int percent)
{
    const nlohmann::json body = { { "volume", percent > 100 ? 100 : percent } };
    return post("/player/volume", body.dump(), COMMAND_TIMEOUT);
}
