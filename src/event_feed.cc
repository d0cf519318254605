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

#include <cerrno>
#include <poll.h>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "event_feed.hh"
#include "messages.h"

static const std::chrono::milliseconds RECONNECT_DELAY(1000);
static const int RECEIVE_POLL_TIMEOUT_MS = 500;

void Librespot::EventFeed::start()
{
    if(thread_.joinable())
    {
        MSG_BUG("Event feed already running");
        return;
    }

    {
        std::lock_guard<LoggedLock::Mutex> lock(lock_);
        is_running_ = true;
    }

    thread_ = std::thread([this] { run(); });

    msg_info("Started event listener: %s", url_.c_str());
}

void Librespot::EventFeed::stop()
{
    if(!thread_.joinable())
        return;

    {
        std::lock_guard<LoggedLock::Mutex> lock(lock_);
        is_running_ = false;
    }

    wakeup_.notify_all();
    thread_.join();

    msg_info("Stopped event listener");
}

std::string Librespot::EventFeed::get_context_uri() const
{
    std::lock_guard<LoggedLock::Mutex> lock(lock_);
    return context_uri_;
}

bool Librespot::EventFeed::keep_running() const
{
    std::lock_guard<LoggedLock::Mutex> lock(lock_);
    return is_running_;
}

Librespot::EventFeed::EventKind
Librespot::EventFeed::parse_event(const std::string &message,
                                  std::string &context_uri)
{
    try
    {
        const auto event(nlohmann::json::parse(message));

        if(!event.is_object())
            return EventKind::INVALID;

        const auto type = event.find("type");

        if(type == event.end() || !type->is_string() ||
           type->get<std::string>() != "playing")
            return EventKind::OTHER;

        context_uri.clear();

        const auto data = event.find("data");

        if(data != event.end() && data->is_object())
        {
            const auto uri = data->find("context_uri");

            if(uri != data->end() && uri->is_string())
                context_uri = uri->get<std::string>();
        }

        return EventKind::PLAYING;
    }
    catch(const std::exception &e)
    {
        msg_error(0, LOG_NOTICE, "Error parsing event: %s", e.what());
    }

    return EventKind::INVALID;
}

Librespot::EventFeed::EventKind
Librespot::EventFeed::handle_message(const std::string &message)
{
    std::string uri;
    const EventKind kind = parse_event(message, uri);

    switch(kind)
    {
      case EventKind::INVALID:
        return kind;

      case EventKind::PLAYING:
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "Playing event, context: %s", uri.c_str());

        {
            std::lock_guard<LoggedLock::Mutex> lock(lock_);
            context_uri_ = std::move(uri);
        }

        break;

      case EventKind::OTHER:
        break;
    }

    if(on_update_ != nullptr)
        on_update_();

    return kind;
}

void Librespot::EventFeed::run()
{
    while(keep_running())
    {
        connect_and_listen();

        LoggedLock::UniqueLock<LoggedLock::Mutex> lock(lock_);
        wakeup_.wait_for(lock, RECONNECT_DELAY, [this] { return !is_running_; });
    }
}

void Librespot::EventFeed::connect_and_listen()
{
    CURL *curl = curl_easy_init();

    if(curl == nullptr)
    {
        msg_out_of_memory("CURL handle");
        return;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 2000L);
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L);

    CURLcode res = curl_easy_perform(curl);

    if(res != CURLE_OK)
    {
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "WebSocket connect failed: %s",
                  curl_easy_strerror(res));
        curl_easy_cleanup(curl);
        return;
    }

    if(was_connected_)
    {
        msg_info("WebSocket reconnected");

        if(on_reconnect_ != nullptr)
            on_reconnect_();
    }
    else
    {
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "WebSocket connected");
        was_connected_ = true;
    }

    curl_socket_t sockfd;

    if(curl_easy_getinfo(curl, CURLINFO_ACTIVESOCKET, &sockfd) != CURLE_OK)
        sockfd = CURL_SOCKET_BAD;

    std::string message;
    char buffer[4096];
    bool is_connected = (sockfd != CURL_SOCKET_BAD);

    while(is_connected && keep_running())
    {
        size_t received;
        struct curl_ws_frame *meta;

        res = curl_ws_recv(curl, buffer, sizeof(buffer), &received, &meta);

        if(res == CURLE_AGAIN)
        {
            struct pollfd pfd;
            pfd.fd = sockfd;
            pfd.events = POLLIN;
            pfd.revents = 0;

            if(poll(&pfd, 1, RECEIVE_POLL_TIMEOUT_MS) < 0 && errno != EINTR)
            {
                msg_error(errno, LOG_ERR, "poll() on WebSocket failed");
                break;
            }

            continue;
        }

        if(res != CURLE_OK)
        {
            msg_vinfo(MESSAGE_LEVEL_DEBUG, "WebSocket disconnected: %s",
                      curl_easy_strerror(res));
            break;
        }

        if((meta->flags & CURLWS_CLOSE) != 0)
        {
            msg_vinfo(MESSAGE_LEVEL_DEBUG, "WebSocket closed by peer");
            break;
        }

        if((meta->flags & (CURLWS_TEXT | CURLWS_CONT)) == 0)
            continue;

        message.append(buffer, received);

        /* fragmented or partially received message */
        if(meta->bytesleft > 0 || (meta->flags & CURLWS_CONT) != 0)
            continue;

        handle_message(message);
        message.clear();
    }

    curl_easy_cleanup(curl);
}
