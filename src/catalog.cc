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

#include <fstream>
#include <sstream>
#include <cerrno>
#include <cstdio>

#include <glib.h>

#include <nlohmann/json.hpp>

#include "catalog.hh"
#include "messages.h"

static std::string get_string_member(const nlohmann::json &obj, const char *key)
{
    const auto it(obj.find(key));

    if(it == obj.end() || !it->is_string())
        return "";

    return it->get<std::string>();
}

static const char *kind_name(Catalog::Kind kind)
{
    switch(kind)
    {
      case Catalog::Kind::ALBUM:
        break;

      case Catalog::Kind::PLAYLIST:
        return "playlist";
    }

    return "album";
}

static std::string make_timestamp()
{
    GDateTime *now = g_date_time_new_now_local();
    gchar *temp = g_date_time_format(now, "%Y-%m-%dT%H:%M:%S");
    std::string result(temp != nullptr ? temp : "");

    g_free(temp);
    g_date_time_unref(now);

    return result;
}

/*!
 * Read catalog file as generic JSON, let \p edit modify it, write it back.
 *
 * A missing file is treated as empty catalog. The file is replaced
 * atomically.
 */
template <typename EditFn>
static bool edit_catalog_file(const std::string &file_name, nlohmann::json &data,
                              const EditFn &edit)
{
    if(file_name.empty())
    {
        msg_error(0, LOG_ERR, "Cannot edit catalog: no catalog file");
        return false;
    }

    try
    {
        std::ifstream in(file_name);

        if(in.is_open())
            data = nlohmann::json::parse(in);
        else
            data = nlohmann::json::object();

        if(!data.is_object())
        {
            msg_error(0, LOG_ERR, "Catalog file \"%s\" is not a JSON object",
                      file_name.c_str());
            return false;
        }

        if(!data.contains("items") || !data["items"].is_array())
            data["items"] = nlohmann::json::array();

        if(!edit(data["items"]))
            return false;

        const std::string temp_name(file_name + ".tmp");

        {
            std::ofstream out(temp_name, std::ios::trunc);

            out << data.dump(2, ' ', false,
                             nlohmann::json::error_handler_t::replace)
                << '\n';
            out.close();

            if(!out)
            {
                msg_error(errno, LOG_ERR, "Failed writing \"%s\"",
                          temp_name.c_str());
                std::remove(temp_name.c_str());
                return false;
            }
        }

        if(std::rename(temp_name.c_str(), file_name.c_str()) != 0)
        {
            msg_error(errno, LOG_ERR, "Failed replacing \"%s\"",
                      file_name.c_str());
            std::remove(temp_name.c_str());
            return false;
        }
    }
    catch(const std::exception &e)
    {
        msg_error(0, LOG_ERR, "Failed editing catalog \"%s\": %s",
                  file_name.c_str(), e.what());
        return false;
    }

    return true;
}

static Catalog::Kind kind_from_uri(const std::string &uri)
{
    return uri.find("playlist") != std::string::npos
        ? Catalog::Kind::PLAYLIST
        : Catalog::Kind::ALBUM;
}

bool Catalog::List::load(const std::string &file_name)
{
    file_name_ = file_name;

    std::ifstream in(file_name);

    if(!in.is_open())
    {
        msg_error(errno, LOG_WARNING, "Catalog not found at \"%s\"",
                  file_name.c_str());
        items_.clear();
        return false;
    }

    std::ostringstream os;
    os << in.rdbuf();

    msg_info("Loading catalog from \"%s\"", file_name.c_str());

    return load_from_string(os.str());
}

bool Catalog::List::load_from_string(const std::string &json)
{
    std::vector<Item> items;

    try
    {
        const auto data(nlohmann::json::parse(json));

        if(data.is_object() && data.contains("items") && data["items"].is_array())
        {
            for(const auto &entry : data["items"])
            {
                if(!entry.is_object())
                    continue;

                auto type(get_string_member(entry, "type"));

                if(type == "track")
                    continue;

                auto uri(get_string_member(entry, "uri"));

                if(uri.empty())
                {
                    msg_error(0, LOG_NOTICE, "Skipping catalog entry without URI");
                    continue;
                }

                const Kind kind = type.empty()
                    ? kind_from_uri(uri)
                    : (type == "playlist" ? Kind::PLAYLIST : Kind::ALBUM);

                items.emplace_back(get_string_member(entry, "id"), std::move(uri),
                                   get_string_member(entry, "name"), kind,
                                   get_string_member(entry, "artist"),
                                   get_string_member(entry, "image"));
            }
        }
    }
    catch(const std::exception &e)
    {
        msg_error(0, LOG_ERR, "Invalid JSON in catalog: %s", e.what());
        items_.clear();
        return false;
    }

    items_ = std::move(items);
    msg_info("Loaded %zu catalog items", items_.size());

    if(temp_item_ != nullptr && is_in_catalog(temp_item_->uri_))
        temp_item_.reset();

    return true;
}

const Catalog::Item *Catalog::List::at(size_t idx) const
{
    if(idx < items_.size())
        return &items_[idx];

    if(idx == items_.size() && temp_item_ != nullptr)
        return temp_item_.get();

    return nullptr;
}

ssize_t Catalog::List::find(const std::string &uri) const
{
    if(uri.empty())
        return -1;

    for(size_t i = 0; i < items_.size(); ++i)
        if(items_[i].uri_ == uri)
            return i;

    if(temp_item_ != nullptr && temp_item_->uri_ == uri)
        return items_.size();

    return -1;
}

bool Catalog::List::is_in_catalog(const std::string &uri) const
{
    for(const auto &item : items_)
        if(item.uri_ == uri)
            return true;

    return false;
}

bool Catalog::List::update_temp_item(const Playback::Snapshot &snapshot)
{
    const std::string &uri(snapshot.context_uri_);

    if(uri.empty() || is_in_catalog(uri))
    {
        if(temp_item_ == nullptr)
            return false;

        msg_vinfo(MESSAGE_LEVEL_DIAG, "Removing temp item %s",
                  temp_item_->uri_.c_str());
        temp_item_.reset();
        return true;
    }

    if(temp_item_ != nullptr && temp_item_->uri_ == uri)
        return false;

    const Kind kind = kind_from_uri(uri);
    std::string name(snapshot.album_);

    if(name.empty())
        name = (kind == Kind::PLAYLIST) ? "Playlist" : "Album";

    temp_item_.reset(new Item("temp", std::string(uri), std::move(name), kind,
                              std::string(snapshot.artist_),
                              std::string(snapshot.cover_url_), true));

    msg_info("TempItem: %s", temp_item_->name_.c_str());

    return true;
}

bool Catalog::List::save_temp_item()
{
    if(temp_item_ == nullptr)
    {
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "No temp item to save");
        return false;
    }

    const Item &temp(*temp_item_);
    nlohmann::json data;

    const bool ok = edit_catalog_file(file_name_, data,
        [&temp] (nlohmann::json &items)
        {
            for(const auto &entry : items)
            {
                if(entry.is_object() && get_string_member(entry, "uri") == temp.uri_)
                {
                    msg_error(0, LOG_WARNING, "Item already in catalog: %s",
                              temp.name_.c_str());
                    return false;
                }
            }

            items.push_back({
                { "id",      std::to_string(g_get_real_time() / 1000) },
                { "type",    kind_name(temp.kind_) },
                { "uri",     temp.uri_ },
                { "name",    temp.name_ },
                { "artist",  temp.artist_ },
                { "image",   temp.image_ },
                { "addedAt", make_timestamp() },
            });

            return true;
        });

    if(!ok)
        return false;

    msg_info("Saved to catalog: %s", temp.name_.c_str());

    return load_from_string(data.dump());
}

bool Catalog::List::delete_item(size_t idx)
{
    if(idx >= items_.size())
    {
        msg_error(0, LOG_NOTICE, "Cannot delete catalog item %zu", idx);
        return false;
    }

    const Item &item(items_[idx]);
    nlohmann::json data;

    const bool ok = edit_catalog_file(file_name_, data,
        [&item] (nlohmann::json &items)
        {
            for(auto it = items.begin(); it != items.end(); ++it)
            {
                if(!it->is_object())
                    continue;

                const bool match = item.id_.empty()
                    ? get_string_member(*it, "uri") == item.uri_
                    : get_string_member(*it, "id") == item.id_;

                if(match)
                {
                    items.erase(it);
                    return true;
                }
            }

            msg_error(0, LOG_WARNING, "Item not found in catalog file: %s",
                      item.uri_.c_str());
            return false;
        });

    if(!ok)
        return false;

    msg_info("Deleted from catalog: %s", item.name_.c_str());

    return load_from_string(data.dump());
}
