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

#ifndef CATALOG_HH
#define CATALOG_HH

#include <string>
#include <vector>
#include <memory>
#include <sys/types.h>

#include "playback_snapshot.hh"

namespace Catalog
{

enum class Kind
{
    ALBUM,
    PLAYLIST,
};

class Item
{
  public:
    std::string id_;
    std::string uri_;
    std::string name_;
    Kind kind_;
    std::string artist_;
    std::string image_;
    bool is_temp_;

    explicit Item(std::string &&id, std::string &&uri, std::string &&name,
                  Kind kind, std::string &&artist, std::string &&image,
                  bool is_temp = false):
        id_(std::move(id)),
        uri_(std::move(uri)),
        name_(std::move(name)),
        kind_(kind),
        artist_(std::move(artist)),
        image_(std::move(image)),
        is_temp_(is_temp)
    {}
};

/*!
 * The covers shown in the carousel.
 *
 * This is the list of items read from the catalog file, plus at most one
 * transient item appended for a context which is playing, but is not part
 * of the catalog. Owned by the main loop.
 */
class List
{
  private:
    std::string file_name_;
    std::vector<Item> items_;
    std::unique_ptr<Item> temp_item_;

  public:
    List(const List &) = delete;
    List &operator=(const List &) = delete;

    explicit List() {}

    bool load(const std::string &file_name);
    bool load_from_string(const std::string &json);

    size_t size() const { return items_.size() + (temp_item_ != nullptr ? 1 : 0); }
    bool empty() const { return size() == 0; }
    const Item *at(size_t idx) const;

    /*!
     * Find item with given context URI, including the temp item.
     *
     * \returns
     *     Index of the item, or -1 if not found.
     */
    ssize_t find(const std::string &uri) const;

    const Item *get_temp_item() const { return temp_item_.get(); }

    /*!
     * Create, replace, or remove the temp item for the playing context.
     *
     * \returns
     *     True if the list of displayed items has changed.
     */
    bool update_temp_item(const Playback::Snapshot &snapshot);

    /*!
     * Turn the temp item into a permanent catalog entry.
     *
     * The entry is appended to the catalog file, which is then reloaded.
     * Members of the file this class does not know about are preserved.
     *
     * \returns
     *     True on success, false if there is no temp item, if its context is
     *     already in the file, or if the file could not be written.
     */
    bool save_temp_item();

    /*!
     * Remove catalog entry at given index from the catalog file.
     *
     * The temp item cannot be deleted this way.
     */
    bool delete_item(size_t idx);

  private:
    bool is_in_catalog(const std::string &uri) const;
};

}

#endif /* !CATALOG_HH */
