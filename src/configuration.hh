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

#ifndef CONFIGURATION_HH
#define CONFIGURATION_HH

#include <array>
#include <string>
#include <vector>
#include <functional>
#include <cinttypes>

#include "messages.h"

namespace Configuration
{

/*!
 * Description of a single configuration key.
 *
 * The deserializer must leave the destination untouched if it rejects the
 * passed string.
 */
template <typename ValuesT>
class ConfigKey
{
  public:
    using Deserializer = std::function<bool(ValuesT &, const char *)>;

    const typename ValuesT::KeyID id_;
    const std::string name_;

  private:
    const Deserializer deserialize_;

  public:
    ConfigKey(const ConfigKey &) = delete;
    ConfigKey(ConfigKey &&) = default;
    ConfigKey &operator=(const ConfigKey &) = delete;

    explicit ConfigKey(typename ValuesT::KeyID id, const char *name,
                       Deserializer &&deserializer):
        id_(id),
        name_(name),
        deserialize_(std::move(deserializer))
    {}

    bool write(ValuesT &dest, const char *src) const
    {
        return deserialize_(dest, src);
    }
};

bool default_deserialize(uint32_t &dest, const char *src);
bool default_deserialize(std::string &dest, const char *src);
bool default_deserialize(std::vector<uint32_t> &dest, const char *src);

/*!
 * Read-only configuration backed by an INI file.
 *
 * Values missing from the file keep their defaults. Values which cannot be
 * parsed are reported and replaced by their defaults.
 */
template <typename ValuesT>
class ConfigManager
{
  private:
    const char *const configuration_file_;
    const ValuesT &default_settings_;

    ValuesT settings_;

  public:
    ConfigManager(const ConfigManager &) = delete;
    ConfigManager &operator=(const ConfigManager &) = delete;

    explicit ConfigManager(const char *configuration_file,
                           const ValuesT &defaults):
        configuration_file_(configuration_file),
        default_settings_(defaults),
        settings_(defaults)
    {}

    /*!
     * Load configuration from file.
     *
     * \returns
     *     True if the file has been read, false if the defaults are in effect.
     */
    bool load()
    {
        ValuesT loaded(default_settings_);

        if(try_load(configuration_file_, loaded))
        {
            settings_ = loaded;
            return true;
        }

        reset_to_defaults();
        return false;
    }

    void reset_to_defaults() { settings_ = default_settings_; }

    const char *get_file_name() const { return configuration_file_; }
    const ValuesT &values() const { return settings_; }

  private:
    static bool try_load(const char *file, ValuesT &values);
};

}

#endif /* !CONFIGURATION_HH */
