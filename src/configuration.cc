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

#include <cstring>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <glib.h>

#include "configuration.hh"
#include "configuration_coverplayd.hh"
#include "messages.h"

template <typename T>
static bool parse_uint(const char *in, T &result)
{
    if(in == nullptr || *in == '\0' || *in == '-')
        return false;

    char *endptr = nullptr;
    errno = 0;
    const unsigned long temp = strtoul(in, &endptr, 10);

    if(*endptr != '\0' || errno == ERANGE)
        return false;

    if(temp > std::numeric_limits<T>::max())
        return false;

    result = temp;

    return true;
}

bool Configuration::default_deserialize(uint32_t &dest, const char *src)
{
    return parse_uint(src, dest);
}

bool Configuration::default_deserialize(std::string &dest, const char *src)
{
    if(src == nullptr || *src == '\0')
        return false;

    dest = src;
    return true;
}

bool Configuration::default_deserialize(std::vector<uint32_t> &dest,
                                        const char *src)
{
    if(src == nullptr)
        return false;

    std::vector<uint32_t> temp;
    gchar **const fields = g_strsplit(src, ";", -1);
    bool ok = true;

    for(gchar **f = fields; *f != nullptr; ++f)
    {
        g_strstrip(*f);

        /* tolerate a trailing separator */
        if(**f == '\0' && f[1] == nullptr)
            break;

        uint32_t value;

        if(!parse_uint(*f, value))
        {
            ok = false;
            break;
        }

        temp.push_back(value);
    }

    g_strfreev(fields);

    if(!ok || temp.empty())
        return false;

    dest = std::move(temp);
    return true;
}

template <typename ValuesT>
bool Configuration::ConfigManager<ValuesT>::try_load(const char *file,
                                                     ValuesT &values)
{
    GKeyFile *key_file = g_key_file_new();
    GError *error = nullptr;

    if(!g_key_file_load_from_file(key_file, file, G_KEY_FILE_NONE, &error))
    {
        if(g_error_matches(error, G_FILE_ERROR, G_FILE_ERROR_NOENT))
            msg_info("Configuration file \"%s\" not found, using defaults",
                     file);
        else
            msg_error(0, LOG_ERR, "Failed reading configuration file \"%s\": %s",
                      file, error->message);

        g_error_free(error);
        g_key_file_free(key_file);
        return false;
    }

    const char *const section = ValuesT::CONFIGURATION_SECTION_NAME;

    gchar **const file_keys = g_key_file_get_keys(key_file, section,
                                                  nullptr, nullptr);

    if(file_keys != nullptr)
    {
        for(gchar **k = file_keys; *k != nullptr; ++k)
        {
            bool found = false;

            for(const auto &key : ValuesT::all_keys)
            {
                if(key.name_ == *k)
                {
                    found = true;
                    break;
                }
            }

            if(!found)
                msg_error(0, LOG_WARNING,
                          "Ignoring unknown configuration key \"%s\"", *k);
        }

        g_strfreev(file_keys);
    }

    for(const auto &key : ValuesT::all_keys)
    {
        gchar *value = g_key_file_get_value(key_file, section,
                                            key.name_.c_str(), nullptr);

        if(value == nullptr)
            continue;

        g_strstrip(value);

        if(!key.write(values, value))
            msg_error(EINVAL, LOG_WARNING,
                      "Invalid value \"%s\" for configuration key \"%s\", "
                      "using default", value, key.name_.c_str());

        g_free(value);
    }

    g_key_file_free(key_file);

    return true;
}

template class Configuration::ConfigManager<Configuration::CoverplaydValues>;
