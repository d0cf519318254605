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
#include <fcntl.h>
#include <unistd.h>
#include <glib.h>

#include "system_control.hh"
#include "messages.h"

static std::string find_backlight(const std::string &backlight_dir)
{
    GDir *dir = g_dir_open(backlight_dir.c_str(), 0, nullptr);

    if(dir == nullptr)
        return "";

    std::string first;
    const gchar *name;

    while((name = g_dir_read_name(dir)) != nullptr)
    {
        if(first.empty() || first > name)
            first = name;
    }

    g_dir_close(dir);

    if(first.empty())
        return "";

    return backlight_dir + '/' + first + "/bl_power";
}

SystemControl::Linux::Linux(unsigned int mixer_card,
                            const std::string &backlight_dir):
    mixer_card_(mixer_card),
    backlight_path_(find_backlight(backlight_dir))
{
    if(backlight_path_.empty())
        msg_info("No backlight found in \"%s\"", backlight_dir.c_str());
    else
        msg_info("Backlight detected: %s", backlight_path_.c_str());
}

bool SystemControl::Linux::amixer_set(const char *control, unsigned int percent)
{
    const std::string card(std::to_string(mixer_card_));
    const std::string value(std::to_string(percent) + '%');
    const gchar *argv[] =
    {
        "amixer", "-q", "-c", card.c_str(), "set", control, value.c_str(), nullptr,
    };

    GError *error = nullptr;
    gint exit_status;

    if(!g_spawn_sync(nullptr, const_cast<gchar **>(argv), nullptr,
                     static_cast<GSpawnFlags>(G_SPAWN_SEARCH_PATH |
                                              G_SPAWN_STDOUT_TO_DEV_NULL |
                                              G_SPAWN_STDERR_TO_DEV_NULL),
                     nullptr, nullptr, nullptr, nullptr, &exit_status, &error))
    {
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "Could not run amixer: %s", error->message);
        g_error_free(error);
        return false;
    }

    if(!g_spawn_check_exit_status(exit_status, &error))
    {
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "Could not set mixer control %s: %s",
                  control, error->message);
        g_error_free(error);
        return false;
    }

    return true;
}

bool SystemControl::Linux::set_local_volume(unsigned int percent)
{
    if(percent > 100)
        percent = 100;

    msg_vinfo(MESSAGE_LEVEL_DIAG, "Local volume %u%%", percent);

    /* master DAC stays at full level, amplifiers do the work */
    const bool a = amixer_set("Playback", 100);
    const bool b = amixer_set("Speaker", percent);
    const bool c = amixer_set("Headphone", percent);

    return a && b && c;
}

bool SystemControl::Linux::set_backlight(bool is_on)
{
    if(backlight_path_.empty())
        return false;

    const int fd = open(backlight_path_.c_str(), O_WRONLY);

    if(fd < 0)
    {
        msg_error(errno, LOG_WARNING, "Could not control backlight");
        return false;
    }

    /* bl_power: 0 means on */
    const char value = is_on ? '0' : '1';
    ssize_t ret;

    while((ret = write(fd, &value, 1)) < 0 && errno == EINTR)
        ;

    if(ret < 0)
        msg_error(errno, LOG_WARNING, "Could not control backlight");
    else
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "Backlight %s", is_on ? "on" : "off");

    close(fd);

    return ret == 1;
}
