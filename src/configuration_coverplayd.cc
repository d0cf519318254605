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

#include "configuration_coverplayd.hh"

constexpr char Configuration::CoverplaydValues::CONFIGURATION_SECTION_NAME[];

using Values = Configuration::CoverplaydValues;

template <std::string Values::*Field>
static bool deserialize_string(Values &v, const char *src)
{
    return Configuration::default_deserialize(v.*Field, src);
}

template <uint32_t Values::*Field, uint32_t MinValue, uint32_t MaxValue>
static bool deserialize_uint(Values &v, const char *src)
{
    uint32_t temp;

    if(!Configuration::default_deserialize(temp, src) ||
       temp < MinValue || temp > MaxValue)
        return false;

    v.*Field = temp;
    return true;
}

static bool deserialize_volume_levels(Values &v, const char *src)
{
    std::vector<uint32_t> temp;

    if(!Configuration::default_deserialize(temp, src))
        return false;

    for(const auto &level : temp)
        if(level > 100)
            return false;

    v.volume_levels_ = std::move(temp);
    return true;
}

const std::array<const Configuration::ConfigKey<Values>, Values::NUMBER_OF_KEYS>
Values::all_keys
{
#define STRING_ENTRY(ID, KEY, FIELD) \
    Configuration::ConfigKey<Values>(Values::KeyID::ID, KEY, \
                                     deserialize_string<&Values::FIELD>)
#define UINT_ENTRY(ID, KEY, FIELD, MIN, MAX) \
    Configuration::ConfigKey<Values>(Values::KeyID::ID, KEY, \
                                     deserialize_uint<&Values::FIELD, MIN, MAX>)

    STRING_ENTRY(LIBRESPOT_URL,          "librespot_url",          librespot_url_),
    STRING_ENTRY(LIBRESPOT_EVENTS_URL,   "librespot_events_url",   librespot_events_url_),
    STRING_ENTRY(CATALOG_FILE,           "catalog_file",           catalog_file_),
    STRING_ENTRY(RESUME_FILE,            "resume_file",            resume_file_),
    UINT_ENTRY(POLL_INTERVAL_MS,         "poll_interval_ms",         poll_interval_ms_,         50, 60000),
    UINT_ENTRY(FAST_POLL_INTERVAL_MS,    "fast_poll_interval_ms",    fast_poll_interval_ms_,    50, 60000),
    UINT_ENTRY(GRACE_THRESHOLD,          "grace_threshold",          grace_threshold_,          1, 100),
    UINT_ENTRY(STARTUP_RETRIES,          "startup_retries",          startup_retries_,          0, 1000),
    UINT_ENTRY(STARTUP_BACKOFF_BASE_MS,  "startup_backoff_base_ms",  startup_backoff_base_ms_,  1, 600000),
    UINT_ENTRY(STARTUP_BACKOFF_CAP_MS,   "startup_backoff_cap_ms",   startup_backoff_cap_ms_,   1, 3600000),
    UINT_ENTRY(PLAY_TIMER_DELAY_MS,      "play_timer_delay_ms",      play_timer_delay_ms_,      0, 60000),
    UINT_ENTRY(SYNC_COOLDOWN_MS,         "sync_cooldown_ms",         sync_cooldown_ms_,         0, 60000),
    UINT_ENTRY(ECHO_WINDOW_MS,           "echo_window_ms",           echo_window_ms_,           0, 60000),
    UINT_ENTRY(REMOTE_TAKEOVER_THRESHOLD, "remote_takeover_threshold", remote_takeover_threshold_, 1, 100),
    Configuration::ConfigKey<Values>(Values::KeyID::VOLUME_LEVELS, "volume_levels",
                                     deserialize_volume_levels),
    UINT_ENTRY(AUTO_PAUSE_TIMEOUT_S,     "auto_pause_timeout_s",     auto_pause_timeout_s_,     1, 24U * 3600U),
    UINT_ENTRY(AUTO_PAUSE_FADE_MS,       "auto_pause_fade_ms",       auto_pause_fade_ms_,       0, 60000),
    UINT_ENTRY(AUTO_PAUSE_FADE_STEPS,    "auto_pause_fade_steps",    auto_pause_fade_steps_,    1, 1000),
    UINT_ENTRY(PLAY_SETTLE_DELAY_MS,     "play_settle_delay_ms",     play_settle_delay_ms_,     0, 10000),
    UINT_ENTRY(RESUME_SEEK_DELAY_MS,     "resume_seek_delay_ms",     resume_seek_delay_ms_,     0, 10000),
    UINT_ENTRY(PROGRESS_SAVE_INTERVAL_S, "progress_save_interval_s", progress_save_interval_s_, 1, 3600),
    UINT_ENTRY(PROGRESS_EXPIRY_HOURS,    "progress_expiry_hours",    progress_expiry_hours_,    1, 24U * 365U),
    UINT_ENTRY(SLEEP_TIMEOUT_S,          "sleep_timeout_s",          sleep_timeout_s_,          1, 24U * 3600U),
    UINT_ENTRY(BUTTON_DEBOUNCE_MS,       "button_debounce_ms",       button_debounce_ms_,       0, 10000),
    UINT_ENTRY(CAROUSEL_SETTLE_MS,       "carousel_settle_ms",       carousel_settle_ms_,       0, 10000),
    UINT_ENTRY(MIXER_CARD,               "mixer_card",               mixer_card_,               0, 31),
    STRING_ENTRY(BACKLIGHT_DIR,          "backlight_dir",          backlight_dir_),

#undef STRING_ENTRY
#undef UINT_ENTRY
};
