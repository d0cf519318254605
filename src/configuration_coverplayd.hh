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

#ifndef CONFIGURATION_COVERPLAYD_HH
#define CONFIGURATION_COVERPLAYD_HH

#include "configuration.hh"

namespace Configuration
{

struct CoverplaydValues
{
    static constexpr char CONFIGURATION_SECTION_NAME[] = "coverplayd";

    enum class KeyID
    {
        LIBRESPOT_URL,
        LIBRESPOT_EVENTS_URL,
        CATALOG_FILE,
        RESUME_FILE,
        POLL_INTERVAL_MS,
        FAST_POLL_INTERVAL_MS,
        GRACE_THRESHOLD,
        STARTUP_RETRIES,
        STARTUP_BACKOFF_BASE_MS,
        STARTUP_BACKOFF_CAP_MS,
        PLAY_TIMER_DELAY_MS,
        SYNC_COOLDOWN_MS,
        ECHO_WINDOW_MS,
        REMOTE_TAKEOVER_THRESHOLD,
        VOLUME_LEVELS,
        AUTO_PAUSE_TIMEOUT_S,
        AUTO_PAUSE_FADE_MS,
        AUTO_PAUSE_FADE_STEPS,
        PLAY_SETTLE_DELAY_MS,
        RESUME_SEEK_DELAY_MS,
        PROGRESS_SAVE_INTERVAL_S,
        PROGRESS_EXPIRY_HOURS,
        SLEEP_TIMEOUT_S,
        BUTTON_DEBOUNCE_MS,
        CAROUSEL_SETTLE_MS,
        MIXER_CARD,
        BACKLIGHT_DIR,

        LAST_ID = BACKLIGHT_DIR,
    };

    static constexpr size_t NUMBER_OF_KEYS = static_cast<size_t>(KeyID::LAST_ID) + 1;

    static const std::array<const ConfigKey<CoverplaydValues>, NUMBER_OF_KEYS> all_keys;

    std::string librespot_url_;
    std::string librespot_events_url_;
    std::string catalog_file_;
    std::string resume_file_;

    uint32_t poll_interval_ms_;
    uint32_t fast_poll_interval_ms_;
    uint32_t grace_threshold_;
    uint32_t startup_retries_;
    uint32_t startup_backoff_base_ms_;
    uint32_t startup_backoff_cap_ms_;

    uint32_t play_timer_delay_ms_;
    uint32_t sync_cooldown_ms_;
    uint32_t echo_window_ms_;
    uint32_t remote_takeover_threshold_;
    std::vector<uint32_t> volume_levels_;

    uint32_t auto_pause_timeout_s_;
    uint32_t auto_pause_fade_ms_;
    uint32_t auto_pause_fade_steps_;

    uint32_t play_settle_delay_ms_;
    uint32_t resume_seek_delay_ms_;
    uint32_t progress_save_interval_s_;
    uint32_t progress_expiry_hours_;

    uint32_t sleep_timeout_s_;
    uint32_t button_debounce_ms_;
    uint32_t carousel_settle_ms_;

    uint32_t mixer_card_;
    std::string backlight_dir_;

    /*!
     * Built-in defaults.
     */
    explicit CoverplaydValues():
        librespot_url_("http://localhost:3678"),
        librespot_events_url_("ws://localhost:3678/events"),
        catalog_file_("/var/local/lib/coverplayd/catalog.json"),
        resume_file_("/var/local/etc/coverplayd-resume.ini"),
        poll_interval_ms_(1000),
        fast_poll_interval_ms_(500),
        grace_threshold_(3),
        startup_retries_(10),
        startup_backoff_base_ms_(1000),
        startup_backoff_cap_ms_(30000),
        play_timer_delay_ms_(1000),
        sync_cooldown_ms_(3000),
        echo_window_ms_(2000),
        remote_takeover_threshold_(95),
        volume_levels_{60, 70, 80},
        auto_pause_timeout_s_(30 * 60),
        auto_pause_fade_ms_(5000),
        auto_pause_fade_steps_(20),
        play_settle_delay_ms_(500),
        resume_seek_delay_ms_(500),
        progress_save_interval_s_(10),
        progress_expiry_hours_(24),
        sleep_timeout_s_(120),
        button_debounce_ms_(300),
        carousel_settle_ms_(250),
        mixer_card_(2),
        backlight_dir_("/sys/class/backlight")
    {}
};

}

#endif /* !CONFIGURATION_COVERPLAYD_HH */
