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

#include <doctest.h>

#include <glib.h>
#include <glib/gstdio.h>

#include "configuration.hh"
#include "configuration_coverplayd.hh"

TEST_SUITE_BEGIN("Configuration");

using ConfigMgr = Configuration::ConfigManager<Configuration::CoverplaydValues>;

class ConfigurationTestsFixture
{
  protected:
    std::string dir_name_;
    std::string file_name_;
    const Configuration::CoverplaydValues defaults_;

  public:
    explicit ConfigurationTestsFixture()
    {
        gchar *dir = g_dir_make_tmp("coverplayd-test-XXXXXX", nullptr);
        REQUIRE(dir != nullptr);
        dir_name_ = dir;
        file_name_ = dir_name_ + "/coverplayd.ini";
        g_free(dir);
    }

    ~ConfigurationTestsFixture()
    {
        g_unlink(file_name_.c_str());
        g_rmdir(dir_name_.c_str());
    }

    void write_file(const char *content)
    {
        REQUIRE(g_file_set_contents(file_name_.c_str(), content, -1, nullptr));
    }
};

TEST_CASE_FIXTURE(ConfigurationTestsFixture, "Defaults are used without configuration file")
{
    ConfigMgr mgr(file_name_.c_str(), defaults_);

    CHECK_FALSE(mgr.load());

    const auto &v(mgr.values());
    CHECK(v.librespot_url_ == "http://localhost:3678");
    CHECK(v.poll_interval_ms_ == 1000);
    CHECK(v.fast_poll_interval_ms_ == 500);
    CHECK(v.grace_threshold_ == 3);
    CHECK(v.echo_window_ms_ == 2000);
    CHECK(v.sync_cooldown_ms_ == 3000);
    CHECK(v.volume_levels_ == std::vector<uint32_t>({60, 70, 80}));
    CHECK(v.auto_pause_timeout_s_ == 1800);
}

TEST_CASE_FIXTURE(ConfigurationTestsFixture, "Values are read from file")
{
    write_file("[coverplayd]\n"
               "librespot_url = http://player:24879\n"
               "grace_threshold = 5\n"
               "volume_levels = 40; 55; 70; 85;\n"
               "mixer_card = 0\n"
               "backlight_dir = /tmp/bl\n");

    ConfigMgr mgr(file_name_.c_str(), defaults_);
    REQUIRE(mgr.load());

    const auto &v(mgr.values());
    CHECK(v.librespot_url_ == "http://player:24879");
    CHECK(v.grace_threshold_ == 5);
    CHECK(v.volume_levels_ == std::vector<uint32_t>({40, 55, 70, 85}));
    CHECK(v.mixer_card_ == 0);
    CHECK(v.backlight_dir_ == "/tmp/bl");
    CHECK(v.poll_interval_ms_ == 1000);
}

TEST_CASE_FIXTURE(ConfigurationTestsFixture, "Invalid values keep defaults")
{
    write_file("[coverplayd]\n"
               "grace_threshold = 0\n"
               "poll_interval_ms = fast\n"
               "sleep_timeout_s = -5\n"
               "volume_levels = 50;120\n"
               "remote_takeover_threshold = 101\n"
               "unknown_key = 1\n");

    ConfigMgr mgr(file_name_.c_str(), defaults_);
    REQUIRE(mgr.load());

    const auto &v(mgr.values());
    CHECK(v.grace_threshold_ == 3);
    CHECK(v.poll_interval_ms_ == 1000);
    CHECK(v.sleep_timeout_s_ == 120);
    CHECK(v.volume_levels_ == std::vector<uint32_t>({60, 70, 80}));
    CHECK(v.remote_takeover_threshold_ == 95);
}

TEST_CASE_FIXTURE(ConfigurationTestsFixture, "Broken file falls back to defaults")
{
    write_file("this is not a key file\n");

    ConfigMgr mgr(file_name_.c_str(), defaults_);
    CHECK_FALSE(mgr.load());
    CHECK(mgr.values().grace_threshold_ == 3);
}

TEST_CASE("Unsigned integers are parsed strictly")
{
    uint32_t value = 7;

    CHECK(Configuration::default_deserialize(value, "42"));
    CHECK(value == 42);

    CHECK_FALSE(Configuration::default_deserialize(value, ""));
    CHECK_FALSE(Configuration::default_deserialize(value, "-1"));
    CHECK_FALSE(Configuration::default_deserialize(value, "12abc"));
    CHECK_FALSE(Configuration::default_deserialize(value, "99999999999"));
    CHECK(value == 42);
}

TEST_SUITE_END();
