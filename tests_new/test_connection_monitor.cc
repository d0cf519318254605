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

#include "connection_monitor.hh"

TEST_SUITE_BEGIN("Connection monitor");

class ConnectionMonitorTestsFixture
{
  protected:
    Connection::Monitor monitor_;

  public:
    explicit ConnectionMonitorTestsFixture():
        monitor_(3, std::chrono::milliseconds(1000),
                 std::chrono::milliseconds(500))
    {}
};

TEST_CASE_FIXTURE(ConnectionMonitorTestsFixture, "Monitor starts disconnected with fast polling")
{
    CHECK_FALSE(monitor_.is_connected());
    CHECK(monitor_.get_poll_interval() == std::chrono::milliseconds(500));
}

TEST_CASE_FIXTURE(ConnectionMonitorTestsFixture, "First success connects")
{
    CHECK(monitor_.feed(true) == Connection::Monitor::Transition::RESTORED);
    CHECK(monitor_.is_connected());
    CHECK(monitor_.get_poll_interval() == std::chrono::milliseconds(1000));
    CHECK(monitor_.feed(true) == Connection::Monitor::Transition::NONE);
}

TEST_CASE_FIXTURE(ConnectionMonitorTestsFixture, "Single timeout between successes does not disconnect")
{
    for(int i = 0; i < 3; ++i)
        monitor_.feed(true);

    CHECK(monitor_.feed(false) == Connection::Monitor::Transition::NONE);
    CHECK(monitor_.is_connected());
    CHECK(monitor_.get_failure_count() == 1);

    for(int i = 0; i < 3; ++i)
    {
        CHECK(monitor_.feed(true) == Connection::Monitor::Transition::NONE);
        CHECK(monitor_.is_connected());
    }

    CHECK(monitor_.get_failure_count() == 0);
}

TEST_CASE_FIXTURE(ConnectionMonitorTestsFixture, "Disconnect only after reaching grace threshold")
{
    monitor_.feed(true);

    CHECK(monitor_.feed(false) == Connection::Monitor::Transition::NONE);
    CHECK(monitor_.feed(false) == Connection::Monitor::Transition::NONE);
    CHECK(monitor_.is_connected());

    CHECK(monitor_.feed(false) == Connection::Monitor::Transition::LOST);
    CHECK_FALSE(monitor_.is_connected());
    CHECK(monitor_.get_poll_interval() == std::chrono::milliseconds(500));

    CHECK(monitor_.feed(false) == Connection::Monitor::Transition::NONE);
    CHECK(monitor_.get_failure_count() == 4);

    CHECK(monitor_.feed(true) == Connection::Monitor::Transition::RESTORED);
    CHECK(monitor_.is_connected());
}

TEST_CASE_FIXTURE(ConnectionMonitorTestsFixture, "Assuming reachability resets failure counter")
{
    monitor_.feed(true);
    monitor_.feed(false);
    monitor_.feed(false);
    monitor_.feed(false);
    REQUIRE_FALSE(monitor_.is_connected());

    CHECK(monitor_.assume_reachable() == Connection::Monitor::Transition::RESTORED);
    CHECK(monitor_.is_connected());
    CHECK(monitor_.get_failure_count() == 0);

    CHECK(monitor_.assume_reachable() == Connection::Monitor::Transition::NONE);

    /* grace period starts over */
    CHECK(monitor_.feed(false) == Connection::Monitor::Transition::NONE);
    CHECK(monitor_.is_connected());
}

TEST_CASE("Startup backoff doubles up to the cap")
{
    const std::chrono::milliseconds base(1000);
    const std::chrono::milliseconds cap(30000);

    CHECK(Connection::Monitor::get_startup_backoff(0, base, cap) == std::chrono::milliseconds(1000));
    CHECK(Connection::Monitor::get_startup_backoff(1, base, cap) == std::chrono::milliseconds(2000));
    CHECK(Connection::Monitor::get_startup_backoff(2, base, cap) == std::chrono::milliseconds(4000));
    CHECK(Connection::Monitor::get_startup_backoff(4, base, cap) == std::chrono::milliseconds(16000));
    CHECK(Connection::Monitor::get_startup_backoff(5, base, cap) == cap);
    CHECK(Connection::Monitor::get_startup_backoff(40, base, cap) == cap);
}

TEST_CASE("Zero grace threshold behaves like one")
{
    Connection::Monitor monitor(0, std::chrono::milliseconds(1000),
                                std::chrono::milliseconds(500));

    monitor.feed(true);
    CHECK(monitor.feed(false) == Connection::Monitor::Transition::LOST);
}

TEST_SUITE_END();
