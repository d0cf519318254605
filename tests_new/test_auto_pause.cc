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

#include <thread>
#include <atomic>

#include "auto_pause.hh"
#include "fakes.hh"

TEST_SUITE_BEGIN("Auto-pause timer");

class AutoPauseTestsFixture
{
  protected:
    Fake::Clock clock_;
    Fake::SystemControl system_;
    Fake::Executor executor_;
    std::atomic<unsigned int> pause_count_;
    AutoPause::Timer timer_;

  public:
    explicit AutoPauseTestsFixture():
        pause_count_(0),
        timer_(clock_, executor_,
               AutoPause::Timer::Policy{std::chrono::milliseconds(30 * 60 * 1000),
                                        std::chrono::milliseconds(20), 4,
                                        std::chrono::milliseconds(1)},
               [] () { return 80U; },
               [this] (unsigned int v) { system_.set_local_volume(v); },
               [this] () { ++pause_count_; return true; })
    {}

    bool wait_for_idle()
    {
        for(int i = 0; i < 500; ++i)
        {
            if(timer_.get_state() == AutoPause::State::IDLE)
                return true;

            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        return false;
    }
};

TEST_CASE_FIXTURE(AutoPauseTestsFixture, "Timer is idle initially")
{
    std::chrono::milliseconds remaining;

    CHECK(timer_.get_state() == AutoPause::State::IDLE);
    CHECK_FALSE(timer_.get_remaining(remaining));
    CHECK_FALSE(timer_.check(true));
}

TEST_CASE_FIXTURE(AutoPauseTestsFixture, "Playing arms the timer")
{
    timer_.on_play("spotify:album:a");
    CHECK(timer_.get_state() == AutoPause::State::ARMED);

    clock_.advance(std::chrono::minutes(10));

    std::chrono::milliseconds remaining;
    REQUIRE(timer_.get_remaining(remaining));
    CHECK(remaining == std::chrono::minutes(20));
    CHECK_FALSE(timer_.check(true));
}

TEST_CASE_FIXTURE(AutoPauseTestsFixture, "Same context does not restart the timer")
{
    timer_.on_play("spotify:album:a");
    clock_.advance(std::chrono::minutes(20));
    timer_.on_play("spotify:album:a");
    clock_.advance(std::chrono::minutes(10));

    CHECK(timer_.check(true));
    CHECK(wait_for_idle());
}

TEST_CASE_FIXTURE(AutoPauseTestsFixture, "Context change restarts the timer")
{
    timer_.on_play("spotify:album:a");
    clock_.advance(std::chrono::minutes(20));
    timer_.on_play("spotify:album:b");
    clock_.advance(std::chrono::minutes(10));

    CHECK_FALSE(timer_.check(true));

    std::chrono::milliseconds remaining;
    REQUIRE(timer_.get_remaining(remaining));
    CHECK(remaining == std::chrono::minutes(20));
}

TEST_CASE_FIXTURE(AutoPauseTestsFixture, "Stop resets the timer")
{
    timer_.on_play("spotify:album:a");
    clock_.advance(std::chrono::minutes(20));
    timer_.on_stop();
    CHECK(timer_.get_state() == AutoPause::State::IDLE);

    timer_.on_play("spotify:album:a");
    clock_.advance(std::chrono::minutes(20));
    CHECK_FALSE(timer_.check(true));
}

TEST_CASE_FIXTURE(AutoPauseTestsFixture, "Empty context is treated like stop")
{
    timer_.on_play("spotify:album:a");
    timer_.on_play("");
    CHECK(timer_.get_state() == AutoPause::State::IDLE);
}

TEST_CASE_FIXTURE(AutoPauseTestsFixture, "No auto-pause while not playing")
{
    timer_.on_play("spotify:album:a");
    clock_.advance(std::chrono::minutes(40));
    CHECK_FALSE(timer_.check(false));
    CHECK(timer_.get_state() == AutoPause::State::ARMED);
}

TEST_CASE_FIXTURE(AutoPauseTestsFixture, "Timeout fades out, pauses, and restores volume")
{
    timer_.on_play("spotify:album:a");
    clock_.advance(std::chrono::minutes(30));

    CHECK(timer_.check(true));
    REQUIRE(wait_for_idle());

    CHECK(pause_count_ == 1);

    const auto volumes(system_.get_volumes());
    REQUIRE(volumes.size() == 5);
    CHECK(volumes[0] == 60);
    CHECK(volumes[1] == 40);
    CHECK(volumes[2] == 20);
    CHECK(volumes[3] == 0);
    CHECK(volumes[4] == 80);

    /* fade is over, nothing left to restore */
    timer_.restore_volume_if_needed();
    CHECK(system_.get_volumes().size() == 5);
}

TEST_CASE_FIXTURE(AutoPauseTestsFixture, "Stop during fade does not abort the fade")
{
    timer_.on_play("spotify:album:a");
    clock_.advance(std::chrono::minutes(30));
    REQUIRE(timer_.check(true));

    timer_.on_stop();

    REQUIRE(wait_for_idle());
    CHECK(pause_count_ == 1);
    CHECK(system_.get_volumes().back() == 80);
}

TEST_CASE_FIXTURE(AutoPauseTestsFixture, "Manual resume right after auto-pause restores volume at once")
{
    AutoPause::Timer slow_restore_timer(clock_, executor_,
                                        AutoPause::Timer::Policy{std::chrono::milliseconds(1000),
                                                                 std::chrono::milliseconds(20), 4,
                                                                 std::chrono::seconds(60)},
                                        [] () { return 80U; },
                                        [this] (unsigned int v) { system_.set_local_volume(v); },
                                        [this] () { ++pause_count_; return true; });

    slow_restore_timer.on_play("spotify:album:a");
    clock_.advance(std::chrono::milliseconds(1000));
    REQUIRE(slow_restore_timer.check(true));

    for(int i = 0; i < 500 && pause_count_ == 0; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    REQUIRE(pause_count_ == 1);
    CHECK(slow_restore_timer.get_state() == AutoPause::State::FADING);
    REQUIRE(system_.get_volumes().size() == 4);
    CHECK(system_.get_volumes().back() == 0);

    slow_restore_timer.restore_volume_if_needed();

    CHECK(system_.get_volumes().size() == 5);
    CHECK(system_.get_volumes().back() == 80);
    REQUIRE_FALSE(executor_.submitted_.empty());
    CHECK(executor_.submitted_.back() == "restore volume after auto-pause");

    /* restored already, nothing to do */
    slow_restore_timer.restore_volume_if_needed();
    CHECK(system_.get_volumes().size() == 5);

    slow_restore_timer.shutdown();
    CHECK(slow_restore_timer.get_state() == AutoPause::State::IDLE);
}

TEST_CASE_FIXTURE(AutoPauseTestsFixture, "Shutdown aborts a running fade")
{
    AutoPause::Timer slow_timer(clock_, executor_,
                                AutoPause::Timer::Policy{std::chrono::milliseconds(1000),
                                                         std::chrono::milliseconds(60000), 4,
                                                         std::chrono::milliseconds(1)},
                                [] () { return 70U; },
                                [this] (unsigned int v) { system_.set_local_volume(v); },
                                [this] () { ++pause_count_; return true; });

    slow_timer.on_play("spotify:album:a");
    clock_.advance(std::chrono::milliseconds(1000));
    REQUIRE(slow_timer.check(true));

    slow_timer.shutdown();

    CHECK(pause_count_ == 0);
    CHECK(system_.get_volumes().back() == 70);
}

TEST_SUITE_END();
