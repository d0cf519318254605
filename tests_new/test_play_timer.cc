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

#include "play_timer.hh"
#include "carousel.hh"
#include "fakes.hh"

TEST_SUITE_BEGIN("Play timer");

class PlayTimerTestsFixture
{
  protected:
    Fake::Clock clock_;
    Selection::PlayTimer timer_;

  public:
    explicit PlayTimerTestsFixture():
        timer_(clock_, std::chrono::milliseconds(1000),
               std::chrono::milliseconds(3000))
    {}
};

TEST_CASE_FIXTURE(PlayTimerTestsFixture, "Timer fires after delay")
{
    std::string uri;

    timer_.start("spotify:album:a");
    CHECK(timer_.is_armed());
    CHECK(timer_.get_armed_uri() == "spotify:album:a");

    clock_.advance(std::chrono::milliseconds(999));
    CHECK_FALSE(timer_.check(uri));

    clock_.advance(std::chrono::milliseconds(1));
    REQUIRE(timer_.check(uri));
    CHECK(uri == "spotify:album:a");
    CHECK_FALSE(timer_.is_armed());
    CHECK(timer_.get_last_played_uri() == "spotify:album:a");

    uri.clear();
    clock_.advance(std::chrono::milliseconds(5000));
    CHECK_FALSE(timer_.check(uri));
}

TEST_CASE_FIXTURE(PlayTimerTestsFixture, "Rearming for another item restarts the delay")
{
    std::string uri;

    timer_.start("spotify:album:a");
    clock_.advance(std::chrono::milliseconds(800));
    timer_.start("spotify:album:b");
    clock_.advance(std::chrono::milliseconds(800));

    CHECK_FALSE(timer_.check(uri));

    clock_.advance(std::chrono::milliseconds(200));
    REQUIRE(timer_.check(uri));
    CHECK(uri == "spotify:album:b");
}

TEST_CASE_FIXTURE(PlayTimerTestsFixture, "Rearming for the same item keeps the deadline")
{
    std::string uri;

    timer_.start("spotify:album:a");
    clock_.advance(std::chrono::milliseconds(800));
    timer_.start("spotify:album:a");
    clock_.advance(std::chrono::milliseconds(200));

    REQUIRE(timer_.check(uri));
    CHECK(uri == "spotify:album:a");
}

TEST_CASE_FIXTURE(PlayTimerTestsFixture, "Cancelled timer does not fire")
{
    std::string uri;

    timer_.start("spotify:album:a");
    timer_.cancel();
    clock_.advance(std::chrono::milliseconds(2000));

    CHECK_FALSE(timer_.is_armed());
    CHECK_FALSE(timer_.check(uri));

    timer_.start("spotify:album:a");
    timer_.start("");
    CHECK_FALSE(timer_.is_armed());
}

TEST_CASE_FIXTURE(PlayTimerTestsFixture, "Cooldown follows each fire")
{
    std::string uri;

    CHECK_FALSE(timer_.is_in_cooldown());

    timer_.start("spotify:album:a");
    clock_.advance(std::chrono::milliseconds(1000));
    REQUIRE(timer_.check(uri));

    CHECK(timer_.is_in_cooldown());
    clock_.advance(std::chrono::milliseconds(2999));
    CHECK(timer_.is_in_cooldown());
    clock_.advance(std::chrono::milliseconds(1));
    CHECK_FALSE(timer_.is_in_cooldown());
}

TEST_SUITE_END();

TEST_SUITE_BEGIN("Carousel");

TEST_CASE("Carousel settles on report or after settle time")
{
    Fake::Clock clock;
    Selection::Carousel carousel(clock, std::chrono::milliseconds(250));

    CHECK(carousel.is_settled());

    carousel.set_target(3);
    CHECK_FALSE(carousel.is_settled());
    CHECK(carousel.get_target_index() == 3);

    CHECK(carousel.settle());
    CHECK(carousel.is_settled());
    CHECK_FALSE(carousel.settle());

    carousel.set_target(2);
    clock.advance(std::chrono::milliseconds(200));
    CHECK_FALSE(carousel.update());
    CHECK_FALSE(carousel.is_settled());

    clock.advance(std::chrono::milliseconds(50));
    CHECK(carousel.update());
    CHECK(carousel.is_settled());
}

TEST_SUITE_END();
