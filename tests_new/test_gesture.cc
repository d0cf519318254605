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

#include <cstring>

#include "gesture.hh"

TEST_SUITE_BEGIN("Gesture parser");

TEST_CASE("Taps are parsed")
{
    Input::Gesture g;

    REQUIRE(Input::parse_gesture("tap play", g));
    CHECK(g.kind_ == Input::GestureKind::TAP_PLAY);

    REQUIRE(Input::parse_gesture("tap prev", g));
    CHECK(g.kind_ == Input::GestureKind::TAP_PREV);

    REQUIRE(Input::parse_gesture("tap next", g));
    CHECK(g.kind_ == Input::GestureKind::TAP_NEXT);

    REQUIRE(Input::parse_gesture("  tap   volume ", g));
    CHECK(g.kind_ == Input::GestureKind::TAP_VOLUME);

    REQUIRE(Input::parse_gesture("tap cover -1", g));
    CHECK(g.kind_ == Input::GestureKind::TAP_COVER);
    CHECK(g.delta_ == -1);

    REQUIRE(Input::parse_gesture("tap cover 1", g));
    CHECK(g.delta_ == 1);
}

TEST_CASE("Catalog editing gestures are parsed")
{
    Input::Gesture g;

    REQUIRE(Input::parse_gesture("hold", g));
    CHECK(g.kind_ == Input::GestureKind::HOLD);

    REQUIRE(Input::parse_gesture("tap save", g));
    CHECK(g.kind_ == Input::GestureKind::TAP_SAVE);

    REQUIRE(Input::parse_gesture("tap delete", g));
    CHECK(g.kind_ == Input::GestureKind::TAP_DELETE);

    CHECK_FALSE(Input::parse_gesture("hold on", g));
    CHECK_FALSE(Input::parse_gesture("tap delete 3", g));
}

TEST_CASE("Swipes carry direction and velocity")
{
    Input::Gesture g;

    REQUIRE(Input::parse_gesture("swipe left 2.5", g));
    CHECK(g.kind_ == Input::GestureKind::SWIPE);
    CHECK(g.direction_ == Selection::SwipeDirection::LEFT);
    CHECK(g.velocity_ == doctest::Approx(2.5));

    REQUIRE(Input::parse_gesture("swipe right -0.4", g));
    CHECK(g.direction_ == Selection::SwipeDirection::RIGHT);
    CHECK(g.velocity_ == doctest::Approx(-0.4));
}

TEST_CASE("Single word gestures are parsed")
{
    Input::Gesture g;

    REQUIRE(Input::parse_gesture("drag begin", g));
    CHECK(g.kind_ == Input::GestureKind::DRAG_BEGIN);

    REQUIRE(Input::parse_gesture("drag end", g));
    CHECK(g.kind_ == Input::GestureKind::DRAG_END);

    REQUIRE(Input::parse_gesture("settled", g));
    CHECK(g.kind_ == Input::GestureKind::SETTLED);

    REQUIRE(Input::parse_gesture("wake", g));
    CHECK(g.kind_ == Input::GestureKind::WAKE);
}

TEST_CASE("Unknown or malformed lines are rejected")
{
    Input::Gesture g;

    CHECK_FALSE(Input::parse_gesture("", g));
    CHECK_FALSE(Input::parse_gesture("tap", g));
    CHECK_FALSE(Input::parse_gesture("tap stop", g));
    CHECK_FALSE(Input::parse_gesture("tap play now", g));
    CHECK_FALSE(Input::parse_gesture("tap cover", g));
    CHECK_FALSE(Input::parse_gesture("tap cover 0", g));
    CHECK_FALSE(Input::parse_gesture("tap cover x", g));
    CHECK_FALSE(Input::parse_gesture("swipe up 1.0", g));
    CHECK_FALSE(Input::parse_gesture("swipe left", g));
    CHECK_FALSE(Input::parse_gesture("swipe left fast", g));
    CHECK_FALSE(Input::parse_gesture("drag sideways", g));
    CHECK_FALSE(Input::parse_gesture("wake up", g));
    CHECK_FALSE(Input::parse_gesture("pinch", g));
}

class LineSplitterTestsFixture
{
  protected:
    Input::LineSplitter splitter_;
    std::vector<std::string> lines_;

  public:
    void feed(const char *data)
    {
        splitter_.feed(data, strlen(data),
                       [this] (const std::string &line) { lines_.push_back(line); });
    }
};

TEST_CASE_FIXTURE(LineSplitterTestsFixture, "Lines are split at newline")
{
    feed("tap play\nswipe left 1.0\n");

    REQUIRE(lines_.size() == 2);
    CHECK(lines_[0] == "tap play");
    CHECK(lines_[1] == "swipe left 1.0");
}

TEST_CASE_FIXTURE(LineSplitterTestsFixture, "Partial lines are kept until complete")
{
    feed("tap ");
    CHECK(lines_.empty());

    feed("next\r\n\n\nwa");
    REQUIRE(lines_.size() == 1);
    CHECK(lines_[0] == "tap next");

    feed("ke\n");
    REQUIRE(lines_.size() == 2);
    CHECK(lines_[1] == "wake");
}

TEST_CASE_FIXTURE(LineSplitterTestsFixture, "Overlong lines are dropped")
{
    const std::string junk(Input::LineSplitter::MAXIMUM_LINE_LENGTH + 10, 'x');

    feed(junk.c_str());
    feed("\nsettled\n");

    REQUIRE(lines_.size() == 1);
    CHECK(lines_[0] == "settled");
}

TEST_SUITE_END();
