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

#include <fstream>

#include <glib.h>
#include <glib/gstdio.h>

#include "selection_sync.hh"
#include "busy.hh"
#include "fakes.hh"

TEST_SUITE_BEGIN("Selection sync");

static const char CATALOG_JSON[] =
    "{\"items\": ["
    "{\"id\": \"0\", \"uri\": \"spotify:album:0\", \"name\": \"Zero\"},"
    "{\"id\": \"1\", \"uri\": \"spotify:album:1\", \"name\": \"One\"},"
    "{\"id\": \"2\", \"uri\": \"spotify:album:2\", \"name\": \"Two\"},"
    "{\"id\": \"3\", \"uri\": \"spotify:playlist:3\", \"name\": \"Three\"}"
    "]}";

class SelectionSyncTestsFixture
{
  protected:
    Fake::Clock clock_;
    Catalog::List catalog_;
    Playback::SnapshotCell now_playing_;
    Connection::Monitor monitor_;
    Fake::PlayRequest player_;
    Fake::Sink sink_;
    Fake::Executor executor_;
    Fake::SystemControl system_;
    Fake::StatusSource source_;
    Fake::Store store_;
    unsigned int wake_count_;
    Volume::Arbiter volume_;
    AutoPause::Timer auto_pause_;
    Progress::Keeper keeper_;
    Sleep::Manager sleep_;
    Selection::Sync sync_;
    std::string catalog_dir_;
    std::string catalog_file_;

  public:
    explicit SelectionSyncTestsFixture():
        monitor_(3, std::chrono::milliseconds(1000), std::chrono::milliseconds(500)),
        wake_count_(0),
        volume_(clock_, system_, sink_, executor_,
                Volume::Arbiter::Policy{{60, 70, 80},
                                        std::chrono::milliseconds(2000), 95}),
        auto_pause_(clock_, executor_,
                    AutoPause::Timer::Policy{std::chrono::minutes(30),
                                             std::chrono::milliseconds(20), 4,
                                             std::chrono::milliseconds(1)},
                    [this] () { return volume_.level(); },
                    [this] (unsigned int v) { system_.set_local_volume(v); },
                    [this] () { return sink_.pause(); }),
        keeper_(source_, store_, executor_, clock_, std::chrono::seconds(10)),
        sleep_(clock_, system_, executor_, std::chrono::seconds(120),
               [this] () { ++wake_count_; }),
        sync_(clock_, catalog_, now_playing_, monitor_, player_, sink_,
              executor_, volume_, auto_pause_, keeper_, sleep_,
              Selection::Sync::Policy{std::chrono::milliseconds(300),
                                      std::chrono::milliseconds(5000),
                                      std::chrono::milliseconds(1000),
                                      std::chrono::milliseconds(3000),
                                      std::chrono::milliseconds(250)})
    {
        Busy::init(nullptr);
        REQUIRE(catalog_.load_from_string(CATALOG_JSON));
        monitor_.feed(true);
    }

    ~SelectionSyncTestsFixture()
    {
        Busy::init(nullptr);

        if(!catalog_file_.empty())
        {
            g_unlink(catalog_file_.c_str());
            g_rmdir(catalog_dir_.c_str());
        }
    }

    void use_catalog_file()
    {
        gchar *dir = g_dir_make_tmp("coverplayd-test-XXXXXX", nullptr);
        REQUIRE(dir != nullptr);
        catalog_dir_ = dir;
        catalog_file_ = catalog_dir_ + "/catalog.json";
        g_free(dir);

        std::ofstream out(catalog_file_);
        out << CATALOG_JSON;
        out.close();
        REQUIRE(out.good());

        REQUIRE(catalog_.load(catalog_file_));
    }

    void set_playing(const char *context_uri, bool is_paused = false)
    {
        std::unique_ptr<Playback::Snapshot> s(new Playback::Snapshot);
        s->stopped_ = false;
        s->paused_ = is_paused;
        s->context_uri_ = context_uri;
        now_playing_.publish(std::move(s));
    }

    void set_stopped()
    {
        now_playing_.publish(nullptr);
    }

    void swipe_left(double velocity = 0.0)
    {
        sync_.swipe(Selection::SwipeDirection::LEFT, velocity);
    }

    void swipe_right(double velocity = 0.0)
    {
        sync_.swipe(Selection::SwipeDirection::RIGHT, velocity);
    }

    void advance_and_tick(std::chrono::milliseconds ms)
    {
        clock_.advance(ms);
        sync_.tick();
    }
};

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Fast swipes play only the final item")
{
    for(int i = 0; i < 3; ++i)
    {
        swipe_left();
        advance_and_tick(std::chrono::milliseconds(200));
        CHECK(player_.requests_.empty());
    }

    CHECK(sync_.get_selected_index() == 3);
    CHECK(sync_.get_play_timer().get_armed_uri() == "spotify:playlist:3");

    advance_and_tick(std::chrono::milliseconds(1000));

    REQUIRE(player_.requests_.size() == 1);
    CHECK(player_.requests_[0] == "spotify:playlist:3");
    CHECK(sync_.is_play_in_progress());

    advance_and_tick(std::chrono::milliseconds(5000));
    CHECK(player_.requests_.size() == 1);
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Swiping away from playing item and back resumes")
{
    set_playing("spotify:album:0");
    sync_.tick();

    swipe_left();
    CHECK(sync_.get_selected_index() == 1);
    CHECK(sync_.is_navigation_paused());
    CHECK(sync_.get_play_timer().is_armed());

    swipe_right();
    CHECK(sync_.get_selected_index() == 0);
    CHECK_FALSE(sync_.is_navigation_paused());
    CHECK_FALSE(sync_.get_play_timer().is_armed());

    advance_and_tick(std::chrono::milliseconds(2000));

    const auto calls(sink_.get_calls());
    REQUIRE(calls.size() == 2);
    CHECK(calls[0] == "pause");
    CHECK(calls[1] == "resume");
    CHECK(player_.requests_.empty());
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Tapping back to item paused for navigation resumes it")
{
    set_playing("spotify:album:0");
    sync_.tick();

    swipe_left();
    REQUIRE(sync_.is_navigation_paused());

    /* player reports the pause, selection goes back via neighbour tap */
    set_playing("spotify:album:0", true);
    clock_.advance(std::chrono::milliseconds(400));
    sync_.tap_cover(-1);

    CHECK(sync_.get_selected_index() == 0);
    CHECK(player_.requests_.empty());

    const auto calls(sink_.get_calls());
    REQUIRE(calls.size() == 2);
    CHECK(calls[1] == "resume");
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Sync to playing does not jump away after timer fire")
{
    for(int i = 0; i < 3; ++i)
    {
        swipe_left();
        advance_and_tick(std::chrono::milliseconds(200));
    }

    advance_and_tick(std::chrono::milliseconds(1000));
    REQUIRE(player_.requests_.size() == 1);
    REQUIRE(sync_.get_selected_index() == 3);

    /* player briefly reports some other context */
    set_playing("spotify:album:0");
    advance_and_tick(std::chrono::milliseconds(500));
    CHECK(sync_.get_selected_index() == 3);
    advance_and_tick(std::chrono::milliseconds(500));
    CHECK(sync_.get_selected_index() == 3);

    set_playing("spotify:playlist:3");
    advance_and_tick(std::chrono::milliseconds(3000));
    CHECK(sync_.get_selected_index() == 3);

    /* external context change is followed */
    set_playing("spotify:album:1");
    sync_.tick();
    CHECK(sync_.get_selected_index() == 1);
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Selection follows external context change")
{
    set_playing("spotify:album:2");
    sync_.status_updated(true);
    sync_.tick();

    CHECK(sync_.get_selected_index() == 2);
    CHECK(player_.requests_.empty());
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Selection does not follow playback while dragging")
{
    sync_.drag_begin();

    set_playing("spotify:album:2");
    sync_.status_updated(true);
    advance_and_tick(std::chrono::milliseconds(500));
    CHECK(sync_.get_selected_index() == 0);

    sync_.drag_end();
    advance_and_tick(std::chrono::milliseconds(100));
    CHECK(sync_.get_selected_index() == 2);
    CHECK(player_.requests_.empty());
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Selection does not follow playback while carousel is moving")
{
    /* bounce at the left end moves the carousel without arming the timer */
    swipe_right();
    REQUIRE_FALSE(sync_.get_carousel().is_settled());
    REQUIRE_FALSE(sync_.get_play_timer().is_armed());

    set_playing("spotify:album:2");
    sync_.status_updated(true);
    advance_and_tick(std::chrono::milliseconds(100));
    CHECK(sync_.get_selected_index() == 0);

    advance_and_tick(std::chrono::milliseconds(200));
    CHECK(sync_.get_carousel().is_settled());
    CHECK(sync_.get_selected_index() == 2);
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Swipe velocity adds bonus items")
{
    swipe_left(1.0);
    CHECK(sync_.get_selected_index() == 2);

    swipe_right(2.5);
    CHECK(sync_.get_selected_index() == 0);

    swipe_left(10.0);
    CHECK(sync_.get_selected_index() == 3);

    swipe_left();
    CHECK(sync_.get_selected_index() == 3);
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Naturally finished context loses its progress")
{
    set_playing("spotify:album:0");
    sync_.status_updated(true);
    sync_.tick();

    set_playing("spotify:album:1");
    sync_.status_updated(true);

    REQUIRE(store_.cleared_.size() == 1);
    CHECK(store_.cleared_[0] == "spotify:album:0");
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Finished context is forgotten only once")
{
    set_playing("spotify:album:0");
    sync_.status_updated(true);
    sync_.tick();

    /* selection cannot follow while dragging, polls keep coming */
    sync_.drag_begin();
    set_playing("spotify:album:elsewhere");

    for(int i = 0; i < 5; ++i)
    {
        sync_.status_updated(true);
        advance_and_tick(std::chrono::milliseconds(100));
    }

    REQUIRE(store_.cleared_.size() == 1);
    CHECK(store_.cleared_[0] == "spotify:album:0");

    sync_.drag_end();
    set_playing("spotify:album:1");
    sync_.status_updated(true);

    REQUIRE(store_.cleared_.size() == 2);
    CHECK(store_.cleared_[1] == "spotify:album:elsewhere");
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Context change right after user play keeps progress")
{
    sync_.tap_play();
    REQUIRE(player_.requests_.size() == 1);
    CHECK(player_.requests_[0] == "spotify:album:0");

    set_playing("spotify:album:0");
    sync_.status_updated(true);
    sync_.tick();

    clock_.advance(std::chrono::milliseconds(1000));
    set_playing("spotify:album:1");
    sync_.status_updated(true);

    CHECK(store_.cleared_.empty());
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Play tap toggles between pause and resume")
{
    set_playing("spotify:album:0");

    sync_.tap_play();
    CHECK(sync_.get_pending_action() == Selection::PendingAction::PAUSE);
    CHECK_FALSE(sync_.display_playing());

    sync_.status_updated(true);
    CHECK(sync_.get_pending_action() == Selection::PendingAction::NONE);

    set_playing("spotify:album:0", true);
    clock_.advance(std::chrono::milliseconds(300));
    sync_.tap_play();
    CHECK(sync_.get_pending_action() == Selection::PendingAction::PLAY);
    CHECK(sync_.display_playing());

    const auto calls(sink_.get_calls());
    REQUIRE(calls.size() == 2);
    CHECK(calls[0] == "pause");
    CHECK(calls[1] == "resume");
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Buttons are debounced")
{
    set_playing("spotify:album:0");

    sync_.tap_next();
    sync_.tap_next();
    clock_.advance(std::chrono::milliseconds(299));
    sync_.tap_prev();
    clock_.advance(std::chrono::milliseconds(1));
    sync_.tap_prev();

    const auto calls(sink_.get_calls());
    REQUIRE(calls.size() == 2);
    CHECK(calls[0] == "next");
    CHECK(calls[1] == "prev");
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Only volume button works while disconnected")
{
    monitor_.feed(false);
    monitor_.feed(false);
    monitor_.feed(false);
    REQUIRE_FALSE(monitor_.is_connected());

    sync_.tap_play();
    clock_.advance(std::chrono::milliseconds(500));
    sync_.tap_next();
    clock_.advance(std::chrono::milliseconds(500));
    sync_.tap_volume();

    CHECK(sink_.get_calls().empty());
    CHECK(player_.requests_.empty());
    CHECK(volume_.get_index() == 2);
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Play timer does not fire while disconnected")
{
    swipe_left();
    REQUIRE(sync_.get_play_timer().is_armed());

    monitor_.feed(false);
    monitor_.feed(false);
    monitor_.feed(false);

    advance_and_tick(std::chrono::milliseconds(2000));

    CHECK(player_.requests_.empty());
    CHECK_FALSE(sync_.get_play_timer().is_armed());
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Loading state covers armed timer and request in flight")
{
    CHECK_FALSE(sync_.is_loading());

    swipe_left();
    CHECK(sync_.tick() == std::chrono::milliseconds(16));
    CHECK(sync_.is_loading());

    advance_and_tick(std::chrono::milliseconds(1000));
    REQUIRE(player_.requests_.size() == 1);
    CHECK(sync_.is_loading());

    player_.is_in_flight_ = false;
    sync_.play_request_finished();
    set_playing("spotify:album:1");
    sync_.status_updated(true);

    CHECK(sync_.tick() == std::chrono::milliseconds(100));
    CHECK_FALSE(sync_.is_loading());
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Gesture while sleeping only wakes up")
{
    sleep_.enter_sleep();
    REQUIRE(sleep_.is_sleeping());

    swipe_left();

    CHECK_FALSE(sleep_.is_sleeping());
    CHECK(wake_count_ == 1);
    CHECK(sync_.get_selected_index() == 0);
    CHECK_FALSE(sync_.get_play_timer().is_armed());
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Device sleeps when idle and wakes on playback")
{
    clock_.advance(std::chrono::seconds(121));
    sync_.tick();
    CHECK(sleep_.is_sleeping());

    const auto backlight(system_.get_backlight());
    REQUIRE_FALSE(backlight.empty());
    CHECK_FALSE(backlight.back());

    set_playing("spotify:album:0");
    sync_.status_updated(true);

    CHECK_FALSE(sleep_.is_sleeping());
    CHECK(wake_count_ == 1);
    CHECK(system_.get_backlight().back());
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Unknown context shows temporary item")
{
    set_playing("spotify:playlist:elsewhere");
    sync_.status_updated(true);

    REQUIRE(catalog_.size() == 5);
    CHECK(catalog_.at(4)->is_temp_);

    sync_.tick();
    CHECK(sync_.get_selected_index() == 4);
    CHECK_FALSE(sync_.get_play_timer().is_armed());

    set_stopped();
    sync_.status_updated(true);

    CHECK(catalog_.size() == 4);
    CHECK(sync_.get_selected_index() == 3);
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Playing temporary item is saved to catalog")
{
    use_catalog_file();

    set_playing("spotify:album:elsewhere");
    sync_.status_updated(true);
    sync_.tick();
    REQUIRE(sync_.get_selected_index() == 4);
    REQUIRE(catalog_.at(4)->is_temp_);

    sync_.tap_save();

    REQUIRE(catalog_.size() == 5);
    CHECK_FALSE(catalog_.at(4)->is_temp_);
    CHECK(catalog_.at(4)->uri_ == "spotify:album:elsewhere");
    CHECK(catalog_.get_temp_item() == nullptr);
    CHECK(sync_.get_selected_index() == 4);

    /* next poll does not bring back the temp item */
    sync_.status_updated(true);
    CHECK(catalog_.size() == 5);
    CHECK(player_.requests_.empty());
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Held cover is deleted and neighbour plays")
{
    use_catalog_file();

    sync_.tap_cover(1);
    sync_.tap_cover(1);
    advance_and_tick(std::chrono::milliseconds(100));
    REQUIRE(sync_.get_selected_index() == 2);
    CHECK_FALSE(sync_.is_delete_mode());

    sync_.hold();
    CHECK(sync_.is_delete_mode());

    sync_.tap_delete();

    CHECK_FALSE(sync_.is_delete_mode());
    REQUIRE(catalog_.size() == 3);
    CHECK(catalog_.find("spotify:album:2") < 0);
    CHECK(sync_.get_selected_index() == 1);
    CHECK_FALSE(sync_.get_play_timer().is_armed());
    REQUIRE(player_.requests_.size() == 1);
    CHECK(player_.requests_[0] == "spotify:album:1");

    Catalog::List reloaded;
    REQUIRE(reloaded.load(catalog_file_));
    CHECK(reloaded.size() == 3);
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Delete mode is canceled by other gestures")
{
    use_catalog_file();

    sync_.hold();
    REQUIRE(sync_.is_delete_mode());

    sync_.drag_begin();
    CHECK_FALSE(sync_.is_delete_mode());
    sync_.drag_end();

    sync_.tap_delete();
    CHECK(catalog_.size() == 4);
    CHECK(player_.requests_.empty());
}

TEST_CASE_FIXTURE(SelectionSyncTestsFixture, "Temporary item cannot enter delete mode")
{
    set_playing("spotify:album:elsewhere");
    sync_.status_updated(true);
    sync_.tick();
    REQUIRE(sync_.get_selected_index() == 4);

    sync_.hold();
    CHECK_FALSE(sync_.is_delete_mode());

    sync_.tap_delete();
    CHECK(catalog_.size() == 5);
}

TEST_SUITE_END();
