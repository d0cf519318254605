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

#ifndef SELECTION_SYNC_HH
#define SELECTION_SYNC_HH

#include <string>
#include <chrono>

#include "catalog.hh"
#include "carousel.hh"
#include "play_timer.hh"
#include "play_request.hh"
#include "connection_monitor.hh"
#include "volume_arbiter.hh"
#include "auto_pause.hh"
#include "progress_keeper.hh"
#include "sleep_manager.hh"

namespace Selection
{

/*!
 * Play or pause requested by the user, not yet confirmed by the player.
 */
enum class PendingAction
{
    NONE,
    PLAY,
    PAUSE,
};

enum class SwipeDirection
{
    LEFT,
    RIGHT,
};

/*!
 * Playback paused because the user has swiped away from the playing item.
 */
class NavigationPause
{
  public:
    enum class State
    {
        INACTIVE,
        PAUSED,
    };

  private:
    State state_;
    std::string context_uri_;

  public:
    NavigationPause(const NavigationPause &) = delete;
    NavigationPause &operator=(const NavigationPause &) = delete;

    explicit NavigationPause():
        state_(State::INACTIVE)
    {}

    void enter(const std::string &context_uri)
    {
        state_ = State::PAUSED;
        context_uri_ = context_uri;
    }

    void leave()
    {
        state_ = State::INACTIVE;
        context_uri_.clear();
    }

    bool is_active() const { return state_ == State::PAUSED; }

    bool is_paused_at(const std::string &uri) const
    {
        return state_ == State::PAUSED && context_uri_ == uri;
    }
};

/*!
 * Keeps the selected cover and the remote player in sync.
 *
 * User gestures, status updates, and the periodic UI tick are all handled
 * here. Everything is called from the main loop, the objects referenced by
 * this class take care of doing blocking work elsewhere.
 */
class Sync
{
  public:
    struct Policy
    {
        std::chrono::milliseconds button_debounce_;
        std::chrono::milliseconds autoplay_window_;
        std::chrono::milliseconds play_timer_delay_;
        std::chrono::milliseconds sync_cooldown_;
        std::chrono::milliseconds carousel_settle_;
    };

    static constexpr int MAXIMUM_SWIPE_JUMP = 5;

  private:
    enum class Command
    {
        PAUSE,
        RESUME,
        NEXT,
        PREV,
    };

    const Clock::MonotonicIface &clock_;
    Catalog::List &catalog_;
    const Playback::SnapshotCell &now_playing_;
    const Connection::Monitor &monitor_;
    Playback::PlayRequestIface &player_;
    RemotePlayer::CommandSinkIface &sink_;
    Async::ExecutorIface &executor_;
    Volume::Arbiter &volume_;
    AutoPause::Timer &auto_pause_;
    Progress::Keeper &progress_;
    Sleep::Manager &sleep_;
    const Policy policy_;

    size_t selected_index_;
    Carousel carousel_;
    PlayTimer play_timer_;
    NavigationPause nav_pause_;
    PendingAction pending_action_;
    bool is_dragging_;
    bool is_play_in_progress_;

    bool has_button_action_;
    Clock::TimePoint last_button_action_;

    /* last playing context the selection has been synced with */
    std::string last_context_uri_;

    /* last playing context seen in any status, synced or not */
    std::string last_observed_uri_;

    /* catalog item offered for deletion */
    std::string delete_mode_uri_;

    bool has_user_played_;
    std::string last_user_play_uri_;
    Clock::TimePoint last_user_play_;

  public:
    Sync(const Sync &) = delete;
    Sync &operator=(const Sync &) = delete;

    explicit Sync(const Clock::MonotonicIface &clock, Catalog::List &catalog,
                  const Playback::SnapshotCell &now_playing,
                  const Connection::Monitor &monitor,
                  Playback::PlayRequestIface &player,
                  RemotePlayer::CommandSinkIface &sink,
                  Async::ExecutorIface &executor, Volume::Arbiter &volume,
                  AutoPause::Timer &auto_pause, Progress::Keeper &progress,
                  Sleep::Manager &sleep, const Policy &policy):
        clock_(clock),
        catalog_(catalog),
        now_playing_(now_playing),
        monitor_(monitor),
        player_(player),
        sink_(sink),
        executor_(executor),
        volume_(volume),
        auto_pause_(auto_pause),
        progress_(progress),
        sleep_(sleep),
        policy_(policy),
        selected_index_(0),
        carousel_(clock, policy.carousel_settle_),
        play_timer_(clock, policy.play_timer_delay_, policy.sync_cooldown_),
        pending_action_(PendingAction::NONE),
        is_dragging_(false),
        is_play_in_progress_(false),
        has_button_action_(false),
        has_user_played_(false)
    {}

    void tap_play();
    void tap_prev();
    void tap_next();
    void tap_volume();
    void tap_cover(int delta);
    void swipe(SwipeDirection direction, double velocity);
    void drag_begin();
    void drag_end();
    void carousel_settled();
    void wake();

    /*!
     * Long press on the selected cover, offer it for deletion.
     */
    void hold();

    void tap_save();
    void tap_delete();

    /*!
     * A status poll has completed.
     *
     * \param have_status
     *     True if the player has reported a status, false if there is no
     *     active playback or the player is unreachable.
     */
    void status_updated(bool have_status);

    /*!
     * The play request coordinator has become idle.
     */
    void play_request_finished();

    /*!
     * Periodic processing.
     *
     * \returns
     *     Time until next tick.
     */
    std::chrono::milliseconds tick();

    size_t get_selected_index() const { return selected_index_; }
    bool is_loading() const;
    bool display_playing() const;
    PendingAction get_pending_action() const { return pending_action_; }
    bool is_navigation_paused() const { return nav_pause_.is_active(); }
    bool is_play_in_progress() const { return is_play_in_progress_; }
    bool is_delete_mode() const;
    const PlayTimer &get_play_timer() const { return play_timer_; }
    const Carousel &get_carousel() const { return carousel_; }

  private:
    bool accept_gesture();
    void cancel_delete_mode();
    bool is_debounced() const;
    bool accept_button(bool even_if_disconnected);

    void toggle_play();
    void play_item(const std::string &uri, bool from_beginning = false);
    void snap_to(size_t target_index);
    void navigate(int delta);
    void send_command(Command cmd);

    void clamp_selection();
    void fire_play_timer(const std::string &uri);
    void sync_to_playing(const Playback::Snapshot &np);
    void check_autoplay(const Playback::Snapshot &np);
    void update_loading_state(const Playback::Snapshot &np);
};

}

#endif /* !SELECTION_SYNC_HH */
