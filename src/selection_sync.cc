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

#include <cmath>
#include <algorithm>

#include "selection_sync.hh"
#include "busy.hh"
#include "messages.h"

constexpr int Selection::Sync::MAXIMUM_SWIPE_JUMP;

static const char *command_name(int cmd)
{
    static const char *names[] = { "pause", "resume", "next", "prev", };

    return names[cmd];
}

void Selection::Sync::cancel_delete_mode()
{
    if(delete_mode_uri_.empty())
        return;

    msg_vinfo(MESSAGE_LEVEL_DIAG, "Delete mode canceled");
    delete_mode_uri_.clear();
}

bool Selection::Sync::accept_gesture()
{
    cancel_delete_mode();

    if(sleep_.is_sleeping())
    {
        sleep_.wake_up();
        return false;
    }

    sleep_.reset_timer();

    return true;
}

bool Selection::Sync::is_debounced() const
{
    return has_button_action_ &&
           !Clock::has_elapsed(clock_, last_button_action_,
                               policy_.button_debounce_);
}

bool Selection::Sync::accept_button(bool even_if_disconnected)
{
    if(!accept_gesture())
        return false;

    if(is_debounced())
    {
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "Button tap debounced");
        return false;
    }

    if(!even_if_disconnected && !monitor_.is_connected())
    {
        msg_info("Button tap ignored (disconnected, %u failures)",
                 monitor_.get_failure_count());
        return false;
    }

    has_button_action_ = true;
    last_button_action_ = clock_.now();

    return true;
}

void Selection::Sync::tap_play()
{
    if(accept_button(false))
        toggle_play();
}

void Selection::Sync::tap_prev()
{
    if(accept_button(false))
        send_command(Command::PREV);
}

void Selection::Sync::tap_next()
{
    if(accept_button(false))
        send_command(Command::NEXT);
}

void Selection::Sync::tap_volume()
{
    if(accept_button(true))
        volume_.toggle();
}

void Selection::Sync::tap_cover(int delta)
{
    if(!accept_gesture())
        return;

    if(is_debounced())
    {
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "Carousel tap debounced");
        return;
    }

    navigate(delta);
}

void Selection::Sync::swipe(SwipeDirection direction, double velocity)
{
    if(!accept_gesture() || catalog_.empty())
        return;

    const double v = std::fabs(velocity);
    const int bonus = (v < 1.0) ? 0 : ((v < 2.0) ? 1 : ((v < 3.5) ? 2 : 3));
    const int steps = std::min(1 + bonus, MAXIMUM_SWIPE_JUMP);
    const long current = static_cast<long>(selected_index_);
    const long last = static_cast<long>(catalog_.size()) - 1;

    long target = (direction == SwipeDirection::LEFT)
        ? current + steps
        : current - steps;

    target = std::max(0L, std::min(target, last));

    msg_vinfo(MESSAGE_LEVEL_DIAG, "Swipe %s (v=%.2f): %ld -> %ld",
              direction == SwipeDirection::LEFT ? "left" : "right",
              velocity, current, target);

    snap_to(static_cast<size_t>(target));
}

void Selection::Sync::drag_begin()
{
    if(!accept_gesture())
        return;

    is_dragging_ = true;
    play_timer_.cancel();
}

void Selection::Sync::drag_end()
{
    is_dragging_ = false;
}

void Selection::Sync::carousel_settled()
{
    if(carousel_.settle())
        msg_vinfo(MESSAGE_LEVEL_TRACE, "Carousel settled at %zu",
                  carousel_.get_target_index());
}

void Selection::Sync::wake()
{
    if(sleep_.is_sleeping())
        sleep_.wake_up();
    else
        sleep_.reset_timer();
}

void Selection::Sync::hold()
{
    if(!accept_gesture())
        return;

    const Catalog::Item *item = catalog_.at(selected_index_);

    if(item == nullptr || item->is_temp_)
        return;

    msg_info("Delete mode: %s", item->name_.c_str());
    delete_mode_uri_ = item->uri_;
}

void Selection::Sync::tap_save()
{
    if(!accept_gesture())
        return;

    const Catalog::Item *temp = catalog_.get_temp_item();

    if(temp == nullptr)
        return;

    msg_info("Saving: %s", temp->name_.c_str());

    if(!catalog_.save_temp_item())
        return;

    clamp_selection();
}

void Selection::Sync::tap_delete()
{
    const std::string uri(delete_mode_uri_);

    if(!accept_gesture() || uri.empty())
        return;

    const ssize_t found = catalog_.find(uri);

    if(found < 0)
        return;

    const size_t idx = static_cast<size_t>(found);

    if(catalog_.at(idx)->is_temp_)
        return;

    msg_info("Deleting: %s", catalog_.at(idx)->name_.c_str());

    if(!catalog_.delete_item(idx))
        return;

    play_timer_.cancel();

    if(catalog_.empty())
    {
        selected_index_ = 0;
        return;
    }

    const size_t old_index = selected_index_;
    selected_index_ = std::min(old_index > 0 ? old_index - 1 : 0,
                               catalog_.size() - 1);
    carousel_.set_target(selected_index_);

    const Catalog::Item *item = catalog_.at(selected_index_);

    if(!item->is_temp_)
        play_item(item->uri_);
}

bool Selection::Sync::is_delete_mode() const
{
    if(delete_mode_uri_.empty())
        return false;

    const Catalog::Item *item = catalog_.at(selected_index_);

    return item != nullptr && item->uri_ == delete_mode_uri_;
}

void Selection::Sync::toggle_play()
{
    if(!monitor_.is_connected())
    {
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "Ignoring play/pause: disconnected");
        return;
    }

    nav_pause_.leave();

    const auto np(now_playing_.get());

    if(np->is_playing())
    {
        msg_info("Pausing");
        pending_action_ = PendingAction::PAUSE;
        is_play_in_progress_ = false;
        send_command(Command::PAUSE);
    }
    else if(np->paused_)
    {
        msg_info("Resuming");
        pending_action_ = PendingAction::PLAY;
        auto_pause_.restore_volume_if_needed();
        send_command(Command::RESUME);
    }
    else
    {
        const Catalog::Item *item = catalog_.at(selected_index_);

        if(item == nullptr || item->is_temp_)
            return;

        msg_info("Playing %s", item->name_.c_str());
        play_item(item->uri_);
    }
}

void Selection::Sync::play_item(const std::string &uri, bool from_beginning)
{
    has_user_played_ = true;
    last_user_play_uri_ = uri;
    last_user_play_ = clock_.now();
    is_play_in_progress_ = true;

    player_.request_play(uri, from_beginning);
}

void Selection::Sync::snap_to(size_t target_index)
{
    if(catalog_.empty())
        return;

    if(target_index >= catalog_.size())
        target_index = catalog_.size() - 1;

    if(target_index == selected_index_)
    {
        carousel_.set_target(target_index);
        return;
    }

    const size_t old_index = selected_index_;
    selected_index_ = target_index;
    carousel_.set_target(target_index);

    const auto np(now_playing_.get());
    const Catalog::Item *old_item = catalog_.at(old_index);

    if(np->is_playing() && old_item != nullptr &&
       old_item->uri_ == np->context_uri_)
    {
        msg_info("Pausing for navigation");
        nav_pause_.enter(np->context_uri_);
        send_command(Command::PAUSE);
    }

    const Catalog::Item *item = catalog_.at(target_index);

    msg_vinfo(MESSAGE_LEVEL_DEBUG, "Snap: %zu -> %zu, item %s",
              old_index, target_index, item->name_.c_str());

    if(item->is_temp_)
        play_timer_.cancel();
    else if(nav_pause_.is_paused_at(item->uri_))
    {
        msg_info("Resuming (returned to item): %s", item->name_.c_str());
        nav_pause_.leave();
        play_timer_.cancel();
        send_command(Command::RESUME);
    }
    else if(item->uri_ != np->context_uri_)
        play_timer_.start(item->uri_);
    else
        play_timer_.cancel();
}

void Selection::Sync::navigate(int delta)
{
    if(catalog_.empty())
        return;

    const long last = static_cast<long>(catalog_.size()) - 1;
    const long target = std::max(0L, std::min(static_cast<long>(selected_index_) + delta,
                                              last));

    snap_to(static_cast<size_t>(target));
}

void Selection::Sync::send_command(Command cmd)
{
    RemotePlayer::CommandSinkIface &sink(sink_);
    const char *name = command_name(static_cast<int>(cmd));

    executor_.submit(
        [&sink, cmd, name] ()
        {
            bool ok = false;

            switch(cmd)
            {
              case Command::PAUSE:
                ok = sink.pause();
                break;

              case Command::RESUME:
                ok = sink.resume();
                break;

              case Command::NEXT:
                ok = sink.next();
                break;

              case Command::PREV:
                ok = sink.prev();
                break;
            }

            if(!ok)
                msg_error(0, LOG_ERR, "Command \"%s\" failed", name);
        },
        name);
}

void Selection::Sync::clamp_selection()
{
    if(catalog_.empty())
        selected_index_ = 0;
    else if(selected_index_ >= catalog_.size())
        selected_index_ = catalog_.size() - 1;
}

void Selection::Sync::fire_play_timer(const std::string &uri)
{
    msg_info("PlayTimer fired: %s (selected %zu)", uri.c_str(), selected_index_);

    if(nav_pause_.is_paused_at(uri))
    {
        msg_info("Resuming (paused for navigation)");
        nav_pause_.leave();
        send_command(Command::RESUME);
        return;
    }

    nav_pause_.leave();
    play_item(uri);
}

void Selection::Sync::sync_to_playing(const Playback::Snapshot &np)
{
    if(catalog_.empty())
        return;

    if(is_dragging_ || !carousel_.is_settled() || play_timer_.is_armed())
        return;

    if(play_timer_.is_in_cooldown())
        return;

    const std::string &uri(np.context_uri_);

    if(uri.empty() || uri == last_context_uri_)
        return;

    if(uri == play_timer_.get_last_played_uri())
    {
        /* the player has caught up with what we asked for */
        play_timer_.clear_last_played_uri();
        last_context_uri_ = uri;
        return;
    }

    const ssize_t idx = catalog_.find(uri);

    if(idx < 0)
        return;

    const size_t playing_index = static_cast<size_t>(idx);

    if(playing_index != selected_index_)
    {
        msg_info("Syncing to: %s", catalog_.at(playing_index)->name_.c_str());
        selected_index_ = playing_index;
        carousel_.set_target(playing_index);
    }

    last_context_uri_ = uri;
}

void Selection::Sync::check_autoplay(const Playback::Snapshot &np)
{
    const std::string &new_uri(np.context_uri_);

    if(new_uri.empty() || !np.is_playing())
        return;

    if(last_observed_uri_.empty() || last_observed_uri_ == new_uri)
    {
        last_observed_uri_ = new_uri;
        return;
    }

    const std::string old_uri(std::move(last_observed_uri_));
    last_observed_uri_ = new_uri;

    const bool recent_user_action =
        has_user_played_ &&
        !Clock::has_elapsed(clock_, last_user_play_, policy_.autoplay_window_);
    const bool is_expected = (new_uri == last_user_play_uri_);

    if(recent_user_action || is_expected)
        return;

    msg_info("Context finished: %s", old_uri.c_str());
    progress_.forget(old_uri);
}

static void set_busy_source(Busy::Source src, bool is_set)
{
    if(is_set)
        Busy::set(src);
    else
        Busy::clear(src);
}

void Selection::Sync::update_loading_state(const Playback::Snapshot &np)
{
    if(np.is_playing())
        is_play_in_progress_ = false;

    if(nav_pause_.is_active())
    {
        if(np.is_playing())
            nav_pause_.leave();
        else if(carousel_.is_settled() && !play_timer_.is_armed() &&
                !is_play_in_progress_)
            nav_pause_.leave();
    }

    set_busy_source(Busy::Source::PLAY_REQUEST_IN_FLIGHT, is_play_in_progress_);
    set_busy_source(Busy::Source::PLAY_TIMER_ARMED, play_timer_.is_armed());
    set_busy_source(Busy::Source::PAUSED_FOR_NAVIGATION, nav_pause_.is_active());
    Busy::set_muted(pending_action_ == PendingAction::PAUSE);
}

void Selection::Sync::status_updated(bool have_status)
{
    const auto np(now_playing_.get());

    if(have_status)
        pending_action_ = PendingAction::NONE;

    if(catalog_.update_temp_item(*np))
        clamp_selection();

    if(!have_status)
    {
        auto_pause_.on_stop();
        return;
    }

    volume_.handle_remote_change(np->volume_);

    check_autoplay(*np);

    if(np->is_playing() && sleep_.is_sleeping())
        sleep_.wake_up();

    if(np->is_playing())
    {
        auto_pause_.on_play(np->context_uri_);
        auto_pause_.check(true);
    }
    else
        auto_pause_.on_stop();
}

void Selection::Sync::play_request_finished()
{
    if(!player_.is_in_flight())
        is_play_in_progress_ = false;
}

std::chrono::milliseconds Selection::Sync::tick()
{
    const auto np(now_playing_.get());

    clamp_selection();
    carousel_.update();

    if(monitor_.is_connected())
    {
        std::string uri;

        if(play_timer_.check(uri))
            fire_play_timer(uri);
    }
    else
        play_timer_.cancel();

    sync_to_playing(*np);
    progress_.tick(*np);
    sleep_.check(np->is_playing());
    update_loading_state(*np);

    if(is_dragging_ || !carousel_.is_settled() || Busy::is_busy())
        return std::chrono::milliseconds(16);

    if(np->is_playing())
        return std::chrono::milliseconds(100);

    return std::chrono::milliseconds(200);
}

bool Selection::Sync::is_loading() const
{
    return Busy::is_busy();
}

bool Selection::Sync::display_playing() const
{
    switch(pending_action_)
    {
      case PendingAction::PAUSE:
        return false;

      case PendingAction::PLAY:
        return true;

      case PendingAction::NONE:
        break;
    }

    return is_loading() || now_playing_.get()->is_playing();
}
