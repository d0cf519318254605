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

#include <sstream>

#include "gesture.hh"
#include "messages.h"

constexpr size_t Input::LineSplitter::MAXIMUM_LINE_LENGTH;

static bool at_end(std::istringstream &is)
{
    std::string extra;
    return !(is >> extra);
}

bool Input::parse_gesture(const std::string &line, Gesture &gesture)
{
    std::istringstream is(line);
    std::string verb;
    std::string what;

    if(!(is >> verb))
        return false;

    if(verb == "settled" || verb == "wake" || verb == "hold")
    {
        if(!at_end(is))
            return false;

        if(verb == "wake")
            gesture = Gesture(GestureKind::WAKE);
        else if(verb == "hold")
            gesture = Gesture(GestureKind::HOLD);
        else
            gesture = Gesture(GestureKind::SETTLED);

        return true;
    }

    if(!(is >> what))
        return false;

    if(verb == "tap")
    {
        if(what == "cover")
        {
            int delta;

            if(!(is >> delta) || delta == 0 || !at_end(is))
                return false;

            gesture = Gesture(GestureKind::TAP_COVER);
            gesture.delta_ = delta;
            return true;
        }

        if(!at_end(is))
            return false;

        if(what == "play")
            gesture = Gesture(GestureKind::TAP_PLAY);
        else if(what == "prev")
            gesture = Gesture(GestureKind::TAP_PREV);
        else if(what == "next")
            gesture = Gesture(GestureKind::TAP_NEXT);
        else if(what == "volume")
            gesture = Gesture(GestureKind::TAP_VOLUME);
        else if(what == "save")
            gesture = Gesture(GestureKind::TAP_SAVE);
        else if(what == "delete")
            gesture = Gesture(GestureKind::TAP_DELETE);
        else
            return false;

        return true;
    }

    if(verb == "swipe")
    {
        Selection::SwipeDirection dir;

        if(what == "left")
            dir = Selection::SwipeDirection::LEFT;
        else if(what == "right")
            dir = Selection::SwipeDirection::RIGHT;
        else
            return false;

        double velocity;

        if(!(is >> velocity) || !at_end(is))
            return false;

        gesture = Gesture(GestureKind::SWIPE);
        gesture.direction_ = dir;
        gesture.velocity_ = velocity;
        return true;
    }

    if(verb == "drag")
    {
        if(!at_end(is))
            return false;

        if(what == "begin")
            gesture = Gesture(GestureKind::DRAG_BEGIN);
        else if(what == "end")
            gesture = Gesture(GestureKind::DRAG_END);
        else
            return false;

        return true;
    }

    return false;
}

void Input::dispatch_gesture(const Gesture &gesture, Selection::Sync &sync)
{
    switch(gesture.kind_)
    {
      case GestureKind::TAP_PLAY:
        sync.tap_play();
        break;

      case GestureKind::TAP_PREV:
        sync.tap_prev();
        break;

      case GestureKind::TAP_NEXT:
        sync.tap_next();
        break;

      case GestureKind::TAP_VOLUME:
        sync.tap_volume();
        break;

      case GestureKind::TAP_COVER:
        sync.tap_cover(gesture.delta_);
        break;

      case GestureKind::SWIPE:
        sync.swipe(gesture.direction_, gesture.velocity_);
        break;

      case GestureKind::DRAG_BEGIN:
        sync.drag_begin();
        break;

      case GestureKind::DRAG_END:
        sync.drag_end();
        break;

      case GestureKind::SETTLED:
        sync.carousel_settled();
        break;

      case GestureKind::WAKE:
        sync.wake();
        break;

      case GestureKind::HOLD:
        sync.hold();
        break;

      case GestureKind::TAP_SAVE:
        sync.tap_save();
        break;

      case GestureKind::TAP_DELETE:
        sync.tap_delete();
        break;
    }
}

void Input::LineSplitter::feed(const char *data, size_t length, const LineFn &fn)
{
    for(size_t i = 0; i < length; ++i)
    {
        const char ch = data[i];

        if(ch == '\n')
        {
            if(partial_line_.size() > MAXIMUM_LINE_LENGTH)
                msg_error(0, LOG_NOTICE, "Dropped overlong gesture line");
            else if(!partial_line_.empty())
                fn(partial_line_);

            partial_line_.clear();
        }
        else if(ch != '\r' && partial_line_.size() <= MAXIMUM_LINE_LENGTH)
            partial_line_.push_back(ch);
    }
}
