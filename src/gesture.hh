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

#ifndef GESTURE_HH
#define GESTURE_HH

#include <string>
#include <functional>

#include "selection_sync.hh"

/*!
 * Gestures as reported by the touch screen classifier.
 */
namespace Input
{

enum class GestureKind
{
    TAP_PLAY,
    TAP_PREV,
    TAP_NEXT,
    TAP_VOLUME,
    TAP_COVER,
    SWIPE,
    DRAG_BEGIN,
    DRAG_END,
    SETTLED,
    WAKE,
    HOLD,
    TAP_SAVE,
    TAP_DELETE,
};

class Gesture
{
  public:
    GestureKind kind_;

    /*! Neighbour cover for #Input::GestureKind::TAP_COVER. */
    int delta_;

    Selection::SwipeDirection direction_;
    double velocity_;

    explicit Gesture(GestureKind kind = GestureKind::WAKE):
        kind_(kind),
        delta_(0),
        direction_(Selection::SwipeDirection::LEFT),
        velocity_(0.0)
    {}
};

/*!
 * Parse one line received from the gesture pipe.
 *
 * \returns
 *     True on success, false if the line is not understood.
 */
bool parse_gesture(const std::string &line, Gesture &gesture);

/*!
 * Hand gesture to the selection logic.
 */
void dispatch_gesture(const Gesture &gesture, Selection::Sync &sync);

/*!
 * Split data read from the gesture pipe into lines.
 */
class LineSplitter
{
  public:
    using LineFn = std::function<void(const std::string &)>;

    static constexpr size_t MAXIMUM_LINE_LENGTH = 256;

  private:
    std::string partial_line_;

  public:
    LineSplitter(const LineSplitter &) = delete;
    LineSplitter &operator=(const LineSplitter &) = delete;

    explicit LineSplitter() {}

    /*!
     * Process chunk of data, call \p fn for each complete line.
     *
     * Empty lines are skipped, overlong lines are dropped.
     */
    void feed(const char *data, size_t length, const LineFn &fn);
};

}

#endif /* !GESTURE_HH */
