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

#ifndef SCREEN_STATE_HH
#define SCREEN_STATE_HH

#include <string>
#include <ostream>

#include "catalog.hh"
#include "playback_snapshot.hh"

/*!
 * What the renderer should show.
 */
namespace Screen
{

class State
{
  public:
    bool is_connected_;
    bool is_sleeping_;
    bool is_loading_;

    /*! Displayed state, includes pending actions. */
    bool is_playing_;

    /*! Selected cover is offered for deletion. */
    bool is_delete_mode_;

    size_t selected_index_;
    std::string volume_icon_;

    explicit State():
        is_connected_(false),
        is_sleeping_(false),
        is_loading_(false),
        is_playing_(false),
        is_delete_mode_(false),
        selected_index_(0)
    {}
};

/*!
 * Render screen state as single-line JSON object.
 */
std::string render(const State &state, const Catalog::List &catalog,
                   const Playback::Snapshot &now_playing);

/*!
 * Writes screen state to the renderer, but only if it has changed.
 */
class Output
{
  private:
    std::ostream &os_;
    std::string last_line_;

  public:
    Output(const Output &) = delete;
    Output &operator=(const Output &) = delete;

    explicit Output(std::ostream &os):
        os_(os)
    {}

    /*!
     * Send line if it differs from the one sent before.
     *
     * \returns
     *     True if the line has been written.
     */
    bool update(const std::string &line);

    /*!
     * Force sending the next line.
     */
    void invalidate() { last_line_.clear(); }
};

}

#endif /* !SCREEN_STATE_HH */
