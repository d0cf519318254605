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

#ifndef PLAYBACK_SNAPSHOT_HH
#define PLAYBACK_SNAPSHOT_HH

#include <string>
#include <memory>
#include <cinttypes>

#include "logged_lock.hh"

namespace Playback
{

/*!
 * What the remote player reported in one status poll.
 *
 * Objects of this type are never modified after they have been published,
 * they are replaced as a whole.
 */
class Snapshot
{
  public:
    bool paused_;
    bool stopped_;

    std::string context_uri_;
    std::string track_uri_;
    std::string track_name_;
    std::string artist_;
    std::string album_;
    std::string cover_url_;

    uint32_t position_ms_;
    uint32_t duration_ms_;

    /*! Remote volume in percent, negative if not reported. */
    int volume_;

    explicit Snapshot():
        paused_(false),
        stopped_(true),
        position_ms_(0),
        duration_ms_(0),
        volume_(-1)
    {}

    bool is_playing() const { return !stopped_ && !paused_; }
    bool is_active() const { return !stopped_; }
    bool has_track() const { return !track_uri_.empty() || !track_name_.empty(); }

    /*!
     * Playback progress in range [0, 1], 0 if duration is unknown.
     */
    double progress() const
    {
        if(duration_ms_ == 0)
            return 0.0;

        const double p = double(position_ms_) / double(duration_ms_);

        return p < 1.0 ? p : 1.0;
    }
};

/*!
 * Synchronized cell holding the most recently published snapshot.
 *
 * Readers get a reference-counted pointer to an immutable snapshot, so they
 * never see a partially updated value and may keep it as long as they like.
 */
class SnapshotCell
{
  private:
    mutable LoggedLock::Mutex lock_;
    std::shared_ptr<const Snapshot> current_;

  public:
    SnapshotCell(const SnapshotCell &) = delete;
    SnapshotCell &operator=(const SnapshotCell &) = delete;

    explicit SnapshotCell():
        current_(std::make_shared<Snapshot>())
    {
        LoggedLock::configure(lock_, "SnapshotCell", MESSAGE_LEVEL_DEBUG);
    }

    /*!
     * Replace current snapshot, \c nullptr means "no active playback".
     */
    void publish(std::unique_ptr<Snapshot> snapshot)
    {
        std::shared_ptr<const Snapshot> next(snapshot != nullptr
                                             ? std::shared_ptr<const Snapshot>(std::move(snapshot))
                                             : std::make_shared<Snapshot>());

        std::lock_guard<LoggedLock::Mutex> lock(lock_);
        current_.swap(next);
    }

    std::shared_ptr<const Snapshot> get() const
    {
        std::lock_guard<LoggedLock::Mutex> lock(lock_);
        return current_;
    }
};

}

#endif /* !PLAYBACK_SNAPSHOT_HH */
