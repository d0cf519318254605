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

#include "busy.hh"
#include "logged_lock.hh"

/*!
 * A class wrapping our busy state flags.
 *
 * There are two interfaces for obtaining the current busy flag: by callback
 * and by function call.
 *
 * The class takes care of calling the callback function only if the flag
 * actually changed.
 */
class GlobalBusyState
{
  private:
    LoggedLock::Mutex lock_;
    uint32_t busy_flags_;
    bool is_muted_;
    std::function<void(bool)> notify_busy_state_changed_;

    bool last_notified_busy_state_;

  public:
    GlobalBusyState(const GlobalBusyState &) = delete;
    GlobalBusyState &operator=(const GlobalBusyState &) = delete;

    explicit GlobalBusyState():
        busy_flags_(0),
        is_muted_(false),
        last_notified_busy_state_(false)
    {
        LoggedLock::configure(lock_, "GlobalBusyState", MESSAGE_LEVEL_DEBUG);
    }

    void reset(const std::function<void(bool)> &callback)
    {
        std::lock_guard<LoggedLock::Mutex> lock(lock_);

        busy_flags_ = 0;
        is_muted_ = false;
        last_notified_busy_state_ = false;
        notify_busy_state_changed_ = callback;
    }

    bool set(uint32_t mask)
    {
        LoggedLock::UniqueLock<LoggedLock::Mutex> lock(lock_);
        busy_flags_ |= mask;
        return notify_if_necessary(lock);
    }

    bool clear(uint32_t mask)
    {
        LoggedLock::UniqueLock<LoggedLock::Mutex> lock(lock_);
        busy_flags_ &= ~mask;
        return notify_if_necessary(lock);
    }

    bool set_muted(bool is_muted)
    {
        LoggedLock::UniqueLock<LoggedLock::Mutex> lock(lock_);
        is_muted_ = is_muted;
        return notify_if_necessary(lock);
    }

    bool is_set(uint32_t mask)
    {
        std::lock_guard<LoggedLock::Mutex> lock(lock_);
        return (busy_flags_ & mask) != 0;
    }

    bool is_busy()
    {
        std::lock_guard<LoggedLock::Mutex> lock(lock_);
        return is_busy__uncached();
    }

  private:
    /*!
     * Call callback if busy state has changed with respect to last call.
     *
     * \param lock
     *     Object lock wrapper, assumed in locked state.
     *
     * \note
     *     This function may or may not unlock the passed \p lock object.
     *     No object data may be accessed after calling this function.
     */
    bool notify_if_necessary(LoggedLock::UniqueLock<LoggedLock::Mutex> &lock)
    {
        if(last_notified_busy_state_ == is_busy__uncached())
            return false;

        last_notified_busy_state_ = !last_notified_busy_state_;

        msg_vinfo(MESSAGE_LEVEL_DEBUG, "Busy: %s [flags %08x%s]",
                  last_notified_busy_state_ ? "yes" : "no", busy_flags_,
                  is_muted_ ? ", muted" : "");

        if(notify_busy_state_changed_ != nullptr)
        {
            const bool state = last_notified_busy_state_;
            const auto fn = notify_busy_state_changed_;
            lock.unlock();
            fn(state);
        }

        return true;
    }

    bool is_busy__uncached() const { return !is_muted_ && busy_flags_ != 0; }
};

/*!
 * Busy state is global, so here is our singleton.
 */
static GlobalBusyState global_busy_state;

static uint32_t make_mask(Busy::Source src)
{
    return (1U << static_cast<unsigned int>(src));
}

void Busy::init(const std::function<void(bool)> &state_changed_callback)
{
    global_busy_state.reset(state_changed_callback);
}

bool Busy::set(Source src)
{
    return global_busy_state.set(make_mask(src));
}

bool Busy::clear(Source src)
{
    return global_busy_state.clear(make_mask(src));
}

bool Busy::set_muted(bool is_muted)
{
    return global_busy_state.set_muted(is_muted);
}

bool Busy::is_set(Source src)
{
    return global_busy_state.is_set(make_mask(src));
}

bool Busy::is_busy()
{
    return global_busy_state.is_busy();
}
