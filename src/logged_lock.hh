/*
 * Copyright (C) 2016, 2017, 2019, 2020, 2026  T+A elektroakustik GmbH & Co. KG
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

#ifndef LOGGED_LOCK_HH
#define LOGGED_LOCK_HH

#include <mutex>
#include <condition_variable>

#include "messages.h"

#define LOGGED_LOCKS_ENABLED            0

#if LOGGED_LOCKS_ENABLED
#include <pthread.h>
#endif /* LOGGED_LOCKS_ENABLED */

/*!
 * Mutexes with names, optionally logging every lock operation.
 *
 * With #LOGGED_LOCKS_ENABLED set to 0 (the default), everything in here maps
 * directly to the standard library types. When chasing a deadlock, set it to
 * 1 and run with verbosity level "debug" to see who takes which lock.
 */
namespace LoggedLock
{

#if LOGGED_LOCKS_ENABLED

class Mutex
{
  private:
    std::mutex lock_;
    const char *name_;
    pthread_t owner_;
    MessageVerboseLevel log_level_;

  public:
    Mutex(const Mutex &) = delete;
    Mutex &operator=(const Mutex &) = delete;

    explicit Mutex():
        name_("(unnamed)"),
        owner_(0),
        log_level_(MESSAGE_LEVEL_NORMAL)
    {}

    void lock()
    {
        if(owner_ == pthread_self())
            MSG_BUG("Mutex %s: DEADLOCK for <%08lx>", name_, pthread_self());

        msg_vinfo(log_level_, "<%08lx> Mutex %s: lock", pthread_self(), name_);
        lock_.lock();
        owner_ = pthread_self();
        msg_vinfo(log_level_, "<%08lx> Mutex %s: locked", pthread_self(), name_);
    }

    bool try_lock()
    {
        const bool is_locked = lock_.try_lock();

        if(is_locked)
            owner_ = pthread_self();

        msg_vinfo(log_level_, "<%08lx> Mutex %s: try lock -> %s",
                  pthread_self(), name_, is_locked ? "locked" : "failed");

        return is_locked;
    }

    void unlock()
    {
        msg_vinfo(log_level_, "<%08lx> Mutex %s: unlock", pthread_self(), name_);

        if(owner_ != pthread_self())
            MSG_BUG("Mutex %s: <%08lx> unlocking mutex owned by <%08lx>",
                    name_, pthread_self(), owner_);

        owner_ = 0;
        lock_.unlock();
    }

    void configure(const char *name, MessageVerboseLevel log_level)
    {
        name_ = name;
        log_level_ = log_level;
    }

    const char *get_name() const { return name_; }
};

template <typename MutexType> using UniqueLock = std::unique_lock<MutexType>;

/* condition variables must work with our own mutex type */
using ConditionVariable = std::condition_variable_any;

template <typename T>
static inline void configure(T &object,
                             const char *name, MessageVerboseLevel log_level)
{
    object.configure(name, log_level);
}

static inline void configure(ConditionVariable &object,
                             const char *name, MessageVerboseLevel log_level)
{
    /* nothing */
}

#define LOGGED_LOCK_CONTEXT_HINT \
    msg_vinfo(MESSAGE_LEVEL_TRACE, "<%08lx> %s:%d", pthread_self(), __func__, __LINE__)

#else /* /!LOGGED_LOCKS_ENABLED */

#define LOGGED_LOCK_CONTEXT_HINT            do {} while(0)

using Mutex = std::mutex;
template <typename MutexType> using UniqueLock = std::unique_lock<MutexType>;
using ConditionVariable = std::condition_variable;

template <typename T>
static inline void configure(T &object,
                             const char *name, MessageVerboseLevel log_level)
{
    /* nothing */
}

#endif /* LOGGED_LOCKS_ENABLED */

}

#endif /* !LOGGED_LOCK_HH */
