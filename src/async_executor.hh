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

#ifndef ASYNC_EXECUTOR_HH
#define ASYNC_EXECUTOR_HH

#include <functional>

struct _GThreadPool;

namespace Async
{

/*!
 * Executor for fire-and-forget work such as remote commands and OS calls.
 */
class ExecutorIface
{
  protected:
    explicit ExecutorIface() {}

  public:
    using Work = std::function<void()>;

    ExecutorIface(const ExecutorIface &) = delete;
    ExecutorIface &operator=(const ExecutorIface &) = delete;

    virtual ~ExecutorIface() {}

    /*!
     * Queue work for execution.
     *
     * \param work
     *     The function to execute. Its result is of no interest, so it must
     *     report its own errors.
     * \param what
     *     Short description for log messages, must be a string literal.
     */
    virtual bool submit(Work &&work, const char *what) = 0;
};

/*!
 * Executor backed by an exclusive GLib thread pool with a single thread.
 *
 * Work items are executed one after the other in the order they were
 * submitted.
 */
class ThreadPoolExecutor: public ExecutorIface
{
  private:
    struct _GThreadPool *pool_;

  public:
    ThreadPoolExecutor(const ThreadPoolExecutor &) = delete;
    ThreadPoolExecutor &operator=(const ThreadPoolExecutor &) = delete;

    explicit ThreadPoolExecutor():
        pool_(nullptr)
    {}

    ~ThreadPoolExecutor() { shutdown(); }

    bool init();

    /*!
     * Finish queued work and stop the worker thread.
     */
    void shutdown();

    bool submit(Work &&work, const char *what) final override;
};

}

#endif /* !ASYNC_EXECUTOR_HH */
