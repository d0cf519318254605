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

#include <memory>
#include <glib.h>

#include "async_executor.hh"
#include "messages.h"

namespace Async
{

class WorkItem
{
  public:
    ExecutorIface::Work work_;
    const char *const what_;

    WorkItem(const WorkItem &) = delete;
    WorkItem &operator=(const WorkItem &) = delete;

    explicit WorkItem(ExecutorIface::Work &&work, const char *what):
        work_(std::move(work)),
        what_(what)
    {}
};

}

static void execute_work_item(gpointer data, gpointer user_data)
{
    std::unique_ptr<Async::WorkItem> item(static_cast<Async::WorkItem *>(data));

    msg_vinfo(MESSAGE_LEVEL_TRACE, "Async: %s", item->what_);

    try
    {
        item->work_();
    }
    catch(const std::exception &e)
    {
        msg_error(0, LOG_ERR, "Async work \"%s\" failed: %s",
                  item->what_, e.what());
    }
}

bool Async::ThreadPoolExecutor::init()
{
    if(pool_ != nullptr)
    {
        MSG_BUG("Thread pool already initialized");
        return true;
    }

    GError *error = nullptr;

    pool_ = g_thread_pool_new(execute_work_item, this, 1, TRUE, &error);

    if(pool_ == nullptr)
    {
        msg_error(0, LOG_EMERG, "Failed creating thread pool: %s",
                  error != nullptr ? error->message : "unknown error");

        if(error != nullptr)
            g_error_free(error);

        return false;
    }

    return true;
}

void Async::ThreadPoolExecutor::shutdown()
{
    if(pool_ == nullptr)
        return;

    g_thread_pool_free(pool_, FALSE, TRUE);
    pool_ = nullptr;
}

bool Async::ThreadPoolExecutor::submit(Work &&work, const char *what)
{
    if(pool_ == nullptr)
    {
        MSG_BUG("Dropping async work \"%s\", thread pool not running", what);
        return false;
    }

    auto *item = new Async::WorkItem(std::move(work), what);
    GError *error = nullptr;

    if(!g_thread_pool_push(pool_, item, &error))
    {
        msg_error(0, LOG_ERR, "Failed queuing async work \"%s\": %s",
                  what, error != nullptr ? error->message : "unknown error");

        if(error != nullptr)
            g_error_free(error);

        delete item;
        return false;
    }

    return true;
}
