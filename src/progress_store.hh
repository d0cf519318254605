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

#ifndef PROGRESS_STORE_HH
#define PROGRESS_STORE_HH

#include <string>
#include <memory>
#include <chrono>
#include <functional>
#include <cinttypes>

#include "logged_lock.hh"

struct _GKeyFile;

/*!
 * Resume positions per playback context.
 */
namespace Progress
{

class Saved
{
  public:
    std::string context_uri_;
    std::string track_uri_;
    uint32_t position_ms_;
    std::string track_name_;
    std::string artist_;

    /*! Wall clock time of last update, seconds since the epoch. */
    int64_t updated_at_;

    explicit Saved():
        position_ms_(0),
        updated_at_(0)
    {}
};

class StoreIface
{
  protected:
    explicit StoreIface() {}

  public:
    StoreIface(const StoreIface &) = delete;
    StoreIface &operator=(const StoreIface &) = delete;

    virtual ~StoreIface() {}

    /*!
     * Get saved progress for context, \c nullptr if none or expired.
     */
    virtual std::unique_ptr<Saved> get_progress(const std::string &context_uri) = 0;

    virtual bool save_progress(const std::string &context_uri,
                               const std::string &track_uri,
                               uint32_t position_ms,
                               const std::string &track_name,
                               const std::string &artist) = 0;

    virtual void clear_progress(const std::string &context_uri) = 0;
};

/*!
 * Progress store persisted in an INI file, one group per context.
 *
 * Entries older than the configured expiry time are treated as absent and
 * removed when found. All functions may be called from any thread.
 */
class Store: public StoreIface
{
  public:
    using WallClock = std::function<int64_t()>;

  private:
    LoggedLock::Mutex lock_;

    const std::string file_name_;
    const std::chrono::hours expiry_;
    const WallClock wall_clock_;

    struct _GKeyFile *key_file_;

  public:
    Store(const Store &) = delete;
    Store &operator=(const Store &) = delete;

    explicit Store(std::string &&file_name, std::chrono::hours expiry,
                   WallClock &&wall_clock = nullptr);
    ~Store();

    std::unique_ptr<Saved> get_progress(const std::string &context_uri) final override;
    bool save_progress(const std::string &context_uri,
                       const std::string &track_uri, uint32_t position_ms,
                       const std::string &track_name,
                       const std::string &artist) final override;
    void clear_progress(const std::string &context_uri) final override;

  private:
    bool write_back();
};

}

#endif /* !PROGRESS_STORE_HH */
