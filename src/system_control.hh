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

#ifndef SYSTEM_CONTROL_HH
#define SYSTEM_CONTROL_HH

#include <string>

/*!
 * Local side effects on the device: mixer volume and display backlight.
 *
 * Failures are logged and otherwise ignored. Functions may block for a short
 * time, so they must not be called from the main loop.
 */
namespace SystemControl
{

class Iface
{
  protected:
    explicit Iface() {}

  public:
    Iface(const Iface &) = delete;
    Iface &operator=(const Iface &) = delete;

    virtual ~Iface() {}

    virtual bool set_local_volume(unsigned int percent) = 0;
    virtual bool set_backlight(bool is_on) = 0;
};

/*!
 * ALSA mixer via amixer(1), backlight via sysfs.
 */
class Linux: public Iface
{
  private:
    const unsigned int mixer_card_;
    std::string backlight_path_;

  public:
    Linux(const Linux &) = delete;
    Linux &operator=(const Linux &) = delete;

    explicit Linux(unsigned int mixer_card, const std::string &backlight_dir);

    bool set_local_volume(unsigned int percent) final override;
    bool set_backlight(bool is_on) final override;

    const std::string &get_backlight_path() const { return backlight_path_; }

  private:
    bool amixer_set(const char *control, unsigned int percent);
};

}

#endif /* !SYSTEM_CONTROL_HH */
