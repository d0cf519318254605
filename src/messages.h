/*
 * Copyright (C) 2015, 2016, 2019, 2026  T+A elektroakustik GmbH & Co. KG
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

#ifndef MESSAGES_H
#define MESSAGES_H

#include <stdbool.h>
#include <syslog.h>

/*!
 * Verbosity levels.
 *
 * Messages emitted with #msg_vinfo() are only shown if the configured
 * verbosity is at least as high as the level passed along.
 */
enum MessageVerboseLevel
{
    MESSAGE_LEVEL_IMPOSSIBLE = -2,
    MESSAGE_LEVEL_QUIET = -1,
    MESSAGE_LEVEL_IMPORTANT = 0,
    MESSAGE_LEVEL_NORMAL,
    MESSAGE_LEVEL_DIAG,
    MESSAGE_LEVEL_DEBUG,
    MESSAGE_LEVEL_TRACE,

    MESSAGE_LEVEL_MIN = MESSAGE_LEVEL_QUIET,
    MESSAGE_LEVEL_MAX = MESSAGE_LEVEL_TRACE,
};

#ifdef __cplusplus
extern "C" {
#endif

/*!
 * Whether or not to make use of syslog.
 */
void msg_enable_syslog(bool enable_syslog);

void msg_set_verbose_level(enum MessageVerboseLevel level);
enum MessageVerboseLevel msg_get_verbose_level(void);
bool msg_is_verbose(enum MessageVerboseLevel level);

/*!
 * Map verbosity level name to level, #MESSAGE_LEVEL_IMPOSSIBLE if unknown.
 */
enum MessageVerboseLevel msg_verbose_level_name_to_level(const char *name);

/*!
 * NULL-terminated list of verbosity level names, lowest level first.
 */
const char *const *msg_get_verbose_level_names(void);

/*!
 * Emit error to stderr and syslog.
 *
 * \param error_code The current error code as stored in errno.
 * \param priority A log priority as expected by syslog(3).
 * \param error_format Format string followed by arguments.
 */
void msg_error(int error_code, int priority, const char *error_format, ...)
    __attribute__ ((format (printf, 3, 4)));

/*!
 * Emit log informative message to stderr and syslog.
 */
void msg_info(const char *format_string, ...)
    __attribute__ ((format (printf, 1, 2)));

/*!
 * Emit informative message if verbosity level allows it.
 */
void msg_vinfo(enum MessageVerboseLevel level, const char *format_string, ...)
    __attribute__ ((format (printf, 2, 3)));

void msg_out_of_memory(const char *what);

void msg_abort(void) __attribute__ ((noreturn));

#ifdef __cplusplus
}
#endif

#define MSG_BUG(...) msg_error(0, LOG_CRIT, "BUG: " __VA_ARGS__)

#define MSG_BUG_IF(COND, ...) \
    do \
    { \
        if(COND) \
            MSG_BUG(__VA_ARGS__); \
    } \
    while(0)

#define MSG_UNREACHABLE() \
    MSG_BUG("Reached unreachable code at %s:%d", __FILE__, __LINE__)

#ifdef NDEBUG
#define msg_log_assert(EXPR) do {} while(0)
#else /* !NDEBUG */
#define msg_log_assert(EXPR) \
    do \
    { \
        if(!(EXPR)) \
        { \
            msg_error(0, LOG_EMERG, "Assertion failed at %s:%d: " #EXPR, \
                      __FILE__, __LINE__); \
            msg_abort(); \
        } \
    } \
    while(0)
#endif /* NDEBUG */

#endif /* !MESSAGES_H */
