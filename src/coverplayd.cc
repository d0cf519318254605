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

#include <cstring>
#include <cstdio>
#include <cerrno>
#include <csignal>
#include <functional>
#include <iostream>
#include <unistd.h>

#include <glib.h>
#include <glib-unix.h>
#include <curl/curl.h>

#include "configuration.hh"
#include "configuration_coverplayd.hh"
#include "librespot_client.hh"
#include "event_feed.hh"
#include "status_poller.hh"
#include "selection_sync.hh"
#include "system_control.hh"
#include "gesture.hh"
#include "screen_state.hh"
#include "ui_event_queue.hh"
#include "busy.hh"
#include "named_pipe.h"
#include "fdstreambuf.hh"
#include "frame_timer.hh"
#include "messages.h"
#include "messages_glib.h"

struct files_t
{
    int gesture_fd;
    int screen_fd;
    const char *gesture_fifo_name;
    const char *screen_fifo_name;
    guint gesture_fd_event_source_id;
};

struct parameters
{
    enum MessageVerboseLevel verbose_level;
    bool run_in_foreground;
    const char *configuration_file;
};

/*!
 * Everything the main loop needs to get its work done.
 */
struct main_loop_data_t
{
    UI::EventQueue *queue;
    Selection::Sync *sync;
    Playback::StatusPoller *poller;
    Connection::Monitor *monitor;
    Volume::Arbiter *volume;
    Sleep::Manager *sleep;
    Catalog::List *catalog;
    const Playback::SnapshotCell *now_playing;
    Screen::Output *screen;
    UI::FrameTimer tick_timer;

    explicit main_loop_data_t():
        queue(nullptr),
        sync(nullptr),
        poller(nullptr),
        monitor(nullptr),
        volume(nullptr),
        sleep(nullptr),
        catalog(nullptr),
        now_playing(nullptr),
        screen(nullptr)
    {}
};

struct gesture_dispatch_data_t
{
    files_t *files;
    main_loop_data_t *loop_data;
    Input::LineSplitter splitter;

    explicit gesture_dispatch_data_t(files_t &f, main_loop_data_t &ld):
        files(&f),
        loop_data(&ld)
    {}
};

using CoverplaydConfigMgr = Configuration::ConfigManager<Configuration::CoverplaydValues>;

static void show_version_info(void)
{
    printf("%s\n", PACKAGE_STRING);
}

static void log_version_info(void)
{
    msg_vinfo(MESSAGE_LEVEL_IMPORTANT, "%s", PACKAGE_STRING);
}

static void update_screen(main_loop_data_t &data)
{
    const auto np(data.now_playing->get());
    Screen::State state;

    state.is_connected_ = data.monitor->is_connected();
    state.is_sleeping_ = data.sleep->is_sleeping();
    state.is_loading_ = data.sync->is_loading();
    state.is_playing_ = data.sync->display_playing();
    state.selected_index_ = data.sync->get_selected_index();
    state.is_delete_mode_ = data.sync->is_delete_mode();
    state.volume_icon_ = data.volume->get_icon_name();

    data.screen->update(Screen::render(state, *data.catalog, *np));
}

static void process_pending_events(main_loop_data_t *data)
{
    msg_log_assert(data != nullptr);

    while(auto event = data->queue->take())
    {
        switch(event->event_id_)
        {
          case UI::EventID::STATUS_POLLED:
            {
                const auto &ev(static_cast<const UI::Events::StatusPolled &>(*event));
                if(ev.result_ != Playback::StatusPoller::Result::UNREACHABLE)
                    data->sync->status_updated(
                        ev.result_ == Playback::StatusPoller::Result::STATUS);

                if(ev.transition_ == Connection::Monitor::Transition::RESTORED)
                    data->screen->invalidate();
            }

            break;

          case UI::EventID::PLAY_REQUEST_DONE:
            data->sync->play_request_finished();
            break;

          case UI::EventID::FEED_UPDATED:
            data->poller->force_poll();
            break;

          case UI::EventID::FEED_RECONNECTED:
            msg_info("Event feed reconnected, refreshing state");
            data->monitor->assume_reachable();
            data->poller->force_poll();
            data->volume->on_wake();
            break;
        }
    }

    update_screen(*data);
}

static gboolean do_call_in_main_context(gpointer user_data)
{
    auto *fn = static_cast<std::function<void()> *>(user_data);
    msg_log_assert(fn != nullptr);

    try
    {
        (*fn)();
    }
    catch(const std::exception &e)
    {
        msg_error(0, LOG_ERR, "Exception in main loop: %s", e.what());
    }

    return G_SOURCE_REMOVE;
}

static void do_call_in_main_context_dtor(gpointer user_data)
{
    auto *fn = static_cast<std::function<void()> *>(user_data);
    delete fn;
}

/*!
 * Call given function in main context.
 *
 * For functions that must not be called from threads other than the main
 * thread.
 *
 * \param fn_object
 *     Dynamically allocated function object that is called from the main
 *     thread's main loop. If \c nullptr, then an out-of-memory error message
 *     is emitted. The object is freed via \c delete after the function object
 *     has been called.
 */
static void call_in_main_context(std::function<void()> *fn_object)
{
    if(fn_object == nullptr)
    {
        msg_out_of_memory("function object");
        return;
    }

    g_main_context_invoke_full(NULL, G_PRIORITY_DEFAULT,
                               do_call_in_main_context, fn_object,
                               do_call_in_main_context_dtor);
}

static void defer_ui_event_processing(main_loop_data_t *data)
{
    msg_log_assert(data != nullptr);
    call_in_main_context(new std::function<void()>(std::bind(process_pending_events, data)));
}

static std::chrono::milliseconds ui_tick(main_loop_data_t *data)
{
    const auto next = data->sync->tick();
    update_screen(*data);
    return next;
}

static bool watch_gesture_fd(gesture_dispatch_data_t *dispatch_data);

static gboolean gesture_fifo_dispatch(int fd, GIOCondition condition,
                                      gpointer user_data)
{
    auto *const data = static_cast<gesture_dispatch_data_t *>(user_data);

    msg_log_assert(data != nullptr);

    if(data->files->gesture_fd < 0)
        return G_SOURCE_REMOVE;

    gboolean return_value = G_SOURCE_CONTINUE;
    bool need_reopen = (condition & G_IO_HUP) != 0;

    if((condition & G_IO_IN) != 0)
    {
        uint8_t buffer[512];
        size_t pos;

        do
        {
            pos = 0;
            const int ret =
                fifo_try_read_to_buffer(buffer, sizeof(buffer), &pos, fd);

            data->splitter.feed(reinterpret_cast<const char *>(buffer), pos,
                [data] (const std::string &line)
                {
                    Input::Gesture gesture;

                    if(!Input::parse_gesture(line, gesture))
                    {
                        msg_error(0, LOG_NOTICE, "Unknown gesture \"%s\"",
                                  line.c_str());
                        return;
                    }

                    msg_vinfo(MESSAGE_LEVEL_TRACE, "Gesture: %s", line.c_str());
                    Input::dispatch_gesture(gesture, *data->loop_data->sync);
                });

            if(ret != 0)
            {
                need_reopen = true;
                break;
            }
        }
        while(pos == sizeof(buffer));

        update_screen(*data->loop_data);
    }

    if(need_reopen)
    {
        msg_vinfo(MESSAGE_LEVEL_DIAG, "Gesture source went away, reopening");

        if(!fifo_reopen(&data->files->gesture_fd,
                        data->files->gesture_fifo_name, false))
        {
            msg_error(EPIPE, LOG_EMERG,
                      "Failed reopening gesture pipe, unable to recover. "
                      "Terminating");
            raise(SIGTERM);
        }
        else if(data->files->gesture_fd != fd)
        {
            if(!watch_gesture_fd(data))
                raise(SIGTERM);

            return_value = G_SOURCE_REMOVE;
        }
    }

    if((condition & ~(G_IO_IN | G_IO_HUP)) != 0)
        msg_error(EINVAL, LOG_WARNING,
                  "Unexpected poll() events on gesture fifo %d: %04x",
                  fd, condition);

    return return_value;
}

static bool watch_gesture_fd(gesture_dispatch_data_t *dispatch_data)
{
    dispatch_data->files->gesture_fd_event_source_id =
        g_unix_fd_add(dispatch_data->files->gesture_fd,
                      GIOCondition(G_IO_IN | G_IO_PRI | G_IO_ERR | G_IO_HUP | G_IO_NVAL),
                      gesture_fifo_dispatch, dispatch_data);

    if(dispatch_data->files->gesture_fd_event_source_id == 0)
        msg_error(ENOMEM, LOG_EMERG, "Failed adding gesture fd event to main loop");

    return dispatch_data->files->gesture_fd_event_source_id != 0;
}

/*!
 * Set up logging, daemonize.
 */
static int setup(const struct parameters *parameters,
                 gesture_dispatch_data_t *dispatch_data, GMainLoop **loop)
{
    msg_enable_syslog(!parameters->run_in_foreground);
    msg_enable_glib_message_redirection();
    msg_set_verbose_level(parameters->verbose_level);

    if(!parameters->run_in_foreground)
        openlog("coverplayd", LOG_PID, LOG_DAEMON);

    if(!parameters->run_in_foreground)
    {
        if(daemon(0, 0) < 0)
        {
            msg_error(errno, LOG_EMERG, "Failed to run as daemon");
            return -1;
        }
    }

    log_version_info();

    /* broken pipes are reported through write(2) */
    signal(SIGPIPE, SIG_IGN);

    msg_vinfo(MESSAGE_LEVEL_DEBUG, "Attempting to open named pipes");

    struct files_t *const files = dispatch_data->files;

    files->screen_fd = fifo_open(files->screen_fifo_name, true);
    if(files->screen_fd < 0)
        goto error_screen_fifo;

    files->gesture_fd = fifo_create_and_open(files->gesture_fifo_name, false);
    if(files->gesture_fd < 0)
        goto error_gesture_fifo;

    *loop = g_main_loop_new(NULL, FALSE);
    if(*loop == NULL)
    {
        msg_error(ENOMEM, LOG_EMERG, "Failed creating GLib main loop");
        goto error_main_loop_new;
    }

    return 0;

error_main_loop_new:
    fifo_close_and_delete(&files->gesture_fd, files->gesture_fifo_name);

error_gesture_fifo:
    fifo_close(&files->screen_fd);

error_screen_fifo:
    *loop = NULL;
    return -1;
}

static void usage(const char *program_name)
{
    std::cout <<
        "Usage: " << program_name << " [options]\n"
        "\n"
        "Options:\n"
        "  --help         Show this help.\n"
        "  --version      Print version information to stdout.\n"
        "  --verbose lvl  Set verbosity level to given level.\n"
        "  --quiet        Short for \"--verbose quite\".\n"
        "  --fg           Run in foreground, don't run as daemon.\n"
        "  --config file  Name of the configuration file.\n"
        "  --igesture name  Name of the named pipe the gesture classifier\n"
        "                 writes to.\n"
        "  --oscreen name Name of the named pipe the renderer reads from.\n"
        ;
}

static bool check_argument(int argc, char *argv[], int &i)
{
    if(i + 1 >= argc)
    {
        std::cerr << "Option " << argv[i] << " requires an argument.\n";
        return false;
    }

    ++i;

    return true;
}

static int process_command_line(int argc, char *argv[],
                                struct parameters *parameters,
                                struct files_t *files)
{
    parameters->verbose_level = MESSAGE_LEVEL_NORMAL;
    parameters->run_in_foreground = false;
    parameters->configuration_file = "/var/local/etc/coverplayd.ini";

    files->gesture_fifo_name = "/tmp/coverplayd_gestures";
    files->screen_fifo_name = "/tmp/coverplayd_screen";

    for(int i = 1; i < argc; ++i)
    {
        if(strcmp(argv[i], "--help") == 0)
            return 1;
        else if(strcmp(argv[i], "--version") == 0)
            return 2;
        else if(strcmp(argv[i], "--fg") == 0)
            parameters->run_in_foreground = true;
        else if(strcmp(argv[i], "--verbose") == 0)
        {
            if(!check_argument(argc, argv, i))
                return -1;

            parameters->verbose_level = msg_verbose_level_name_to_level(argv[i]);

            if(parameters->verbose_level == MESSAGE_LEVEL_IMPOSSIBLE)
            {
                fprintf(stderr,
                        "Invalid verbosity \"%s\". "
                        "Valid verbosity levels are:\n", argv[i]);

                const char *const *names = msg_get_verbose_level_names();

                for(const char *name = *names; name != NULL; name = *++names)
                    fprintf(stderr, "    %s\n", name);

                return -1;
            }
        }
        else if(strcmp(argv[i], "--quiet") == 0)
            parameters->verbose_level = MESSAGE_LEVEL_QUIET;
        else if(strcmp(argv[i], "--config") == 0)
        {
            if(!check_argument(argc, argv, i))
                return -1;
            parameters->configuration_file = argv[i];
        }
        else if(strcmp(argv[i], "--igesture") == 0)
        {
            if(!check_argument(argc, argv, i))
                return -1;
            files->gesture_fifo_name = argv[i];
        }
        else if(strcmp(argv[i], "--oscreen") == 0)
        {
            if(!check_argument(argc, argv, i))
                return -1;
            files->screen_fifo_name = argv[i];
        }
        else
        {
            std::cerr << "Unknown option \"" << argv[i]
                      << "\". Please try --help.\n";
            return -1;
        }
    }

    return 0;
}

static gboolean signal_handler(gpointer user_data)
{
    g_main_loop_quit(static_cast<GMainLoop *>(user_data));
    return G_SOURCE_REMOVE;
}

static std::chrono::milliseconds ms(uint32_t value)
{
    return std::chrono::milliseconds(value);
}

static std::chrono::milliseconds seconds(uint32_t value)
{
    return std::chrono::milliseconds(uint64_t(value) * 1000U);
}

int main(int argc, char *argv[])
{
    static struct parameters parameters;
    static struct files_t files;

    int ret = process_command_line(argc, argv, &parameters, &files);

    if(ret == -1)
        return EXIT_FAILURE;
    else if(ret == 1)
    {
        usage(argv[0]);
        return EXIT_SUCCESS;
    }
    else if(ret == 2)
    {
        show_version_info();
        return EXIT_SUCCESS;
    }

    static GMainLoop *loop = NULL;

    static main_loop_data_t loop_data;
    static gesture_dispatch_data_t gesture_dispatch_data(files, loop_data);

    if(setup(&parameters, &gesture_dispatch_data, &loop) < 0)
        return EXIT_FAILURE;

    static const Configuration::CoverplaydValues default_settings;
    static CoverplaydConfigMgr config_manager(parameters.configuration_file,
                                              default_settings);

    if(!config_manager.load())
        msg_info("Using built-in defaults");

    const Configuration::CoverplaydValues &config(config_manager.values());

    if(curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
    {
        msg_error(0, LOG_EMERG, "Failed initializing libcurl");
        return EXIT_FAILURE;
    }

    static Async::ThreadPoolExecutor executor;

    if(!executor.init())
        return EXIT_FAILURE;

    static const Clock::Monotonic clock;
    static Librespot::Client client{std::string(config.librespot_url_)};
    static Progress::Store store(std::string(config.resume_file_),
                                 std::chrono::hours(config.progress_expiry_hours_));
    static Catalog::List catalog;
    static Playback::SnapshotCell now_playing;
    static Connection::Monitor monitor(config.grace_threshold_,
                                       ms(config.poll_interval_ms_),
                                       ms(config.fast_poll_interval_ms_));
    static SystemControl::Linux system(config.mixer_card_, config.backlight_dir_);

    if(!catalog.load(config.catalog_file_))
        msg_error(0, LOG_WARNING, "Starting with empty catalog");

    static Volume::Arbiter volume(
        clock, system, client, executor,
        Volume::Arbiter::Policy{
            std::vector<unsigned int>(config.volume_levels_.begin(),
                                      config.volume_levels_.end()),
            ms(config.echo_window_ms_), config.remote_takeover_threshold_});

    static AutoPause::Timer auto_pause(
        clock, executor,
        AutoPause::Timer::Policy{seconds(config.auto_pause_timeout_s_),
                                 ms(config.auto_pause_fade_ms_),
                                 config.auto_pause_fade_steps_,
                                 ms(500)},
        [] () { return volume.level(); },
        [] (unsigned int percent) { system.set_local_volume(percent); },
        [] () { return client.pause(); });

    static Progress::Keeper keeper(client, store, executor, clock,
                                   seconds(config.progress_save_interval_s_));

    static UI::EventQueue ui_event_queue(
        std::bind(defer_ui_event_processing, &loop_data));

    static Playback::PlayRequestCoordinator player(
        client, store, now_playing,
        Playback::PlayRequestCoordinator::Timing{ms(config.play_settle_delay_ms_),
                                                 ms(config.resume_seek_delay_ms_)},
        [] () { volume.ensure_remote_at_full(); },
        [] (const Playback::Snapshot &left) { keeper.save_left_context(left); },
        [] ()
        {
            ui_event_queue.post(std::unique_ptr<UI::Events::BaseEvent>(
                new UI::Events::Notification(UI::EventID::PLAY_REQUEST_DONE)));
        });

    static Librespot::EventFeed feed(
        std::string(config.librespot_events_url_),
        [] ()
        {
            ui_event_queue.post(std::unique_ptr<UI::Events::BaseEvent>(
                new UI::Events::Notification(UI::EventID::FEED_UPDATED)));
        },
        [] ()
        {
            ui_event_queue.post(std::unique_ptr<UI::Events::BaseEvent>(
                new UI::Events::Notification(UI::EventID::FEED_RECONNECTED)));
        });

    static Playback::StatusPoller poller(
        client, monitor, now_playing,
        Playback::StatusPoller::StartupPolicy{config.startup_retries_,
                                              ms(config.startup_backoff_base_ms_),
                                              ms(config.startup_backoff_cap_ms_)},
        [] () { return feed.get_context_uri(); },
        [] (Playback::StatusPoller::Result result,
            Connection::Monitor::Transition transition)
        {
            ui_event_queue.post(std::unique_ptr<UI::Events::BaseEvent>(
                new UI::Events::StatusPolled(result, transition)));
        });

    static Sleep::Manager sleep_manager(
        clock, system, executor, seconds(config.sleep_timeout_s_),
        [] ()
        {
            msg_info("Wake up: connected %d, %u failures, volume mode %s",
                     monitor.is_connected(), monitor.get_failure_count(),
                     volume.get_mode() == Volume::Mode::LOCAL ? "local" : "remote");
            monitor.assume_reachable();
            poller.force_poll();
            volume.on_wake();
        });

    static Selection::Sync sync(
        clock, catalog, now_playing, monitor, player, client, executor,
        volume, auto_pause, keeper, sleep_manager,
        Selection::Sync::Policy{ms(config.button_debounce_ms_),
                                std::chrono::milliseconds(5000),
                                ms(config.play_timer_delay_ms_),
                                ms(config.sync_cooldown_ms_),
                                ms(config.carousel_settle_ms_)});

    static FdStreambuf fd_sbuf(files.screen_fd);
    static std::ostream fd_out(&fd_sbuf);
    static Screen::Output screen(fd_out);

    loop_data.queue = &ui_event_queue;
    loop_data.sync = &sync;
    loop_data.poller = &poller;
    loop_data.monitor = &monitor;
    loop_data.volume = &volume;
    loop_data.sleep = &sleep_manager;
    loop_data.catalog = &catalog;
    loop_data.now_playing = &now_playing;
    loop_data.screen = &screen;

    Busy::init(nullptr);

    if(!watch_gesture_fd(&gesture_dispatch_data))
        return EXIT_FAILURE;

    g_unix_signal_add(SIGINT, signal_handler, loop);
    g_unix_signal_add(SIGTERM, signal_handler, loop);

    sleep_manager.init();
    volume.init();
    player.start();
    feed.start();
    poller.start();

    msg_info("Polling %s", config.librespot_url_.c_str());

    loop_data.tick_timer.start(std::chrono::milliseconds(200),
                               std::bind(ui_tick, &loop_data));

    g_main_loop_run(loop);

    msg_vinfo(MESSAGE_LEVEL_IMPORTANT, "Shutting down");

    loop_data.tick_timer.stop();
    feed.stop();
    poller.stop();
    player.shutdown();
    auto_pause.shutdown();

    keeper.save_now(*now_playing.get());

    executor.shutdown();
    curl_global_cleanup();

    fd_sbuf.set_fd(-1);

    if(files.gesture_fd_event_source_id != 0)
        g_source_remove(files.gesture_fd_event_source_id);

    fifo_close(&files.gesture_fd);
    fifo_close(&files.screen_fd);

    g_main_loop_unref(loop);

    return EXIT_SUCCESS;
}
