#include "host_window.hpp"
#include "tab_strip_painter.hpp"

#include "../config/config.hpp"
#include "../host/host_session.hpp"
#include "../process/child_process.hpp"
#include "../window/window_locator.hpp"
#include "../window/x11_window_system.hpp"

#include <tabhost/logger.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

namespace
{

using namespace tabhost;

constexpr int  TITLEBAR_HEIGHT = TabStripLayout::STRIP_HEIGHT;
constexpr int  CONTENT_INSET   = 4;
constexpr int  INITIAL_WIDTH   = 1200;
constexpr int  INITIAL_HEIGHT  = 800;
constexpr auto POLL_INTERVAL   = std::chrono::milliseconds(250);

// How long a fatal error stays on screen if the user does not close the host.
constexpr auto FATAL_BANNER_DURATION = std::chrono::seconds(15);

std::atomic<bool> g_close_requested{false};

void signal_handler(int /*sig*/)
{
    g_close_requested.store(true, std::memory_order_relaxed);
}

void print_usage()
{
    std::cout << "Usage:\n"
                 "  tabhost [--config <path>] [--verbose] [--log-level <level>]\n"
                 "                                           run the tab host\n"
                 "  tabhost list-windows [name]              list X11 windows whose title or\n"
                 "                                           class contains name (default: neovide)\n"
                 "  tabhost help                             show this help\n";
}

void setup_logging(LogLevel level)
{
    auto& logger = Logger::instance();
    logger.set_level(level);
    logger.add_sink(sinks::console_sink());

    std::error_code ec;
    auto            tmp = std::filesystem::temp_directory_path(ec);
    if (!ec)
        logger.add_sink(sinks::file_sink((tmp / "tabhost.log").string()));
}

int list_windows(const std::string& search)
{
    auto windows = X11WindowSystem::open();
    if (!windows)
    {
        std::cerr << "tabhost: cannot connect to the X server\n";
        return 1;
    }

    WindowLocator locator(windows, nullptr);
    auto          matches = locator.list_matching(search);
    std::cout << "Windows matching '" << search << "': " << matches.size() << "\n";
    for (const auto& w : matches)
    {
        char id[32];
        std::snprintf(id, sizeof(id), "0x%08lx", static_cast<unsigned long>(w.id));
        std::cout << "  " << id << "  pid=" << w.pid << "  class=\"" << w.window_class
                  << "\"  title=\"" << w.title << "\"  " << w.rect.to_string()
                  << (w.visible ? "" : "  (hidden)") << "\n";
    }
    return 0;
}

// Maps in-window shortcuts onto session commands.
HostAction handle_key(HostSession& session, int key, int action, int mods)
{
    if (action != GLFW_PRESS || !(mods & GLFW_MOD_CONTROL))
        return HostAction::None;

    if (mods & GLFW_MOD_SHIFT)
    {
        if (key >= GLFW_KEY_F1 && key <= GLFW_KEY_F9)
            return session.on_profile_hotkey(static_cast<size_t>(key - GLFW_KEY_F1));
        return HostAction::None;
    }

    if (key == GLFW_KEY_T)
        return session.on_new_tab_requested(0);
    if (key == GLFW_KEY_W)
        return session.on_tab_close_clicked(session.tabs().selected_index());
    if (key >= GLFW_KEY_1 && key <= GLFW_KEY_9)
        return session.on_tab_clicked(static_cast<size_t>(key - GLFW_KEY_1));
    return HostAction::None;
}

}   // namespace

int main(int argc, char* argv[])
{
    std::string config_path;
    LogLevel    log_level = LogLevel::Info;

    std::string command;
    std::string command_arg;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            log_level = LogLevel::Debug;
        }
        else if (arg == "--log-level" && i + 1 < argc)
        {
            auto level = Logger::level_from_string(argv[++i]);
            if (!level)
            {
                std::cerr << "tabhost: unknown log level '" << argv[i] << "'\n";
                return 2;
            }
            log_level = *level;
        }
        else if (arg == "help" || arg == "--help" || arg == "-h")
        {
            print_usage();
            return 0;
        }
        else if (command.empty() && arg == "list-windows")
        {
            command = arg;
        }
        else if (command == "list-windows" && command_arg.empty())
        {
            command_arg = arg;
        }
        else
        {
            std::cerr << "tabhost: unknown argument '" << arg << "'\n";
            print_usage();
            return 2;
        }
    }

    setup_logging(log_level);

    // Must precede every other Xlib call, including GLFW's.
    X11WindowSystem::init_threads();

    if (command == "list-windows")
        return list_windows(command_arg.empty() ? "neovide" : command_arg);

    if (config_path.empty())
        config_path = Config::default_path();
    Config config = Config::load(config_path);

    if (!find_in_path(config.content.command))
    {
        TABHOST_LOG_CRITICAL("main",
                             "'{}' was not found on PATH; install it or set content.command in {}",
                             config.content.command,
                             config_path);
        return 1;
    }

    auto windows = X11WindowSystem::open();
    if (!windows)
        return 1;

    HostWindow window(TITLEBAR_HEIGHT, CONTENT_INSET);
    if (!window.init(INITIAL_WIDTH, INITIAL_HEIGHT, "tabhost"))
        return 1;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    TabStripPainter painter(window.x11_display(), window.x11_window(), config.background_color);
    HostSession     session(config, windows, window.geometry_provider());
    session.set_wake_callback([] { HostWindow::post_empty_event(); });

    ConfigWatcher watcher(config_path);

    bool running   = true;
    bool dirty     = true;
    bool fatal     = false;
    int  exit_code = 0;

    std::chrono::steady_clock::time_point fatal_deadline;

    auto apply = [&](HostAction action)
    {
        switch (action)
        {
            case HostAction::None:
                break;
            case HostAction::Repaint:
                dirty = true;
                break;
            case HostAction::Quit:
                TABHOST_LOG_INFO("main", "All tabs closed, exiting");
                running = false;
                break;
            case HostAction::Fatal:
                if (fatal)
                    break;
                TABHOST_LOG_CRITICAL("main",
                                     "The content window never appeared; '{}' may have failed to "
                                     "start. Exiting.",
                                     session.config().content.command);
                // Input is ignored from here on; the banner stays up until the
                // user closes the window or the deadline passes.
                fatal          = true;
                exit_code      = 1;
                dirty          = true;
                fatal_deadline = std::chrono::steady_clock::now() + FATAL_BANNER_DURATION;
                break;
        }
    };

    bool pointer_down = false;

    HostWindowCallbacks callbacks;
    callbacks.on_mouse_button = [&](int button, int action, int /*mods*/, double x, double y)
    {
        if (fatal || button != GLFW_MOUSE_BUTTON_LEFT)
            return;
        if (action == GLFW_PRESS)
        {
            pointer_down = true;
            apply(session.on_drag_start(static_cast<int>(x), static_cast<int>(y)));
        }
        else if (action == GLFW_RELEASE && pointer_down)
        {
            pointer_down = false;
            apply(session.on_drag_end(static_cast<int>(x)));
        }
    };
    callbacks.on_mouse_move = [&](double x, double /*y*/)
    {
        if (pointer_down && !fatal)
            apply(session.on_drag_move(static_cast<int>(x)));
    };
    callbacks.on_resize = [&](int, int) { apply(session.on_resize()); };
    callbacks.on_move   = [&](int, int) { apply(session.on_resize()); };
    callbacks.on_key    = [&](int key, int action, int mods)
    {
        if (!fatal)
            apply(handle_key(session, key, action, mods));
    };
    callbacks.on_close_requested = [&]()
    {
        if (fatal)
            running = false;
        else
            apply(session.on_window_close_requested());
    };
    callbacks.on_refresh = [&]() { dirty = true; };
    callbacks.on_focus   = [&](bool focused)
    {
        if (focused && !fatal)
            apply(session.on_host_activated());
    };
    window.set_callbacks(callbacks);

    apply(session.start());

    auto next_tick = std::chrono::steady_clock::now() + POLL_INTERVAL;
    while (running)
    {
        if (dirty)
        {
            int width = 0, height = 0;
            window.client_size(width, height);
            painter.paint(session, width, height);
            dirty = false;
        }

        auto   now     = std::chrono::steady_clock::now();
        double timeout = std::chrono::duration<double>(next_tick - now).count();
        window.wait_events_timeout(timeout);

        if (g_close_requested.exchange(false))
        {
            if (fatal)
                running = false;
            else
                apply(session.on_window_close_requested());
        }

        if (fatal)
        {
            if (std::chrono::steady_clock::now() >= fatal_deadline)
                running = false;
            next_tick = std::chrono::steady_clock::now() + POLL_INTERVAL;
            continue;
        }

        if (running && session.discovery_failed())
        {
            apply(session.on_discovery_failed());
            continue;
        }

        if (running && std::chrono::steady_clock::now() >= next_tick)
        {
            next_tick = std::chrono::steady_clock::now() + POLL_INTERVAL;
            apply(session.on_poll_tick());

            if (running && watcher.poll())
            {
                Config reloaded = Config::load(config_path);
                painter.set_background_color(reloaded.background_color);
                apply(session.on_config_reloaded(std::move(reloaded)));
            }
        }
    }

    return exit_code;
}
