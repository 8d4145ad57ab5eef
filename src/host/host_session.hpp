#pragma once

#include <tabhost/fwd.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "../config/config.hpp"
#include "../tabs/tab_manager.hpp"
#include "../tabs/tab_strip_layout.hpp"

namespace tabhost
{

// What the event loop should do after a command.
enum class HostAction
{
    None,
    Repaint,
    Quit,    // last tab is gone
    Fatal,   // a content window was never found
};

const char* host_action_to_string(HostAction action);

// ─── HostSession ─────────────────────────────────────────────────────────────
// The command surface of the host window. The event loop translates input,
// resize, close and timer events into these calls and acts on the returned
// HostAction; all tab and process logic lives behind it. Host-thread only,
// except for the wake callback which may be invoked from discovery threads.

class HostSession
{
   public:
    HostSession(Config                        config,
                std::shared_ptr<WindowSystem> windows,
                HostGeometryProvider          geometry,
                DiscoveryOptions              discovery = {});
    ~HostSession() = default;

    HostSession(const HostSession&)            = delete;
    HostSession& operator=(const HostSession&) = delete;

    // Called (from any thread) when the event loop must wake up early, e.g.
    // after a discovery failure. Set before the first tab is created.
    void set_wake_callback(std::function<void()> wake) { wake_ = std::move(wake); }

    // Opens the initial tab with the default profile.
    HostAction start();

    HostAction on_new_tab_requested(size_t profile_index);

    // Activates the first tab of the profile, creating one if there is none.
    HostAction on_profile_hotkey(size_t profile_index);

    HostAction on_tab_clicked(size_t index);
    HostAction on_tab_close_clicked(size_t index);

    // Pointer press/move/release in strip coordinates. A press on a close
    // button or on the new-tab button acts immediately; a press on a tab
    // body starts a drag that becomes a click if it never moves far.
    HostAction on_drag_start(int x, int y);
    HostAction on_drag_move(int x);
    HostAction on_drag_end(int x);

    HostAction on_resize();
    HostAction on_window_close_requested();

    // The host window gained focus. Raising the host covers the content
    // area, so the selected content window is brought back in front.
    HostAction on_host_activated();

    // Periodic: removes exited tabs, drives the close sequence, keeps the
    // selected window in front and its title fresh.
    HostAction on_poll_tick();

    // Puts the discovery-timeout message into the error banner. Always Fatal.
    HostAction on_discovery_failed();

    HostAction on_config_reloaded(Config config);

    const TabManager& tabs() const { return tabs_; }
    const Config&     config() const { return config_; }

    // Layout of the strip for the current host width.
    TabStripLayout layout() const;

    // Last tab-creation or discovery failure, for the error banner. Empty if
    // none.
    const std::string& error_message() const { return error_message_; }
    void               clear_error() { error_message_.clear(); }

    bool discovery_failed() const { return discovery_failed_->load(); }

   private:
    HostGeometry      geometry() const;
    PixelSize         content_size() const;
    SupervisorOptions make_supervisor_options() const;
    size_t            ready_count() const;

    Config                             config_;
    std::shared_ptr<WindowSystem>      windows_;
    HostGeometryProvider               geometry_;
    DiscoveryOptions                   discovery_;
    std::shared_ptr<std::atomic<bool>> discovery_failed_;
    std::function<void()>              wake_;
    TabManager                         tabs_;
    std::string                        error_message_;
    size_t                             last_ready_count_ = 0;
};

}   // namespace tabhost
