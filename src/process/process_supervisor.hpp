#pragma once

#include <tabhost/fwd.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../core/geometry_planner.hpp"
#include "../core/shared_cell.hpp"
#include "../window/window_locator.hpp"
#include "child_process.hpp"

namespace tabhost
{

using SteadyTime = std::chrono::steady_clock::time_point;

struct DiscoveryOptions
{
    std::chrono::milliseconds interval{100};
    int                       max_attempts = 600;
};

// Invoked from the discovery thread when the attempt budget runs out. Must
// not touch host-thread state directly.
using DiscoveryFailedCallback = std::function<void(ProcessId pid)>;

struct SupervisorOptions
{
    LaunchCommand                 command;
    std::shared_ptr<WindowSystem> windows;
    WindowPredicate               predicate;   // empty: WindowMatch{} defaults
    DiscoveryOptions              discovery;
    HostGeometryProvider          geometry;
    DiscoveryFailedCallback       on_discovery_failed;
};

struct SpawnResult
{
    std::unique_ptr<ProcessSupervisor> supervisor;
    SpawnError                         error = SpawnError::None;
    std::string                        message;

    explicit operator bool() const { return supervisor != nullptr; }
};

// Owns one content process and tracks the top-level window it creates.
//
// The window is found by a detached discovery thread started in spawn().
// That thread shares only reference-counted state with the supervisor, so
// the supervisor may be destroyed at any time; the thread then stops quietly.
// Every other method runs on the host thread and never blocks.
class ProcessSupervisor
{
    // Restricts construction to spawn().
    struct ConstructionKey
    {
        explicit ConstructionKey() = default;
    };

   public:
    static SpawnResult spawn(const SupervisorOptions&     options,
                             PixelSize                    target_size,
                             const std::filesystem::path& working_directory);

    ProcessSupervisor(ConstructionKey, ChildProcessHandle process, std::shared_ptr<WindowSystem> windows);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&)            = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    bool is_running();
    bool is_ready() const;

    // Moves the window only if its rect differs from the planned one.
    // Returns whether a move was issued and succeeded.
    bool update_position(const HostGeometry& geometry);

    // Show, position, raise. What tab switching calls.
    void activate(const HostGeometry& geometry);

    void show();
    void hide();

    // Graceful close. False if no live window is known yet.
    bool request_close();

    // Forceful kill + reap. Idempotent.
    bool terminate();

    std::string             window_title() const;
    ProcessId               pid() const { return pid_; }
    std::optional<WindowId> window() const { return window_->get(); }

    std::optional<SteadyTime> close_requested_at() const { return close_requested_at_->get(); }

    // Keeps the earliest request time.
    void mark_close_requested(SteadyTime now);

   private:
    // Discovered window if it still exists.
    std::optional<WindowId> live_window() const;

    static void run_discovery(WindowLocator                          locator,
                              ProcessId                              pid,
                              DiscoveryOptions                       options,
                              HostGeometryProvider                   geometry,
                              DiscoveryFailedCallback                on_failed,
                              std::shared_ptr<WindowSystem>          windows,
                              SharedCellPtr<std::optional<WindowId>> window,
                              std::shared_ptr<std::atomic<bool>>     abandoned);

    ChildProcessHandle                       process_;
    ProcessId                                pid_ = 0;
    std::shared_ptr<WindowSystem>            windows_;
    SharedCellPtr<std::optional<WindowId>>   window_;
    SharedCellPtr<std::optional<SteadyTime>> close_requested_at_;
    std::shared_ptr<std::atomic<bool>>       abandoned_;
};

}   // namespace tabhost
