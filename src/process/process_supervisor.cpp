#include "process_supervisor.hpp"

#include <tabhost/logger.hpp>

#include <system_error>
#include <thread>
#include <utility>

namespace tabhost
{

SpawnResult ProcessSupervisor::spawn(const SupervisorOptions&     options,
                                     PixelSize                    target_size,
                                     const std::filesystem::path& working_directory)
{
    SpawnResult result;

    if (!options.windows)
    {
        result.error   = SpawnError::LaunchFailed;
        result.message = "no window system available";
        TABHOST_LOG_ERROR("supervisor", "Cannot spawn {}: {}", options.command.program, result.message);
        return result;
    }

    auto       argv = options.command.build_argv(target_size.width, target_size.height);
    SpawnError error = SpawnError::None;
    auto       child = ChildProcessHandle::spawn(argv, working_directory, error);
    if (!child.has_process())
    {
        result.error   = error == SpawnError::None ? SpawnError::LaunchFailed : error;
        result.message = std::string("failed to start '") + options.command.program
                         + "': " + spawn_error_to_string(result.error);
        return result;
    }

    auto supervisor =
        std::make_unique<ProcessSupervisor>(ConstructionKey{}, std::move(child), options.windows);

    WindowLocator locator(options.windows,
                          options.predicate ? options.predicate : WindowMatch{}.predicate());

    try
    {
        std::thread(&ProcessSupervisor::run_discovery,
                    std::move(locator),
                    supervisor->pid_,
                    options.discovery,
                    options.geometry,
                    options.on_discovery_failed,
                    options.windows,
                    supervisor->window_,
                    supervisor->abandoned_)
            .detach();
    }
    catch (const std::system_error& e)
    {
        // The supervisor's destructor kills the child we just started.
        result.error   = SpawnError::LaunchFailed;
        result.message = std::string("cannot start window discovery: ") + e.what();
        TABHOST_LOG_ERROR("supervisor", "{}", result.message);
        return result;
    }

    result.supervisor = std::move(supervisor);
    return result;
}

ProcessSupervisor::ProcessSupervisor(ConstructionKey,
                                     ChildProcessHandle            process,
                                     std::shared_ptr<WindowSystem> windows)
    : process_(std::move(process)),
      pid_(process_.pid()),
      windows_(std::move(windows)),
      window_(make_shared_cell<std::optional<WindowId>>()),
      close_requested_at_(make_shared_cell<std::optional<SteadyTime>>()),
      abandoned_(std::make_shared<std::atomic<bool>>(false))
{
}

ProcessSupervisor::~ProcessSupervisor()
{
    abandoned_->store(true);
    terminate();
}

// ─── Discovery ───────────────────────────────────────────────────────────────

void ProcessSupervisor::run_discovery(WindowLocator                          locator,
                                      ProcessId                              pid,
                                      DiscoveryOptions                       options,
                                      HostGeometryProvider                   geometry,
                                      DiscoveryFailedCallback                on_failed,
                                      std::shared_ptr<WindowSystem>          windows,
                                      SharedCellPtr<std::optional<WindowId>> window,
                                      std::shared_ptr<std::atomic<bool>>     abandoned)
{
    TABHOST_LOG_DEBUG("discovery",
                      "Looking for window of pid={} ({} attempts, {} ms apart)",
                      pid,
                      options.max_attempts,
                      static_cast<long long>(options.interval.count()));

    for (int attempt = 1; attempt <= options.max_attempts; ++attempt)
    {
        std::this_thread::sleep_for(options.interval);
        // The host may be shutting down; exit without touching the logger.
        if (abandoned->load())
            return;

        auto found = locator.find(pid);
        if (!found)
            continue;
        if (abandoned->load())
            return;

        // Place the window before anyone can observe it as ready.
        if (geometry)
        {
            Rect target = plan_content_rect(geometry());
            if (!windows->move_resize(found->id, target))
            {
                TABHOST_LOG_WARN("discovery",
                                 "Initial placement of window {} failed",
                                 found->id);
            }
        }

        if (abandoned->load())
            return;

        window->set(found->id);
        TABHOST_LOG_INFO("discovery",
                         "Found window {} for pid={} after {} attempts",
                         found->id,
                         pid,
                         attempt);
        return;
    }

    if (abandoned->load())
        return;

    TABHOST_LOG_ERROR("discovery",
                      "No window for pid={} after {} attempts",
                      pid,
                      options.max_attempts);
    if (on_failed)
        on_failed(pid);
}

// ─── Host-thread operations ──────────────────────────────────────────────────

bool ProcessSupervisor::is_running()
{
    return process_.is_running();
}

bool ProcessSupervisor::is_ready() const
{
    return window_->get().has_value();
}

std::optional<WindowId> ProcessSupervisor::live_window() const
{
    auto id = window_->get();
    if (!id || !windows_->is_window(*id))
        return std::nullopt;
    return id;
}

bool ProcessSupervisor::update_position(const HostGeometry& geometry)
{
    auto id = live_window();
    if (!id)
        return false;

    Rect target  = plan_content_rect(geometry);
    auto current = windows_->window_rect(*id);
    if (current && *current == target)
        return false;

    if (!windows_->move_resize(*id, target))
    {
        TABHOST_LOG_WARN("supervisor",
                         "Moving window {} to {} failed",
                         *id,
                         target.to_string());
        return false;
    }
    return true;
}

void ProcessSupervisor::activate(const HostGeometry& geometry)
{
    auto id = live_window();
    if (!id)
        return;

    // Mapping a withdrawn window lets the window manager place it anew.
    windows_->show(*id);
    update_position(geometry);
    if (!windows_->raise(*id))
        TABHOST_LOG_DEBUG("supervisor", "Raising window {} failed", *id);
}

void ProcessSupervisor::show()
{
    if (auto id = live_window())
        windows_->show(*id);
}

void ProcessSupervisor::hide()
{
    if (auto id = live_window())
        windows_->hide(*id);
}

bool ProcessSupervisor::request_close()
{
    auto id = live_window();
    if (!id)
        return false;

    if (!windows_->post_close(*id))
    {
        TABHOST_LOG_DEBUG("supervisor", "Close request to window {} failed", *id);
        return false;
    }
    return true;
}

bool ProcessSupervisor::terminate()
{
    // A process that is already gone counts as terminated.
    process_.terminate();
    return true;
}

std::string ProcessSupervisor::window_title() const
{
    if (auto id = live_window())
        return windows_->window_title(*id);
    return {};
}

void ProcessSupervisor::mark_close_requested(SteadyTime now)
{
    close_requested_at_->update(
        [now](std::optional<SteadyTime>& at)
        {
            if (!at)
                at = now;
        });
}

}   // namespace tabhost
