#include "host_session.hpp"

#include <tabhost/logger.hpp>

#include <utility>

namespace tabhost
{

const char* host_action_to_string(HostAction action)
{
    switch (action)
    {
        case HostAction::None:
            return "none";
        case HostAction::Repaint:
            return "repaint";
        case HostAction::Quit:
            return "quit";
        case HostAction::Fatal:
            return "fatal";
    }
    return "unknown";
}

HostSession::HostSession(Config                        config,
                         std::shared_ptr<WindowSystem> windows,
                         HostGeometryProvider          geometry,
                         DiscoveryOptions              discovery)
    : config_(std::move(config)),
      windows_(std::move(windows)),
      geometry_(std::move(geometry)),
      discovery_(discovery),
      discovery_failed_(std::make_shared<std::atomic<bool>>(false)),
      tabs_(SupervisorOptions{})
{
    tabs_.set_supervisor_options(make_supervisor_options());
}

SupervisorOptions HostSession::make_supervisor_options() const
{
    SupervisorOptions options;
    options.command   = config_.content.launch_command();
    options.windows   = windows_;
    options.predicate = config_.content.window_match().predicate();
    options.discovery = discovery_;
    options.geometry  = geometry_;

    // Runs on a discovery thread, possibly after this session is gone, so it
    // captures only shared state.
    options.on_discovery_failed = [failed = discovery_failed_, wake = wake_](ProcessId)
    {
        failed->store(true);
        if (wake)
            wake();
    };
    return options;
}

HostGeometry HostSession::geometry() const
{
    return geometry_ ? geometry_() : HostGeometry{};
}

PixelSize HostSession::content_size() const
{
    Rect target = plan_content_rect(geometry());
    return PixelSize{target.width, target.height};
}

TabStripLayout HostSession::layout() const
{
    return TabStripLayout(geometry().client_rect.width, tabs_.count());
}

size_t HostSession::ready_count() const
{
    size_t ready = 0;
    for (size_t i = 0; i < tabs_.count(); ++i)
    {
        if (tabs_.tab(i)->supervisor->is_ready())
            ++ready;
    }
    return ready;
}

// ─── Tab commands ────────────────────────────────────────────────────────────

HostAction HostSession::start()
{
    // The wake callback may only have been set after construction.
    tabs_.set_supervisor_options(make_supervisor_options());
    return on_new_tab_requested(0);
}

HostAction HostSession::on_new_tab_requested(size_t profile_index)
{
    const Profile* profile = config_.profile(profile_index);
    if (!profile)
    {
        TABHOST_LOG_WARN("session", "No profile {}, using the default profile", profile_index);
        profile       = &config_.default_profile();
        profile_index = 0;
    }

    auto result = tabs_.create_tab(content_size(), *profile, profile_index);
    if (!result)
    {
        error_message_ = result.message;
        return HostAction::Repaint;
    }

    error_message_.clear();
    tabs_.activate_selected(geometry());
    return HostAction::Repaint;
}

HostAction HostSession::on_profile_hotkey(size_t profile_index)
{
    if (auto existing = tabs_.find_tab_by_profile_index(profile_index))
    {
        tabs_.select_tab(*existing);
        tabs_.activate_selected(geometry());
        return HostAction::Repaint;
    }
    return on_new_tab_requested(profile_index);
}

HostAction HostSession::on_tab_clicked(size_t index)
{
    if (index >= tabs_.count())
        return HostAction::None;

    bool changed = tabs_.select_tab(index);
    tabs_.activate_selected(geometry());
    return changed ? HostAction::Repaint : HostAction::None;
}

HostAction HostSession::on_tab_close_clicked(size_t index)
{
    if (index >= tabs_.count())
        return HostAction::None;

    if (tabs_.request_close_tab(index))
        return HostAction::Repaint;

    // No window yet: the tab was closed on the spot.
    if (tabs_.empty())
        return HostAction::Quit;
    tabs_.activate_selected(geometry());
    return HostAction::Repaint;
}

// ─── Pointer ─────────────────────────────────────────────────────────────────

HostAction HostSession::on_drag_start(int x, int y)
{
    TabStripLayout strip = layout();
    auto           hit   = strip.hit_test(x, y);
    switch (hit.kind)
    {
        case TabStripLayout::HitKind::CloseButton:
            return on_tab_close_clicked(hit.index);
        case TabStripLayout::HitKind::NewTab:
            return on_new_tab_requested(0);
        case TabStripLayout::HitKind::Tab:
            tabs_.begin_drag(hit.index, x, strip.tab_left(hit.index));
            return HostAction::None;
        case TabStripLayout::HitKind::None:
            break;
    }
    return HostAction::None;
}

HostAction HostSession::on_drag_move(int x)
{
    return tabs_.update_drag(x, layout()) ? HostAction::Repaint : HostAction::None;
}

HostAction HostSession::on_drag_end(int x)
{
    if (!tabs_.drag_state())
        return HostAction::None;

    tabs_.update_drag(x, layout());
    if (auto clicked = tabs_.end_drag())
        on_tab_clicked(*clicked);
    return HostAction::Repaint;
}

// ─── Window events ───────────────────────────────────────────────────────────

HostAction HostSession::on_resize()
{
    tabs_.update_all_positions(geometry());
    return HostAction::Repaint;
}

HostAction HostSession::on_window_close_requested()
{
    if (tabs_.empty())
        return HostAction::Quit;

    TABHOST_LOG_INFO("session", "Closing {} tabs", tabs_.count());
    tabs_.request_close_all();
    return tabs_.empty() ? HostAction::Quit : HostAction::Repaint;
}

HostAction HostSession::on_host_activated()
{
    if (!tabs_.is_selected_ready())
        return HostAction::None;

    tabs_.activate_selected(geometry());
    return HostAction::None;
}

HostAction HostSession::on_poll_tick()
{
    if (discovery_failed_->load())
        return on_discovery_failed();

    const TabId selected_before = tabs_.selected_tab() ? tabs_.selected_tab()->id : INVALID_TAB_ID;

    bool removed = false;
    for (size_t index : tabs_.find_exited_tabs())
    {
        removed = true;
        if (tabs_.remove_exited_tab(index))
        {
            TABHOST_LOG_INFO("session", "Last tab exited");
            return HostAction::Quit;
        }
    }

    if (removed && tabs_.has_pending_close())
    {
        tabs_.continue_close_sequence();
        if (tabs_.empty())
            return HostAction::Quit;
    }

    const TabId selected_after = tabs_.selected_tab() ? tabs_.selected_tab()->id : INVALID_TAB_ID;
    const size_t ready         = ready_count();

    // A window that appeared since the last tick may belong to a hidden tab.
    bool repaint = removed;
    if (removed || selected_after != selected_before || ready != last_ready_count_)
    {
        tabs_.activate_selected(geometry());
        repaint = true;
    }
    else
    {
        // Retries moves that failed earlier; a no-op when nothing drifted.
        tabs_.update_all_positions(geometry());
    }
    last_ready_count_ = ready;

    if (tabs_.update_selected_tab_title())
        repaint = true;

    return repaint ? HostAction::Repaint : HostAction::None;
}

HostAction HostSession::on_discovery_failed()
{
    error_message_ = "The " + config_.content.command
                     + " window did not appear within the time limit. tabhost will exit.";
    return HostAction::Fatal;
}

HostAction HostSession::on_config_reloaded(Config config)
{
    config_ = std::move(config);
    tabs_.set_supervisor_options(make_supervisor_options());
    tabs_.refresh_profiles(config_.profiles);
    TABHOST_LOG_INFO("session", "Configuration reloaded ({} profiles)", config_.profiles.size());
    return HostAction::Repaint;
}

}   // namespace tabhost
