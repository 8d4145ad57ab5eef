#include "tab_manager.hpp"

#include <tabhost/logger.hpp>

#include <algorithm>
#include <utility>

namespace tabhost
{

TabManager::TabManager(SupervisorOptions supervisor_options, TitleFormatter formatter)
    : supervisor_options_(std::move(supervisor_options)), formatter_(std::move(formatter))
{
}

TabManager::~TabManager()
{
    terminate_all();
}

void TabManager::set_supervisor_options(SupervisorOptions options)
{
    supervisor_options_ = std::move(options);
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

CreateTabResult TabManager::create_tab(PixelSize size, const Profile& profile, size_t profile_index)
{
    CreateTabResult result;

    auto spawned =
        ProcessSupervisor::spawn(supervisor_options_, size, profile.working_directory);
    if (!spawned)
    {
        result.error   = spawned.error;
        result.message = spawned.message;
        TABHOST_LOG_ERROR("tabs",
                          "Cannot create tab for profile '{}': {}",
                          profile.name,
                          spawned.message);
        return result;
    }

    Tab tab;
    tab.id                = next_id_++;
    tab.supervisor        = std::move(spawned.supervisor);
    tab.profile_name      = profile.name;
    tab.profile_icon      = profile.icon;
    tab.working_directory = profile.working_directory;
    tab.profile_index     = profile_index;
    tab.title_format      = profile.title;
    tab.cached_title      = profile.name;

    TABHOST_LOG_INFO("tabs",
                     "Created tab {} for profile '{}' (pid={})",
                     tab.id,
                     profile.name,
                     tab.supervisor->pid());

    tabs_.push_back(std::move(tab));
    selected_index_ = tabs_.size() - 1;
    result.index    = selected_index_;
    return result;
}

bool TabManager::select_tab(size_t index)
{
    if (index >= tabs_.size() || index == selected_index_)
        return false;

    selected_index_ = index;
    update_tab_title(index);
    return true;
}

bool TabManager::close_tab(size_t index)
{
    if (index >= tabs_.size())
        return false;

    Tab tab = std::move(tabs_[index]);
    tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(index));
    tab.supervisor->terminate();
    TABHOST_LOG_DEBUG("tabs", "Closed tab {}", tab.id);

    rebalance_selection(index);
    return tabs_.empty();
}

bool TabManager::remove_exited_tab(size_t index)
{
    if (index >= tabs_.size())
        return false;

    TABHOST_LOG_DEBUG("tabs", "Removing exited tab {}", tabs_[index].id);
    tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(index));

    rebalance_selection(index);
    return tabs_.empty();
}

void TabManager::rebalance_selection(size_t removed_index)
{
    if (drag_state_)
        drag_state_.reset();

    if (tabs_.empty())
    {
        selected_index_ = 0;
        return;
    }

    if (removed_index <= selected_index_ && selected_index_ > 0)
        --selected_index_;
    if (selected_index_ >= tabs_.size())
        selected_index_ = tabs_.size() - 1;
}

void TabManager::move_tab(size_t from, size_t to)
{
    if (from >= tabs_.size() || to >= tabs_.size() || from == to)
        return;

    Tab tab = std::move(tabs_[from]);
    tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(from));
    tabs_.insert(tabs_.begin() + static_cast<std::ptrdiff_t>(to), std::move(tab));

    if (selected_index_ == from)
        selected_index_ = to;
    else if (from < selected_index_ && to >= selected_index_)
        --selected_index_;
    else if (from > selected_index_ && to <= selected_index_)
        ++selected_index_;
}

void TabManager::terminate_all()
{
    for (auto& tab : tabs_)
        tab.supervisor->terminate();
    tabs_.clear();
    selected_index_ = 0;
    drag_state_.reset();
}

// ─── Graceful close ──────────────────────────────────────────────────────────

bool TabManager::request_close_tab(size_t index, SteadyTime now)
{
    if (index >= tabs_.size())
        return false;

    auto& supervisor = *tabs_[index].supervisor;
    if (supervisor.request_close())
    {
        supervisor.mark_close_requested(now);
        return true;
    }

    TABHOST_LOG_DEBUG("tabs", "Tab {} has no window yet, closing it", tabs_[index].id);
    close_tab(index);
    return false;
}

void TabManager::request_close_all(SteadyTime now)
{
    if (tabs_.empty())
        return;

    // Mark the hidden tabs first so none is missed if the selected one has
    // to be closed on the spot.
    for (size_t i = 0; i < tabs_.size(); ++i)
    {
        if (i != selected_index_)
            tabs_[i].supervisor->mark_close_requested(now);
    }

    auto& selected = *tabs_[selected_index_].supervisor;
    if (selected.request_close())
    {
        selected.mark_close_requested(now);
        return;
    }

    TABHOST_LOG_DEBUG("tabs",
                      "Selected tab {} has no window yet, closing it",
                      tabs_[selected_index_].id);
    close_tab(selected_index_);
    continue_close_sequence();
}

bool TabManager::continue_close_sequence()
{
    while (!tabs_.empty())
    {
        auto& tab = tabs_[selected_index_];
        if (!tab.is_pending_close())
            return false;

        // Hidden windows cannot be relied on to act on a close request.
        tab.supervisor->show();
        if (tab.supervisor->request_close())
            return true;

        TABHOST_LOG_DEBUG("tabs", "Pending tab {} has no window, closing it", tab.id);
        close_tab(selected_index_);
    }
    return false;
}

bool TabManager::has_pending_close() const
{
    return std::any_of(tabs_.begin(),
                       tabs_.end(),
                       [](const Tab& tab) { return tab.is_pending_close(); });
}

std::vector<size_t> TabManager::find_exited_tabs()
{
    std::vector<size_t> exited;
    for (size_t i = tabs_.size(); i-- > 0;)
    {
        if (!tabs_[i].supervisor->is_running())
            exited.push_back(i);
    }
    return exited;
}

// ─── Windows ─────────────────────────────────────────────────────────────────

void TabManager::update_all_positions(const HostGeometry& geometry)
{
    for (auto& tab : tabs_)
        tab.supervisor->update_position(geometry);
}

void TabManager::activate_selected(const HostGeometry& geometry)
{
    for (size_t i = 0; i < tabs_.size(); ++i)
    {
        if (i == selected_index_)
            tabs_[i].supervisor->activate(geometry);
        else
            tabs_[i].supervisor->hide();
    }
}

bool TabManager::is_selected_ready() const
{
    const Tab* selected = selected_tab();
    return selected && selected->supervisor->is_ready();
}

// ─── Profiles & titles ───────────────────────────────────────────────────────

std::optional<size_t> TabManager::find_tab_by_profile_index(size_t profile_index) const
{
    for (size_t i = 0; i < tabs_.size(); ++i)
    {
        if (tabs_[i].profile_index == profile_index)
            return i;
    }
    return std::nullopt;
}

void TabManager::refresh_profiles(const std::vector<Profile>& profiles)
{
    for (auto& tab : tabs_)
    {
        if (tab.profile_index >= profiles.size())
            continue;

        const Profile& profile = profiles[tab.profile_index];
        tab.profile_name       = profile.name;
        tab.profile_icon       = profile.icon;
        tab.title_format       = profile.title;
        tab.cached_title       = compute_title(tab);
    }
}

std::string TabManager::compute_title(const Tab& tab) const
{
    TitleContext context;
    context.profile_name      = tab.profile_name;
    context.working_directory = tab.working_directory;
    context.window_title      = tab.supervisor->window_title();

    std::string title =
        formatter_ ? formatter_(tab.title_format, context) : expand_title(tab.title_format, context);
    return title.empty() ? tab.profile_name : title;
}

bool TabManager::update_tab_title(size_t index)
{
    if (index >= tabs_.size())
        return false;

    std::string title = compute_title(tabs_[index]);
    if (title == tabs_[index].cached_title)
        return false;
    tabs_[index].cached_title = std::move(title);
    return true;
}

bool TabManager::update_selected_tab_title()
{
    return update_tab_title(selected_index_);
}

// ─── Drag reorder ────────────────────────────────────────────────────────────

void TabManager::begin_drag(size_t index, int x, int tab_left)
{
    if (index >= tabs_.size())
        return;

    DragState drag;
    drag.tab_index      = index;
    drag.start_x        = x;
    drag.current_x      = x;
    drag.tab_start_left = tab_left;
    drag_state_         = drag;
}

bool TabManager::update_drag(int x, const TabStripLayout& layout)
{
    if (!drag_state_)
        return false;

    DragState& drag = *drag_state_;
    drag.current_x  = x;
    if (!drag.is_active())
        return false;
    drag.exceeded_threshold = true;

    // Rebase so visual_x() is unchanged after the tab jumps to a new slot.
    auto rebind = [&](size_t new_index)
    {
        int new_left = layout.tab_left(new_index);
        drag.start_x += new_left - drag.tab_start_left;
        drag.tab_start_left = new_left;
        drag.tab_index      = new_index;
    };

    const int half_width = layout.tab_width() / 2;
    for (;;)
    {
        int    center = drag.visual_x() + half_width;
        size_t index  = drag.tab_index;

        if (index + 1 < tabs_.size() && center > layout.tab_center(index + 1))
        {
            move_tab(index, index + 1);
            rebind(index + 1);
        }
        else if (index > 0 && center < layout.tab_center(index - 1))
        {
            move_tab(index, index - 1);
            rebind(index - 1);
        }
        else
        {
            break;
        }
    }
    return true;
}

std::optional<size_t> TabManager::end_drag()
{
    if (!drag_state_)
        return std::nullopt;

    DragState drag = *drag_state_;
    drag_state_.reset();
    if (drag.is_active())
        return std::nullopt;
    return drag.tab_index;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

const Tab* TabManager::tab(size_t index) const
{
    return index < tabs_.size() ? &tabs_[index] : nullptr;
}

std::optional<size_t> TabManager::index_of(TabId id) const
{
    for (size_t i = 0; i < tabs_.size(); ++i)
    {
        if (tabs_[i].id == id)
            return i;
    }
    return std::nullopt;
}

std::string TabManager::tab_label(size_t index) const
{
    return index < tabs_.size() ? tabs_[index].cached_title : std::string();
}

std::string TabManager::tab_icon(size_t index) const
{
    return index < tabs_.size() ? tabs_[index].profile_icon : std::string();
}

std::filesystem::path TabManager::tab_working_directory(size_t index) const
{
    return index < tabs_.size() ? tabs_[index].working_directory : std::filesystem::path();
}

}   // namespace tabhost
