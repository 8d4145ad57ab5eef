#pragma once

#include <tabhost/fwd.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "../config/config.hpp"
#include "../process/process_supervisor.hpp"
#include "tab.hpp"
#include "tab_drag.hpp"
#include "tab_strip_layout.hpp"
#include "title_format.hpp"

namespace tabhost
{

struct CreateTabResult
{
    std::optional<size_t> index;
    SpawnError            error = SpawnError::None;
    std::string           message;

    explicit operator bool() const { return index.has_value(); }
};

/**
 * TabManager: ordered collection of tabs with one selected tab.
 *
 * Owns every tab's supervisor, tracks the selection, drives the live drag
 * reorder and sequences graceful shutdown so that only the visible tab is
 * ever asked to close. Host-thread only.
 *
 * Invariant: selected_index() < count() whenever count() > 0, and
 * selected_index() == 0 when empty.
 */
class TabManager
{
   public:
    explicit TabManager(SupervisorOptions supervisor_options, TitleFormatter formatter = expand_title);
    ~TabManager();

    TabManager(const TabManager&)            = delete;
    TabManager& operator=(const TabManager&) = delete;

    // Template for tabs created from now on (content program, window system,
    // discovery timing, geometry provider, failure callback).
    void                     set_supervisor_options(SupervisorOptions options);
    const SupervisorOptions& supervisor_options() const { return supervisor_options_; }

    void set_title_formatter(TitleFormatter formatter) { formatter_ = std::move(formatter); }

    // ── Lifecycle ───────────────────────────────────────────────────────

    // Spawns a content process for profile, appends the tab and selects it.
    // On failure nothing changes.
    CreateTabResult create_tab(PixelSize size, const Profile& profile, size_t profile_index);

    // False if out of range or already selected. Refreshes the title.
    bool select_tab(size_t index);

    // Removes the tab and kills its process. Returns true if it was the
    // last tab.
    bool close_tab(size_t index);

    // Removes a tab whose process has already exited. Returns true if the
    // manager is now empty.
    bool remove_exited_tab(size_t index);

    // Moves a tab; the selection keeps pointing at the same tab.
    void move_tab(size_t from, size_t to);

    // Kills every process and drops all tabs.
    void terminate_all();

    // ── Graceful close ──────────────────────────────────────────────────

    // Graceful close of one tab, or immediate close_tab() if it has no
    // window yet. Returns true if a close request was sent.
    bool request_close_tab(size_t index, SteadyTime now = std::chrono::steady_clock::now());

    // Asks the selected tab to close and marks every other tab pending.
    void request_close_all(SteadyTime now = std::chrono::steady_clock::now());

    // If the selected tab is pending, shows it and asks it to close. Tabs
    // without a window are closed forcefully and the next one is tried.
    // Returns true if a close request was sent.
    bool continue_close_sequence();

    bool has_pending_close() const;

    // Indices of tabs whose process is gone, highest first.
    std::vector<size_t> find_exited_tabs();

    // ── Windows ─────────────────────────────────────────────────────────

    void update_all_positions(const HostGeometry& geometry);

    // Activates the selected tab and hides all others.
    void activate_selected(const HostGeometry& geometry);

    bool is_selected_ready() const;

    // ── Profiles & titles ───────────────────────────────────────────────

    std::optional<size_t> find_tab_by_profile_index(size_t profile_index) const;

    // Re-reads name, icon and title format for tabs whose profile index
    // still exists. Working directories are left alone.
    void refresh_profiles(const std::vector<Profile>& profiles);

    // Returns true if the cached title changed.
    bool update_tab_title(size_t index);
    bool update_selected_tab_title();

    // ── Drag reorder ────────────────────────────────────────────────────

    void begin_drag(size_t index, int x, int tab_left);

    // Moves the dragged tab to x, swapping it past neighbours whose centre
    // it crosses. Returns true if the strip needs repainting.
    bool update_drag(int x, const TabStripLayout& layout);

    // Ends the drag. Returns the tab index if the gesture never passed the
    // drag threshold, i.e. it was a click.
    std::optional<size_t> end_drag();

    void cancel_drag() { drag_state_.reset(); }

    const std::optional<DragState>& drag_state() const { return drag_state_; }

    // ── Queries ─────────────────────────────────────────────────────────

    size_t count() const { return tabs_.size(); }
    bool   empty() const { return tabs_.empty(); }
    size_t selected_index() const { return selected_index_; }

    const Tab* tab(size_t index) const;
    const Tab* selected_tab() const { return tab(selected_index_); }

    std::optional<size_t> index_of(TabId id) const;

    std::string           tab_label(size_t index) const;
    std::string           tab_icon(size_t index) const;
    std::filesystem::path tab_working_directory(size_t index) const;

   private:
    void        rebalance_selection(size_t removed_index);
    std::string compute_title(const Tab& tab) const;

    SupervisorOptions        supervisor_options_;
    TitleFormatter           formatter_;
    std::vector<Tab>         tabs_;
    size_t                   selected_index_ = 0;
    TabId                    next_id_        = 1;
    std::optional<DragState> drag_state_;
};

}   // namespace tabhost
