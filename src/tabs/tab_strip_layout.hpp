#pragma once

#include <cstddef>

#include "../core/geometry_planner.hpp"

namespace tabhost
{

// ─── TabStripLayout ──────────────────────────────────────────────────────────
// Geometry of the tab strip at the top of the host window, in host client
// coordinates. All tabs share one width, which shrinks from TAB_MAX_WIDTH
// towards TAB_MIN_WIDTH as tabs are added. The new-tab button follows the
// last tab.
//
//   | M | tab 0 | tab 1 | tab 2 | + |
//
// Used for painting, hit testing and as the slot grid for drag reordering.

class TabStripLayout
{
   public:
    static constexpr int STRIP_HEIGHT      = 32;
    static constexpr int LEFT_MARGIN       = 8;
    static constexpr int TAB_MIN_WIDTH     = 80;
    static constexpr int TAB_MAX_WIDTH     = 200;
    static constexpr int CLOSE_BUTTON_SIZE = 16;
    static constexpr int CLOSE_PADDING     = 6;
    static constexpr int ADD_BUTTON_WIDTH  = 32;

    enum class HitKind
    {
        None,
        Tab,
        CloseButton,
        NewTab,
    };

    struct Hit
    {
        HitKind kind  = HitKind::None;
        size_t  index = 0;   // tab index for Tab / CloseButton
    };

    TabStripLayout(int strip_width, size_t tab_count);

    size_t tab_count() const { return tab_count_; }
    int    tab_width() const { return tab_width_; }

    int  tab_left(size_t index) const;
    int  tab_center(size_t index) const { return tab_left(index) + tab_width_ / 2; }
    Rect tab_rect(size_t index) const;
    Rect close_rect(size_t index) const;
    Rect new_tab_rect() const;

    // Close buttons win over the tab body they sit in.
    Hit hit_test(int x, int y) const;

   private:
    int    strip_width_ = 0;
    size_t tab_count_   = 0;
    int    tab_width_   = TAB_MAX_WIDTH;
};

}   // namespace tabhost
