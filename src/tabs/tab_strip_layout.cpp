#include "tab_strip_layout.hpp"

#include <algorithm>

namespace tabhost
{

TabStripLayout::TabStripLayout(int strip_width, size_t tab_count)
    : strip_width_(strip_width), tab_count_(tab_count)
{
    if (tab_count_ == 0)
        return;

    int available = strip_width_ - 2 * LEFT_MARGIN - ADD_BUTTON_WIDTH;
    int per_tab   = available / static_cast<int>(tab_count_);
    tab_width_    = std::clamp(per_tab, TAB_MIN_WIDTH, TAB_MAX_WIDTH);
}

int TabStripLayout::tab_left(size_t index) const
{
    return LEFT_MARGIN + static_cast<int>(index) * tab_width_;
}

Rect TabStripLayout::tab_rect(size_t index) const
{
    return Rect{tab_left(index), 0, tab_width_, STRIP_HEIGHT};
}

Rect TabStripLayout::close_rect(size_t index) const
{
    return Rect{tab_left(index) + tab_width_ - CLOSE_BUTTON_SIZE - CLOSE_PADDING,
                (STRIP_HEIGHT - CLOSE_BUTTON_SIZE) / 2,
                CLOSE_BUTTON_SIZE,
                CLOSE_BUTTON_SIZE};
}

Rect TabStripLayout::new_tab_rect() const
{
    return Rect{tab_left(tab_count_), 0, ADD_BUTTON_WIDTH, STRIP_HEIGHT};
}

TabStripLayout::Hit TabStripLayout::hit_test(int x, int y) const
{
    Hit hit;
    if (y < 0 || y >= STRIP_HEIGHT)
        return hit;

    for (size_t i = 0; i < tab_count_; ++i)
    {
        if (close_rect(i).contains(x, y))
            return Hit{HitKind::CloseButton, i};
        if (tab_rect(i).contains(x, y))
            return Hit{HitKind::Tab, i};
    }

    if (new_tab_rect().contains(x, y))
        hit.kind = HitKind::NewTab;
    return hit;
}

}   // namespace tabhost
