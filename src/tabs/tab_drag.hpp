#pragma once

#include <cstddef>
#include <cstdlib>

namespace tabhost
{

// Live drag of one tab along the strip. tab_index follows the dragged tab
// through every swap; tab_start_left and start_x are rebased on each swap so
// visual_x() stays continuous under the pointer.
struct DragState
{
    static constexpr int THRESHOLD = 5;

    size_t tab_index      = 0;
    int    start_x        = 0;
    int    current_x      = 0;
    int    tab_start_left = 0;

    // Set once the pointer has moved past THRESHOLD; a drag that crossed it
    // stays a drag even if the pointer comes back.
    bool exceeded_threshold = false;

    bool is_active() const
    {
        return exceeded_threshold || std::abs(current_x - start_x) > THRESHOLD;
    }

    // Left edge at which the dragged tab is drawn.
    int visual_x() const { return tab_start_left + (current_x - start_x); }
};

}   // namespace tabhost
