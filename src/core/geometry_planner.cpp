#include "geometry_planner.hpp"

#include <algorithm>

namespace tabhost
{

std::string Rect::to_string() const
{
    return "(" + std::to_string(x) + ", " + std::to_string(y) + ") " + std::to_string(width)
           + "x" + std::to_string(height);
}

Rect plan_content_rect(const Rect& host_client_rect, int titlebar_height, int inset)
{
    Rect target;
    target.x      = host_client_rect.x + inset;
    target.y      = host_client_rect.y + titlebar_height + inset;
    target.width  = std::max(1, host_client_rect.width - 2 * inset);
    target.height = std::max(1, host_client_rect.height - titlebar_height - 2 * inset);
    return target;
}

}   // namespace tabhost
