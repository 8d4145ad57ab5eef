#pragma once

#include <functional>
#include <string>

namespace tabhost
{

// Integer screen rectangle. x/y are the top-left corner.
struct Rect
{
    int x      = 0;
    int y      = 0;
    int width  = 0;
    int height = 0;

    bool operator==(const Rect&) const = default;

    bool contains(int px, int py) const
    {
        return px >= x && px < x + width && py >= y && py < y + height;
    }

    std::string to_string() const;
};

struct PixelSize
{
    int width  = 0;
    int height = 0;
};

// Geometry of the host as seen by the supervisors. client_rect is the host's
// client area with its origin already converted to screen coordinates.
struct HostGeometry
{
    Rect client_rect;
    int  titlebar_height = 0;
    int  inset           = 0;

    bool operator==(const HostGeometry&) const = default;
};

// Must be safe to call from any thread: discovery threads use it to place a
// freshly found window.
using HostGeometryProvider = std::function<HostGeometry()>;

// Target rectangle for a content window inside the host's content area.
// Width and height never drop below 1 px.
Rect plan_content_rect(const Rect& host_client_rect, int titlebar_height, int inset);

inline Rect plan_content_rect(const HostGeometry& geometry)
{
    return plan_content_rect(geometry.client_rect, geometry.titlebar_height, geometry.inset);
}

}   // namespace tabhost
