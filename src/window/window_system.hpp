#pragma once

#include <tabhost/fwd.hpp>

#include <functional>
#include <optional>
#include <string>

#include "../core/geometry_planner.hpp"

namespace tabhost
{

// Snapshot of one top-level window as reported by the window system.
struct WindowInfo
{
    WindowId    id = INVALID_WINDOW_ID;
    std::string title;
    std::string window_class;
    ProcessId   pid     = 0;
    Rect        rect;
    bool        visible = false;
};

// Abstract OS window facility. The production implementation talks to the X
// server; tests substitute an in-memory fake.
//
// Implementations must be callable from several threads at once (host thread
// plus discovery threads). Every operation on a WindowId must tolerate the
// window having disappeared and report that as a failure, never crash.
class WindowSystem
{
   public:
    // Return false from the visitor to stop the enumeration early.
    using WindowVisitor = std::function<bool(const WindowInfo&)>;

    virtual ~WindowSystem() = default;

    // Visit top-level windows in stacking/client-list order.
    virtual void enumerate_windows(const WindowVisitor& visitor) = 0;

    virtual bool                is_window(WindowId id)   = 0;
    virtual std::optional<Rect> window_rect(WindowId id) = 0;
    virtual std::string         window_title(WindowId id) = 0;

    virtual bool move_resize(WindowId id, const Rect& rect) = 0;
    virtual bool show(WindowId id)                          = 0;
    virtual bool hide(WindowId id)                          = 0;

    // Raise above all other windows and give it input focus.
    virtual bool raise(WindowId id) = 0;

    // Ask the window to close itself (may be ignored or delayed).
    virtual bool post_close(WindowId id) = 0;
};

}   // namespace tabhost
