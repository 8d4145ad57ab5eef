#pragma once

#include <tabhost/fwd.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "window_system.hpp"

namespace tabhost
{

// Decides whether a window belongs to the content program. The owning pid is
// checked separately by the locator.
using WindowPredicate = std::function<bool(const WindowInfo&)>;

// Title/class signature the content program's top-level window carries.
struct WindowMatch
{
    std::string title        = "Neovide";
    std::string window_class = "neovide";

    // Exact match on both fields. An empty field matches anything.
    WindowPredicate predicate() const;
};

class WindowLocator
{
   public:
    WindowLocator(std::shared_ptr<WindowSystem> windows, WindowPredicate predicate);

    // One enumeration pass. Stops at the first window owned by pid that the
    // predicate accepts.
    std::optional<WindowInfo> find(ProcessId pid) const;

    // Windows whose title or class contains search, ignoring case. An empty
    // search lists everything.
    std::vector<WindowInfo> list_matching(const std::string& search) const;

   private:
    std::shared_ptr<WindowSystem> windows_;
    WindowPredicate               predicate_;
};

}   // namespace tabhost
