#pragma once

#include <cstddef>
#include <cstdint>
#include <sys/types.h>

namespace tabhost
{

// Monotonic tab identifier. Never reused, so a stale id is always detectable.
using TabId = uint64_t;

inline constexpr TabId INVALID_TAB_ID = 0;

// Opaque OS top-level window reference (an XID on X11).
using WindowId = uint64_t;

inline constexpr WindowId INVALID_WINDOW_ID = 0;

using ProcessId = pid_t;

struct Rect;
struct HostGeometry;
struct Profile;
struct Config;

class ChildProcessHandle;
class ProcessSupervisor;
class WindowSystem;
class WindowLocator;
class TabManager;
class HostSession;

}   // namespace tabhost
