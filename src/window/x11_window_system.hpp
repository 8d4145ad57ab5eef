#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "window_system.hpp"

// Keep Xlib out of every translation unit that only needs the interface.
typedef struct _XDisplay Display;

namespace tabhost
{

// WindowSystem backed by its own Xlib connection. All Xlib traffic is
// serialised by one mutex, and X protocol errors raised by vanished windows
// are trapped and reported as failed operations.
class X11WindowSystem : public WindowSystem
{
    // Restricts construction to open().
    struct ConstructionKey
    {
        explicit ConstructionKey() = default;
    };

   public:
    // Opens a connection to display_name (nullptr: $DISPLAY). Returns nullptr
    // if the X server cannot be reached.
    static std::shared_ptr<X11WindowSystem> open(const char* display_name = nullptr);

    // XInitThreads(). Call before anything else in the process talks to Xlib.
    static bool init_threads();

    X11WindowSystem(ConstructionKey, Display* display);
    ~X11WindowSystem() override;

    X11WindowSystem(const X11WindowSystem&)            = delete;
    X11WindowSystem& operator=(const X11WindowSystem&) = delete;

    void enumerate_windows(const WindowVisitor& visitor) override;

    bool                is_window(WindowId id) override;
    std::optional<Rect> window_rect(WindowId id) override;
    std::string         window_title(WindowId id) override;

    bool move_resize(WindowId id, const Rect& rect) override;
    bool show(WindowId id) override;
    bool hide(WindowId id) override;
    bool raise(WindowId id) override;
    bool post_close(WindowId id) override;

   private:
    struct Atoms
    {
        unsigned long net_client_list  = 0;
        unsigned long net_wm_name      = 0;
        unsigned long net_wm_pid       = 0;
        unsigned long net_active_win   = 0;
        unsigned long net_close_window = 0;
        unsigned long utf8_string      = 0;
        unsigned long wm_state         = 0;
        unsigned long wm_protocols     = 0;
        unsigned long wm_delete_window = 0;
    };

    // Callers hold mu_ for everything below.
    std::vector<unsigned long> top_level_windows_locked();
    unsigned long              find_client_locked(unsigned long window, int depth);
    bool                       has_property_locked(unsigned long window, unsigned long atom);
    WindowInfo                 describe_locked(unsigned long window);
    std::string                read_title_locked(unsigned long window);
    std::string                read_class_locked(unsigned long window);
    ProcessId                  read_pid_locked(unsigned long window);
    std::optional<Rect>        read_rect_locked(unsigned long window, bool* viewable);
    bool                       send_root_message_locked(unsigned long window,
                                                        unsigned long message_type,
                                                        long          data0,
                                                        long          data1);
    void                       begin_trap_locked();
    bool                       end_trap_locked(const char* what);

    mutable std::mutex mu_;
    Display*           display_ = nullptr;
    unsigned long      root_    = 0;
    int                screen_  = 0;
    Atoms              atoms_;
};

}   // namespace tabhost
