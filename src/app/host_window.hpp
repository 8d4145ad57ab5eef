#pragma once

#include <functional>
#include <string>

#include "../core/geometry_planner.hpp"
#include "../core/shared_cell.hpp"

struct GLFWwindow;
typedef struct _XDisplay Display;

namespace tabhost
{

// Input and window events, delivered on the thread that waits for events.
struct HostWindowCallbacks
{
    std::function<void(double x, double y)>                                   on_mouse_move;
    std::function<void(int button, int action, int mods, double x, double y)> on_mouse_button;
    std::function<void(int width, int height)>                                on_resize;
    std::function<void(int x, int y)>                                         on_move;
    std::function<void(int key, int action, int mods)>                        on_key;
    std::function<void()>                                                     on_close_requested;
    std::function<void()>                                                     on_refresh;
    std::function<void(bool focused)>                                         on_focus;
};

// The top-level host window: a GLFW window without a client API, drawn on
// through its native X11 handle. Keeps a geometry snapshot that other
// threads may read through geometry_provider().
class HostWindow
{
   public:
    static constexpr int MIN_WIDTH  = 800;
    static constexpr int MIN_HEIGHT = 600;

    HostWindow(int titlebar_height, int inset);
    ~HostWindow();

    HostWindow(const HostWindow&)            = delete;
    HostWindow& operator=(const HostWindow&) = delete;

    // Initialize GLFW and create the window.
    bool init(int width, int height, const std::string& title);

    void shutdown();
    void destroy_window();
    static void terminate();

    // Blocks until an event arrives or timeout_seconds elapse.
    void wait_events_timeout(double timeout_seconds);

    // Wakes wait_events_timeout() from any thread.
    static void post_empty_event();

    Display*      x11_display() const;
    unsigned long x11_window() const;

    void client_size(int& width, int& height) const;

    // Re-reads position and size from GLFW into the shared snapshot.
    void refresh_geometry();

    HostGeometry         geometry() const { return geometry_->get(); }
    HostGeometryProvider geometry_provider() const;

    void set_callbacks(const HostWindowCallbacks& callbacks) { callbacks_ = callbacks; }

   private:
    GLFWwindow*                window_ = nullptr;
    HostWindowCallbacks        callbacks_;
    SharedCellPtr<HostGeometry> geometry_;

    // Static callback trampolines (GLFW uses C callbacks)
    static void cursor_pos_callback(GLFWwindow* window, double x, double y);
    static void mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
    static void window_size_callback(GLFWwindow* window, int width, int height);
    static void window_pos_callback(GLFWwindow* window, int x, int y);
    static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void close_callback(GLFWwindow* window);
    static void refresh_callback(GLFWwindow* window);
    static void focus_callback(GLFWwindow* window, int focused);
};

}   // namespace tabhost
