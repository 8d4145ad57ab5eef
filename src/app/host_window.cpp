#include "host_window.hpp"

#include <tabhost/logger.hpp>

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#define GLFW_EXPOSE_NATIVE_X11
#include <GLFW/glfw3native.h>

namespace tabhost
{

namespace
{

void on_glfw_error(int code, const char* description)
{
    TABHOST_LOG_ERROR("glfw", "GLFW error {}: {}", code, description);
}

}   // namespace

HostWindow::HostWindow(int titlebar_height, int inset)
    : geometry_(make_shared_cell(HostGeometry{Rect{}, titlebar_height, inset}))
{
}

HostWindow::~HostWindow()
{
    shutdown();
}

bool HostWindow::init(int width, int height, const std::string& title)
{
    glfwSetErrorCallback(on_glfw_error);

#if GLFW_VERSION_MAJOR > 3 || (GLFW_VERSION_MAJOR == 3 && GLFW_VERSION_MINOR >= 4)
    glfwInitHint(GLFW_PLATFORM, GLFW_PLATFORM_X11);
#endif

    if (!glfwInit())
    {
        TABHOST_LOG_CRITICAL("glfw", "Failed to initialize GLFW");
        return false;
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);   // Drawn with Xlib
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    window_ = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
    if (!window_)
    {
        TABHOST_LOG_CRITICAL("glfw", "Failed to create the host window");
        glfwTerminate();
        return false;
    }

    glfwSetWindowUserPointer(window_, this);
    glfwSetWindowSizeLimits(window_, MIN_WIDTH, MIN_HEIGHT, GLFW_DONT_CARE, GLFW_DONT_CARE);

    glfwSetCursorPosCallback(window_, cursor_pos_callback);
    glfwSetMouseButtonCallback(window_, mouse_button_callback);
    glfwSetWindowSizeCallback(window_, window_size_callback);
    glfwSetWindowPosCallback(window_, window_pos_callback);
    glfwSetKeyCallback(window_, key_callback);
    glfwSetWindowCloseCallback(window_, close_callback);
    glfwSetWindowRefreshCallback(window_, refresh_callback);
    glfwSetWindowFocusCallback(window_, focus_callback);

    refresh_geometry();
    TABHOST_LOG_INFO("glfw", "Host window created ({}x{})", width, height);
    return true;
}

void HostWindow::shutdown()
{
    if (!window_)
        return;
    destroy_window();
    terminate();
}

void HostWindow::destroy_window()
{
    if (window_)
    {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
}

void HostWindow::terminate()
{
    glfwTerminate();
}

void HostWindow::wait_events_timeout(double timeout_seconds)
{
    if (timeout_seconds <= 0.0)
        glfwPollEvents();
    else
        glfwWaitEventsTimeout(timeout_seconds);
}

void HostWindow::post_empty_event()
{
    glfwPostEmptyEvent();
}

Display* HostWindow::x11_display() const
{
    return glfwGetX11Display();
}

unsigned long HostWindow::x11_window() const
{
    return window_ ? glfwGetX11Window(window_) : 0;
}

void HostWindow::client_size(int& width, int& height) const
{
    if (window_)
    {
        glfwGetWindowSize(window_, &width, &height);
    }
    else
    {
        width  = 0;
        height = 0;
    }
}

void HostWindow::refresh_geometry()
{
    if (!window_)
        return;

    int x = 0, y = 0, width = 0, height = 0;
    glfwGetWindowPos(window_, &x, &y);
    glfwGetWindowSize(window_, &width, &height);

    geometry_->update(
        [&](HostGeometry& geometry)
        {
            geometry.client_rect = Rect{x, y, width, height};
        });
}

HostGeometryProvider HostWindow::geometry_provider() const
{
    return [cell = geometry_]() { return cell->get(); };
}

// ─── Static callback trampolines ─────────────────────────────────────────────

void HostWindow::cursor_pos_callback(GLFWwindow* window, double x, double y)
{
    auto* host = static_cast<HostWindow*>(glfwGetWindowUserPointer(window));
    if (host && host->callbacks_.on_mouse_move)
        host->callbacks_.on_mouse_move(x, y);
}

void HostWindow::mouse_button_callback(GLFWwindow* window, int button, int action, int mods)
{
    auto* host = static_cast<HostWindow*>(glfwGetWindowUserPointer(window));
    if (host && host->callbacks_.on_mouse_button)
    {
        double x, y;
        glfwGetCursorPos(window, &x, &y);
        host->callbacks_.on_mouse_button(button, action, mods, x, y);
    }
}

void HostWindow::window_size_callback(GLFWwindow* window, int width, int height)
{
    auto* host = static_cast<HostWindow*>(glfwGetWindowUserPointer(window));
    if (!host)
        return;
    host->refresh_geometry();
    if (host->callbacks_.on_resize)
        host->callbacks_.on_resize(width, height);
}

void HostWindow::window_pos_callback(GLFWwindow* window, int x, int y)
{
    auto* host = static_cast<HostWindow*>(glfwGetWindowUserPointer(window));
    if (!host)
        return;
    host->refresh_geometry();
    if (host->callbacks_.on_move)
        host->callbacks_.on_move(x, y);
}

void HostWindow::key_callback(GLFWwindow* window, int key, int /*scancode*/, int action, int mods)
{
    auto* host = static_cast<HostWindow*>(glfwGetWindowUserPointer(window));
    if (host && host->callbacks_.on_key)
        host->callbacks_.on_key(key, action, mods);
}

void HostWindow::close_callback(GLFWwindow* window)
{
    // The session decides when the window really closes.
    glfwSetWindowShouldClose(window, GLFW_FALSE);

    auto* host = static_cast<HostWindow*>(glfwGetWindowUserPointer(window));
    if (host && host->callbacks_.on_close_requested)
        host->callbacks_.on_close_requested();
}

void HostWindow::refresh_callback(GLFWwindow* window)
{
    auto* host = static_cast<HostWindow*>(glfwGetWindowUserPointer(window));
    if (host && host->callbacks_.on_refresh)
        host->callbacks_.on_refresh();
}

void HostWindow::focus_callback(GLFWwindow* window, int focused)
{
    auto* host = static_cast<HostWindow*>(glfwGetWindowUserPointer(window));
    if (host && host->callbacks_.on_focus)
        host->callbacks_.on_focus(focused == GLFW_TRUE);
}

}   // namespace tabhost
