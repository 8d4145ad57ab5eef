#include "x11_window_system.hpp"

#include <tabhost/logger.hpp>

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include <atomic>
#include <cstring>

namespace tabhost
{

namespace
{

// Xlib error handlers are process-wide. Errors on our own connection are
// recorded for the trap in progress; anything else is logged instead of
// letting the default handler exit the process.
std::atomic<Display*> g_trap_display{nullptr};
std::atomic<int>      g_trapped_error{Success};

int on_x_error(Display* display, XErrorEvent* event)
{
    if (display == g_trap_display.load())
    {
        g_trapped_error.store(event->error_code);
        return 0;
    }

    char text[256] = {};
    XGetErrorText(display, event->error_code, text, sizeof(text));
    TABHOST_LOG_WARN("x11",
                     "X error on foreign connection: {} (request {})",
                     text,
                     static_cast<int>(event->request_code));
    return 0;
}

}   // namespace

bool X11WindowSystem::init_threads()
{
    return XInitThreads() != 0;
}

std::shared_ptr<X11WindowSystem> X11WindowSystem::open(const char* display_name)
{
    init_threads();

    Display* display = XOpenDisplay(display_name);
    if (!display)
    {
        TABHOST_LOG_ERROR("x11",
                          "Cannot open X display {}",
                          display_name ? display_name : "(DISPLAY)");
        return nullptr;
    }

    XSetErrorHandler(on_x_error);
    return std::make_shared<X11WindowSystem>(ConstructionKey{}, display);
}

X11WindowSystem::X11WindowSystem(ConstructionKey, Display* display) : display_(display)
{
    screen_ = DefaultScreen(display_);
    root_   = RootWindow(display_, screen_);
    g_trap_display.store(display_);

    atoms_.net_client_list  = XInternAtom(display_, "_NET_CLIENT_LIST", False);
    atoms_.net_wm_name      = XInternAtom(display_, "_NET_WM_NAME", False);
    atoms_.net_wm_pid       = XInternAtom(display_, "_NET_WM_PID", False);
    atoms_.net_active_win   = XInternAtom(display_, "_NET_ACTIVE_WINDOW", False);
    atoms_.net_close_window = XInternAtom(display_, "_NET_CLOSE_WINDOW", False);
    atoms_.utf8_string      = XInternAtom(display_, "UTF8_STRING", False);
    atoms_.wm_state         = XInternAtom(display_, "WM_STATE", False);
    atoms_.wm_protocols     = XInternAtom(display_, "WM_PROTOCOLS", False);
    atoms_.wm_delete_window = XInternAtom(display_, "WM_DELETE_WINDOW", False);

    TABHOST_LOG_INFO("x11", "Connected to X display {}", DisplayString(display_));
}

X11WindowSystem::~X11WindowSystem()
{
    std::lock_guard lock(mu_);
    if (g_trap_display.load() == display_)
        g_trap_display.store(nullptr);
    XCloseDisplay(display_);
}

// ─── Error trap ──────────────────────────────────────────────────────────────

void X11WindowSystem::begin_trap_locked()
{
    XSync(display_, False);
    g_trapped_error.store(Success);
}

bool X11WindowSystem::end_trap_locked(const char* what)
{
    XSync(display_, False);
    int code = g_trapped_error.exchange(Success);
    if (code == Success)
        return true;

    char text[256] = {};
    XGetErrorText(display_, code, text, sizeof(text));
    TABHOST_LOG_DEBUG("x11", "{} failed: {}", what, text);
    return false;
}

// ─── Enumeration ─────────────────────────────────────────────────────────────

void X11WindowSystem::enumerate_windows(const WindowVisitor& visitor)
{
    std::lock_guard lock(mu_);

    for (unsigned long window : top_level_windows_locked())
    {
        WindowInfo info = describe_locked(window);
        if (info.id == INVALID_WINDOW_ID)
            continue;
        if (!visitor(info))
            break;
    }
}

std::vector<unsigned long> X11WindowSystem::top_level_windows_locked()
{
    std::vector<unsigned long> result;

    // EWMH window managers publish the managed clients on the root window.
    Atom           actual_type   = None;
    int            actual_format = 0;
    unsigned long  count         = 0;
    unsigned long  bytes_after   = 0;
    unsigned char* data          = nullptr;

    begin_trap_locked();
    int status = XGetWindowProperty(display_,
                                    root_,
                                    atoms_.net_client_list,
                                    0,
                                    65536,
                                    False,
                                    XA_WINDOW,
                                    &actual_type,
                                    &actual_format,
                                    &count,
                                    &bytes_after,
                                    &data);
    bool ok = end_trap_locked("XGetWindowProperty(_NET_CLIENT_LIST)");

    if (ok && status == Success && data && actual_type == XA_WINDOW && actual_format == 32)
    {
        auto* windows = reinterpret_cast<unsigned long*>(data);
        result.assign(windows, windows + count);
        XFree(data);
        return result;
    }
    if (data)
        XFree(data);

    // No EWMH: walk the root's children, descending into WM frames.
    Window       root_return   = 0;
    Window       parent_return = 0;
    Window*      children      = nullptr;
    unsigned int n_children    = 0;

    begin_trap_locked();
    Status tree_ok =
        XQueryTree(display_, root_, &root_return, &parent_return, &children, &n_children);
    end_trap_locked("XQueryTree(root)");
    if (!tree_ok)
        return result;

    for (unsigned int i = 0; i < n_children; ++i)
    {
        unsigned long client = find_client_locked(children[i], 2);
        result.push_back(client ? client : children[i]);
    }
    if (children)
        XFree(children);
    return result;
}

unsigned long X11WindowSystem::find_client_locked(unsigned long window, int depth)
{
    if (has_property_locked(window, atoms_.wm_state))
        return window;
    if (depth <= 0)
        return 0;

    Window       root_return   = 0;
    Window       parent_return = 0;
    Window*      children      = nullptr;
    unsigned int n_children    = 0;

    begin_trap_locked();
    Status tree_ok =
        XQueryTree(display_, window, &root_return, &parent_return, &children, &n_children);
    end_trap_locked("XQueryTree");
    if (!tree_ok)
        return 0;

    unsigned long found = 0;
    for (unsigned int i = 0; i < n_children && !found; ++i)
        found = find_client_locked(children[i], depth - 1);

    if (children)
        XFree(children);
    return found;
}

bool X11WindowSystem::has_property_locked(unsigned long window, unsigned long atom)
{
    Atom           actual_type   = None;
    int            actual_format = 0;
    unsigned long  count         = 0;
    unsigned long  bytes_after   = 0;
    unsigned char* data          = nullptr;

    begin_trap_locked();
    int status = XGetWindowProperty(display_,
                                    window,
                                    atom,
                                    0,
                                    0,
                                    False,
                                    AnyPropertyType,
                                    &actual_type,
                                    &actual_format,
                                    &count,
                                    &bytes_after,
                                    &data);
    bool ok = end_trap_locked("XGetWindowProperty");
    if (data)
        XFree(data);
    return ok && status == Success && actual_type != None;
}

WindowInfo X11WindowSystem::describe_locked(unsigned long window)
{
    WindowInfo info;
    bool       viewable = false;
    auto       rect     = read_rect_locked(window, &viewable);
    if (!rect)
        return info;

    info.id           = window;
    info.rect         = *rect;
    info.visible      = viewable;
    info.title        = read_title_locked(window);
    info.window_class = read_class_locked(window);
    info.pid          = read_pid_locked(window);
    return info;
}

std::string X11WindowSystem::read_title_locked(unsigned long window)
{
    Atom           actual_type   = None;
    int            actual_format = 0;
    unsigned long  count         = 0;
    unsigned long  bytes_after   = 0;
    unsigned char* data          = nullptr;
    std::string    title;

    begin_trap_locked();
    int status = XGetWindowProperty(display_,
                                    window,
                                    atoms_.net_wm_name,
                                    0,
                                    1024,
                                    False,
                                    atoms_.utf8_string,
                                    &actual_type,
                                    &actual_format,
                                    &count,
                                    &bytes_after,
                                    &data);
    bool ok = end_trap_locked("XGetWindowProperty(_NET_WM_NAME)");
    if (ok && status == Success && data && actual_format == 8)
        title.assign(reinterpret_cast<const char*>(data), count);
    if (data)
        XFree(data);

    if (!title.empty())
        return title;

    char* name = nullptr;
    begin_trap_locked();
    XFetchName(display_, window, &name);
    end_trap_locked("XFetchName");
    if (name)
    {
        title = name;
        XFree(name);
    }
    return title;
}

std::string X11WindowSystem::read_class_locked(unsigned long window)
{
    XClassHint hint{};
    std::string result;

    begin_trap_locked();
    Status ok = XGetClassHint(display_, window, &hint);
    end_trap_locked("XGetClassHint");
    if (ok)
    {
        result = hint.res_class ? hint.res_class : "";
        if (hint.res_name)
            XFree(hint.res_name);
        if (hint.res_class)
            XFree(hint.res_class);
    }
    return result;
}

ProcessId X11WindowSystem::read_pid_locked(unsigned long window)
{
    Atom           actual_type   = None;
    int            actual_format = 0;
    unsigned long  count         = 0;
    unsigned long  bytes_after   = 0;
    unsigned char* data          = nullptr;
    ProcessId      pid           = 0;

    begin_trap_locked();
    int status = XGetWindowProperty(display_,
                                    window,
                                    atoms_.net_wm_pid,
                                    0,
                                    1,
                                    False,
                                    XA_CARDINAL,
                                    &actual_type,
                                    &actual_format,
                                    &count,
                                    &bytes_after,
                                    &data);
    bool ok = end_trap_locked("XGetWindowProperty(_NET_WM_PID)");
    // Format-32 properties come back as arrays of long.
    if (ok && status == Success && data && count == 1 && actual_format == 32)
        pid = static_cast<ProcessId>(*reinterpret_cast<unsigned long*>(data));
    if (data)
        XFree(data);
    return pid;
}

std::optional<Rect> X11WindowSystem::read_rect_locked(unsigned long window, bool* viewable)
{
    XWindowAttributes attrs{};
    begin_trap_locked();
    Status got = XGetWindowAttributes(display_, window, &attrs);
    if (!end_trap_locked("XGetWindowAttributes") || !got)
        return std::nullopt;

    int    abs_x = 0;
    int    abs_y = 0;
    Window child = 0;
    begin_trap_locked();
    XTranslateCoordinates(display_, window, root_, 0, 0, &abs_x, &abs_y, &child);
    if (!end_trap_locked("XTranslateCoordinates"))
        return std::nullopt;

    if (viewable)
        *viewable = attrs.map_state == IsViewable;
    return Rect{abs_x, abs_y, attrs.width, attrs.height};
}

// ─── Queries ─────────────────────────────────────────────────────────────────

bool X11WindowSystem::is_window(WindowId id)
{
    std::lock_guard lock(mu_);
    return read_rect_locked(id, nullptr).has_value();
}

std::optional<Rect> X11WindowSystem::window_rect(WindowId id)
{
    std::lock_guard lock(mu_);
    return read_rect_locked(id, nullptr);
}

std::string X11WindowSystem::window_title(WindowId id)
{
    std::lock_guard lock(mu_);
    return read_title_locked(id);
}

// ─── Operations ──────────────────────────────────────────────────────────────

bool X11WindowSystem::move_resize(WindowId id, const Rect& rect)
{
    std::lock_guard lock(mu_);
    begin_trap_locked();
    XMoveResizeWindow(display_,
                      id,
                      rect.x,
                      rect.y,
                      static_cast<unsigned int>(rect.width),
                      static_cast<unsigned int>(rect.height));
    return end_trap_locked("XMoveResizeWindow");
}

bool X11WindowSystem::show(WindowId id)
{
    std::lock_guard lock(mu_);
    begin_trap_locked();
    XMapWindow(display_, id);
    return end_trap_locked("XMapWindow");
}

bool X11WindowSystem::hide(WindowId id)
{
    std::lock_guard lock(mu_);
    begin_trap_locked();
    // Withdraw rather than plain unmap so the window manager drops it from
    // task bars and pagers too.
    XWithdrawWindow(display_, id, screen_);
    return end_trap_locked("XWithdrawWindow");
}

bool X11WindowSystem::raise(WindowId id)
{
    std::lock_guard lock(mu_);
    begin_trap_locked();
    XRaiseWindow(display_, id);
    bool raised = end_trap_locked("XRaiseWindow");
    if (!raised)
        return false;

    // Source indication 2: request comes from a pager-like tool, which window
    // managers honour without focus-stealing prevention.
    return send_root_message_locked(id, atoms_.net_active_win, 2, CurrentTime);
}

bool X11WindowSystem::post_close(WindowId id)
{
    std::lock_guard lock(mu_);

    Atom* protocols   = nullptr;
    int   n_protocols = 0;
    bool  supports_delete = false;

    begin_trap_locked();
    Status got = XGetWMProtocols(display_, id, &protocols, &n_protocols);
    if (!end_trap_locked("XGetWMProtocols"))
        return false;
    if (got && protocols)
    {
        for (int i = 0; i < n_protocols; ++i)
        {
            if (protocols[i] == atoms_.wm_delete_window)
            {
                supports_delete = true;
                break;
            }
        }
        XFree(protocols);
    }

    if (!supports_delete)
    {
        // Let the window manager decide how to close it.
        return send_root_message_locked(id, atoms_.net_close_window, CurrentTime, 2);
    }

    XEvent event;
    std::memset(&event, 0, sizeof(event));
    event.xclient.type         = ClientMessage;
    event.xclient.window       = id;
    event.xclient.message_type = atoms_.wm_protocols;
    event.xclient.format       = 32;
    event.xclient.data.l[0]    = static_cast<long>(atoms_.wm_delete_window);
    event.xclient.data.l[1]    = CurrentTime;

    begin_trap_locked();
    Status sent = XSendEvent(display_, id, False, NoEventMask, &event);
    return end_trap_locked("XSendEvent(WM_DELETE_WINDOW)") && sent != 0;
}

bool X11WindowSystem::send_root_message_locked(unsigned long window,
                                               unsigned long message_type,
                                               long          data0,
                                               long          data1)
{
    XEvent event;
    std::memset(&event, 0, sizeof(event));
    event.xclient.type         = ClientMessage;
    event.xclient.window       = window;
    event.xclient.message_type = message_type;
    event.xclient.format       = 32;
    event.xclient.data.l[0]    = data0;
    event.xclient.data.l[1]    = data1;

    begin_trap_locked();
    Status sent = XSendEvent(display_,
                             root_,
                             False,
                             SubstructureRedirectMask | SubstructureNotifyMask,
                             &event);
    return end_trap_locked("XSendEvent(root)") && sent != 0;
}

}   // namespace tabhost
