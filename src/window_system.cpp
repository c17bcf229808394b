#include "window_system.hpp"

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/extensions/XTest.h>
#include <X11/keysym.h>

#include <mutex>

#include "tiny-process-library/process.hpp"
#include "x11_display.hpp"

namespace
{

class X11WindowSystem : public WindowSystem
{
public:
    X11WindowSystem(std::unique_ptr<X11Display> dpy) : m_dpy(std::move(dpy)) {}

    window_handle_t GetForegroundWindow() override;
    Result<>        BringToForeground(window_handle_t window) override;
    Result<>        SendPasteKeystroke() override;

private:
    std::mutex                  m_mtx;
    std::unique_ptr<X11Display> m_dpy;

    Window ActiveWindowProperty();
};

Window X11WindowSystem::ActiveWindowProperty()
{
    Display*   dpy  = m_dpy->get();
    const Atom prop = XInternAtom(dpy, "_NET_ACTIVE_WINDOW", False);

    Atom           type;
    int            format;
    unsigned long  nitems, bytes_after;
    unsigned char* data = nullptr;

    Window ret = 0;
    if (XGetWindowProperty(dpy,
                           DefaultRootWindow(dpy),
                           prop,
                           0,
                           1,
                           False,
                           XA_WINDOW,
                           &type,
                           &format,
                           &nitems,
                           &bytes_after,
                           &data) == Success &&
        data)
    {
        if (type == XA_WINDOW && format == 32 && nitems == 1)
            ret = *reinterpret_cast<Window*>(data);
        XFree(data);
    }

    return ret;
}

window_handle_t X11WindowSystem::GetForegroundWindow()
{
    std::lock_guard lk(m_mtx);

    // EWMH window managers tell us the top-level client directly
    if (const Window w = ActiveWindowProperty(); w != 0)
        return w;

    Window focus;
    int    revert;
    XGetInputFocus(m_dpy->get(), &focus, &revert);
    if (focus == None || focus == PointerRoot)
        return 0;
    return focus;
}

Result<> X11WindowSystem::BringToForeground(window_handle_t window)
{
    std::lock_guard lk(m_mtx);
    Display*        dpy = m_dpy->get();
    const Window    w   = static_cast<Window>(window);

    X11ErrorTrap      trap(dpy);
    XWindowAttributes attrs;
    if (!XGetWindowAttributes(dpy, w, &attrs) || trap.Sync() != Success)
        return Err(ErrorKind::WindowGone, fmt::format("window 0x{:x} is gone", window));

    XEvent ev{};
    ev.xclient.type         = ClientMessage;
    ev.xclient.window       = w;
    ev.xclient.message_type = XInternAtom(dpy, "_NET_ACTIVE_WINDOW", False);
    ev.xclient.format       = 32;
    ev.xclient.data.l[0]    = 2;  // source indication: pager, so the WM doesn't refuse
    ev.xclient.data.l[1]    = CurrentTime;
    XSendEvent(dpy, DefaultRootWindow(dpy), False, SubstructureRedirectMask | SubstructureNotifyMask, &ev);

    XRaiseWindow(dpy, w);
    if (attrs.map_state == IsViewable)
        XSetInputFocus(dpy, w, RevertToParent, CurrentTime);

    // the window may still die between the check and here
    const int err = trap.Sync();
    if (err == BadWindow)
        return Err(ErrorKind::WindowGone, fmt::format("window 0x{:x} is gone", window));
    if (err != Success)
        debug("focusing window 0x{:x} raised X error {}", window, err);

    return Ok();
}

Result<> X11WindowSystem::SendPasteKeystroke()
{
    std::lock_guard lk(m_mtx);
    Display*        dpy = m_dpy->get();

    // keycodes, not characters, so it works on any keyboard layout
    const KeyCode ctrl = XKeysymToKeycode(dpy, XK_Control_L);
    const KeyCode v    = XKeysymToKeycode(dpy, XK_v);
    if (ctrl == 0 || v == 0)
        return Err("No keycode for Ctrl or V in the current keymap");

    XTestFakeKeyEvent(dpy, ctrl, True, CurrentTime);
    XTestFakeKeyEvent(dpy, v, True, CurrentTime);
    XTestFakeKeyEvent(dpy, v, False, CurrentTime);
    XTestFakeKeyEvent(dpy, ctrl, False, CurrentTime);
    XFlush(dpy);

    return Ok();
}

// No global focus on Wayland: the compositor gives focus back to
// the previous window once the picker closes, we only inject the keystroke
class WaylandWindowSystem : public WindowSystem
{
public:
    window_handle_t GetForegroundWindow() override { return 0; }

    Result<> BringToForeground(window_handle_t) override { return Ok(); }

    Result<> SendPasteKeystroke() override
    {
        std::string             err;
        TinyProcessLib::Process proc({ "wtype", "-M", "ctrl", "v", "-m", "ctrl" }, "", nullptr, [&](const char* b, size_t n) {
            err.append(b, n);
        });

        if (proc.get_exit_status() == 0)
            return Ok();
        return Err("Failed to send Ctrl+V with wtype: " + trim(err));
    }
};

}  // namespace

void init_x11_threads()
{
    if (!XInitThreads())
        warn(_("XInitThreads() failed, X11 calls from different threads may crash"));
}

Result<std::unique_ptr<WindowSystem>> make_window_system(SessionType session)
{
    if (session == WAYLAND)
        return std::unique_ptr<WindowSystem>(std::make_unique<WaylandWindowSystem>());

    auto dpy = std::make_unique<X11Display>();
    if (!*dpy)
        return Err("Failed to open the X display, is $DISPLAY set?");

    int event_base, error_base, major, minor;
    if (!XTestQueryExtension(dpy->get(), &event_base, &error_base, &major, &minor))
        return Err("The X server doesn't support the XTest extension");

    return std::unique_ptr<WindowSystem>(std::make_unique<X11WindowSystem>(std::move(dpy)));
}
