#ifndef _WINDOW_SYSTEM_HPP_
#define _WINDOW_SYSTEM_HPP_

#include <cstdint>
#include <memory>

#include "util.hpp"

// X11 Window id. 0 means no window (or none we can know of, e.g. on Wayland)
using window_handle_t = uint64_t;

class WindowSystem
{
public:
    virtual ~WindowSystem() = default;

    // The window that has keyboard focus right now
    virtual window_handle_t GetForegroundWindow() = 0;

    // WindowGone if the window was closed in the meantime
    virtual Result<> BringToForeground(window_handle_t window) = 0;

    // Ctrl+V into whatever has focus
    virtual Result<> SendPasteKeystroke() = 0;
};

// Has to run before any other Xlib call, our X11 parts live on different threads
void init_x11_threads();

// Fails only when the X display can't be opened
Result<std::unique_ptr<WindowSystem>> make_window_system(SessionType session);

#endif  // !_WINDOW_SYSTEM_HPP_
