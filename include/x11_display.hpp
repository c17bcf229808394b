#ifndef _X11_DISPLAY_HPP_
#define _X11_DISPLAY_HPP_

#include <chrono>
#include <mutex>

#include <X11/Xlib.h>

// Own Xlib connection, one per thread that needs to block on events
class X11Display
{
public:
    X11Display() : m_dpy(XOpenDisplay(nullptr)) {}
    ~X11Display()
    {
        if (m_dpy)
            XCloseDisplay(m_dpy);
    }

    X11Display(const X11Display&)            = delete;
    X11Display& operator=(const X11Display&) = delete;

    Display* get() const { return m_dpy; }
    explicit operator bool() const { return m_dpy != nullptr; }

private:
    Display* m_dpy;
};

/*
 * Catch X protocol errors of the requests made while it's alive,
 * instead of letting Xlib's default handler exit the process.
 * The handler is process wide, so traps are serialized.
 */
class X11ErrorTrap
{
public:
    explicit X11ErrorTrap(Display* dpy);
    ~X11ErrorTrap();

    X11ErrorTrap(const X11ErrorTrap&)            = delete;
    X11ErrorTrap& operator=(const X11ErrorTrap&) = delete;

    // Flushes the requests and returns the first error code, Success if none
    int Sync();

private:
    Display*                     m_dpy;
    std::unique_lock<std::mutex> m_lock;
    int (*m_old_handler)(Display*, XErrorEvent*);
};

// eventfd used to wake a thread blocked in poll()
class WakeFd
{
public:
    WakeFd();
    ~WakeFd();

    WakeFd(const WakeFd&)            = delete;
    WakeFd& operator=(const WakeFd&) = delete;

    void Signal();
    void Drain();
    int  fd() const { return m_fd; }

private:
    int m_fd;
};

/*
 * Block until the X connection has events queued, wake is signaled,
 * or the timeout expires.
 * @return true if there are X events to read
 */
bool wait_for_x_events(Display* dpy, const WakeFd& wake, std::chrono::milliseconds timeout);

#endif  // !_X11_DISPLAY_HPP_
