#include "x11_display.hpp"

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>

#include "util.hpp"

static std::mutex g_trap_mtx;
static int        g_trapped_error = Success;

static int trap_handler(Display*, XErrorEvent* ev)
{
    if (g_trapped_error == Success)
        g_trapped_error = ev->error_code;
    return 0;
}

X11ErrorTrap::X11ErrorTrap(Display* dpy) : m_dpy(dpy), m_lock(g_trap_mtx)
{
    XSync(m_dpy, False);
    g_trapped_error = Success;
    m_old_handler   = XSetErrorHandler(trap_handler);
}

X11ErrorTrap::~X11ErrorTrap()
{
    XSync(m_dpy, False);
    XSetErrorHandler(m_old_handler);
}

int X11ErrorTrap::Sync()
{
    XSync(m_dpy, False);
    const int err   = g_trapped_error;
    g_trapped_error = Success;
    return err;
}

WakeFd::WakeFd() : m_fd(eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC))
{
    if (m_fd < 0)
        die(_("eventfd() failed: {}"), std::strerror(errno));
}

WakeFd::~WakeFd()
{
    ::close(m_fd);
}

void WakeFd::Signal()
{
    const uint64_t one = 1;
    if (::write(m_fd, &one, sizeof(one)) < 0 && errno != EAGAIN)
        error(_("Failed to signal wake fd: {}"), std::strerror(errno));
}

void WakeFd::Drain()
{
    uint64_t value;
    while (::read(m_fd, &value, sizeof(value)) > 0)
        ;
}

bool wait_for_x_events(Display* dpy, const WakeFd& wake, std::chrono::milliseconds timeout)
{
    if (XPending(dpy) > 0)
        return true;

    pollfd fds[2] = {
        { ConnectionNumber(dpy), POLLIN, 0 },
        { wake.fd(), POLLIN, 0 },
    };

    const int ret = ::poll(fds, 2, static_cast<int>(timeout.count()));
    if (ret < 0)
    {
        if (errno != EINTR)
            error(_("poll() on the X connection failed: {}"), std::strerror(errno));
        return false;
    }

    return (fds[0].revents & POLLIN) && XPending(dpy) > 0;
}
