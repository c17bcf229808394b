#include "change_notifier.hpp"

#include <X11/Xlib.h>
#include <X11/extensions/Xfixes.h>

#include <condition_variable>
#include <mutex>
#include <thread>

#include "tiny-process-library/process.hpp"
#include "x11_display.hpp"

namespace
{

class X11ChangeNotifier : public ChangeNotifier
{
public:
    Result<> Subscribe() override
    {
        m_dpy = std::make_unique<X11Display>();
        if (!*m_dpy)
            return Err("Failed to open the X display, is $DISPLAY set?");

        int error_base;
        if (!XFixesQueryExtension(m_dpy->get(), &m_event_base, &error_base))
            return Err("The X server doesn't support the XFixes extension");

        Display* dpy = m_dpy->get();
        XFixesSelectSelectionInput(dpy,
                                   DefaultRootWindow(dpy),
                                   XInternAtom(dpy, "CLIPBOARD", False),
                                   XFixesSetSelectionOwnerNotifyMask);
        XFlush(dpy);
        return Ok();
    }

    void Unsubscribe() override { m_dpy.reset(); }

    bool WaitForChange(std::chrono::milliseconds timeout) override
    {
        if (!m_dpy)
            return false;

        m_wake.Drain();
        if (!wait_for_x_events(m_dpy->get(), m_wake, timeout))
            return false;

        bool changed = false;
        while (XPending(m_dpy->get()) > 0)
        {
            XEvent ev;
            XNextEvent(m_dpy->get(), &ev);
            if (ev.type == m_event_base + XFixesSelectionNotify)
                changed = true;
        }
        return changed;
    }

    void Wake() override { m_wake.Signal(); }

private:
    std::unique_ptr<X11Display> m_dpy;
    WakeFd                      m_wake;
    int                         m_event_base = 0;
};

// wl-paste runs `echo` on every selection change, one line per change
class WlPasteNotifier : public ChangeNotifier
{
public:
    ~WlPasteNotifier() override { Unsubscribe(); }

    Result<> Subscribe() override
    {
        m_proc = std::make_unique<TinyProcessLib::Process>(
            std::vector<std::string>{ "wl-paste", "--watch", "echo" },
            "",
            [this](const char* b, size_t n) {
                size_t lines = 0;
                for (size_t i = 0; i < n; ++i)
                    if (b[i] == '\n')
                        ++lines;

                std::lock_guard lk(m_mtx);
                m_pending += lines;
                m_cv.notify_one();
            },
            nullptr);

        if (m_proc->get_id() <= 0)
        {
            m_proc.reset();
            return Err("Failed to start wl-paste --watch");
        }

        // a missing wl-paste, or one that can't reach the compositor, exits right away
        for (int i = 0; i < 10; ++i)
        {
            int status;
            if (m_proc->try_get_exit_status(status))
            {
                m_proc.reset();
                return Err(fmt::format("wl-paste --watch exited with status {}, is wl-clipboard installed?", status));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return Ok();
    }

    void Unsubscribe() override
    {
        if (!m_proc)
            return;

        m_proc->kill();
        m_proc->get_exit_status();
        m_proc.reset();
    }

    bool WaitForChange(std::chrono::milliseconds timeout) override
    {
        std::unique_lock lk(m_mtx);
        m_cv.wait_for(lk, timeout, [&] { return m_pending > 0 || m_woken; });
        m_woken = false;
        if (m_pending == 0)
        {
            lk.unlock();
            CheckAlive();
            return false;
        }

        // a burst of changes is one read of the latest content
        m_pending = 0;
        return true;
    }

    void Wake() override
    {
        std::lock_guard lk(m_mtx);
        m_woken = true;
        m_cv.notify_one();
    }

private:
    std::unique_ptr<TinyProcessLib::Process> m_proc;

    void CheckAlive()
    {
        int status;
        if (!m_proc || !m_proc->try_get_exit_status(status))
            return;

        error(_("wl-paste --watch exited with status {}, clipboard changes are no longer recorded"), status);
        m_proc.reset();
    }

    std::mutex                               m_mtx;
    std::condition_variable                  m_cv;
    size_t                                   m_pending = 0;
    bool                                     m_woken   = false;
};

}  // namespace

std::unique_ptr<ChangeNotifier> make_change_notifier(SessionType session)
{
    if (session == WAYLAND)
        return std::make_unique<WlPasteNotifier>();
    return std::make_unique<X11ChangeNotifier>();
}
