#ifndef _CHANGE_NOTIFIER_HPP_
#define _CHANGE_NOTIFIER_HPP_

#include <chrono>
#include <memory>

#include "util.hpp"

// Source of "the clipboard changed" notifications
class ChangeNotifier
{
public:
    virtual ~ChangeNotifier() = default;

    virtual Result<> Subscribe()   = 0;
    virtual void     Unsubscribe() = 0;

    // Block until a change, Wake() or the timeout. True only on a change
    virtual bool WaitForChange(std::chrono::milliseconds timeout) = 0;

    // Unblock WaitForChange() from another thread
    virtual void Wake() = 0;
};

// XFixes selection events on X11, `wl-paste --watch` on Wayland
std::unique_ptr<ChangeNotifier> make_change_notifier(SessionType session);

#endif  // !_CHANGE_NOTIFIER_HPP_
