#include "hotkey_source.hpp"

#include <X11/Xlib.h>
#include <X11/XKBlib.h>

#include <vector>

#include "x11_display.hpp"

Result<hotkey_combo_t> parse_hotkey(const std::string_view str)
{
    hotkey_combo_t combo;
    for (std::string_view rest = str; !rest.empty() || combo.key.empty();)
    {
        const size_t      plus = rest.find('+');
        const std::string part = trim(rest.substr(0, plus));
        rest                   = plus == rest.npos ? std::string_view{} : rest.substr(plus + 1);

        if (part.empty())
            return Err(fmt::format("invalid hotkey '{}': empty key", str));

        const std::string& lower = str_tolower(part);
        if (lower == "ctrl" || lower == "control")
            combo.modifiers |= MOD_CTRL;
        else if (lower == "shift")
            combo.modifiers |= MOD_SHIFT;
        else if (lower == "alt")
            combo.modifiers |= MOD_ALT;
        else if (lower == "super" || lower == "win" || lower == "meta")
            combo.modifiers |= MOD_SUPER;
        else if (!combo.key.empty())
            return Err(fmt::format("invalid hotkey '{}': more than one key", str));
        else
            combo.key = part.size() == 1 ? lower : part;

        if (rest.empty() && combo.key.empty())
            return Err(fmt::format("invalid hotkey '{}': missing a key", str));
    }

    return combo;
}

std::string hotkey_to_string(const hotkey_combo_t& combo)
{
    std::string ret;
    if (combo.modifiers & MOD_CTRL)
        ret += "ctrl+";
    if (combo.modifiers & MOD_SHIFT)
        ret += "shift+";
    if (combo.modifiers & MOD_ALT)
        ret += "alt+";
    if (combo.modifiers & MOD_SUPER)
        ret += "super+";
    return ret + combo.key;
}

Result<std::optional<hotkey_combo_t>> daemon_hotkey(SessionType session, const std::string_view str)
{
    if (session != X11)
        return std::optional<hotkey_combo_t>{};

    const Result<hotkey_combo_t>& res = parse_hotkey(str);
    if (!res.ok())
        return Err(res.error());
    return std::optional<hotkey_combo_t>(res.get());
}

namespace
{

class X11HotkeySource : public HotkeySource
{
public:
    ~X11HotkeySource() override { Unregister(); }

    Result<> Register(const hotkey_combo_t& combo) override;
    void     Unregister() override;
    bool     WaitForActivation(std::chrono::milliseconds timeout) override;
    void     Wake() override { m_wake.Signal(); }

private:
    std::unique_ptr<X11Display> m_dpy;
    WakeFd                      m_wake;
    KeyCode                     m_keycode   = 0;
    unsigned                    m_modifiers = 0;
    bool                        m_held      = false;
};

// NumLock and CapsLock would make the grab miss
static const unsigned lock_variants[] = { 0, LockMask, Mod2Mask, LockMask | Mod2Mask };

Result<> X11HotkeySource::Register(const hotkey_combo_t& combo)
{
    m_dpy = std::make_unique<X11Display>();
    if (!*m_dpy)
        return Err("Failed to open the X display, is $DISPLAY set?");

    Display* dpy = m_dpy->get();

    const KeySym sym = XStringToKeysym(combo.key.c_str());
    if (sym == NoSymbol)
        return Err(fmt::format("unknown key '{}'", combo.key));

    // grabbing the physical key makes it work on any layout
    m_keycode = XKeysymToKeycode(dpy, sym);
    if (m_keycode == 0)
        return Err(fmt::format("key '{}' is not on this keyboard", combo.key));

    m_modifiers = 0;
    if (combo.modifiers & MOD_CTRL)
        m_modifiers |= ControlMask;
    if (combo.modifiers & MOD_SHIFT)
        m_modifiers |= ShiftMask;
    if (combo.modifiers & MOD_ALT)
        m_modifiers |= Mod1Mask;
    if (combo.modifiers & MOD_SUPER)
        m_modifiers |= Mod4Mask;

    // a held key then repeats KeyPress without KeyRelease in between, see m_held
    XkbSetDetectableAutoRepeat(dpy, True, nullptr);
    m_held = false;

    X11ErrorTrap trap(dpy);
    for (const unsigned extra : lock_variants)
        XGrabKey(dpy, m_keycode, m_modifiers | extra, DefaultRootWindow(dpy), False, GrabModeAsync, GrabModeAsync);

    if (trap.Sync() != Success)
    {
        m_dpy.reset();
        return Err(fmt::format("hotkey '{}' is already taken by another application", hotkey_to_string(combo)));
    }

    return Ok();
}

void X11HotkeySource::Unregister()
{
    if (!m_dpy)
        return;

    Display* dpy = m_dpy->get();
    for (const unsigned extra : lock_variants)
        XUngrabKey(dpy, m_keycode, m_modifiers | extra, DefaultRootWindow(dpy));
    XFlush(dpy);
    m_dpy.reset();
}

bool X11HotkeySource::WaitForActivation(std::chrono::milliseconds timeout)
{
    if (!m_dpy)
        return false;

    m_wake.Drain();
    Display* dpy = m_dpy->get();
    if (!wait_for_x_events(dpy, m_wake, timeout))
        return false;

    bool pressed = false;
    while (XPending(dpy) > 0)
    {
        XEvent ev;
        XNextEvent(dpy, &ev);
        if ((ev.type != KeyPress && ev.type != KeyRelease) || ev.xkey.keycode != m_keycode)
            continue;

        if (ev.type == KeyRelease)
        {
            m_held = false;
        }
        else if (ev.type == KeyPress && !m_held &&
                 (ev.xkey.state & (ShiftMask | ControlMask | Mod1Mask | Mod4Mask)) == m_modifiers)
        {
            m_held  = true;
            pressed = true;
        }
    }
    return pressed;
}

}  // namespace

std::unique_ptr<HotkeySource> make_x11_hotkey_source()
{
    return std::make_unique<X11HotkeySource>();
}
