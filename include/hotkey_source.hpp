#ifndef _HOTKEY_SOURCE_HPP_
#define _HOTKEY_SOURCE_HPP_

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "util.hpp"

enum HotkeyModifier : unsigned
{
    MOD_CTRL  = 1 << 0,
    MOD_SHIFT = 1 << 1,
    MOD_ALT   = 1 << 2,
    MOD_SUPER = 1 << 3,
};

struct hotkey_combo_t
{
    unsigned    modifiers = 0;
    std::string key;  // X keysym name, e.g. "v" or "F12"

    bool operator==(const hotkey_combo_t&) const = default;
};

/*
 * Parse a combo like "ctrl+shift+v" or "Super+Insert".
 * Modifier names are case-insensitive, exactly one non-modifier key is required.
 */
Result<hotkey_combo_t> parse_hotkey(const std::string_view str);

std::string hotkey_to_string(const hotkey_combo_t& combo);

// The combo the daemon grabs. Wayland has no global hotkeys, so there's
// nothing to grab and the string isn't even looked at
Result<std::optional<hotkey_combo_t>> daemon_hotkey(SessionType session, const std::string_view str);

// Global hotkey registration, delivered regardless of which window has focus
class HotkeySource
{
public:
    virtual ~HotkeySource() = default;

    virtual Result<> Register(const hotkey_combo_t& combo) = 0;
    virtual void     Unregister()                          = 0;

    // Block until the hotkey is pressed, Wake() or the timeout. True only on a press
    virtual bool WaitForActivation(std::chrono::milliseconds timeout) = 0;

    virtual void Wake() = 0;
};

// XGrabKey on the root window. There's no Wayland counterpart,
// bind `clipkeep --show` in the compositor instead
std::unique_ptr<HotkeySource> make_x11_hotkey_source();

#endif  // !_HOTKEY_SOURCE_HPP_
