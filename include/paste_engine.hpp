#ifndef _PASTE_ENGINE_HPP_
#define _PASTE_ENGINE_HPP_

#include <chrono>

#include "clipboard.hpp"
#include "echo_suppressor.hpp"
#include "history_entry.hpp"
#include "window_system.hpp"

struct paste_options_t
{
    int                       clipboard_retries = 3;
    std::chrono::milliseconds clipboard_retry_delay{ 50 };  // doubled after each failed attempt
    std::chrono::milliseconds paste_delay{ 150 };           // focus settle time before Ctrl+V
};

/*
 * Puts a history entry back on the clipboard and pastes it into the
 * window that had focus when the hotkey was pressed:
 *   1. arm echo suppression
 *   2. write the clipboard
 *   3. focus the target window (skipped with no target)
 *   4. send Ctrl+V
 * Nothing is typed if the clipboard write or the focus change fails.
 */
class PasteEngine
{
public:
    PasteEngine(ClipboardBackend& clipboard, WindowSystem& windows, EchoSuppressor& suppressor,
                paste_options_t options = {});

    /**
     * @param entry A full entry, image entries need their bytes loaded
     * @param target Window captured at activation, 0 for none
     * @return ClipboardBusy if the clipboard stayed locked,
     *         WindowGone if the target was closed (the clipboard keeps the entry)
     */
    Result<> Paste(const entry_t& entry, window_handle_t target);

private:
    ClipboardBackend& m_clipboard;
    WindowSystem&     m_windows;
    EchoSuppressor&   m_suppressor;
    paste_options_t   m_options;

    Result<> WriteWithRetry(const clip_content_t& content);
};

#endif  // !_PASTE_ENGINE_HPP_
