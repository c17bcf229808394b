#include "paste_engine.hpp"

#include <algorithm>
#include <thread>

PasteEngine::PasteEngine(ClipboardBackend& clipboard, WindowSystem& windows, EchoSuppressor& suppressor,
                         paste_options_t options)
    : m_clipboard(clipboard), m_windows(windows), m_suppressor(suppressor), m_options(options)
{
}

Result<> PasteEngine::WriteWithRetry(const clip_content_t& content)
{
    std::chrono::milliseconds delay = m_options.clipboard_retry_delay;
    std::string               last_error;

    for (int attempt = 1; attempt <= std::max(1, m_options.clipboard_retries); ++attempt)
    {
        const Result<>& res = m_clipboard.Write(content);
        if (res.ok())
            return Ok();

        last_error = res.error();
        debug("clipboard write attempt {} failed: {}", attempt, last_error);
        if (attempt < m_options.clipboard_retries)
        {
            std::this_thread::sleep_for(delay);
            delay *= 2;
        }
    }

    return Err(ErrorKind::ClipboardBusy, last_error);
}

Result<> PasteEngine::Paste(const entry_t& entry, window_handle_t target)
{
    if (entry.is_image() && entry.content.empty())
        return Err(fmt::format("image entry {} has no data loaded", entry.id));

    const clip_content_t content{ entry.kind, entry.content };

    m_suppressor.Expect(content);
    if (const Result<>& res = WriteWithRetry(content); !res.ok())
    {
        m_suppressor.Cancel();
        return res;
    }

    if (target != 0)
    {
        const Result<>& res = m_windows.BringToForeground(target);
        if (!res.ok())
            return res;
    }

    // the picker just closed, give focus time to settle either way
    std::this_thread::sleep_for(m_options.paste_delay);

    const Result<>& res = m_windows.SendPasteKeystroke();
    if (!res.ok())
        return res;

    debug("pasted entry {} into window 0x{:x}", entry.id, target);
    return Ok();
}
