#include "clipboard_watcher.hpp"

#include <exception>

#include "util.hpp"

ClipboardWatcher::ClipboardWatcher(ChangeNotifier& notifier, ClipboardBackend& clipboard,
                                   EchoSuppressor& suppressor, watcher_limits_t limits)
    : m_notifier(notifier), m_clipboard(clipboard), m_suppressor(suppressor), m_limits(limits)
{
}

ClipboardWatcher::~ClipboardWatcher()
{
    Stop();
}

Result<> ClipboardWatcher::Start()
{
    std::lock_guard lk(m_lifecycle_mtx);
    if (m_state.load() == WatcherState::Listening)
        return Ok();

    const Result<>& res = m_notifier.Subscribe();
    if (!res.ok())
        return Err(res.kind(), "Failed to watch the clipboard: " + res.error());

    m_stop.store(false);
    m_state.store(WatcherState::Listening);
    m_thread = std::thread(&ClipboardWatcher::Run, this);
    debug("clipboard watcher started");
    return Ok();
}

void ClipboardWatcher::Stop()
{
    std::lock_guard lk(m_lifecycle_mtx);
    if (!m_thread.joinable())
        return;

    // the thread sees the flag at its next wake
    m_stop.store(true);
    m_notifier.Wake();
    m_thread.join();

    m_notifier.Unsubscribe();
    m_state.store(WatcherState::Stopped);
    debug("clipboard watcher stopped");
}

void ClipboardWatcher::Run()
{
    while (!m_stop.load())
    {
        if (!m_notifier.WaitForChange(std::chrono::milliseconds(500)))
            continue;
        if (m_stop.load())
            break;

        try
        {
            HandleChange();
        }
        catch (const std::exception& e)
        {
            error(_("Clipboard capture failed: {}"), e.what());
        }
    }
}

void ClipboardWatcher::HandleChange()
{
    Result<clip_content_t> res = m_clipboard.Read();
    for (int attempt = 1; !res.ok() && res.kind() == ErrorKind::ClipboardBusy && attempt < m_limits.read_retries;
         ++attempt)
    {
        if (m_stop.load())
            return;
        std::this_thread::sleep_for(m_limits.read_retry_delay);
        res = m_clipboard.Read();
    }

    if (!res.ok())
    {
        if (res.kind() == ErrorKind::UnsupportedFormat)
            debug("ignoring clipboard change: {}", res.error());
        else
            warn(_("Failed to read the clipboard: {}"), res.error());
        return;
    }

    clip_content_t& content = res.get();

    // before any filtering, our own write must always consume the flag
    if (m_suppressor.ShouldSuppress(content))
    {
        debug("ignoring the echo of our own paste");
        return;
    }

    if (content.kind == EntryKind::Text)
    {
        if (is_blank(content.data))
        {
            debug("ignoring blank text");
            return;
        }

        if (content.data.size() > m_limits.max_content_length)
        {
            debug("truncating {} bytes of text to {}", content.data.size(), m_limits.max_content_length);
            content.data = utf8_truncate(content.data, m_limits.max_content_length);
        }
    }
    else
    {
        if (content.data.empty())
            return;

        if (content.data.size() > m_limits.max_image_bytes)
        {
            debug("ignoring {} image: {} bytes is over the limit of {}",
                  error_kind_name(ErrorKind::UnsupportedFormat),
                  content.data.size(),
                  m_limits.max_image_bytes);
            return;
        }
    }

    // stopping mid-capture drops it
    if (m_stop.load() || !m_on_change)
        return;

    m_on_change(content);
}
