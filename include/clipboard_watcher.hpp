#ifndef _CLIPBOARD_WATCHER_HPP_
#define _CLIPBOARD_WATCHER_HPP_

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

#include "change_notifier.hpp"
#include "clipboard.hpp"
#include "echo_suppressor.hpp"
#include "history_entry.hpp"

enum class WatcherState
{
    Stopped,
    Listening
};

struct watcher_limits_t
{
    size_t max_content_length = 50000;    // text is cut to this many bytes
    size_t max_image_bytes    = 5242880;  // bigger images are ignored
    int    read_retries       = 3;
    std::chrono::milliseconds read_retry_delay{ 50 };
};

/*
 * Background thread that turns clipboard change notifications into
 * captures: it reads the clipboard, drops echoes of our own pastes,
 * blank text and oversized images, truncates long text, and hands the
 * rest to the change callback (usually HistoryStore::Add).
 *
 * Nothing thrown or returned by a single capture stops the thread.
 */
class ClipboardWatcher
{
public:
    using ChangeCallback = std::function<void(const clip_content_t&)>;

    ClipboardWatcher(ChangeNotifier& notifier, ClipboardBackend& clipboard, EchoSuppressor& suppressor,
                     watcher_limits_t limits = {});
    ~ClipboardWatcher();

    ClipboardWatcher(const ClipboardWatcher&)            = delete;
    ClipboardWatcher& operator=(const ClipboardWatcher&) = delete;

    // Set it before Start()
    void SetOnChange(ChangeCallback cb) { m_on_change = std::move(cb); }

    // Stopped -> Listening. Fails if the notifications can't be subscribed
    Result<> Start();

    // Listening -> Stopped, idempotent. A capture in flight is dropped
    void Stop();

    bool IsListening() const { return m_state.load() == WatcherState::Listening; }

private:
    ChangeNotifier&   m_notifier;
    ClipboardBackend& m_clipboard;
    EchoSuppressor&   m_suppressor;
    watcher_limits_t  m_limits;
    ChangeCallback    m_on_change;

    std::mutex                m_lifecycle_mtx;
    std::thread               m_thread;
    std::atomic<bool>         m_stop{ false };
    std::atomic<WatcherState> m_state{ WatcherState::Stopped };

    void Run();
    void HandleChange();
};

#endif  // !_CLIPBOARD_WATCHER_HPP_
