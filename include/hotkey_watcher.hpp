#ifndef _HOTKEY_WATCHER_HPP_
#define _HOTKEY_WATCHER_HPP_

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>

#include "clipboard_watcher.hpp"
#include "hotkey_source.hpp"
#include "window_system.hpp"

/*
 * Background thread waiting for the global hotkey.
 * On every press it captures the foreground window right away, before
 * anything of ours can take focus, and hands it to the callback.
 */
class HotkeyWatcher
{
public:
    using ActivateCallback = std::function<void(window_handle_t)>;

    HotkeyWatcher(HotkeySource& source, WindowSystem& windows, hotkey_combo_t combo);
    ~HotkeyWatcher();

    HotkeyWatcher(const HotkeyWatcher&)            = delete;
    HotkeyWatcher& operator=(const HotkeyWatcher&) = delete;

    // Set it before Start()
    void SetOnActivate(ActivateCallback cb) { m_on_activate = std::move(cb); }

    // Stopped -> Listening. Fails if the combo can't be grabbed
    Result<> Start();

    // Listening -> Stopped, idempotent
    void Stop();

    bool IsListening() const { return m_state.load() == WatcherState::Listening; }

private:
    HotkeySource&    m_source;
    WindowSystem&    m_windows;
    hotkey_combo_t   m_combo;
    ActivateCallback m_on_activate;

    std::mutex                m_lifecycle_mtx;
    std::thread               m_thread;
    std::atomic<bool>         m_stop{ false };
    std::atomic<WatcherState> m_state{ WatcherState::Stopped };

    void Run();
};

#endif  // !_HOTKEY_WATCHER_HPP_
