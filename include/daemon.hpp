#ifndef _DAEMON_HPP_
#define _DAEMON_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "history_store.hpp"
#include "paste_engine.hpp"
#include "picker.hpp"
#include "socket.hpp"
#include "window_system.hpp"

struct daemon_options_t
{
    size_t picker_limit = 100;
    bool   notify       = true;
};

/*
 * Wires everything together.
 * Watcher threads call OnClipboardChange() and RequestShow(), the IPC
 * thread calls HandleRequest(), and the UI thread sits in Run() picking
 * and pasting one activation at a time.
 */
class Daemon
{
public:
    // Desktop notification for errors the user has to know about
    using Notifier = std::function<void(const std::string& summary, const std::string& body)>;

    Daemon(HistoryStore& store, WindowSystem& windows, PasteEngine& paste, Picker& picker,
           daemon_options_t options = {}, Notifier notifier = nullptr);

    // Clipboard watcher callback. Store errors are logged and dropped
    void OnClipboardChange(const clip_content_t& content);

    // Queue a picker for target. A pending activation is replaced,
    // so pressing the hotkey five times opens the picker once
    void RequestShow(window_handle_t target);

    void RequestQuit();
    bool QuitRequested() const { return m_quit.load(); }

    // UI loop, returns after RequestQuit()
    void Run();

    // Handle at most one activation, waiting up to timeout for it.
    // False once quit was requested
    bool RunOnce(std::chrono::milliseconds timeout);

    // Pick an entry and paste it into target
    Result<> ShowPicker(window_handle_t target);

    ipc_message_t HandleRequest(const ipc_message_t& req);

private:
    HistoryStore&    m_store;
    WindowSystem&    m_windows;
    PasteEngine&     m_paste;
    Picker&          m_picker;
    daemon_options_t m_options;
    Notifier         m_notifier;

    std::mutex                     m_mtx;
    std::condition_variable        m_cv;
    std::optional<window_handle_t> m_pending;
    std::atomic<bool>              m_quit{ false };

    void SurfaceError(const std::string& what, const Result<>& res);
};

// Fire and forget `notify-send`
void notify_send(const std::string& summary, const std::string& body);

#endif  // !_DAEMON_HPP_
