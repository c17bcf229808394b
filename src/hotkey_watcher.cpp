#include "hotkey_watcher.hpp"

#include <exception>

HotkeyWatcher::HotkeyWatcher(HotkeySource& source, WindowSystem& windows, hotkey_combo_t combo)
    : m_source(source), m_windows(windows), m_combo(std::move(combo))
{
}

HotkeyWatcher::~HotkeyWatcher()
{
    Stop();
}

Result<> HotkeyWatcher::Start()
{
    std::lock_guard lk(m_lifecycle_mtx);
    if (m_state.load() == WatcherState::Listening)
        return Ok();

    const Result<>& res = m_source.Register(m_combo);
    if (!res.ok())
        return Err(res.kind(), "Failed to register the hotkey: " + res.error());

    m_stop.store(false);
    m_state.store(WatcherState::Listening);
    m_thread = std::thread(&HotkeyWatcher::Run, this);
    info(_("Listening for {}"), hotkey_to_string(m_combo));
    return Ok();
}

void HotkeyWatcher::Stop()
{
    std::lock_guard lk(m_lifecycle_mtx);
    if (!m_thread.joinable())
        return;

    m_stop.store(true);
    m_source.Wake();
    m_thread.join();

    m_source.Unregister();
    m_state.store(WatcherState::Stopped);
    debug("hotkey watcher stopped");
}

void HotkeyWatcher::Run()
{
    while (!m_stop.load())
    {
        if (!m_source.WaitForActivation(std::chrono::milliseconds(500)))
            continue;
        if (m_stop.load())
            break;

        const window_handle_t window = m_windows.GetForegroundWindow();
        debug("hotkey pressed, foreground window 0x{:x}", window);

        if (!m_on_activate)
            continue;

        try
        {
            m_on_activate(window);
        }
        catch (const std::exception& e)
        {
            error(_("Hotkey activation failed: {}"), e.what());
        }
    }
}
