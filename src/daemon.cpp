#include "daemon.hpp"

#include <charconv>

#include "tiny-process-library/process.hpp"

void notify_send(const std::string& summary, const std::string& body)
{
    TinyProcessLib::Process proc({ "notify-send", "-a", "clipkeep", summary, body });
    if (proc.get_exit_status() != 0)
        debug("notify-send failed, is libnotify installed?");
}

static std::optional<EntryId> parse_entry_id(const std::string& str)
{
    const std::string& s = trim(str);

    EntryId id{};
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), id);
    if (ec != std::errc() || ptr != s.data() + s.size() || id <= 0)
        return {};
    return id;
}

Daemon::Daemon(HistoryStore& store, WindowSystem& windows, PasteEngine& paste, Picker& picker,
               daemon_options_t options, Notifier notifier)
    : m_store(store),
      m_windows(windows),
      m_paste(paste),
      m_picker(picker),
      m_options(options),
      m_notifier(std::move(notifier))
{
    if (!m_notifier)
        m_notifier = notify_send;
}

void Daemon::OnClipboardChange(const clip_content_t& content)
{
    const Result<EntryId>& res = m_store.Add(content.data, content.kind);
    if (!res.ok())
        error(_("Failed to record clipboard {}: {}"), error_kind_name(res.kind()), res.error());
}

void Daemon::RequestShow(window_handle_t target)
{
    std::lock_guard lk(m_mtx);
    if (m_pending)
        debug("replacing the pending activation for window 0x{:x}", *m_pending);
    m_pending = target;
    m_cv.notify_all();
}

void Daemon::RequestQuit()
{
    {
        std::lock_guard lk(m_mtx);
        m_quit.store(true);
        m_cv.notify_all();
    }

    // the UI thread may be sitting in an open picker
    m_picker.Cancel();
}

bool Daemon::RunOnce(std::chrono::milliseconds timeout)
{
    std::unique_lock lk(m_mtx);
    m_cv.wait_for(lk, timeout, [&] { return m_quit.load() || m_pending.has_value(); });
    if (m_quit.load())
        return false;
    if (!m_pending)
        return true;

    const window_handle_t target = *m_pending;
    m_pending.reset();
    lk.unlock();

    const Result<>& res = ShowPicker(target);
    if (!res.ok())
        SurfaceError(_("Paste failed"), res);

    return !m_quit.load();
}

void Daemon::Run()
{
    while (RunOnce(std::chrono::seconds(1)))
        ;
}

void Daemon::SurfaceError(const std::string& what, const Result<>& res)
{
    error("{}: {} ({})", what, res.error(), error_kind_name(res.kind()));

    // everything else is only worth a log line
    if (m_options.notify && (res.kind() == ErrorKind::ClipboardBusy || res.kind() == ErrorKind::WindowGone))
    {
        const std::string& body = res.kind() == ErrorKind::WindowGone
                                      ? _("The window you were in was closed. The entry is on the clipboard.")
                                      : _("Another application is holding the clipboard, try again.");
        m_notifier(what, body);
    }
}

Result<> Daemon::ShowPicker(window_handle_t target)
{
    const auto& list = m_store.List("", m_options.picker_limit);
    if (!list.ok())
        return Err(list.kind(), list.error());

    if (list.get().empty())
    {
        info(_("The history is empty"));
        return Ok();
    }

    const Result<std::optional<EntryId>>& picked = m_picker.Pick(list.get());
    if (!picked.ok())
        return Err(picked.kind(), picked.error());

    if (!picked.get() || m_quit.load())
    {
        debug("picker dismissed");
        return Ok();
    }

    // the snapshot may be stale by now, and images need their bytes
    const EntryId id    = *picked.get();
    const auto&   entry = m_store.Get(id);
    if (!entry.ok())
        return Err(entry.kind(), entry.error());
    if (!entry.get())
    {
        warn(_("Entry {} was deleted in the meantime"), id);
        return Ok();
    }

    return m_paste.Paste(*entry.get(), target);
}

ipc_message_t Daemon::HandleRequest(const ipc_message_t& req)
{
    const auto id_request = [&](const auto& fn) -> ipc_message_t {
        const std::optional<EntryId>& id = parse_entry_id(req.payload);
        if (!id)
            return { IpcType::Error, fmt::format("invalid entry id '{}'", req.payload) };

        const Result<>& res = fn(*id);
        if (!res.ok())
            return { IpcType::Error, res.error() };
        return { IpcType::Ok, "" };
    };

    switch (req.type)
    {
        case IpcType::Show:
            // captured now, before the picker can take focus
            RequestShow(m_windows.GetForegroundWindow());
            return { IpcType::Ok, "" };

        case IpcType::List:
        {
            const auto& list = m_store.List(req.payload);
            if (!list.ok())
                return { IpcType::Error, list.error() };

            std::string out;
            for (const entry_t& entry : list.get())
                out += MenuPicker::FormatLine(entry) + '\n';
            return { IpcType::Ok, out };
        }

        case IpcType::Pin:    return id_request([&](EntryId id) { return m_store.SetPinned(id, true); });
        case IpcType::Unpin:  return id_request([&](EntryId id) { return m_store.SetPinned(id, false); });
        case IpcType::Delete: return id_request([&](EntryId id) { return m_store.Delete(id); });

        case IpcType::Clear:
        {
            const Result<size_t>& res = m_store.Clear();
            if (!res.ok())
                return { IpcType::Error, res.error() };
            return { IpcType::Ok, fmt::format("{}", res.get()) };
        }

        case IpcType::Quit:
            RequestQuit();
            return { IpcType::Ok, "" };

        default:
            return { IpcType::Error, fmt::format("unknown request '{}'", static_cast<char>(req.type)) };
    }
}
