#include "picker.hpp"

#include <charconv>

#include "tiny-process-library/process.hpp"

std::string MenuPicker::FormatLine(const entry_t& entry)
{
    return fmt::format("{}\t{}{}", entry.id, entry.pinned ? "* " : "", entry.preview(120));
}

std::optional<EntryId> MenuPicker::ParseSelection(const std::string_view line)
{
    const std::string_view id_str = line.substr(0, line.find('\t'));

    EntryId id{};
    const auto [ptr, ec] = std::from_chars(id_str.data(), id_str.data() + id_str.size(), id);
    if (ec != std::errc() || ptr == id_str.data() || id <= 0)
        return {};

    // "12abc" isn't an id
    if (ptr != id_str.data() + id_str.size() && !std::isspace(static_cast<unsigned char>(*ptr)))
        return {};

    return id;
}

Result<std::optional<EntryId>> MenuPicker::Pick(const std::vector<entry_t>& entries)
{
    if (m_command.empty())
        return Err("picker-command is empty");

    std::string input;
    for (const entry_t& entry : entries)
    {
        input += FormatLine(entry);
        input += '\n';
    }

    std::string out, err;
    {
        std::lock_guard lk(m_mtx);
        if (m_cancelled)
            return std::optional<EntryId>{};
    }

    // run through the shell, picker-command is a command line
    TinyProcessLib::Process proc(
        m_command,
        "",
        [&](const char* b, size_t n) { out.append(b, n); },
        [&](const char* b, size_t n) { err.append(b, n); },
        true);

    {
        std::lock_guard lk(m_mtx);
        m_running = &proc;
        // Cancel() came in while we were spawning
        if (m_cancelled)
            proc.kill(true);
    }

    if (!proc.write(input))
        debug("picker closed its stdin early");
    proc.close_stdin();

    const int status = proc.get_exit_status();
    {
        std::lock_guard lk(m_mtx);
        m_running = nullptr;
        if (m_cancelled)
            return std::optional<EntryId>{};
    }

    // dmenu and rofi exit with 1 when dismissed
    if (status == 1 && trim(out).empty())
        return std::optional<EntryId>{};
    if (status != 0)
        return Err(fmt::format("picker '{}' failed with status {}: {}", m_command, status, trim(err)));

    const std::string& line = trim(out);
    if (line.empty())
        return std::optional<EntryId>{};

    const std::optional<EntryId>& id = ParseSelection(line);
    if (!id)
        return Err(fmt::format("picker returned an unknown line '{}'", line));

    return id;
}

void MenuPicker::Cancel()
{
    std::lock_guard lk(m_mtx);
    m_cancelled = true;
    if (m_running)
    {
        debug("closing the picker");
        m_running->kill(true);
    }
}
