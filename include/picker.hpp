#ifndef _PICKER_HPP_
#define _PICKER_HPP_

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "history_entry.hpp"
#include "util.hpp"

namespace TinyProcessLib
{
class Process;
}

// Lets the user choose one entry of the history
class Picker
{
public:
    virtual ~Picker() = default;

    // Empty when the user dismissed it
    virtual Result<std::optional<EntryId>> Pick(const std::vector<entry_t>& entries) = 0;

    // Called from another thread on shutdown. Closes a picker that is
    // open and makes every later Pick() return dismissed
    virtual void Cancel() = 0;
};

/*
 * dmenu compatible picker (rofi -dmenu, wofi --dmenu, fuzzel -d, ...).
 * Each entry is a line "<id>\t<pin marker><preview>" on its stdin,
 * the chosen line comes back on stdout.
 */
class MenuPicker : public Picker
{
public:
    explicit MenuPicker(std::string command) : m_command(std::move(command)) {}

    Result<std::optional<EntryId>> Pick(const std::vector<entry_t>& entries) override;
    void                           Cancel() override;

    static std::string            FormatLine(const entry_t& entry);
    static std::optional<EntryId> ParseSelection(const std::string_view line);

private:
    std::string m_command;

    std::mutex               m_mtx;
    TinyProcessLib::Process* m_running   = nullptr;
    bool                     m_cancelled = false;
};

#endif  // !_PICKER_HPP_
