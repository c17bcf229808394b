#ifndef _UTIL_HPP_
#define _UTIL_HPP_

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "fmt/chrono.h"
#include "fmt/color.h"
#include "fmt/format.h"

#if ENABLE_NLS
/* here so it doesn't need to be included elsewhere */
#include <libintl.h>
#include <locale.h>
#define _(str) gettext(str)
#else
#define _(s) (char*)s
#endif

namespace fs = std::filesystem;

enum class ErrorKind
{
    Generic,
    StorageUnavailable,
    ClipboardBusy,
    WindowGone,
    UnsupportedFormat
};

struct err_t
{
    ErrorKind   kind = ErrorKind::Generic;
    std::string msg;
};

inline err_t Err(std::string msg)
{
    return { ErrorKind::Generic, std::move(msg) };
}

inline err_t Err(ErrorKind kind, std::string msg)
{
    return { kind, std::move(msg) };
}

template <typename T = std::monostate>
class Result
{
public:
    Result(T value) : m_data(std::move(value)) {}
    Result(err_t err) : m_data(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(m_data); }

    const T& get() const { return std::get<T>(m_data); }
    T&       get() { return std::get<T>(m_data); }

    const std::string& error() const { return std::get<err_t>(m_data).msg; }
    ErrorKind          kind() const { return ok() ? ErrorKind::Generic : std::get<err_t>(m_data).kind; }

private:
    std::variant<T, err_t> m_data;
};

inline Result<> Ok()
{
    return Result<>(std::monostate{});
}

template <typename T>
Result<std::decay_t<T>> Ok(T&& value)
{
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

std::string_view error_kind_name(ErrorKind kind);

enum SessionType
{
    WAYLAND,
    X11,
    UNKNOWN
};

SessionType get_session_type();

std::string replace_str(std::string str, const std::string_view from, const std::string_view to);
std::string str_tolower(std::string str);
std::string trim(const std::string_view str);
bool        is_blank(const std::string_view str);

// Cut str to at most max_len bytes without splitting a UTF-8 sequence
std::string utf8_truncate(const std::string_view str, size_t max_len);

// 64-bit FNV-1a, printed as 16 hex chars by fnv1a_hex()
uint64_t    fnv1a64(const std::string_view data);
std::string fnv1a_hex(const std::string_view data);

/*
 * Get the user config directory
 * either from $XDG_CONFIG_HOME or from $HOME/.config/
 * @return user's config directory
 */
fs::path get_home_config_dir();

/*
 * Get the clipkeep config directory
 * where we'll have "config.toml"
 * from get_home_config_dir()
 * @return clipkeep's config directory
 */
fs::path get_config_dir();

// $XDG_DATA_HOME/clipkeep or $HOME/.local/share/clipkeep
fs::path get_data_dir();

/* Replace special symbols such as ~ and $ (at the begging) in std::string
 * @param str The string
 * @param dont Don't do it
 * @return The modified string
 */
std::string expandVar(std::string ret, bool dont = false);

// toggled by --debug
extern std::atomic<bool> g_debug_print;

#define BOLD_COLOR(x) (fmt::emphasis::bold | fmt::fg(x))
template <typename... Args>
void error(const std::string_view fmt, Args&&... args) noexcept
{
    fmt::print(stderr,
               BOLD_COLOR(fmt::rgb(fmt::color::red)),
               "[{}] ERROR: {}\n",
               std::chrono::system_clock::now(),
               fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
}

template <typename... Args>
[[noreturn]] void die(const std::string_view fmt, Args&&... args) noexcept
{
    fmt::print(stderr,
               BOLD_COLOR(fmt::rgb(fmt::color::red)),
               "[{}] FATAL: {}\n",
               std::chrono::system_clock::now(),
               fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
    std::exit(1);
}

template <typename... Args>
void debug(const std::string_view fmt, Args&&... args) noexcept
{
#if !DEBUG
    if (!g_debug_print.load(std::memory_order_relaxed))
        return;
#endif
    fmt::print(BOLD_COLOR((fmt::rgb(fmt::color::hot_pink))),
               "[{}] [DEBUG]: {}\n",
               std::chrono::system_clock::now(),
               fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
}

template <typename... Args>
void warn(const std::string_view fmt, Args&&... args) noexcept
{
    fmt::print(BOLD_COLOR((fmt::rgb(fmt::color::yellow))),
               "[{}] WARNING: {}\n",
               std::chrono::system_clock::now(),
               fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
}

template <typename... Args>
void info(const std::string_view fmt, Args&&... args) noexcept
{
    fmt::print(BOLD_COLOR((fmt::rgb(fmt::color::cyan))),
               "[{}] INFO: {}\n",
               std::chrono::system_clock::now(),
               fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
}

inline void ctrl_d_handler(const std::istream& cin)
{
    if (cin.eof())
        die(_("Exiting due to CTRL-D or EOF"));
}

/** Ask the user a yes or no question.
 * @param def The default result
 * @param fmt The format string
 * @param args Arguments in the format
 * @returns the result, y = true, n = false, only returns def if the result is def
 */
template <typename... Args>
bool askUserYorN(bool def, const std::string_view fmt, Args&&... args)
{
    const std::string& inputs_str = fmt::format(" [{}]: ", def ? "Y/n" : "y/N");
    std::string        result;
    fmt::print(fmt::runtime(fmt), std::forward<Args>(args)...);
    fmt::print("{}", inputs_str);

    while (std::getline(std::cin, result) && (result.length() > 1))
        fmt::print(BOLD_COLOR(fmt::rgb(fmt::color::yellow)), "Please answear y or n,{}", inputs_str);

    ctrl_d_handler(std::cin);

    if (result.empty())
        return def;

    if (def ? std::tolower(result[0]) != 'n' : std::tolower(result[0]) != 'y')
        return def;

    return !def;
}

#endif  // !_UTIL_HPP_
