#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include "fmt/format.h"

std::atomic<bool> g_debug_print{ false };

std::string_view error_kind_name(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::StorageUnavailable: return "StorageUnavailable";
        case ErrorKind::ClipboardBusy:      return "ClipboardBusy";
        case ErrorKind::WindowGone:         return "WindowGone";
        case ErrorKind::UnsupportedFormat:  return "UnsupportedFormat";
        default:                            return "Error";
    }
}

SessionType get_session_type()
{
    const char* xdg     = std::getenv("XDG_SESSION_TYPE");
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    const char* x11     = std::getenv("DISPLAY");

    if (xdg && strncmp(xdg, "wayland", 8) == 0)
        return WAYLAND;
    if (wayland && wayland[0] != '\0')
        return WAYLAND;

    if (x11 && x11[0] != '\0')
        return X11;
    if (xdg && strncmp(xdg, "x11", 4) == 0)
        return X11;

    return UNKNOWN;
}

std::string replace_str(std::string str, const std::string_view from, const std::string_view to)
{
    size_t start_pos = 0;
    while ((start_pos = str.find(from, start_pos)) != std::string::npos)
    {
        str.replace(start_pos, from.length(), to);
        start_pos += to.length();  // Handles case where 'to' is a substring of 'from'
    }
    return str;
}

std::string str_tolower(std::string str)
{
    std::transform(
        str.begin(), str.end(), str.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string trim(const std::string_view str)
{
    const size_t start = str.find_first_not_of(" \t\r\n\v\f");
    if (start == std::string_view::npos)
        return {};

    const size_t end = str.find_last_not_of(" \t\r\n\v\f");
    return std::string(str.substr(start, end - start + 1));
}

bool is_blank(const std::string_view str)
{
    return std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string utf8_truncate(const std::string_view str, size_t max_len)
{
    if (str.size() <= max_len)
        return std::string(str);

    size_t len = max_len;
    // back off while we're on a continuation byte (10xxxxxx)
    while (len > 0 && (static_cast<uint8_t>(str[len]) & 0xC0) == 0x80)
        --len;

    return std::string(str.substr(0, len));
}

uint64_t fnv1a64(const std::string_view data)
{
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (const unsigned char c : data)
    {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

std::string fnv1a_hex(const std::string_view data)
{
    return fmt::format("{:016x}", fnv1a64(data));
}

std::string expandVar(std::string ret, bool dont)
{
    if (ret.empty() || dont)
        return ret;

    const char* env;
    if (ret.front() == '~')
    {
        env = std::getenv("HOME");
        if (env == nullptr)
            die(_("FATAL: $HOME enviroment variable is not set (how?)"));

        ret.replace(0, 1, env);  // replace ~ with the $HOME value
    }
    else if (ret.front() == '$')
    {
        ret.erase(0, 1);

        std::string   temp;
        const size_t& pos = ret.find('/');
        if (pos != std::string::npos)
        {
            temp = ret.substr(pos);
            ret.erase(pos);
        }

        env = std::getenv(ret.c_str());
        if (env == nullptr)
            die(_("No such enviroment variable: {}"), ret);

        ret = env;
        ret += temp;
    }

    return ret;
}

static fs::path get_home_dir()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr)
        die(_("Failed to find $HOME, set it to your home directory!"));

    return fs::path(home);
}

fs::path get_home_config_dir()
{
    const char* dir = std::getenv("XDG_CONFIG_HOME");
    if (dir != NULL && dir[0] != '\0' && fs::exists(dir))
        return fs::path(dir);

    return get_home_dir() / ".config";
}

fs::path get_config_dir()
{
    return get_home_config_dir() / "clipkeep";
}

fs::path get_data_dir()
{
    const char* dir = std::getenv("XDG_DATA_HOME");
    if (dir != NULL && dir[0] != '\0')
        return fs::path(dir) / "clipkeep";

    return get_home_dir() / ".local" / "share" / "clipkeep";
}
