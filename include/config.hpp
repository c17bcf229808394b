#ifndef _CONFIG_HPP_
#define _CONFIG_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>

#include "toml++/toml.hpp"
#include "util.hpp"

enum types
{
    TYPE_STR,
    TYPE_BOOL,
    TYPE_INT
};

struct override_configs_types
{
    types       value_type;
    std::string string_value = "";
    bool        bool_value   = false;
    int64_t     int_value    = 0;
};

class Config
{
public:
    // Create .config directories and files and load the config file (args or default)
    Config(const std::string& configFile, const std::string& configDir);

    // Variables of config file in [default] table
    struct
    {
        int64_t     max_history        = 500;
        int64_t     max_content_length = 50000;
        int64_t     max_image_bytes    = 5 * 1024 * 1024;
        int64_t     expire_days        = 30;
        std::string db_path;
        std::string hotkey         = "ctrl+shift+v";
        std::string picker_command = "rofi -dmenu -i -p clipkeep";
        int64_t     picker_limit   = 100;
        bool        notify         = true;
    } File;

    struct
    {
        int64_t paste_delay_ms     = 150;
        int64_t clipboard_retries  = 3;
        int64_t clipboard_retry_ms = 50;
        int64_t suppress_window_ms = 1500;
    } Timing;

    // Set from the command line, never from the file
    struct
    {
        bool debug_print = false;
    } Runtime;

    std::unordered_map<std::string, override_configs_types> overrides;

    /**
     * Load config file and parse every config variables
     * @param filename The config file path
     */
    void LoadConfigFile(const std::string& filename);

    /**
     * Generate a config file
     * @param filename The config file path
     */
    void GenerateConfig(const std::string& filename);

    /**
     * Override a config value from --override
     * @param str The value to override.
     *            Must have a '=' for separating the name and value to override.
     *            NO spaces between
     */
    void OverrideOption(const std::string& opt);

    // db-path with ~/$VAR expanded, or the default under the data dir
    std::string GetDatabasePath() const;

private:
    // Parsed config from LoadConfigFile()
    toml::table m_tbl;

    /**
     * Get value of config variables
     * @param value The config variable "path" (e.g "default.max-history")
     * @param fallback Default value if couldn't retrive value
     */
    template <typename T>
    T getValue(const std::string_view value, const T&& fallback, bool dont_expand_var = false) const
    {
        const auto& overridePos = overrides.find(value.data());

        // user wants a bool (overridable), we found an override matching the name, and the override is a bool.
        if constexpr (std::is_same<T, bool>())
            if (overridePos != overrides.end() && overridePos->second.value_type == TYPE_BOOL)
                return overridePos->second.bool_value;

        // user wants a str (overridable), we found an override matching the name, and the override is a str.
        if constexpr (std::is_same<T, std::string>())
            if (overridePos != overrides.end() && overridePos->second.value_type == TYPE_STR)
                return overridePos->second.string_value;

        if constexpr (std::is_same<T, int64_t>())
            if (overridePos != overrides.end() && overridePos->second.value_type == TYPE_INT)
                return overridePos->second.int_value;

        const std::optional<T> ret = this->m_tbl.at_path(value).value<T>();
        if constexpr (toml::is_string<T>)  // if we want to get a value that's a string
            return ret ? expandVar(ret.value(), dont_expand_var) : expandVar(fallback, dont_expand_var);
        else
            return ret.value_or(fallback);
    }
};

extern std::unique_ptr<Config> g_config;

// default config
inline constexpr std::string_view AUTOCONFIG = R"#([default]
# Maximum number of entries kept in the history.
# Pinned entries are never evicted, so the history may grow past
# this number when every entry is pinned.
max-history = 500

# Text longer than this (in bytes) is truncated before being stored.
max-content-length = 50000

# Images bigger than this (in bytes, PNG encoded) are not recorded.
max-image-bytes = 5242880

# Unpinned entries older than this many days are deleted.
# 0 disables expiration.
expire-days = 30

# Path to the history database.
# Empty means $XDG_DATA_HOME/clipkeep/history.db
db-path = ""

# Global key combination that opens the history picker (X11 only).
# On Wayland bind "clipkeep --show" in your compositor instead.
hotkey = "ctrl+shift+v"

# dmenu compatible command used to pick an entry.
# It reads one entry per line from stdin and prints the chosen line.
picker-command = "rofi -dmenu -i -p clipkeep"

# Maximum number of entries handed to the picker.
picker-limit = 100

# Show a desktop notification (notify-send) when a paste fails.
notify = true

[timing]
# Milliseconds to wait after focusing the target window before pasting.
paste-delay-ms = 150

# How many times to try writing the clipboard when it's busy,
# and the initial wait between tries (doubles each time).
clipboard-retries = 3
clipboard-retry-ms = 50

# Milliseconds during which our own clipboard write is not recorded again.
suppress-window-ms = 1500
)#";

inline constexpr std::string_view clipkeep_help = (R"(Usage: clipkeep [OPTIONS]...
Clipboard history daemon. Records every text or image you copy and pastes old entries back.
Without options it starts the daemon (only one instance can run at a time).

GENERAL OPTIONS:
    -h, --help                  Print this help menu.
    -V, --version               Print version and other infos about the build.
    -C, --config <PATH>         Path to the config file to use (default: ~/.config/clipkeep/config.toml).
    -O, --override <NAME=VALUE> Override a config value (e.g "default.max-history=100").
    --debug                     Print debug messages.

    --gen-config [<PATH>]       Generate default config file. If PATH is omitted, saves to default location.
                                Prompts before overwriting.

DAEMON CONTROL:
    -s, --show                  Open the history picker of the running daemon.
    -l, --list [<FILTER>]       Print the history, optionally only entries containing FILTER (case-insensitive).
    -p, --pin <ID>              Pin an entry so it's never evicted.
    -u, --unpin <ID>            Unpin an entry.
    -d, --delete <ID>           Delete an entry.
    --clear                     Delete every entry that isn't pinned.
    -q, --quit                  Stop the running daemon.
)");

#endif  // !_CONFIG_HPP_
