#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>

#include "fmt/os.h"
#include "util.hpp"

Config::Config(const std::string& configFile, const std::string& configDir)
{
    if (!fs::exists(configDir))
    {
        warn(_("clipkeep config folder was not found, Creating folders at {}!"), configDir);
        fs::create_directories(configDir);
    }

    if (!fs::exists(configFile))
    {
        warn(_("config file {} not found, generating new one"), configFile);
        GenerateConfig(configFile);
    }
}

void Config::LoadConfigFile(const std::string& filename)
{
    try
    {
        m_tbl = toml::parse_file(filename);
    }
    catch (const toml::parse_error& err)
    {
        die(_("Parsing config file '{}' failed:\n"
              "{}\n"
              "\t(error occurred at line {} column {})"),
            filename,
            err.description(),
            err.source().begin.line,
            err.source().begin.column);
    }

    File.max_history        = getValue<int64_t>("default.max-history", 500);
    File.max_content_length = getValue<int64_t>("default.max-content-length", 50000);
    File.max_image_bytes    = getValue<int64_t>("default.max-image-bytes", 5 * 1024 * 1024);
    File.expire_days        = getValue<int64_t>("default.expire-days", 30);
    File.db_path            = getValue<std::string>("default.db-path", "");
    File.hotkey             = getValue<std::string>("default.hotkey", "ctrl+shift+v", true);
    File.picker_command     = getValue<std::string>("default.picker-command", "rofi -dmenu -i -p clipkeep", true);
    File.picker_limit       = getValue<int64_t>("default.picker-limit", 100);
    File.notify             = getValue<bool>("default.notify", true);

    Timing.paste_delay_ms     = getValue<int64_t>("timing.paste-delay-ms", 150);
    Timing.clipboard_retries  = getValue<int64_t>("timing.clipboard-retries", 3);
    Timing.clipboard_retry_ms = getValue<int64_t>("timing.clipboard-retry-ms", 50);
    Timing.suppress_window_ms = getValue<int64_t>("timing.suppress-window-ms", 1500);

    if (File.max_history < 1)
        die(_("default.max-history must be at least 1 (got {})"), File.max_history);
    if (File.max_content_length < 1)
        die(_("default.max-content-length must be at least 1 (got {})"), File.max_content_length);
    if (Timing.clipboard_retries < 1)
        Timing.clipboard_retries = 1;
}

static bool is_str_digital(const std::string& str)
{
    if (str.empty())
        return false;

    for (size_t i = 0; i < str.size(); ++i)
        if (!(str[i] >= '0' && str[i] <= '9'))
            return false;

    return true;
}

void Config::OverrideOption(const std::string& opt)
{
    const size_t pos = opt.find('=');
    if (pos == std::string::npos)
        die(_("override '{}' does NOT have an equal sign '=' for separating config name and value\n"
              "For more check with --help"),
            opt);

    std::string        name{ opt.substr(0, pos) };
    const std::string& value = opt.substr(pos + 1);

    // usually the user finds incovinient to write "default.foo"
    // for general config options
    if (name.find('.') == name.npos)
        name.insert(0, "default.");

    if (value == "true")
        overrides[name] = { .value_type = TYPE_BOOL, .bool_value = true };
    else if (value == "false")
        overrides[name] = { .value_type = TYPE_BOOL, .bool_value = false };
    else if (value.size() >= 2 &&
             ((value[0] == '"' && value.back() == '"') || (value[0] == '\'' && value.back() == '\'')))
        overrides[name] = { .value_type = TYPE_STR, .string_value = value.substr(1, value.size() - 2) };
    else if (is_str_digital(value))
        overrides[name] = { .value_type = TYPE_INT, .int_value = std::stoll(value) };
    else
        die(_("looks like override value '{}' from '{}' is neither a bool, int or string value"), value, name);
}

void Config::GenerateConfig(const std::string& filename)
{
    if (fs::exists(filename))
    {
        if (!askUserYorN(false, "WARNING: config file '{}' already exists. Do you want to overwrite it?", filename))
            std::exit(1);
    }

    auto f = fmt::output_file(filename.data());
    f.print("{}", AUTOCONFIG);
}

std::string Config::GetDatabasePath() const
{
    if (!File.db_path.empty())
        return File.db_path;

    return (get_data_dir() / "history.db").string();
}
