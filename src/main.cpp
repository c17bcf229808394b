#include <getopt.h>
#include <pthread.h>
#include <unistd.h>

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

#include "change_notifier.hpp"
#include "clipboard.hpp"
#include "clipboard_watcher.hpp"
#include "config.hpp"
#include "daemon.hpp"
#include "echo_suppressor.hpp"
#include "history_store.hpp"
#include "hotkey_source.hpp"
#include "hotkey_watcher.hpp"
#include "paste_engine.hpp"
#include "picker.hpp"
#include "socket.hpp"
#include "sqlite_backend.hpp"
#include "util.hpp"
#include "window_system.hpp"

#ifndef VERSION
#  define VERSION "unknown"
#endif

// clang-format off
// https://cfengine.com/blog/2021/optional-arguments-with-getopt-long/
// because "--opt-arg arg" won't work
// but "--opt-arg=arg" will
#define OPTIONAL_ARGUMENT_IS_PRESENT \
    ((optarg == NULL && optind < argc && argv[optind][0] != '-') \
     ? (bool) (optarg = argv[optind++]) \
     : (optarg != NULL))
// clang-format on

// Extern variables declariaions
std::unique_ptr<Config> g_config;

// Long-only options
enum
{
    OPT_DEBUG = 0x100,
    OPT_GEN_CONFIG,
    OPT_CLEAR,
};

// Print the version and some other infos, then exit successfully
static void version()
{
    fmt::print("clipkeep {}\n", VERSION);

    // if only everyone would not return error when querying the program version :(
    std::exit(EXIT_SUCCESS);
}

// Print the args help menu, then exit with code depending if it's from invalid or -h arg
static void help(bool invalid_opt = false)
{
    fmt::print("{}\n", clipkeep_help);
    std::exit(invalid_opt);
}

// clang-format off
// parseargs() but only for parsing the user config path trough args
// and so we can directly construct Config
static fs::path parse_config_path(int argc, char* argv[], const fs::path& configDir)
{
    int opt = 0;
    int option_index = 0;
    opterr = 0;
    const char *optstring = "-C:";
    static const struct option opts[] = {
        {"config", required_argument, 0, 'C'},
        {0,0,0,0}
    };

    while ((opt = getopt_long(argc, argv, optstring, opts, &option_index)) != -1)
    {
        switch (opt)
        {
            // skip errors or anything else
            case 0:
            case '?':
                break;

            case 'C':
                if (!fs::exists(optarg))
                    die(_("config file '{}' doesn't exist"), optarg);
                return optarg;
        }
    }

    return configDir / "config.toml";
}

static bool parseargs(int argc, char* argv[], const fs::path& configFile, std::optional<ipc_message_t>& request)
{
    int opt = 0;
    int option_index = 0;
    opterr = 1; // re-enable since before we disabled for "invalid option" error
    const char *optstring = "-Vhsl::p:u:d:qC:O:";
    static const struct option opts[] = {
        {"version",  no_argument,       0, 'V'},
        {"help",     no_argument,       0, 'h'},
        {"show",     no_argument,       0, 's'},
        {"list",     optional_argument, 0, 'l'},
        {"pin",      required_argument, 0, 'p'},
        {"unpin",    required_argument, 0, 'u'},
        {"delete",   required_argument, 0, 'd'},
        {"quit",     no_argument,       0, 'q'},
        {"config",   required_argument, 0, 'C'},
        {"override", required_argument, 0, 'O'},

        {"debug",      no_argument,       0, OPT_DEBUG},
        {"clear",      no_argument,       0, OPT_CLEAR},
        {"gen-config", optional_argument, 0, OPT_GEN_CONFIG},

        {0,0,0,0}
    };

    /* parse operation */
    optind = 1;
    while ((opt = getopt_long(argc, argv, optstring, opts, &option_index)) != -1)
    {
        switch (opt)
        {
            case 0:
            case 'C':
                break;
            case '?':
                help(EXIT_FAILURE); break;

            case 'V':
                version(); break;
            case 'h':
                help(); break;
            case 'O':
                g_config->OverrideOption(optarg); break;
            case OPT_DEBUG:
                g_config->Runtime.debug_print = true; break;

            case 's':
                request = ipc_message_t{ IpcType::Show, "" }; break;
            case 'l':
                request = ipc_message_t{ IpcType::List, OPTIONAL_ARGUMENT_IS_PRESENT ? optarg : "" }; break;
            case 'p':
                request = ipc_message_t{ IpcType::Pin, optarg }; break;
            case 'u':
                request = ipc_message_t{ IpcType::Unpin, optarg }; break;
            case 'd':
                request = ipc_message_t{ IpcType::Delete, optarg }; break;
            case 'q':
                request = ipc_message_t{ IpcType::Quit, "" }; break;
            case OPT_CLEAR:
                request = ipc_message_t{ IpcType::Clear, "" }; break;

            case OPT_GEN_CONFIG:
                if (OPTIONAL_ARGUMENT_IS_PRESENT)
                    g_config->GenerateConfig(optarg);
                else
                    g_config->GenerateConfig(configFile.string());
                exit(EXIT_SUCCESS);

            default:
                return false;
        }
    }

    return true;
}
// clang-format on

// Send one request to the running daemon and print the answer
static int run_client(const ipc_message_t& request)
{
    if (request.type == IpcType::Clear && isatty(STDIN_FILENO) &&
        !askUserYorN(false, _("Delete every entry that isn't pinned?")))
        return EXIT_SUCCESS;

    SocketSender sender;
    if (!sender.Start(default_socket_path()))
    {
        error(_("clipkeep is not running"));
        return EXIT_FAILURE;
    }

    if (!sender.Send(request.type, request.payload))
    {
        error(_("Failed to send the request to clipkeep"));
        return EXIT_FAILURE;
    }

    const Result<ipc_message_t>& reply = sender.Receive();
    if (!reply.ok())
    {
        error(_("No answer from clipkeep: {}"), reply.error());
        return EXIT_FAILURE;
    }

    if (reply.get().type != IpcType::Ok)
    {
        error("{}", reply.get().payload);
        return EXIT_FAILURE;
    }

    if (request.type == IpcType::List)
        fmt::print("{}", reply.get().payload);
    else if (request.type == IpcType::Clear)
        info(_("Deleted {} entries"), reply.get().payload);

    return EXIT_SUCCESS;
}

static std::unique_ptr<StorageBackend> open_storage()
{
    const std::string& path = g_config->GetDatabasePath();

    auto res = SqliteBackend::Open(path);
    if (res.ok())
    {
        debug("history database: {}", path);
        return std::move(res.get());
    }

    error("{}: {}", error_kind_name(res.kind()), res.error());
    warn(_("Keeping the history in memory, it won't be saved this session"));
    return std::make_unique<MemoryBackend>();
}

static int run_daemon()
{
    // only the signal thread gets them, every thread spawned from here inherits the mask
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    sigaddset(&sigs, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    // a picker or wl-copy that exits before reading its stdin must not kill us
    std::signal(SIGPIPE, SIG_IGN);

    const SessionType session = get_session_type();
    if (session == UNKNOWN)
        die(_("Couldn't detect a Wayland or X11 session"));

    // every X11 component runs on its own thread
    if (session == X11)
        init_x11_threads();

    // bad config must fail before anything holds the socket or the database
    const Result<std::optional<hotkey_combo_t>>& hotkey = daemon_hotkey(session, g_config->File.hotkey);
    if (!hotkey.ok())
        die(_("default.hotkey: {}"), hotkey.error());
    const std::optional<hotkey_combo_t>& combo = hotkey.get();

    InstanceLock lock(default_socket_path());
    {
        const Result<LockStatus>& res = lock.Acquire();
        if (!res.ok())
            die(_("Failed to create the instance socket: {}"), res.error());
        if (res.get() == LockStatus::AlreadyRunning)
        {
            error(_("clipkeep is already running"));
            return EXIT_FAILURE;
        }
    }

    HistoryStore store(open_storage(),
                       static_cast<size_t>(g_config->File.max_history),
                       std::chrono::hours(std::max<int64_t>(0, g_config->File.expire_days) * 24));

    Clipboard clipboard(session);

    std::unique_ptr<WindowSystem> windows;
    {
        auto res = make_window_system(session);
        if (!res.ok())
        {
            error("{}", res.error());
            return EXIT_FAILURE;
        }
        windows = std::move(res.get());
    }

    EchoSuppressor suppressor(std::chrono::milliseconds(g_config->Timing.suppress_window_ms));

    paste_options_t paste_opts;
    paste_opts.clipboard_retries     = static_cast<int>(g_config->Timing.clipboard_retries);
    paste_opts.clipboard_retry_delay = std::chrono::milliseconds(g_config->Timing.clipboard_retry_ms);
    paste_opts.paste_delay           = std::chrono::milliseconds(g_config->Timing.paste_delay_ms);
    PasteEngine paste(clipboard, *windows, suppressor, paste_opts);

    MenuPicker picker(g_config->File.picker_command);

    daemon_options_t daemon_opts;
    daemon_opts.picker_limit = static_cast<size_t>(std::max<int64_t>(0, g_config->File.picker_limit));
    daemon_opts.notify       = g_config->File.notify;
    Daemon daemon(store, *windows, paste, picker, daemon_opts);

    watcher_limits_t limits;
    limits.max_content_length = static_cast<size_t>(g_config->File.max_content_length);
    limits.max_image_bytes    = static_cast<size_t>(std::max<int64_t>(0, g_config->File.max_image_bytes));

    std::unique_ptr<ChangeNotifier> notifier = make_change_notifier(session);
    ClipboardWatcher                clip_watcher(*notifier, clipboard, suppressor, limits);
    clip_watcher.SetOnChange([&](const clip_content_t& content) { daemon.OnClipboardChange(content); });
    if (const Result<>& res = clip_watcher.Start(); !res.ok())
    {
        error("{}", res.error());
        return EXIT_FAILURE;
    }

    std::unique_ptr<HotkeySource>  hotkey_source;
    std::unique_ptr<HotkeyWatcher> hotkey_watcher;
    if (combo)
    {
        hotkey_source  = make_x11_hotkey_source();
        hotkey_watcher = std::make_unique<HotkeyWatcher>(*hotkey_source, *windows, *combo);
        hotkey_watcher->SetOnActivate([&](window_handle_t target) { daemon.RequestShow(target); });
        if (const Result<>& res = hotkey_watcher->Start(); !res.ok())
            warn(_("{}, bind 'clipkeep --show' to a key instead"), res.error());
    }
    else
    {
        info(_("Global hotkeys belong to the Wayland compositor, bind 'clipkeep --show' to a key"));
    }

    IpcServer server(lock, [&](const ipc_message_t& req) { return daemon.HandleRequest(req); });
    server.Start();

    std::thread signal_thread([&] {
        int sig = 0;
        if (sigwait(&sigs, &sig) == 0 && !daemon.QuitRequested())
            info(_("Received signal {}, quitting"), sig);
        daemon.RequestQuit();
    });

    info(_("clipkeep {} is running"), VERSION);
    daemon.Run();

    // Quitted, unblock the signal thread if it's still waiting
    pthread_kill(signal_thread.native_handle(), SIGTERM);
    signal_thread.join();

    server.Stop();
    if (hotkey_watcher)
        hotkey_watcher->Stop();
    clip_watcher.Stop();
    store.Close();

    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    const std::string& configDir  = get_config_dir().string();
    const std::string& configFile = parse_config_path(argc, argv, configDir).string();

    std::optional<ipc_message_t> request;

    g_config = std::make_unique<Config>(configFile, configDir);
    if (!parseargs(argc, argv, configFile, request))
        return EXIT_FAILURE;

    g_config->LoadConfigFile(configFile);
    g_debug_print.store(g_config->Runtime.debug_print);

    if (request)
        return run_client(*request);

    return run_daemon();
}
