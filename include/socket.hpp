#ifndef _SOCKET_HPP_
#define _SOCKET_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <thread>

#include "util.hpp"

/*
 * Wire format, both directions:
 *   1 byte type | 4 bytes payload length (big endian) | payload
 * One request and one reply per connection.
 */
enum class IpcType : char
{
    // requests
    Show   = 'S',
    List   = 'L',  // payload: filter
    Pin    = 'P',  // payload: entry id
    Unpin  = 'U',  // payload: entry id
    Delete = 'D',  // payload: entry id
    Clear  = 'C',
    Quit   = 'Q',

    // replies
    Ok    = 'O',
    Error = 'E',
};

struct ipc_message_t
{
    IpcType     type = IpcType::Ok;
    std::string payload;
};

inline constexpr uint32_t IPC_MAX_PAYLOAD = 16 * 1024 * 1024;

// $XDG_RUNTIME_DIR/clipkeep.sock, or /tmp/clipkeep-<uid>.sock
std::string default_socket_path();

bool                  send_message(int fd, IpcType type, const std::string_view payload);
Result<ipc_message_t> recv_message(int fd);

enum class LockStatus
{
    Proceed,
    AlreadyRunning
};

/*
 * Single instance guard: the daemon owns the listening unix socket.
 * A socket file nobody listens on is left over from a crash and gets replaced.
 */
class InstanceLock
{
public:
    explicit InstanceLock(std::string path) : m_path(std::move(path)) {}
    ~InstanceLock() { Release(); }

    InstanceLock(const InstanceLock&)            = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    Result<LockStatus> Acquire();
    void               Release();

    int                fd() const { return m_fd; }
    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    int         m_fd = -1;
};

// Client side, used by `clipkeep --show` and friends
class SocketSender
{
public:
    ~SocketSender() { Close(); };

    bool                  Start(const std::string& path);
    bool                  Send(IpcType type, const std::string_view payload = {});
    Result<ipc_message_t> Receive();

    void Close();

private:
    int  m_sock = -1;
    bool m_failed{};
};

// Daemon side: answers requests on the instance lock socket from its own thread
class IpcServer
{
public:
    using Handler = std::function<ipc_message_t(const ipc_message_t&)>;

    IpcServer(InstanceLock& lock, Handler handler) : m_lock(lock), m_handler(std::move(handler)) {}
    ~IpcServer() { Stop(); }

    IpcServer(const IpcServer&)            = delete;
    IpcServer& operator=(const IpcServer&) = delete;

    void Start();
    void Stop();

private:
    InstanceLock&     m_lock;
    Handler           m_handler;
    std::thread       m_thread;
    std::atomic<bool> m_quit{ false };

    void Run();
};

#endif  // !_SOCKET_HPP_
