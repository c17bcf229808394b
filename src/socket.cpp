#include "socket.hpp"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <exception>

static bool send_all(int fd, const char* buf, size_t size)
{
    size_t sent = 0;
    while (sent < size)
    {
        const size_t  remaining = size - sent;
        const ssize_t n         = ::send(fd, buf + sent, std::min(remaining, static_cast<size_t>(INT_MAX)), MSG_NOSIGNAL);
        if (n <= 0)
        {
            if (n < 0 && errno == EINTR)
                continue;
            return false;
        }

        sent += static_cast<size_t>(n);
    }
    return true;
}

static bool recv_all(int fd, void* dst, size_t n)
{
    uint8_t* p = static_cast<uint8_t*>(dst);
    while (n)
    {
        const ssize_t r = ::recv(fd, p, n, 0);
        if (r < 0 && errno == EINTR)
            continue;
        if (r <= 0)
            return false;
        p += static_cast<size_t>(r);
        n -= static_cast<size_t>(r);
    }
    return true;
}

static bool fill_addr(sockaddr_un& addr, const std::string& path)
{
    addr            = {};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path))
        return false;

    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return true;
}

std::string default_socket_path()
{
    const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
    if (runtime_dir && runtime_dir[0] != '\0')
        return fmt::format("{}/clipkeep.sock", runtime_dir);
    return fmt::format("/tmp/clipkeep-{}.sock", getuid());
}

bool send_message(int fd, IpcType type, const std::string_view payload)
{
    if (payload.size() > IPC_MAX_PAYLOAD)
        return false;

    char header[5];
    header[0] = static_cast<char>(type);

    const uint32_t net_len = htonl(static_cast<uint32_t>(payload.size()));  // network byte order
    std::memcpy(header + 1, &net_len, sizeof(net_len));

    return send_all(fd, header, sizeof(header)) && send_all(fd, payload.data(), payload.size());
}

Result<ipc_message_t> recv_message(int fd)
{
    char     type    = 0;
    uint32_t net_len = 0;
    if (!recv_all(fd, &type, 1) || !recv_all(fd, &net_len, sizeof(net_len)))
        return Err("connection closed before the message header");

    const uint32_t len = ntohl(net_len);
    if (len > IPC_MAX_PAYLOAD)
        return Err(fmt::format("message of {} bytes is too big", len));

    ipc_message_t msg;
    msg.type = static_cast<IpcType>(type);
    msg.payload.resize(len);
    if (len > 0 && !recv_all(fd, msg.payload.data(), len))
        return Err("connection closed in the middle of the message");

    return msg;
}

Result<LockStatus> InstanceLock::Acquire()
{
    if (m_fd >= 0)
        return LockStatus::Proceed;

    sockaddr_un addr;
    if (!fill_addr(addr, m_path))
        return Err(fmt::format("socket path '{}' is too long", m_path));

    for (int attempt = 0; attempt < 2; ++attempt)
    {
        const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0)
            return Err(fmt::format("socket() failed: {}", std::strerror(errno)));

        if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0)
        {
            ::chmod(m_path.c_str(), 0600);
            if (::listen(fd, 8) < 0)
            {
                const int err = errno;
                ::close(fd);
                ::unlink(m_path.c_str());
                return Err(fmt::format("listen() failed: {}", std::strerror(err)));
            }

            m_fd = fd;
            return LockStatus::Proceed;
        }

        const int bind_err = errno;
        if (bind_err != EADDRINUSE)
        {
            ::close(fd);
            return Err(fmt::format("bind('{}') failed: {}", m_path, std::strerror(bind_err)));
        }

        // someone answering on it means the daemon is up
        const bool alive = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
        ::close(fd);
        if (alive)
            return LockStatus::AlreadyRunning;

        debug("removing stale socket {}", m_path);
        ::unlink(m_path.c_str());
    }

    return Err(fmt::format("couldn't take over the stale socket '{}'", m_path));
}

void InstanceLock::Release()
{
    if (m_fd < 0)
        return;

    ::close(m_fd);
    ::unlink(m_path.c_str());
    m_fd = -1;
}

bool SocketSender::Start(const std::string& path)
{
    sockaddr_un addr;
    if (!fill_addr(addr, path))
        return false;

    m_sock = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (m_sock < 0)
        return false;

    m_failed = (::connect(m_sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0);
    if (m_failed)
        debug("connect('{}') failed: {}", path, std::strerror(errno));

    return !m_failed;
}

bool SocketSender::Send(IpcType type, const std::string_view payload)
{
    if (m_sock < 0 || m_failed)
        return false;
    return send_message(m_sock, type, payload);
}

Result<ipc_message_t> SocketSender::Receive()
{
    if (m_sock < 0 || m_failed)
        return Err("not connected");
    return recv_message(m_sock);
}

void SocketSender::Close()
{
    if (m_sock >= 0)
    {
        ::close(m_sock);
        m_sock = -1;
    }
}

void IpcServer::Start()
{
    if (m_thread.joinable())
        return;

    m_quit.store(false);
    m_thread = std::thread(&IpcServer::Run, this);
}

void IpcServer::Stop()
{
    if (!m_thread.joinable())
        return;

    // wakes up the accept()
    m_quit.store(true);
    ::shutdown(m_lock.fd(), SHUT_RDWR);
    m_thread.join();
}

void IpcServer::Run()
{
    while (!m_quit.load())
    {
        const int client = ::accept4(m_lock.fd(), nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0)
        {
            if (m_quit.load())
                break;
            if (errno != EINTR && errno != ECONNABORTED)
            {
                error(_("accept() failed: {}"), std::strerror(errno));
                break;
            }
            continue;
        }

        // a client that never finishes its request can't hang us
        const timeval timeout{ 5, 0 };
        ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        ::setsockopt(client, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

        const Result<ipc_message_t>& req = recv_message(client);
        if (!req.ok())
        {
            debug("dropping bad request: {}", req.error());
            ::close(client);
            continue;
        }

        ipc_message_t reply;
        try
        {
            reply = m_handler(req.get());
        }
        catch (const std::exception& e)
        {
            reply = { IpcType::Error, e.what() };
        }

        if (!send_message(client, reply.type, reply.payload))
            debug("failed to send the reply: {}", std::strerror(errno));

        ::close(client);
    }
}
