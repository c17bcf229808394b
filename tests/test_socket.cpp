#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <atomic>
#include <cstring>
#include <stdexcept>

#include "socket.hpp"

class SocketTest : public ::testing::Test
{
protected:
    std::string path;

    void SetUp() override
    {
        static std::atomic<int> counter{ 0 };
        path = fmt::format("/tmp/clipkeep-test-{}-{}.sock", getpid(), counter++);
        ::unlink(path.c_str());
    }

    void TearDown() override { ::unlink(path.c_str()); }

    // What a crashed daemon leaves behind: the socket file, nobody listening
    void LeaveStaleSocket()
    {
        const int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
        ASSERT_GE(fd, 0);

        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
        ::close(fd);
        ASSERT_TRUE(fs::exists(path));
    }
};

// ============================================================================
// Framing
// ============================================================================

TEST_F(SocketTest, MessageFraming)
{
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);

    ASSERT_TRUE(send_message(fds[0], IpcType::List, "filter"));
    ASSERT_TRUE(send_message(fds[0], IpcType::Clear, ""));

    const auto& first = recv_message(fds[1]);
    ASSERT_TRUE(first.ok()) << first.error();
    EXPECT_EQ(first.get().type, IpcType::List);
    EXPECT_EQ(first.get().payload, "filter");

    const auto& second = recv_message(fds[1]);
    ASSERT_TRUE(second.ok()) << second.error();
    EXPECT_EQ(second.get().type, IpcType::Clear);
    EXPECT_TRUE(second.get().payload.empty());

    ::close(fds[0]);
    ::close(fds[1]);
}

TEST_F(SocketTest, HeaderIsTypeAndBigEndianLength)
{
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);

    ASSERT_TRUE(send_message(fds[0], IpcType::Pin, "1234"));

    char buf[9];
    ASSERT_EQ(::recv(fds[1], buf, sizeof(buf), MSG_WAITALL), 9);
    EXPECT_EQ(buf[0], 'P');
    EXPECT_EQ(std::string(buf + 1, 4), std::string("\0\0\0\x04", 4));
    EXPECT_EQ(std::string(buf + 5, 4), "1234");

    ::close(fds[0]);
    ::close(fds[1]);
}

TEST_F(SocketTest, OversizedLengthIsRejected)
{
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);

    char           header[5] = { 'L' };
    const uint32_t len       = htonl(IPC_MAX_PAYLOAD + 1);
    std::memcpy(header + 1, &len, sizeof(len));
    ASSERT_EQ(::send(fds[0], header, sizeof(header), 0), 5);

    EXPECT_FALSE(recv_message(fds[1]).ok());

    ::close(fds[0]);
    ::close(fds[1]);
}

TEST_F(SocketTest, TruncatedMessageIsAnError)
{
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);

    char           header[5] = { 'L' };
    const uint32_t len       = htonl(10);
    std::memcpy(header + 1, &len, sizeof(len));
    ASSERT_EQ(::send(fds[0], header, sizeof(header), 0), 5);
    ASSERT_EQ(::send(fds[0], "abc", 3, 0), 3);
    ::close(fds[0]);

    EXPECT_FALSE(recv_message(fds[1]).ok());
    ::close(fds[1]);
}

// ============================================================================
// Single instance
// ============================================================================

TEST_F(SocketTest, FirstInstanceProceeds)
{
    InstanceLock lock(path);

    const auto& res = lock.Acquire();
    ASSERT_TRUE(res.ok()) << res.error();
    EXPECT_EQ(res.get(), LockStatus::Proceed);
    EXPECT_GE(lock.fd(), 0);
}

TEST_F(SocketTest, SecondInstanceSeesTheFirst)
{
    InstanceLock first(path);
    ASSERT_EQ(first.Acquire().get(), LockStatus::Proceed);

    InstanceLock second(path);
    const auto&  res = second.Acquire();
    ASSERT_TRUE(res.ok()) << res.error();
    EXPECT_EQ(res.get(), LockStatus::AlreadyRunning);
    EXPECT_LT(second.fd(), 0);
}

TEST_F(SocketTest, StaleSocketIsTakenOver)
{
    LeaveStaleSocket();

    InstanceLock lock(path);
    const auto&  res = lock.Acquire();
    ASSERT_TRUE(res.ok()) << res.error();
    EXPECT_EQ(res.get(), LockStatus::Proceed);
}

TEST_F(SocketTest, ReleaseRemovesTheSocket)
{
    {
        InstanceLock lock(path);
        ASSERT_EQ(lock.Acquire().get(), LockStatus::Proceed);
        EXPECT_TRUE(fs::exists(path));
    }
    EXPECT_FALSE(fs::exists(path));

    InstanceLock again(path);
    EXPECT_EQ(again.Acquire().get(), LockStatus::Proceed);
}

TEST_F(SocketTest, TooLongPathIsAnError)
{
    InstanceLock lock("/tmp/" + std::string(200, 'x'));
    EXPECT_FALSE(lock.Acquire().ok());
}

// ============================================================================
// Request and reply
// ============================================================================

TEST_F(SocketTest, ServerAnswersClients)
{
    InstanceLock lock(path);
    ASSERT_EQ(lock.Acquire().get(), LockStatus::Proceed);

    IpcServer server(lock, [](const ipc_message_t& req) -> ipc_message_t {
        if (req.type == IpcType::List)
            return { IpcType::Ok, "entries matching " + req.payload };
        return { IpcType::Error, "nope" };
    });
    server.Start();

    for (int i = 0; i < 3; ++i)
    {
        SocketSender sender;
        ASSERT_TRUE(sender.Start(path));
        ASSERT_TRUE(sender.Send(IpcType::List, "foo"));

        const auto& reply = sender.Receive();
        ASSERT_TRUE(reply.ok()) << reply.error();
        EXPECT_EQ(reply.get().type, IpcType::Ok);
        EXPECT_EQ(reply.get().payload, "entries matching foo");
    }

    SocketSender sender;
    ASSERT_TRUE(sender.Start(path));
    ASSERT_TRUE(sender.Send(IpcType::Quit));
    const auto& reply = sender.Receive();
    ASSERT_TRUE(reply.ok()) << reply.error();
    EXPECT_EQ(reply.get().type, IpcType::Error);

    server.Stop();
}

TEST_F(SocketTest, ThrowingHandlerRepliesWithError)
{
    InstanceLock lock(path);
    ASSERT_EQ(lock.Acquire().get(), LockStatus::Proceed);

    IpcServer server(lock, [](const ipc_message_t&) -> ipc_message_t { throw std::runtime_error("handler blew up"); });
    server.Start();

    SocketSender sender;
    ASSERT_TRUE(sender.Start(path));
    ASSERT_TRUE(sender.Send(IpcType::Show));

    const auto& reply = sender.Receive();
    ASSERT_TRUE(reply.ok()) << reply.error();
    EXPECT_EQ(reply.get().type, IpcType::Error);
    EXPECT_EQ(reply.get().payload, "handler blew up");
}

TEST_F(SocketTest, NoDaemonMeansConnectFails)
{
    SocketSender sender;
    EXPECT_FALSE(sender.Start(path));
    EXPECT_FALSE(sender.Send(IpcType::Show));
}
