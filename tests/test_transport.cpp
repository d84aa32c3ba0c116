// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <chrono>
#include <fcntl.h>
#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include <unistd.h>
#include <wsbridge/transport.hpp>
#include <wsbridge/transport_stdio.hpp>
#include <wsbridge/transport_tcp.hpp>

#include "test_fakes.hpp"

using namespace wsbridge;
using wsbridge::testing::MockTransport;

namespace
{

/// Socket descriptors of this process that would survive exec()
std::vector<int> inheritable_sockets()
{
    std::vector<int> fds;
    for (const auto& entry : std::filesystem::directory_iterator("/proc/self/fd"))
    {
        std::error_code ec;
        auto target = std::filesystem::read_symlink(entry.path(), ec);
        if (ec || target.string().rfind("socket:", 0) != 0)
            continue;
        int fd = std::stoi(entry.path().filename().string());
        int flags = ::fcntl(fd, F_GETFD);
        if (flags >= 0 && (flags & FD_CLOEXEC) == 0)
            fds.push_back(fd);
    }
    return fds;
}

} // namespace

// =============================================================================
// MessageFramer Tests
// =============================================================================

TEST(MessageFramerTest, ReadSimpleMessage)
{
    MockTransport transport;
    MessageFramer framer(transport);

    std::string message = R"({"jsonrpc":"2.0","method":"getContext","id":1})";
    transport.queue_frame(message);

    EXPECT_EQ(framer.read_message(), message);
}

TEST(MessageFramerTest, IgnoresOtherHeadersAndCase)
{
    MockTransport transport;
    MessageFramer framer(transport);

    std::string message = R"({"id":1})";
    transport.queue_read_data(
        "Content-Type: application/vscode-jsonrpc; charset=utf-8\r\n"
        "content-length:   " +
        std::to_string(message.size()) + "\r\n\r\n" + message
    );

    EXPECT_EQ(framer.read_message(), message);
}

TEST(MessageFramerTest, ReadBackToBackMessages)
{
    MockTransport transport;
    MessageFramer framer(transport);

    transport.queue_frame(R"({"id":1})");
    transport.queue_frame(R"({"id":2})");
    transport.queue_frame(R"({"id":3})");

    EXPECT_EQ(framer.read_message(), R"({"id":1})");
    EXPECT_EQ(framer.read_message(), R"({"id":2})");
    EXPECT_EQ(framer.read_message(), R"({"id":3})");
}

TEST(MessageFramerTest, BodyLargerThanReadBuffer)
{
    MockTransport transport;
    MessageFramer framer(transport);

    std::string message(100000, 'x');
    transport.queue_frame(message);

    EXPECT_EQ(framer.read_message(), message);
}

TEST(MessageFramerTest, UnixLineEndingsAndStrayBlankLines)
{
    MockTransport transport;
    MessageFramer framer(transport);

    transport.queue_read_data("\r\n\nContent-Length: 2\n\n{}");

    EXPECT_EQ(framer.read_message(), "{}");
}

TEST(MessageFramerTest, WriteMessage)
{
    MockTransport transport;
    MessageFramer framer(transport);

    framer.write_message(R"({"result":{}})");

    EXPECT_EQ(transport.get_written_data(), "Content-Length: 13\r\n\r\n{\"result\":{}}");
}

TEST(MessageFramerTest, MissingContentLength)
{
    MockTransport transport;
    MessageFramer framer(transport);

    transport.queue_read_data("Content-Type: application/json\r\n\r\n{}");

    EXPECT_THROW(framer.read_message(), TransportError);
}

TEST(MessageFramerTest, MalformedHeaderLine)
{
    MockTransport transport;
    MessageFramer framer(transport);

    transport.queue_read_data("{\"jsonrpc\":\"2.0\"}\r\n\r\n");

    EXPECT_THROW(framer.read_message(), TransportError);
}

TEST(MessageFramerTest, InvalidContentLength)
{
    MockTransport transport;
    MessageFramer framer(transport);

    transport.queue_read_data("Content-Length: -5\r\n\r\n");

    EXPECT_THROW(framer.read_message(), TransportError);
}

TEST(MessageFramerTest, MessageOverLimitIsRejected)
{
    MockTransport transport;
    MessageFramer framer(transport, 16);

    transport.queue_frame(std::string(17, 'a'));

    EXPECT_THROW(framer.read_message(), TransportError);
}

TEST(MessageFramerTest, EofBeforeAnyHeader)
{
    MockTransport transport;
    MessageFramer framer(transport);

    EXPECT_THROW(framer.read_message(), ConnectionClosedError);
}

TEST(MessageFramerTest, EofDuringBody)
{
    MockTransport transport;
    MessageFramer framer(transport);

    transport.queue_read_data("Content-Length: 100\r\n\r\n{\"partial\":");

    EXPECT_THROW(framer.read_message(), ConnectionClosedError);
}

TEST(MessageFramerTest, EmptyBody)
{
    MockTransport transport;
    MessageFramer framer(transport);

    transport.queue_read_data("Content-Length: 0\r\n\r\n");

    EXPECT_EQ(framer.read_message(), "");
}

// =============================================================================
// StdioTransport Tests
// =============================================================================

TEST(StdioTransportTest, FramesOverPipes)
{
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);

    StdioTransport writer(StdioTransport::invalid_handle(), fds[1]);
    StdioTransport reader(fds[0], StdioTransport::invalid_handle());

    MessageFramer writer_framer(writer);
    writer_framer.write_message(R"({"id":"pipe"})");
    writer.close();

    MessageFramer framer(reader);
    EXPECT_EQ(framer.read_message(), R"({"id":"pipe"})");
    EXPECT_THROW(framer.read_message(), ConnectionClosedError);
}

TEST(StdioTransportTest, WriteAfterCloseThrows)
{
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);

    StdioTransport transport(fds[0], fds[1]);
    transport.close();

    EXPECT_FALSE(transport.is_open());
    EXPECT_THROW(transport.write("x"), ConnectionClosedError);
}

// =============================================================================
// TCP Tests
// =============================================================================

TEST(TcpTransportTest, DefaultConstructionIsClosed)
{
    TcpTransport transport;
    EXPECT_FALSE(transport.is_open());

    char buffer[4];
    EXPECT_THROW(transport.read(buffer, sizeof(buffer)), ConnectionClosedError);
    EXPECT_THROW(transport.write("x"), ConnectionClosedError);
}

TEST(TcpTransportTest, ConnectToClosedPortFails)
{
    TcpListener listener;
    listener.listen("127.0.0.1", 0);
    int port = listener.port();
    listener.close();

    TcpTransport transport;
    EXPECT_THROW(transport.connect("127.0.0.1", port, 2000), TransportError);
}

TEST(TcpListenerTest, EphemeralPortIsReported)
{
    TcpListener listener;
    listener.listen("127.0.0.1", 0);

    EXPECT_TRUE(listener.is_listening());
    EXPECT_GT(listener.port(), 0);

    listener.close();
    EXPECT_FALSE(listener.is_listening());
}

TEST(TcpListenerTest, LoopbackExchange)
{
    TcpListener listener;
    listener.listen("127.0.0.1", 0);

    std::string received;
    std::thread server(
        [&]
        {
            auto connection = listener.accept();
            ASSERT_TRUE(connection != nullptr);
            MessageFramer framer(*connection);
            received = framer.read_message();
            framer.write_message(R"({"ok":true})");
        }
    );

    TcpTransport client;
    client.connect("127.0.0.1", listener.port(), 5000);
    MessageFramer framer(client);
    framer.write_message(R"({"hello":1})");
    std::string reply = framer.read_message();

    server.join();
    EXPECT_EQ(received, R"({"hello":1})");
    EXPECT_EQ(reply, R"({"ok":true})");
}

TEST(TcpListenerTest, CloseUnblocksAccept)
{
    TcpListener listener;
    listener.listen("127.0.0.1", 0);

    std::unique_ptr<TcpTransport> accepted;
    std::thread acceptor([&] { accepted = listener.accept(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    listener.close();
    acceptor.join();

    EXPECT_TRUE(accepted == nullptr);
}

TEST(TcpListenerTest, SocketsAreCloseOnExec)
{
    if (!std::filesystem::exists("/proc/self/fd"))
        GTEST_SKIP() << "/proc is not mounted";

    TcpListener listener;
    listener.listen("127.0.0.1", 0);

    std::unique_ptr<TcpTransport> accepted;
    std::thread acceptor([&] { accepted = listener.accept(); });

    TcpTransport client;
    client.connect("127.0.0.1", listener.port(), 5000);
    acceptor.join();
    ASSERT_TRUE(accepted != nullptr);

    EXPECT_TRUE(inheritable_sockets().empty());
}
