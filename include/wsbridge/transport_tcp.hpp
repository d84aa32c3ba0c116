// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <wsbridge/transport.hpp>

namespace wsbridge
{

// =============================================================================
// TCP Transport
// =============================================================================

/// Transport that communicates over a connected TCP socket
class TcpTransport : public ITransport
{
  public:
    using Socket = int;
    static constexpr Socket kInvalidSocket = -1;

    /// Construct an unconnected transport
    TcpTransport() : socket_(kInvalidSocket), open_(false) {}

    /// Take ownership of an already connected socket (e.g. from accept())
    explicit TcpTransport(Socket socket) : socket_(socket), open_(socket != kInvalidSocket) {}

    ~TcpTransport() override
    {
        close();
    }

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;
    TcpTransport(TcpTransport&&) = delete;
    TcpTransport& operator=(TcpTransport&&) = delete;

    /// Connect to a host:port
    /// @param timeout_ms Connection timeout in milliseconds (0 = no timeout)
    /// @throws TransportError on connection failure
    void connect(const std::string& host, int port, int timeout_ms = 30000);

    size_t read(char* buffer, size_t size) override;
    void write(const char* data, size_t size) override;
    using ITransport::write;

    /// Shut the socket down; a blocked read() on another thread returns EOF
    void close() override;

    bool is_open() const override
    {
        return open_;
    }

  private:
    std::atomic<Socket> socket_;
    std::atomic<bool> open_;
};

// =============================================================================
// TCP Listener
// =============================================================================

/// Listening socket that hands out accepted connections as TcpTransports
class TcpListener
{
  public:
    TcpListener() = default;
    ~TcpListener()
    {
        close();
    }

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    /// Bind and listen
    /// @param port Port to bind, 0 picks an ephemeral port (see port())
    /// @throws TransportError on failure
    void listen(const std::string& host, int port, int backlog = 16);

    /// Block until a client connects
    /// @return The connection, or nullptr once the listener has been closed
    /// @throws TransportError on accept failure
    std::unique_ptr<TcpTransport> accept();

    /// Stop listening; unblocks a pending accept()
    void close();

    bool is_listening() const
    {
        return socket_ != TcpTransport::kInvalidSocket;
    }

    /// Bound port (useful after listening on port 0)
    int port() const
    {
        return port_;
    }

  private:
    std::atomic<TcpTransport::Socket> socket_{TcpTransport::kInvalidSocket};
    int port_ = 0;
};

} // namespace wsbridge
