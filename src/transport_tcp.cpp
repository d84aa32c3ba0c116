// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#include <wsbridge/transport_tcp.hpp>

// MSG_NOSIGNAL doesn't exist on macOS - use SO_NOSIGPIPE socket option instead
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace wsbridge
{

namespace
{

std::string get_socket_error()
{
    return std::strerror(errno);
}

void set_socket_blocking(int sock, bool blocking)
{
    int flags = fcntl(sock, F_GETFL, 0);
    if (blocking)
        fcntl(sock, F_SETFL, flags & ~O_NONBLOCK);
    else
        fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

void set_no_sigpipe(int sock)
{
#if defined(__APPLE__)
    int flag = 1;
    setsockopt(sock, SOL_SOCKET, SO_NOSIGPIPE, &flag, sizeof(flag));
#else
    (void)sock;
#endif
}

struct AddrInfoDeleter
{
    void operator()(addrinfo* info) const
    {
        freeaddrinfo(info);
    }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

AddrInfoPtr resolve(const std::string& host, int port, bool passive)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    if (passive)
        hints.ai_flags = AI_PASSIVE;

    addrinfo* result = nullptr;
    std::string port_str = std::to_string(port);
    const char* node = host.empty() ? nullptr : host.c_str();

    int status = getaddrinfo(node, port_str.c_str(), &hints, &result);
    if (status != 0)
        throw TransportError("getaddrinfo failed: " + std::string(gai_strerror(status)));
    return AddrInfoPtr(result);
}

} // namespace

// =============================================================================
// TcpTransport
// =============================================================================

void TcpTransport::connect(const std::string& host, int port, int timeout_ms)
{
    close();

    auto addresses = resolve(host, port, false);

    Socket sock = kInvalidSocket;
    for (auto* rp = addresses.get(); rp != nullptr; rp = rp->ai_next)
    {
        sock = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
        if (sock == kInvalidSocket)
            continue;

        if (timeout_ms > 0)
            set_socket_blocking(sock, false);

        if (::connect(sock, rp->ai_addr, rp->ai_addrlen) == 0)
            break;

        if (errno == EINPROGRESS && timeout_ms > 0)
        {
            fd_set write_fds;
            FD_ZERO(&write_fds);
            FD_SET(sock, &write_fds);

            timeval tv;
            tv.tv_sec = timeout_ms / 1000;
            tv.tv_usec = (timeout_ms % 1000) * 1000;

            if (select(sock + 1, nullptr, &write_fds, nullptr, &tv) > 0)
            {
                int error = 0;
                socklen_t len = sizeof(error);
                getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &len);
                if (error == 0)
                    break;
            }
        }

        ::close(sock);
        sock = kInvalidSocket;
    }

    if (sock == kInvalidSocket)
        throw TransportError("Failed to connect to " + host + ":" + std::to_string(port));

    set_socket_blocking(sock, true);

    int flag = 1;
    setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    set_no_sigpipe(sock);

    socket_ = sock;
    open_ = true;
}

size_t TcpTransport::read(char* buffer, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();

    while (true)
    {
        ssize_t bytes_read = recv(socket_, buffer, size, 0);
        if (bytes_read >= 0)
        {
            if (bytes_read == 0)
                open_ = false;
            return static_cast<size_t>(bytes_read);
        }
        if (errno == EINTR)
            continue;
        if (errno == ECONNRESET || errno == EPIPE || errno == EBADF || errno == ENOTCONN)
        {
            open_ = false;
            return 0;
        }
        throw TransportError("recv failed: " + get_socket_error());
    }
}

void TcpTransport::write(const char* data, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();

    size_t total_sent = 0;
    while (total_sent < size)
    {
        ssize_t bytes_sent = send(socket_, data + total_sent, size - total_sent, MSG_NOSIGNAL);
        if (bytes_sent < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE || errno == ECONNRESET)
            {
                open_ = false;
                throw ConnectionClosedError("Peer closed the connection");
            }
            throw TransportError("send failed: " + get_socket_error());
        }
        total_sent += static_cast<size_t>(bytes_sent);
    }
}

void TcpTransport::close()
{
    open_ = false;

    Socket sock = socket_.exchange(kInvalidSocket);
    if (sock != kInvalidSocket)
    {
        shutdown(sock, SHUT_RDWR);
        ::close(sock);
    }
}

// =============================================================================
// TcpListener
// =============================================================================

void TcpListener::listen(const std::string& host, int port, int backlog)
{
    close();

    auto addresses = resolve(host, port, true);

    std::string last_error = "no usable address";
    TcpTransport::Socket sock = TcpTransport::kInvalidSocket;
    for (auto* rp = addresses.get(); rp != nullptr; rp = rp->ai_next)
    {
        sock = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
        if (sock == TcpTransport::kInvalidSocket)
        {
            last_error = get_socket_error();
            continue;
        }

        int reuse = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        if (::bind(sock, rp->ai_addr, rp->ai_addrlen) == 0 && ::listen(sock, backlog) == 0)
            break;

        last_error = get_socket_error();
        ::close(sock);
        sock = TcpTransport::kInvalidSocket;
    }

    if (sock == TcpTransport::kInvalidSocket)
        throw TransportError(
            "Failed to listen on " + host + ":" + std::to_string(port) + ": " + last_error
        );

    sockaddr_storage bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(sock, reinterpret_cast<sockaddr*>(&bound), &len) == 0)
    {
        if (bound.ss_family == AF_INET)
            port_ = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
        else if (bound.ss_family == AF_INET6)
            port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
    }
    else
    {
        port_ = port;
    }

    socket_ = sock;
}

std::unique_ptr<TcpTransport> TcpListener::accept()
{
    while (true)
    {
        TcpTransport::Socket listening = socket_;
        if (listening == TcpTransport::kInvalidSocket)
            return nullptr;

        // Close-on-exec so git children do not inherit client sockets
        TcpTransport::Socket client = ::accept4(listening, nullptr, nullptr, SOCK_CLOEXEC);
        if (client != TcpTransport::kInvalidSocket)
        {
            int flag = 1;
            setsockopt(client, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
            set_no_sigpipe(client);
            return std::make_unique<TcpTransport>(client);
        }

        if (socket_ == TcpTransport::kInvalidSocket)
            return nullptr;
        if (errno == EINTR || errno == ECONNABORTED)
            continue;
        throw TransportError("accept failed: " + get_socket_error());
    }
}

void TcpListener::close()
{
    TcpTransport::Socket sock = socket_.exchange(TcpTransport::kInvalidSocket);
    if (sock != TcpTransport::kInvalidSocket)
    {
        shutdown(sock, SHUT_RDWR);
        ::close(sock);
    }
}

} // namespace wsbridge
