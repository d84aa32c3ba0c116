// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file server.hpp
/// @brief Serves the dispatcher over framed byte-stream transports

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <wsbridge/dispatcher.hpp>
#include <wsbridge/transport.hpp>
#include <wsbridge/transport_tcp.hpp>

namespace wsbridge
{

/// Reads Content-Length framed requests, dispatches them and writes replies
///
/// A single stream (stdio) is served with serve(). For TCP, start() binds and
/// accepts connections in the background, each served on its own thread.
///
/// Example usage:
/// @code
/// Server server(dispatcher);
/// server.start("127.0.0.1", 8765);
/// server.wait(); // until stop() from a signal handler thread
/// @endcode
class Server
{
  public:
    /// @param dispatcher Must outlive the server
    explicit Server(const Dispatcher& dispatcher) : dispatcher_(dispatcher) {}

    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Serve one connection until the peer closes it or framing breaks
    /// @return Number of requests handled
    size_t serve(ITransport& transport);

    /// Listen on host:port and accept connections on a background thread
    /// @throws TransportError if the port cannot be bound
    void start(const std::string& host, int port);

    /// Block until the server stops, by stop() or because accepting failed
    void wait();

    /// Stop accepting, close live connections and join their threads
    ///
    /// Safe to call more than once, and from another thread than wait().
    void stop();

    bool is_running() const
    {
        return running_;
    }

    /// Bound TCP port (after start)
    int port() const
    {
        return listener_.port();
    }

  private:
    struct Connection
    {
        uint64_t id;
        std::shared_ptr<TcpTransport> transport;
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    void accept_loop();
    void reap_finished();

    const Dispatcher& dispatcher_;
    TcpListener listener_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};
    std::mutex state_mutex_;
    std::condition_variable stopped_cv_;
    std::mutex stop_mutex_;

    std::mutex connections_mutex_;
    std::list<Connection> connections_;
    uint64_t next_connection_id_ = 1;
};

} // namespace wsbridge
