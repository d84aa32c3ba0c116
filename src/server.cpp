// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <wsbridge/logging.hpp>
#include <wsbridge/server.hpp>

namespace wsbridge
{

Server::~Server()
{
    stop();
}

size_t Server::serve(ITransport& transport)
{
    auto log = logger();
    MessageFramer framer(transport);
    size_t handled = 0;

    while (true)
    {
        std::string message;
        try
        {
            message = framer.read_message();
        }
        catch (const ConnectionClosedError&)
        {
            log->debug("Peer closed the connection after {} requests", handled);
            break;
        }
        catch (const TransportError& e)
        {
            log->warn("Dropping connection: {}", e.what());
            break;
        }

        std::string reply = dispatcher_.dispatch(message);
        ++handled;
        if (reply.empty())
            continue;

        try
        {
            framer.write_message(reply);
        }
        catch (const TransportError& e)
        {
            log->warn("Failed to send response: {}", e.what());
            break;
        }
    }

    transport.close();
    return handled;
}

void Server::start(const std::string& host, int port)
{
    if (running_)
        throw TransportError("Server is already running");

    listener_.listen(host, port);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        running_ = true;
    }
    logger()->info("Listening on {}:{}", host, listener_.port());

    accept_thread_ = std::thread([this] { accept_loop(); });
}

void Server::wait()
{
    std::unique_lock<std::mutex> lock(state_mutex_);
    stopped_cv_.wait(lock, [this] { return !running_; });
}

void Server::stop()
{
    std::lock_guard<std::mutex> stop_lock(stop_mutex_);
    bool was_running;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        was_running = running_.exchange(false);
    }
    stopped_cv_.notify_all();

    listener_.close();
    if (accept_thread_.joinable())
        accept_thread_.join();

    std::list<Connection> remaining;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        remaining.splice(remaining.end(), connections_);
    }
    for (auto& connection : remaining)
        connection.transport->close();
    for (auto& connection : remaining)
    {
        if (connection.thread.joinable())
            connection.thread.join();
    }

    if (was_running)
        logger()->info("Server stopped");
}

void Server::accept_loop()
{
    auto log = logger();

    while (running_)
    {
        std::unique_ptr<TcpTransport> accepted;
        try
        {
            accepted = listener_.accept();
        }
        catch (const TransportError& e)
        {
            log->error("Accept failed: {}", e.what());
            break;
        }
        if (!accepted)
            break;

        reap_finished();

        std::lock_guard<std::mutex> lock(connections_mutex_);
        if (!running_)
            break;

        auto& connection = connections_.emplace_back();
        connection.id = next_connection_id_++;
        connection.transport = std::shared_ptr<TcpTransport>(std::move(accepted));
        log->debug("Accepted connection {}", connection.id);

        connection.thread = std::thread(
            [this, &connection]
            {
                size_t handled = serve(*connection.transport);
                logger()->debug("Connection {} closed after {} requests", connection.id, handled);
                connection.finished = true;
            }
        );
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        running_ = false;
    }
    stopped_cv_.notify_all();
}

void Server::reap_finished()
{
    std::list<Connection> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();)
        {
            auto next = std::next(it);
            if (it->finished)
                finished.splice(finished.end(), connections_, it);
            it = next;
        }
    }
    for (auto& connection : finished)
    {
        if (connection.thread.joinable())
            connection.thread.join();
    }
}

} // namespace wsbridge
