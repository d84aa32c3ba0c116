// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <cerrno>
#include <cstring>
#include <string>
#include <unistd.h>
#include <wsbridge/transport.hpp>

namespace wsbridge
{

/// Transport over a pair of file descriptors
///
/// The server uses it on stdin/stdout; tests use it on pipe ends.
class StdioTransport : public ITransport
{
  public:
    using Handle = int;
    static constexpr Handle invalid_handle()
    {
        return -1;
    }

    /// Transport over the process's own stdin/stdout (not closed on destruction)
    static StdioTransport standard_streams()
    {
        return StdioTransport(STDIN_FILENO, STDOUT_FILENO, false);
    }

    /// @param read_handle Descriptor to read requests from
    /// @param write_handle Descriptor to write responses to
    /// @param owns_handles If true, handles are closed on destruction
    StdioTransport(Handle read_handle, Handle write_handle, bool owns_handles = true)
        : read_handle_(read_handle), write_handle_(write_handle), owns_handles_(owns_handles),
          open_(true)
    {
    }

    ~StdioTransport() override
    {
        close();
    }

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    StdioTransport(StdioTransport&& other) noexcept
        : read_handle_(other.read_handle_), write_handle_(other.write_handle_),
          owns_handles_(other.owns_handles_), open_(other.open_.load())
    {
        other.read_handle_ = invalid_handle();
        other.write_handle_ = invalid_handle();
        other.owns_handles_ = false;
        other.open_ = false;
    }

    StdioTransport& operator=(StdioTransport&&) = delete;

    size_t read(char* buffer, size_t size) override
    {
        if (!open_)
            throw ConnectionClosedError();

        while (true)
        {
            ssize_t bytes_read = ::read(read_handle_, buffer, size);
            if (bytes_read >= 0)
            {
                if (bytes_read == 0)
                    open_ = false;
                return static_cast<size_t>(bytes_read);
            }
            if (errno == EINTR)
                continue;
            if (errno == EBADF)
            {
                open_ = false;
                return 0;
            }
            throw TransportError("read() failed: " + std::string(std::strerror(errno)));
        }
    }

    void write(const char* data, size_t size) override
    {
        if (!open_)
            throw ConnectionClosedError();

        size_t total_written = 0;
        while (total_written < size)
        {
            ssize_t bytes_written =
                ::write(write_handle_, data + total_written, size - total_written);
            if (bytes_written < 0)
            {
                if (errno == EINTR)
                    continue;
                if (errno == EPIPE)
                    throw ConnectionClosedError("Peer closed the output stream");
                throw TransportError("write() failed: " + std::string(std::strerror(errno)));
            }
            total_written += static_cast<size_t>(bytes_written);
        }
    }

    using ITransport::write;

    void close() override
    {
        if (!open_.exchange(false))
            return;

        if (owns_handles_)
        {
            if (read_handle_ != invalid_handle())
                ::close(read_handle_);
            if (write_handle_ != invalid_handle() && write_handle_ != read_handle_)
                ::close(write_handle_);
        }
        read_handle_ = invalid_handle();
        write_handle_ = invalid_handle();
    }

    bool is_open() const override
    {
        return open_;
    }

  private:
    Handle read_handle_;
    Handle write_handle_;
    bool owns_handles_;
    std::atomic<bool> open_;
};

} // namespace wsbridge
