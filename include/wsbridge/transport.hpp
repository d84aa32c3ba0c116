// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace wsbridge
{

// =============================================================================
// Transport Exceptions
// =============================================================================

/// Exception thrown when transport operations fail
class TransportError : public std::runtime_error
{
  public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

/// Exception thrown when connection is closed
class ConnectionClosedError : public TransportError
{
  public:
    ConnectionClosedError() : TransportError("Connection closed") {}
    explicit ConnectionClosedError(const std::string& message) : TransportError(message) {}
};

// =============================================================================
// Transport Interface
// =============================================================================

/// Abstract interface for raw byte I/O transport
///
/// Implementations provide the byte stream (stdio, accepted TCP sockets, test
/// pipes). Framing is handled separately by MessageFramer.
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Read up to `size` bytes into buffer
    /// @return Number of bytes actually read (0 indicates EOF)
    /// @throws TransportError on read failure
    virtual size_t read(char* buffer, size_t size) = 0;

    /// Write all bytes to the transport
    /// @throws TransportError on write failure
    virtual void write(const char* data, size_t size) = 0;

    /// Close the transport
    virtual void close() = 0;

    /// Check if transport is open
    virtual bool is_open() const = 0;

    void write(const std::string& data)
    {
        write(data.data(), data.size());
    }
};

// =============================================================================
// Content-Length Message Framer (LSP-style)
// =============================================================================

/// Handles Content-Length header framing for JSON-RPC messages
///
/// Message format:
/// ```
/// Content-Length: <length>\r\n
/// \r\n
/// <json-rpc-message>
/// ```
///
/// Other headers (Content-Type) are read and ignored.
class MessageFramer
{
  public:
    /// Largest body accepted from a peer
    static constexpr size_t kDefaultMaxMessageSize = 64 * 1024 * 1024;

    explicit MessageFramer(ITransport& transport, size_t max_message_size = kDefaultMaxMessageSize)
        : transport_(transport), max_message_size_(max_message_size)
    {
    }

    /// Read a complete framed message
    /// @return The message body (without headers)
    /// @throws TransportError on read failure or invalid framing
    /// @throws ConnectionClosedError if the peer closed the stream
    std::string read_message();

    /// Write a message with Content-Length framing
    /// @throws TransportError on write failure
    void write_message(const std::string& message);

  private:
    ITransport& transport_;
    size_t max_message_size_;
    std::vector<char> buffer_;
    size_t buffer_pos_ = 0;
    size_t buffer_len_ = 0;

    /// Read exactly n bytes, draining the header buffer first
    void read_exact(char* out, size_t n);

    /// Read a single header line (terminated by \r\n or \n)
    std::string read_line();

    /// Pull more bytes into the header buffer; false on EOF
    bool fill_buffer();

    /// Parse the value of a Content-Length header
    size_t parse_content_length(const std::string& value) const;
};

} // namespace wsbridge
