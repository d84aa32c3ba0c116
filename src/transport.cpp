// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cctype>
#include <optional>
#include <wsbridge/transport.hpp>

namespace wsbridge
{

namespace
{

constexpr size_t kMinBufferSize = 4096;
constexpr size_t kMaxHeaderLine = 8192;

std::string to_lower(std::string s)
{
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string trim(const std::string& s)
{
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos)
        return {};
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

} // namespace

std::string MessageFramer::read_message()
{
    std::optional<size_t> content_length;
    bool saw_header = false;

    while (true)
    {
        auto line = read_line();
        if (line.empty())
        {
            // Tolerate stray blank lines between messages
            if (!saw_header)
                continue;
            break;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos)
            throw TransportError("Malformed header line: " + line);
        saw_header = true;

        if (to_lower(trim(line.substr(0, colon))) == "content-length")
            content_length = parse_content_length(trim(line.substr(colon + 1)));
    }

    if (!content_length)
        throw TransportError("Missing Content-Length header");

    std::string message(*content_length, '\0');
    read_exact(message.data(), *content_length);
    return message;
}

void MessageFramer::write_message(const std::string& message)
{
    std::string frame = "Content-Length: " + std::to_string(message.size()) + "\r\n\r\n";
    frame += message;
    transport_.write(frame);
}

size_t MessageFramer::parse_content_length(const std::string& value) const
{
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }))
        throw TransportError("Invalid Content-Length value: " + value);

    size_t length = 0;
    try
    {
        length = static_cast<size_t>(std::stoull(value));
    }
    catch (const std::exception&)
    {
        throw TransportError("Invalid Content-Length value: " + value);
    }

    if (length > max_message_size_)
        throw TransportError(
            "Content-Length " + value + " exceeds limit of " + std::to_string(max_message_size_)
        );
    return length;
}

void MessageFramer::read_exact(char* out, size_t n)
{
    size_t copied = std::min(n, buffer_len_ - buffer_pos_);
    std::copy_n(buffer_.data() + buffer_pos_, copied, out);
    buffer_pos_ += copied;

    while (copied < n)
    {
        size_t bytes_read = transport_.read(out + copied, n - copied);
        if (bytes_read == 0)
            throw ConnectionClosedError("Connection closed while reading message body");
        copied += bytes_read;
    }
}

std::string MessageFramer::read_line()
{
    std::string line;

    while (true)
    {
        if (buffer_pos_ >= buffer_len_ && !fill_buffer())
        {
            if (line.empty())
                throw ConnectionClosedError("Connection closed while reading header");
            throw ConnectionClosedError("Connection closed in the middle of a header line");
        }

        char c = buffer_[buffer_pos_++];
        if (c == '\n')
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return line;
        }

        line += c;
        if (line.size() > kMaxHeaderLine)
            throw TransportError("Header line too long");
    }
}

bool MessageFramer::fill_buffer()
{
    if (buffer_.size() < kMinBufferSize)
        buffer_.resize(kMinBufferSize);

    buffer_pos_ = 0;
    buffer_len_ = transport_.read(buffer_.data(), buffer_.size());
    return buffer_len_ > 0;
}

} // namespace wsbridge
