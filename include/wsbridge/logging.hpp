// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file logging.hpp
/// @brief The library's named spdlog logger and its one-time configuration

#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

namespace wsbridge
{

inline constexpr const char* kLoggerName = "wsbridge";

/// Logging configuration
struct LoggingOptions
{
    /// trace, debug, info, warn, error, critical or off
    std::string level = "info";

    /// Also write to this file (rotated at 10 MiB, 3 files kept)
    std::optional<std::string> file;
};

/// The library logger
///
/// Logs go to stderr: stdout belongs to the stdio transport. If
/// init_logging() has not been called, a stderr logger at info level is
/// created on first use.
std::shared_ptr<spdlog::logger> logger();

/// Replace the library logger according to options
/// @throws spdlog::spdlog_ex if the log file cannot be opened
void init_logging(const LoggingOptions& options);

/// Parse a level name; unknown names yield std::nullopt
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

} // namespace wsbridge
