// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file options.hpp
/// @brief Command-line and environment configuration for wsbridge-server

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <wsbridge/types.hpp>

namespace wsbridge
{

/// Server version string
inline constexpr const char* kVersion = "0.1.0";

/// What main() should do after parsing
enum class CommandAction
{
    Run,
    ShowHelp,
    ShowVersion,
};

struct CommandLine
{
    CommandAction action = CommandAction::Run;
    ServerOptions options;
};

/// Looks up an environment variable; std::nullopt when unset
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Reads the real process environment
std::optional<std::string> process_environment(const std::string& name);

/// Build server options from defaults, WSBRIDGE_* variables and flags
///
/// Flags accept both "--name value" and "--name=value". Flags win over the
/// environment.
///
/// @param args Arguments without the program name
/// @param env Environment lookup (tests pass their own)
/// @throws std::invalid_argument on unknown flags, missing values or bad values
CommandLine parse_command_line(
    const std::vector<std::string>& args, const EnvironmentLookup& env = process_environment
);

/// Usage text for --help and argument errors
std::string usage(const std::string& program);

} // namespace wsbridge
