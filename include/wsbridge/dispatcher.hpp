// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file dispatcher.hpp
/// @brief JSON-RPC 2.0 request dispatcher for the workspace methods

#include <optional>
#include <string>
#include <vector>
#include <wsbridge/jsonrpc.hpp>
#include <wsbridge/workspace.hpp>

namespace wsbridge
{

/// Turns raw JSON-RPC requests into raw JSON-RPC responses
///
/// Methods: getContext and applyChanges. Every request yields exactly one
/// response holding either a result or an error, except notifications
/// (null or absent id), which yield nothing.
///
/// The dispatcher keeps no per-request state; dispatch() may be called from
/// several threads at once.
///
/// Example usage:
/// @code
/// LocalFileStore store;
/// Workspace workspace("/path/to/repo", store);
/// Dispatcher dispatcher(workspace);
///
/// std::string reply = dispatcher.dispatch(
///     R"({"jsonrpc":"2.0","method":"getContext","params":{"file_paths":["a.py"]},"id":1})");
/// @endcode
class Dispatcher
{
  public:
    /// @param workspace Must outlive the dispatcher
    explicit Dispatcher(const Workspace& workspace) : workspace_(workspace) {}

    /// Handle one serialized request
    /// @return The serialized response, or an empty string for notifications
    std::string dispatch(const std::string& raw) const;

    /// Handle one parsed request
    /// @return The response, or std::nullopt for notifications
    std::optional<JsonRpcResponse> handle(const json& message) const;

    /// Names of the supported methods
    static std::vector<std::string> methods();

    /// Serialize a response; invalid UTF-8 in strings is replaced, never fatal
    static std::string serialize(const JsonRpcResponse& response);

  private:
    JsonRpcResponse invoke(const JsonRpcRequest& request) const;

    const Workspace& workspace_;
};

} // namespace wsbridge
