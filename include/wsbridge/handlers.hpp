// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file handlers.hpp
/// @brief The getContext and applyChanges operations
///
/// Handlers report invalid parameters by throwing JsonRpcError with
/// JsonRpcErrorCode::InvalidParams. Collaborator failures are thrown as
/// JsonRpcError with InternalError, or as the collaborator's own exception.

#include <wsbridge/jsonrpc.hpp>
#include <wsbridge/types.hpp>
#include <wsbridge/workspace.hpp>

namespace wsbridge
{

/// Validate and extract getContext parameters
/// @throws JsonRpcError (InvalidParams)
GetContextParams parse_get_context_params(const json& params);

/// Validate and extract applyChanges parameters
/// @throws JsonRpcError (InvalidParams)
ApplyChangesParams parse_apply_changes_params(const json& params);

/// Read the requested files, best-effort
///
/// Paths that resolve outside the workspace, do not exist, cannot be read or
/// are not UTF-8 text are left out of the result and logged. Never writes.
ContextResult get_context(const Workspace& workspace, const GetContextParams& params);

/// Replace a file and record the change
///
/// The write happens first. If recording then fails, the new content stays
/// in place and the result has success == false with a message saying so.
/// @throws JsonRpcError (InvalidParams) if the path escapes the workspace
/// @throws JsonRpcError (InternalError) if the write fails
ApplyResult apply_changes(const Workspace& workspace, const ApplyChangesParams& params);

/// JSON entry points used by the dispatcher's method table
json handle_get_context(const Workspace& workspace, const json& params);
json handle_apply_changes(const Workspace& workspace, const json& params);

} // namespace wsbridge
