// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <wsbridge/handlers.hpp>
#include <wsbridge/logging.hpp>

namespace wsbridge
{

namespace
{

[[noreturn]] void invalid_params(const std::string& detail)
{
    throw JsonRpcError(
        JsonRpcErrorCode::InvalidParams,
        default_error_message(JsonRpcErrorCode::InvalidParams),
        error_detail(detail)
    );
}

/// Null params are treated as an empty object
const json& params_object(const json& params)
{
    static const json empty = json::object();
    if (params.is_null())
        return empty;
    if (!params.is_object())
        invalid_params("params must be an object");
    return params;
}

} // namespace

// =============================================================================
// Parameter parsing
// =============================================================================

GetContextParams parse_get_context_params(const json& params)
{
    const json& p = params_object(params);

    if (!p.contains("file_paths"))
        invalid_params("file_paths is required");
    const json& paths = p.at("file_paths");
    if (!paths.is_array())
        invalid_params("file_paths must be an array of strings");
    if (paths.empty())
        invalid_params("file_paths must not be empty");

    GetContextParams result;
    result.file_paths.reserve(paths.size());
    for (size_t i = 0; i < paths.size(); ++i)
    {
        const json& entry = paths[i];
        if (!entry.is_string() || entry.get_ref<const std::string&>().empty())
            invalid_params("file_paths[" + std::to_string(i) + "] must be a non-empty string");
        result.file_paths.push_back(entry.get<std::string>());
    }
    return result;
}

ApplyChangesParams parse_apply_changes_params(const json& params)
{
    const json& p = params_object(params);

    if (!p.contains("file_path"))
        invalid_params("file_path is required");
    const json& path = p.at("file_path");
    if (!path.is_string() || path.get_ref<const std::string&>().empty())
        invalid_params("file_path must be a non-empty string");

    if (!p.contains("content"))
        invalid_params("content is required");
    const json& content = p.at("content");
    if (!content.is_string())
        invalid_params("content must be a string");

    return ApplyChangesParams{path.get<std::string>(), content.get<std::string>()};
}

// =============================================================================
// getContext
// =============================================================================

ContextResult get_context(const Workspace& workspace, const GetContextParams& params)
{
    auto log = logger();
    ContextResult result;

    for (const auto& requested : params.file_paths)
    {
        auto resolved = workspace.resolve(requested);
        if (!resolved)
        {
            log->warn("getContext: skipping {}: outside the workspace", requested);
            continue;
        }

        std::optional<std::string> content;
        try
        {
            content = workspace.store().read(*resolved);
        }
        catch (const FileStoreError& e)
        {
            log->warn("getContext: skipping {}: {}", requested, e.reason());
            continue;
        }

        if (!content)
        {
            log->warn("getContext: skipping {}: file not found", requested);
            continue;
        }
        if (!detail::is_valid_utf8(*content))
        {
            log->warn("getContext: skipping {}: not UTF-8 text", requested);
            continue;
        }

        result.files[requested] = std::move(*content);
    }

    log->info(
        "getContext: returned {} of {} requested files",
        result.files.size(),
        params.file_paths.size()
    );
    return result;
}

// =============================================================================
// applyChanges
// =============================================================================

ApplyResult apply_changes(const Workspace& workspace, const ApplyChangesParams& params)
{
    auto log = logger();
    const std::string& requested = params.file_path;

    auto resolved = workspace.resolve(requested);
    if (!resolved)
    {
        log->warn("applyChanges: rejected {}: outside the workspace", requested);
        throw JsonRpcError(
            JsonRpcErrorCode::InvalidParams,
            "Path traversal attempt",
            json{
                {"detail", "file_path resolves outside the workspace root"},
                {"file_path", requested},
            }
        );
    }
    if (*resolved == workspace.root())
        invalid_params("file_path names the workspace root");

    // Phase 1: replace the file
    log->info("applyChanges: writing {} ({} bytes)", resolved->string(), params.content.size());
    try
    {
        workspace.store().write(*resolved, params.content);
    }
    catch (const FileStoreError& e)
    {
        log->error("applyChanges: write of {} failed: {}", requested, e.reason());
        throw JsonRpcError(
            JsonRpcErrorCode::InternalError,
            "Failed to write " + requested,
            json{{"detail", e.what()}, {"file_path", requested}}
        );
    }

    IChangeCommitter* committer = workspace.committer();
    if (!committer)
        return ApplyResult{true, "Changes applied to " + requested + " (no version control)"};

    // Phase 2: record it. The new content stays even if this fails.
    std::string description =
        workspace.commit_prefix() + ": Apply changes to " + resolved->filename().string();
    try
    {
        committer->record(*resolved, description);
    }
    catch (const std::exception& e)
    {
        log->error("applyChanges: {} written but not committed: {}", requested, e.what());
        return ApplyResult{
            false, "Changes applied to " + requested + " but not committed: " + e.what()
        };
    }

    return ApplyResult{true, "Changes applied and committed to " + requested};
}

// =============================================================================
// JSON entry points
// =============================================================================

json handle_get_context(const Workspace& workspace, const json& params)
{
    return get_context(workspace, parse_get_context_params(params));
}

json handle_apply_changes(const Workspace& workspace, const json& params)
{
    return apply_changes(workspace, parse_apply_changes_params(params));
}

} // namespace wsbridge
