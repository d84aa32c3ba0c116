// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace wsbridge
{

// =============================================================================
// Type Aliases
// =============================================================================

/// JSON type alias for cleaner API
using json = nlohmann::json;

// =============================================================================
// Method Names
// =============================================================================

inline constexpr const char* kGetContextMethod = "getContext";
inline constexpr const char* kApplyChangesMethod = "applyChanges";

// =============================================================================
// getContext
// =============================================================================

/// Parameters of a getContext request
struct GetContextParams
{
    /// Paths to read, in request order (duplicates allowed)
    std::vector<std::string> file_paths;
};

/// Result of a getContext request
///
/// Keys are the paths exactly as requested. Paths that could not be read
/// have no entry.
struct ContextResult
{
    std::map<std::string, std::string> files;
};

inline void to_json(json& j, const GetContextParams& p)
{
    j = json{{"file_paths", p.file_paths}};
}

inline void to_json(json& j, const ContextResult& r)
{
    j = json{{"files", r.files}};
}

inline void from_json(const json& j, ContextResult& r)
{
    j.at("files").get_to(r.files);
}

// =============================================================================
// applyChanges
// =============================================================================

/// Parameters of an applyChanges request
struct ApplyChangesParams
{
    std::string file_path;
    /// Full replacement text; empty truncates the file
    std::string content;
};

/// Result of an applyChanges request
struct ApplyResult
{
    bool success = false;
    std::string message;
};

inline void to_json(json& j, const ApplyChangesParams& p)
{
    j = json{{"file_path", p.file_path}, {"content", p.content}};
}

inline void to_json(json& j, const ApplyResult& r)
{
    j = json{{"success", r.success}, {"message", r.message}};
}

inline void from_json(const json& j, ApplyResult& r)
{
    j.at("success").get_to(r.success);
    j.at("message").get_to(r.message);
}

// =============================================================================
// Server Options
// =============================================================================

/// Options for running the wsbridge server
struct ServerOptions
{
    /// Workspace root (empty = current directory)
    std::string workspace_root;

    /// Serve over stdin/stdout; when false, serve TCP on host:port
    bool use_stdio = true;
    std::string host = "127.0.0.1";
    int port = 0;

    /// Commit applied changes when the workspace is a git work tree
    bool use_git = true;
    std::string git_path = "git";
    std::string commit_prefix = "wsbridge";
    std::optional<std::string> commit_author;

    std::string log_level = "info";
    std::optional<std::string> log_file;
};

namespace detail
{

/// Check that a byte string is well-formed UTF-8 (no overlongs, no surrogates)
inline bool is_valid_utf8(const std::string& s)
{
    size_t i = 0;
    const size_t n = s.size();
    while (i < n)
    {
        auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80)
        {
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0)
        {
            len = 2;
            cp = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            len = 3;
            cp = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            len = 4;
            cp = c & 0x07;
        }
        else
        {
            return false;
        }

        if (i + len > n)
            return false;
        for (size_t k = 1; k < len; ++k)
        {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;

        i += len;
    }
    return true;
}

} // namespace detail

} // namespace wsbridge
