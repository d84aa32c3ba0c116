// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file workspace.hpp
/// @brief The sandbox the operation handlers work in

#include <filesystem>
#include <optional>
#include <string>
#include <wsbridge/committer.hpp>
#include <wsbridge/file_store.hpp>

namespace wsbridge
{

/// Everything a request handler needs, built once at startup
///
/// The workspace does not own its collaborators; they must outlive it.
/// A null committer means applied changes are written but not recorded.
class Workspace
{
  public:
    /// @param root Workspace root; made absolute and canonical here
    /// @param store File store used for all reads and writes
    /// @param committer Change committer, or nullptr for none
    /// @param commit_prefix Prefix of generated commit descriptions
    Workspace(
        const std::filesystem::path& root,
        IFileStore& store,
        IChangeCommitter* committer = nullptr,
        std::string commit_prefix = "wsbridge"
    );

    const std::filesystem::path& root() const
    {
        return root_;
    }

    IFileStore& store() const
    {
        return store_;
    }

    IChangeCommitter* committer() const
    {
        return committer_;
    }

    const std::string& commit_prefix() const
    {
        return commit_prefix_;
    }

    /// Resolve a request path against the root
    ///
    /// Relative paths are joined to the root. The result is normalised and
    /// symlinks in its existing components are followed.
    /// @return The resolved path, or std::nullopt if it lies outside the root
    std::optional<std::filesystem::path> resolve(const std::string& request_path) const;

  private:
    std::filesystem::path root_;
    IFileStore& store_;
    IChangeCommitter* committer_;
    std::string commit_prefix_;
};

/// Check whether path is root or lies below it (both already normalised)
bool is_within(const std::filesystem::path& root, const std::filesystem::path& path);

} // namespace wsbridge
