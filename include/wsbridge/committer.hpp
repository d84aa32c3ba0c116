// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file committer.hpp
/// @brief Durable recording of applied file changes

#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace wsbridge
{

/// Exception thrown when a change cannot be recorded
class CommitError : public std::runtime_error
{
  public:
    explicit CommitError(const std::string& message) : std::runtime_error(message) {}
};

/// Records a file change as one attributable unit (e.g. a commit)
class IChangeCommitter
{
  public:
    virtual ~IChangeCommitter() = default;

    /// Record that the file at path was replaced
    ///
    /// Recording a file whose content is already recorded is a successful
    /// no-op.
    /// @throws CommitError on failure
    virtual void record(const std::filesystem::path& path, const std::string& description) = 0;
};

/// Options for GitCommitter
struct GitCommitterOptions
{
    /// git executable (name on PATH or path)
    std::string git_path = "git";

    /// Value for `git commit --author`, e.g. "Bot <bot@example.com>"
    std::optional<std::string> author;
};

/// Change committer that creates one git commit per recorded file
///
/// Only the recorded path is committed; other staged changes in the
/// repository are left alone. Calls are serialised because git holds a
/// repository-wide index lock.
class GitCommitter : public IChangeCommitter
{
  public:
    /// @param repo_root Directory inside the git work tree
    explicit GitCommitter(std::filesystem::path repo_root, GitCommitterOptions options = {});

    void record(const std::filesystem::path& path, const std::string& description) override;

    /// Check whether dir lies inside a git work tree
    static bool is_work_tree(const std::filesystem::path& dir, const std::string& git_path = "git");

    const std::filesystem::path& repo_root() const
    {
        return repo_root_;
    }

  private:
    struct GitOutput
    {
        int exit_code;
        std::string output;
    };

    GitOutput git(const std::vector<std::string>& args) const;
    void git_checked(const std::vector<std::string>& args) const;

    std::filesystem::path repo_root_;
    GitCommitterOptions options_;
    std::mutex mutex_;
};

} // namespace wsbridge
