// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file file_store.hpp
/// @brief Byte-level file access used by the operation handlers

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace wsbridge
{

/// Exception thrown when a file cannot be read or written
class FileStoreError : public std::runtime_error
{
  public:
    FileStoreError(const std::string& path, const std::string& reason)
        : std::runtime_error(path + ": " + reason), path_(path), reason_(reason)
    {
    }

    const std::string& path() const
    {
        return path_;
    }
    const std::string& reason() const
    {
        return reason_;
    }

  private:
    std::string path_;
    std::string reason_;
};

/// Read/write access to whole files by absolute path
///
/// Implementations must be safe to call from several threads at once.
class IFileStore
{
  public:
    virtual ~IFileStore() = default;

    /// Read a whole file
    /// @return The file bytes, or std::nullopt if nothing exists at path
    /// @throws FileStoreError if the path exists but cannot be read
    virtual std::optional<std::string> read(const std::filesystem::path& path) = 0;

    /// Replace a whole file, creating it if needed
    /// @throws FileStoreError on failure
    virtual void write(const std::filesystem::path& path, const std::string& content) = 0;
};

/// File store backed by the local file system
///
/// Writes go to a temporary file in the target's directory which is flushed
/// and renamed over the target, so readers see either the old or the new
/// content. Permission bits of an existing target are kept.
class LocalFileStore : public IFileStore
{
  public:
    struct Options
    {
        /// Create missing parent directories on write
        bool create_directories = true;
    };

    LocalFileStore() = default;
    explicit LocalFileStore(Options options) : options_(options) {}

    std::optional<std::string> read(const std::filesystem::path& path) override;
    void write(const std::filesystem::path& path, const std::string& content) override;

  private:
    Options options_;
};

} // namespace wsbridge
