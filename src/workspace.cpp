// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <wsbridge/workspace.hpp>

namespace wsbridge
{

namespace fs = std::filesystem;

namespace
{

fs::path canonical_form(const fs::path& path)
{
    std::error_code ec;
    auto resolved = fs::weakly_canonical(path, ec);
    if (ec)
        return path.lexically_normal();
    return resolved.lexically_normal();
}

fs::path strip_trailing_separator(fs::path path)
{
    if (!path.has_filename() && path.has_relative_path())
        path = path.parent_path();
    return path;
}

} // namespace

Workspace::Workspace(
    const fs::path& root, IFileStore& store, IChangeCommitter* committer, std::string commit_prefix
)
    : root_(strip_trailing_separator(canonical_form(fs::absolute(root)))), store_(store),
      committer_(committer), commit_prefix_(std::move(commit_prefix))
{
}

std::optional<fs::path> Workspace::resolve(const std::string& request_path) const
{
    if (request_path.empty() || request_path.find('\0') != std::string::npos)
        return std::nullopt;

    fs::path requested(request_path);
    fs::path joined = requested.is_absolute() ? requested : root_ / requested;
    fs::path resolved = strip_trailing_separator(canonical_form(joined));

    if (!is_within(root_, resolved))
        return std::nullopt;
    return resolved;
}

bool is_within(const fs::path& root, const fs::path& path)
{
    auto root_it = root.begin();
    auto path_it = path.begin();
    for (; root_it != root.end(); ++root_it, ++path_it)
    {
        if (path_it == path.end() || *root_it != *path_it)
            return false;
    }
    for (; path_it != path.end(); ++path_it)
    {
        if (*path_it == "..")
            return false;
    }
    return true;
}

} // namespace wsbridge
