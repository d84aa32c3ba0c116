// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <wsbridge/committer.hpp>
#include <wsbridge/logging.hpp>
#include <wsbridge/process.hpp>

namespace wsbridge
{

namespace
{

ProcessOptions git_process_options(const std::filesystem::path& dir)
{
    ProcessOptions options;
    options.working_directory = dir.string();
    // Never wait on a credential or editor prompt
    options.environment["GIT_TERMINAL_PROMPT"] = "0";
    options.environment["GIT_EDITOR"] = "true";
    return options;
}

std::string trim_output(std::string text)
{
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' '))
        text.pop_back();
    return text;
}

std::string join_args(const std::vector<std::string>& args)
{
    std::string joined = "git";
    for (const auto& arg : args)
        joined += " " + arg;
    return joined;
}

} // namespace

GitCommitter::GitCommitter(std::filesystem::path repo_root, GitCommitterOptions options)
    : repo_root_(std::move(repo_root)), options_(std::move(options))
{
}

bool GitCommitter::is_work_tree(const std::filesystem::path& dir, const std::string& git_path)
{
    try
    {
        auto result =
            run_process(git_path, {"rev-parse", "--is-inside-work-tree"}, git_process_options(dir));
        return result.exit_code == 0 && trim_output(result.stdout_text) == "true";
    }
    catch (const ProcessError& e)
    {
        logger()->debug("git not usable in {}: {}", dir.string(), e.what());
        return false;
    }
}

GitCommitter::GitOutput GitCommitter::git(const std::vector<std::string>& args) const
{
    ProcessResult result;
    try
    {
        result = run_process(options_.git_path, args, git_process_options(repo_root_));
    }
    catch (const ProcessError& e)
    {
        throw CommitError("Failed to run " + join_args(args) + ": " + e.what());
    }

    std::string output = trim_output(result.stderr_text);
    if (output.empty())
        output = trim_output(result.stdout_text);
    return GitOutput{result.exit_code, std::move(output)};
}

void GitCommitter::git_checked(const std::vector<std::string>& args) const
{
    auto result = git(args);
    if (result.exit_code != 0)
    {
        std::string message =
            join_args(args) + " exited with status " + std::to_string(result.exit_code);
        if (!result.output.empty())
            message += ": " + result.output;
        throw CommitError(message);
    }
}

void GitCommitter::record(const std::filesystem::path& path, const std::string& description)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string file = path.string();

    git_checked({"add", "--", file});

    // Exit status 0 means nothing is staged for this path
    auto staged = git({"diff", "--cached", "--quiet", "--", file});
    if (staged.exit_code == 0)
    {
        logger()->info("No changes to commit for {}", file);
        return;
    }
    if (staged.exit_code != 1)
        throw CommitError(
            "git diff --cached failed with status " + std::to_string(staged.exit_code) + ": " +
            staged.output
        );

    std::vector<std::string> commit_args = {"commit", "--quiet", "--no-verify", "-m", description};
    if (options_.author)
    {
        commit_args.push_back("--author");
        commit_args.push_back(*options_.author);
    }
    commit_args.push_back("--");
    commit_args.push_back(file);

    git_checked(commit_args);
    logger()->info("Committed {}: {}", file, description);
}

} // namespace wsbridge
