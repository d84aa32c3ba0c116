// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file main.cpp
/// @brief wsbridge-server: serves a workspace over JSON-RPC 2.0

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <thread>
#include <wsbridge/wsbridge.hpp>

namespace fs = std::filesystem;

namespace
{

/// Block SIGINT/SIGTERM in every thread; a dedicated thread takes them with sigwait
sigset_t shutdown_signals()
{
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

int serve_tcp(wsbridge::Server& server, const wsbridge::ServerOptions& options)
{
    sigset_t signals = shutdown_signals();
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    server.start(options.host, options.port);

    std::thread signal_thread(
        [&server, signals]
        {
            int signal_number = 0;
            if (sigwait(&signals, &signal_number) == 0 && server.is_running())
            {
                wsbridge::logger()->info("Received signal {}, shutting down", signal_number);
                server.stop();
            }
        }
    );

    server.wait();

    // Wake the signal thread if the server ended on its own
    pthread_kill(signal_thread.native_handle(), SIGTERM);
    signal_thread.join();
    server.stop();
    return 0;
}

int serve_stdio(wsbridge::Server& server)
{
    auto transport = wsbridge::StdioTransport::standard_streams();
    size_t handled = server.serve(transport);
    wsbridge::logger()->info("stdin closed after {} requests", handled);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    std::string program = argc > 0 ? fs::path(argv[0]).filename().string() : "wsbridge-server";

    wsbridge::CommandLine command;
    try
    {
        command = wsbridge::parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << program << ": " << e.what() << "\n\n" << wsbridge::usage(program);
        return 2;
    }

    if (command.action == wsbridge::CommandAction::ShowHelp)
    {
        std::cout << wsbridge::usage(program);
        return 0;
    }
    if (command.action == wsbridge::CommandAction::ShowVersion)
    {
        std::cout << program << " " << wsbridge::kVersion << "\n";
        return 0;
    }

    const wsbridge::ServerOptions& options = command.options;

    try
    {
        wsbridge::init_logging(wsbridge::LoggingOptions{options.log_level, options.log_file});
        auto log = wsbridge::logger();

        // Broken pipes surface as EPIPE from write()
        std::signal(SIGPIPE, SIG_IGN);

        fs::path root = options.workspace_root.empty() ? fs::current_path()
                                                       : fs::path(options.workspace_root);
        std::error_code ec;
        if (!fs::is_directory(root, ec))
        {
            log->critical("Workspace root is not a directory: {}", root.string());
            return 1;
        }

        wsbridge::LocalFileStore store;

        std::unique_ptr<wsbridge::GitCommitter> committer;
        if (options.use_git)
        {
            if (wsbridge::GitCommitter::is_work_tree(root, options.git_path))
            {
                wsbridge::GitCommitterOptions git_options;
                git_options.git_path = options.git_path;
                git_options.author = options.commit_author;
                committer = std::make_unique<wsbridge::GitCommitter>(root, git_options);
            }
            else
            {
                log->warn("{} is not a git work tree; changes will not be committed", root.string());
            }
        }

        wsbridge::Workspace workspace(root, store, committer.get(), options.commit_prefix);
        wsbridge::Dispatcher dispatcher(workspace);
        wsbridge::Server server(dispatcher);

        log->info(
            "wsbridge {} serving {} (version control: {})",
            wsbridge::kVersion,
            workspace.root().string(),
            committer ? "git" : "none"
        );

        if (options.use_stdio)
            return serve_stdio(server);
        return serve_tcp(server, options);
    }
    catch (const std::exception& e)
    {
        wsbridge::logger()->critical("Fatal: {}", e.what());
        return 1;
    }
}
