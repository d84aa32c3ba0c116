// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <wsbridge/logging.hpp>
#include <wsbridge/options.hpp>

namespace wsbridge
{

namespace
{

int parse_port(const std::string& text)
{
    size_t consumed = 0;
    int port = -1;
    try
    {
        port = std::stoi(text, &consumed);
    }
    catch (const std::exception&)
    {
        consumed = 0;
    }
    if (consumed != text.size() || port < 0 || port > 65535)
        throw std::invalid_argument("Invalid port: " + text);
    return port;
}

std::string checked_log_level(const std::string& level)
{
    if (!parse_log_level(level))
        throw std::invalid_argument("Invalid log level: " + level);
    return level;
}

void apply_environment(ServerOptions& options, const EnvironmentLookup& env)
{
    if (auto root = env("WSBRIDGE_ROOT"); root && !root->empty())
        options.workspace_root = *root;
    if (auto level = env("WSBRIDGE_LOG_LEVEL"); level && !level->empty())
        options.log_level = checked_log_level(*level);
    if (auto file = env("WSBRIDGE_LOG_FILE"); file && !file->empty())
        options.log_file = *file;
    if (auto prefix = env("WSBRIDGE_COMMIT_PREFIX"); prefix && !prefix->empty())
        options.commit_prefix = *prefix;
}

} // namespace

std::optional<std::string> process_environment(const std::string& name)
{
    const char* value = std::getenv(name.c_str());
    if (!value)
        return std::nullopt;
    return std::string(value);
}

CommandLine parse_command_line(const std::vector<std::string>& args, const EnvironmentLookup& env)
{
    CommandLine result;
    ServerOptions& options = result.options;
    apply_environment(options, env);

    for (size_t i = 0; i < args.size(); ++i)
    {
        std::string name = args[i];
        std::optional<std::string> inline_value;
        if (auto eq = name.find('='); name.rfind("--", 0) == 0 && eq != std::string::npos)
        {
            inline_value = name.substr(eq + 1);
            name.resize(eq);
        }

        auto value = [&]() -> std::string
        {
            if (inline_value)
                return *inline_value;
            if (i + 1 >= args.size())
                throw std::invalid_argument("Missing value for " + name);
            return args[++i];
        };
        auto no_value = [&]()
        {
            if (inline_value)
                throw std::invalid_argument(name + " does not take a value");
        };

        if (name == "--help" || name == "-h")
        {
            no_value();
            result.action = CommandAction::ShowHelp;
        }
        else if (name == "--version")
        {
            no_value();
            result.action = CommandAction::ShowVersion;
        }
        else if (name == "--root")
        {
            options.workspace_root = value();
            if (options.workspace_root.empty())
                throw std::invalid_argument("--root must not be empty");
        }
        else if (name == "--stdio")
        {
            no_value();
            options.use_stdio = true;
        }
        else if (name == "--host")
        {
            options.host = value();
            if (options.host.empty())
                throw std::invalid_argument("--host must not be empty");
            options.use_stdio = false;
        }
        else if (name == "--port")
        {
            options.port = parse_port(value());
            options.use_stdio = false;
        }
        else if (name == "--git")
        {
            options.use_git = true;
            if (inline_value)
                options.git_path = *inline_value;
        }
        else if (name == "--no-git")
        {
            no_value();
            options.use_git = false;
        }
        else if (name == "--commit-prefix")
        {
            options.commit_prefix = value();
            if (options.commit_prefix.empty())
                throw std::invalid_argument("--commit-prefix must not be empty");
        }
        else if (name == "--author")
        {
            options.commit_author = value();
        }
        else if (name == "--log-level")
        {
            options.log_level = checked_log_level(value());
        }
        else if (name == "--log-file")
        {
            options.log_file = value();
        }
        else
        {
            throw std::invalid_argument("Unknown argument: " + args[i]);
        }
    }

    return result;
}

std::string usage(const std::string& program)
{
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "Serves getContext and applyChanges over JSON-RPC 2.0 with Content-Length framing.\n"
        << "\n"
        << "Options:\n"
        << "  --root PATH            Workspace root (env WSBRIDGE_ROOT, default: cwd)\n"
        << "  --stdio                Serve over stdin/stdout (default)\n"
        << "  --host HOST            Serve TCP on HOST (default 127.0.0.1)\n"
        << "  --port PORT            Serve TCP on PORT (0 picks a free port)\n"
        << "  --git[=PATH]           Commit applied changes with git (default)\n"
        << "  --no-git               Never commit\n"
        << "  --commit-prefix TEXT   Commit message prefix (env WSBRIDGE_COMMIT_PREFIX)\n"
        << "  --author AUTHOR        Commit author, \"Name <email>\"\n"
        << "  --log-level LEVEL      trace|debug|info|warn|error|critical|off "
           "(env WSBRIDGE_LOG_LEVEL)\n"
        << "  --log-file PATH        Also log to a rotating file (env WSBRIDGE_LOG_FILE)\n"
        << "  --version              Print the version and exit\n"
        << "  -h, --help             Print this help and exit\n";
    return out.str();
}

} // namespace wsbridge
