// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT
//
// POSIX implementation of subprocess management (Linux and macOS)

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <wsbridge/process.hpp>

extern "C" char** environ;

namespace wsbridge
{

// =============================================================================
// Platform-specific handle structures
// =============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

namespace
{

std::string get_errno_message()
{
    return std::strerror(errno);
}

/// Both ends of a pipe(2), closed on destruction unless released
struct FdPair
{
    int read_end = -1;
    int write_end = -1;

    FdPair() = default;
    FdPair(const FdPair&) = delete;
    FdPair& operator=(const FdPair&) = delete;

    ~FdPair()
    {
        close_read();
        close_write();
    }

    void open(const char* what)
    {
        int fds[2];
        if (pipe(fds) != 0)
            throw ProcessError(std::string("Failed to create ") + what + " pipe: " +
                               get_errno_message());
        read_end = fds[0];
        write_end = fds[1];
        fcntl(read_end, F_SETFD, FD_CLOEXEC);
        fcntl(write_end, F_SETFD, FD_CLOEXEC);
    }

    bool is_open() const
    {
        return read_end >= 0 || write_end >= 0;
    }

    int release_read()
    {
        int fd = read_end;
        read_end = -1;
        return fd;
    }

    int release_write()
    {
        int fd = write_end;
        write_end = -1;
        return fd;
    }

    void close_read()
    {
        if (read_end >= 0)
            ::close(read_end);
        read_end = -1;
    }

    void close_write()
    {
        if (write_end >= 0)
            ::close(write_end);
        write_end = -1;
    }
};

/// Build "KEY=VALUE" strings for the child: inherited environment plus overrides
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides)
{
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry)
    {
        std::string item(*entry);
        auto eq = item.find('=');
        if (eq != std::string::npos && overrides.count(item.substr(0, eq)) > 0)
            continue;
        env.push_back(std::move(item));
    }
    for (const auto& [key, value] : overrides)
        env.push_back(key + "=" + value);
    return env;
}

int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

// =============================================================================
// ReadPipe implementation
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    while (true)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<size_t>(bytes_read);
        if (errno != EINTR)
            throw ProcessError("Read failed: " + get_errno_message());
    }
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

int ReadPipe::native_handle() const
{
    return handle_ ? handle_->fd : -1;
}

// =============================================================================
// WritePipe implementation
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const std::string& data)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    size_t total_written = 0;
    while (total_written < data.size())
    {
        ssize_t bytes_written =
            ::write(handle_->fd, data.data() + total_written, data.size() - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + get_errno_message());
        }
        total_written += static_cast<size_t>(bytes_written);
    }
    return total_written;
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// Process implementation
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>()), stderr_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    if (stdin_)
        stdin_->close();
    if (stdout_)
        stdout_->close();
    if (stderr_)
        stderr_->close();

    if (is_running())
    {
        terminate();
        try
        {
            wait();
        }
        catch (const ProcessError&)
        {
            // Child already reaped elsewhere; nothing left to clean up
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(
    const std::string& executable,
    const std::vector<std::string>& args,
    const ProcessOptions& options
)
{
    // Resolve and prepare everything before fork(); the child only calls
    // async-signal-safe functions.
    auto resolved = find_executable(executable);
    if (!resolved)
        throw ProcessError("Executable not found: " + executable);

    std::vector<std::string> env_strings = build_environment(options.environment);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& entry : env_strings)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    std::vector<std::string> arg_strings;
    arg_strings.reserve(args.size() + 1);
    arg_strings.push_back(executable);
    arg_strings.insert(arg_strings.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(arg_strings.size() + 1);
    for (auto& arg : arg_strings)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    FdPair in, out, err, exec_status;
    if (options.redirect_stdin)
        in.open("stdin");
    if (options.redirect_stdout)
        out.open("stdout");
    if (options.redirect_stderr)
        err.open("stderr");
    exec_status.open("error");

    const char* work_dir =
        options.working_directory.empty() ? nullptr : options.working_directory.c_str();

    pid_t pid = fork();
    if (pid < 0)
        throw ProcessError("Failed to fork process: " + get_errno_message());

    if (pid == 0)
    {
        auto fail = [&]() {
            int e = errno;
            (void)::write(exec_status.write_end, &e, sizeof(e));
            _exit(127);
        };

        if (in.is_open() && dup2(in.read_end, STDIN_FILENO) < 0)
            fail();
        if (out.is_open() && dup2(out.write_end, STDOUT_FILENO) < 0)
            fail();
        if (err.is_open() && dup2(err.write_end, STDERR_FILENO) < 0)
            fail();
        if (work_dir && chdir(work_dir) != 0)
            fail();

        execve(resolved->c_str(), argv.data(), envp.data());
        fail();
    }

    // Parent: the exec-status pipe's write end is CLOEXEC in the child, so a
    // read of zero bytes means exec succeeded.
    exec_status.close_write();
    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(exec_status.read_end, &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);

    if (error_bytes > 0)
    {
        waitpid(pid, nullptr, 0);
        throw ProcessError("Failed to execute '" + executable + "': " + std::strerror(child_errno));
    }

    if (in.is_open())
    {
        in.close_read();
        stdin_->handle_->fd = in.release_write();
    }
    if (out.is_open())
    {
        out.close_write();
        stdout_->handle_->fd = out.release_read();
    }
    if (err.is_open())
    {
        err.close_write();
        stderr_->handle_->fd = err.release_read();
    }

    handle_->pid = pid;
    handle_->running = true;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_ || !stdin_->is_open())
        throw ProcessError("stdin pipe not available");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_ || !stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_ || !stderr_->is_open())
        throw ProcessError("stderr pipe not available");
    return *stderr_;
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    if (::kill(handle_->pid, 0) == 0)
        return true;
    return errno != ESRCH;
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status = 0;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result != handle_->pid)
        throw ProcessError("waitpid failed: " + get_errno_message());

    handle_->exit_code = decode_wait_status(status);
    handle_->running = false;
    return handle_->exit_code;
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// =============================================================================
// Utility functions
// =============================================================================

ProcessResult run_process(
    const std::string& executable,
    const std::vector<std::string>& args,
    ProcessOptions options
)
{
    options.redirect_stdin = true;
    options.redirect_stdout = true;
    options.redirect_stderr = true;

    Process proc;
    proc.spawn(executable, args, options);
    proc.stdin_pipe().close();

    ProcessResult result;
    ReadPipe* pipes[2] = {&proc.stdout_pipe(), &proc.stderr_pipe()};
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
    char buffer[4096];

    while (pipes[0]->is_open() || pipes[1]->is_open())
    {
        pollfd fds[2];
        nfds_t count = 0;
        int index[2];
        for (int i = 0; i < 2; ++i)
        {
            if (!pipes[i]->is_open())
                continue;
            fds[count] = pollfd{pipes[i]->native_handle(), POLLIN, 0};
            index[count] = i;
            ++count;
        }

        if (::poll(fds, count, -1) < 0)
        {
            if (errno == EINTR)
                continue;
            throw ProcessError("poll failed: " + get_errno_message());
        }

        for (nfds_t k = 0; k < count; ++k)
        {
            if ((fds[k].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
                continue;
            int i = index[k];
            size_t n = pipes[i]->read(buffer, sizeof(buffer));
            if (n == 0)
                pipes[i]->close();
            else
                sinks[i]->append(buffer, n);
        }
    }

    result.exit_code = proc.wait();
    return result;
}

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string::npos)
    {
        std::error_code ec;
        if (access(name.c_str(), X_OK) == 0 && !fs::is_directory(name, ec))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path_str = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path candidate = fs::path(dir) / name;
            std::error_code ec;
            if (access(candidate.c_str(), X_OK) == 0 && !fs::is_directory(candidate, ec))
                return candidate.string();
        }
        start = end + 1;
    }

    return std::nullopt;
}

} // namespace wsbridge
