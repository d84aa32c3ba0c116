// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file process.hpp
/// @brief POSIX subprocess management used to drive version control tools

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace wsbridge
{

struct ProcessHandle;
struct PipeHandle;

// =============================================================================
// Error Types
// =============================================================================

/// Exception thrown when process operations fail
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

// =============================================================================
// Pipes
// =============================================================================

/// Pipe for reading output from a subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    /// Read up to size bytes into buffer
    /// @return Number of bytes read, 0 on EOF
    /// @throws ProcessError on read failure
    size_t read(char* buffer, size_t size);

    void close();
    bool is_open() const;

    /// Underlying descriptor, -1 when closed
    int native_handle() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Pipe for writing input to a subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    /// Write all of data to the pipe
    /// @throws ProcessError on write failure
    size_t write(const std::string& data);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// =============================================================================
// ProcessOptions
// =============================================================================

/// Options for spawning a subprocess
struct ProcessOptions
{
    /// Working directory for the subprocess (empty = inherit from parent)
    std::string working_directory;

    /// Environment variables to set on top of the inherited environment
    std::map<std::string, std::string> environment;

    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = false;
};

// =============================================================================
// Process
// =============================================================================

/// POSIX subprocess
///
/// Example usage:
/// @code
/// Process proc;
/// proc.spawn("cat", {});
/// proc.stdin_pipe().write("hello\n");
/// proc.stdin_pipe().close();
/// char buf[64];
/// size_t n = proc.stdout_pipe().read(buf, sizeof(buf));
/// int exit_code = proc.wait();
/// @endcode
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    /// Spawn a new process
    /// @param executable Executable name (searched on PATH) or path
    /// @param args Arguments, not including the executable
    /// @throws ProcessError if the pipes cannot be created or exec fails
    void spawn(
        const std::string& executable,
        const std::vector<std::string>& args,
        const ProcessOptions& options = {}
    );

    /// @throws ProcessError if the stream was not redirected
    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    bool is_running() const;

    /// Blocking wait for process termination
    /// @return Exit code (128 + signal number when killed by a signal)
    int wait();

    /// Request graceful termination (SIGTERM)
    void terminate();

    /// Get process ID, or 0 if not spawned
    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// Outcome of a process run to completion
struct ProcessResult
{
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
};

/// Run a command to completion, capturing stdout and stderr
///
/// stdin is connected to an empty pipe. Both output streams are drained
/// concurrently so a chatty child cannot block on a full pipe.
/// @throws ProcessError if the process cannot be started
ProcessResult run_process(
    const std::string& executable,
    const std::vector<std::string>& args,
    ProcessOptions options = {}
);

/// Find an executable in the system PATH
/// @return Full path to executable, or std::nullopt if not found
std::optional<std::string> find_executable(const std::string& name);

} // namespace wsbridge
