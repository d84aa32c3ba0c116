// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <wsbridge/file_store.hpp>

namespace wsbridge
{

namespace fs = std::filesystem;

namespace
{

std::string get_errno_message()
{
    return std::strerror(errno);
}

/// Owns a file descriptor
class FileDescriptor
{
  public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor()
    {
        if (fd_ >= 0)
            ::close(fd_);
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const
    {
        return fd_;
    }

    /// Close now and report failure (buffered write errors surface here)
    bool close()
    {
        int fd = fd_;
        fd_ = -1;
        return ::close(fd) == 0;
    }

  private:
    int fd_;
};

/// Removes a temporary file unless dismissed
class TempFileGuard
{
  public:
    explicit TempFileGuard(fs::path path) : path_(std::move(path)) {}
    ~TempFileGuard()
    {
        if (!path_.empty())
        {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    void dismiss()
    {
        path_.clear();
    }

  private:
    fs::path path_;
};

/// Temp name is independent of the target name so it never exceeds NAME_MAX
fs::path make_temp_path(const fs::path& target)
{
    static std::atomic<unsigned> counter{0};
    std::string name =
        ".wsbridge-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + ".tmp";
    return target.parent_path() / name;
}

void fsync_directory(const fs::path& dir, const std::string& path)
{
    int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0)
        throw FileStoreError(path, "cannot open parent directory: " + get_errno_message());
    FileDescriptor directory(fd);
    if (::fsync(directory.get()) != 0)
        throw FileStoreError(path, "directory fsync failed: " + get_errno_message());
}

void write_all(int fd, const std::string& content, const std::string& path)
{
    size_t total_written = 0;
    while (total_written < content.size())
    {
        ssize_t n = ::write(fd, content.data() + total_written, content.size() - total_written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw FileStoreError(path, "write failed: " + get_errno_message());
        }
        total_written += static_cast<size_t>(n);
    }
}

} // namespace

std::optional<std::string> LocalFileStore::read(const fs::path& path)
{
    const std::string display = path.string();

    // O_NONBLOCK keeps a FIFO from blocking open() until a writer shows up
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK);
    if (fd < 0)
    {
        if (errno == ENOENT || errno == ENOTDIR)
            return std::nullopt;
        throw FileStoreError(display, "cannot open: " + get_errno_message());
    }
    FileDescriptor file(fd);

    struct stat st{};
    if (::fstat(file.get(), &st) != 0)
        throw FileStoreError(display, "cannot stat: " + get_errno_message());
    if (!S_ISREG(st.st_mode))
        throw FileStoreError(display, "not a regular file");

    int flags = ::fcntl(file.get(), F_GETFL);
    if (flags < 0 || ::fcntl(file.get(), F_SETFL, flags & ~O_NONBLOCK) != 0)
        throw FileStoreError(display, "cannot clear O_NONBLOCK: " + get_errno_message());

    std::string content;
    content.reserve(static_cast<size_t>(st.st_size));

    char buffer[16384];
    while (true)
    {
        ssize_t n = ::read(file.get(), buffer, sizeof(buffer));
        if (n == 0)
            break;
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw FileStoreError(display, "read failed: " + get_errno_message());
        }
        content.append(buffer, static_cast<size_t>(n));
    }
    return content;
}

void LocalFileStore::write(const fs::path& path, const std::string& content)
{
    const std::string display = path.string();

    if (path.filename().empty())
        throw FileStoreError(display, "path does not name a file");

    std::error_code ec;
    if (fs::is_directory(path, ec))
        throw FileStoreError(display, "is a directory");

    fs::path parent = path.parent_path();
    if (options_.create_directories && !parent.empty())
    {
        fs::create_directories(parent, ec);
        if (ec)
            throw FileStoreError(display, "cannot create parent directory: " + ec.message());
    }

    // Keep the permission bits of the file being replaced
    mode_t mode = 0644;
    struct stat existing{};
    if (::stat(path.c_str(), &existing) == 0)
        mode = existing.st_mode & 07777;

    fs::path temp = make_temp_path(path);
    int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0)
        throw FileStoreError(display, "cannot create temporary file: " + get_errno_message());

    TempFileGuard guard(temp);
    FileDescriptor file(fd);

    write_all(file.get(), content, display);

    if (::fchmod(file.get(), mode) != 0)
        throw FileStoreError(display, "cannot set permissions: " + get_errno_message());
    if (::fsync(file.get()) != 0)
        throw FileStoreError(display, "fsync failed: " + get_errno_message());
    if (!file.close())
        throw FileStoreError(display, "close failed: " + get_errno_message());

    if (::rename(temp.c_str(), path.c_str()) != 0)
        throw FileStoreError(display, "rename failed: " + get_errno_message());
    guard.dismiss();

    fsync_directory(parent, display);
}

} // namespace wsbridge
