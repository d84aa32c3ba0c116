// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <chrono>
#include <fcntl.h>
#include <fstream>
#include <future>
#include <gtest/gtest.h>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <wsbridge/file_store.hpp>

#include "test_fakes.hpp"

using namespace wsbridge;
using wsbridge::testing::TempDir;
namespace fs = std::filesystem;

namespace
{

void write_file(const fs::path& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string slurp(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

mode_t file_mode(const fs::path& path)
{
    struct stat st{};
    ::stat(path.c_str(), &st);
    return st.st_mode & 07777;
}

} // namespace

// =============================================================================
// Read Tests
// =============================================================================

TEST(LocalFileStoreTest, ReadExistingFile)
{
    TempDir dir;
    write_file(dir / "a.txt", "hello\n");

    LocalFileStore store;
    auto content = store.read(dir / "a.txt");

    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "hello\n");
}

TEST(LocalFileStoreTest, ReadKeepsBytesExactly)
{
    TempDir dir;
    std::string bytes("line1\r\nline2\0tail", 17);
    write_file(dir / "bin", bytes);

    LocalFileStore store;
    EXPECT_EQ(store.read(dir / "bin").value(), bytes);
}

TEST(LocalFileStoreTest, ReadMissingFileIsNullopt)
{
    TempDir dir;
    LocalFileStore store;

    EXPECT_FALSE(store.read(dir / "missing.txt").has_value());
    EXPECT_FALSE(store.read(dir / "no" / "such" / "dir.txt").has_value());
}

TEST(LocalFileStoreTest, ReadDirectoryThrows)
{
    TempDir dir;
    fs::create_directory(dir / "sub");

    LocalFileStore store;
    EXPECT_THROW(store.read(dir / "sub"), FileStoreError);
}

TEST(LocalFileStoreTest, ReadEmptyFile)
{
    TempDir dir;
    write_file(dir / "empty", "");

    LocalFileStore store;
    auto content = store.read(dir / "empty");
    ASSERT_TRUE(content.has_value());
    EXPECT_TRUE(content->empty());
}

TEST(LocalFileStoreTest, ReadFifoThrowsWithoutBlocking)
{
    TempDir dir;
    fs::path fifo = dir / "pipe";
    ASSERT_EQ(::mkfifo(fifo.c_str(), 0600), 0);

    LocalFileStore store;
    auto pending = std::async(std::launch::async, [&] { return store.read(fifo); });

    if (pending.wait_for(std::chrono::seconds(5)) != std::future_status::ready)
    {
        // Give the blocked open() a writer so the test can finish
        int writer = ::open(fifo.c_str(), O_WRONLY);
        if (writer >= 0)
            ::close(writer);
        FAIL() << "read() blocked on a FIFO";
    }
    EXPECT_THROW(pending.get(), FileStoreError);
}

// =============================================================================
// Write Tests
// =============================================================================

TEST(LocalFileStoreTest, WriteCreatesFile)
{
    TempDir dir;
    LocalFileStore store;

    store.write(dir / "new.py", "print('hi')\n");

    EXPECT_EQ(slurp(dir / "new.py"), "print('hi')\n");
}

TEST(LocalFileStoreTest, WriteReplacesWholeFile)
{
    TempDir dir;
    write_file(dir / "a.txt", "a much longer original content\n");

    LocalFileStore store;
    store.write(dir / "a.txt", "short\n");

    EXPECT_EQ(slurp(dir / "a.txt"), "short\n");
}

TEST(LocalFileStoreTest, WriteEmptyContentTruncates)
{
    TempDir dir;
    write_file(dir / "a.txt", "something");

    LocalFileStore store;
    store.write(dir / "a.txt", "");

    EXPECT_TRUE(fs::exists(dir / "a.txt"));
    EXPECT_EQ(fs::file_size(dir / "a.txt"), 0u);
}

TEST(LocalFileStoreTest, WriteCreatesParentDirectories)
{
    TempDir dir;
    LocalFileStore store;

    store.write(dir / "pkg" / "sub" / "mod.py", "x = 1\n");

    EXPECT_EQ(slurp(dir / "pkg" / "sub" / "mod.py"), "x = 1\n");
}

TEST(LocalFileStoreTest, WriteWithoutCreatingDirectoriesFails)
{
    TempDir dir;
    LocalFileStore store(LocalFileStore::Options{false});

    EXPECT_THROW(store.write(dir / "pkg" / "mod.py", "x"), FileStoreError);
    EXPECT_FALSE(fs::exists(dir / "pkg"));
}

TEST(LocalFileStoreTest, WriteLeavesNoTemporaryFiles)
{
    TempDir dir;
    LocalFileStore store;

    store.write(dir / "a.txt", "one");
    store.write(dir / "a.txt", "two");

    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(dir.path()))
    {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST(LocalFileStoreTest, WriteLongFileName)
{
    TempDir dir;
    LocalFileStore store;
    fs::path target = dir / (std::string(240, 'n') + ".txt");

    store.write(target, "long\n");
    store.write(target, "longer\n");

    EXPECT_EQ(slurp(target), "longer\n");
}

TEST(LocalFileStoreTest, WriteKeepsPermissions)
{
    TempDir dir;
    write_file(dir / "run.sh", "#!/bin/sh\n");
    ::chmod((dir / "run.sh").c_str(), 0755);

    LocalFileStore store;
    store.write(dir / "run.sh", "#!/bin/sh\necho hi\n");

    EXPECT_EQ(file_mode(dir / "run.sh"), 0755u);
}

TEST(LocalFileStoreTest, WriteOverDirectoryThrows)
{
    TempDir dir;
    fs::create_directory(dir / "sub");

    LocalFileStore store;
    EXPECT_THROW(store.write(dir / "sub", "x"), FileStoreError);
    EXPECT_TRUE(fs::is_directory(dir / "sub"));
}

TEST(LocalFileStoreTest, WriteThenReadSeesNewContent)
{
    TempDir dir;
    LocalFileStore store;

    std::string content = "caf\xC3\xA9\n";
    store.write(dir / "u.txt", content);

    EXPECT_EQ(store.read(dir / "u.txt").value(), content);
}

TEST(FileStoreErrorTest, CarriesPathAndReason)
{
    FileStoreError e("/tmp/x", "is a directory");

    EXPECT_EQ(e.path(), "/tmp/x");
    EXPECT_EQ(e.reason(), "is a directory");
    EXPECT_STREQ(e.what(), "/tmp/x: is a directory");
}
