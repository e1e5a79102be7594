// File System tests
//
// Tests for the in-memory and on-disk file systems and for completions.

#include "fs/file_system.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace weave::fs;
using weave::is_err;
using weave::is_ok;
using weave::unwrap;
using weave::unwrap_err;
namespace stdfs = std::filesystem;

// ============================================================================
// Completion
// ============================================================================

TEST(CompletionTest, MergeKeepsFirstError) {
    auto completion = Completion::ok();
    completion.merge(Completion::ok());
    EXPECT_TRUE(completion.success);

    completion.merge(Completion::failure("first"));
    completion.merge(Completion::failure("second"));
    EXPECT_FALSE(completion.success);
    EXPECT_EQ(completion.error_message, "first");
}

// ============================================================================
// MemoryFileSystem
// ============================================================================

TEST(MemoryFileSystemTest, MissingFileIsNotFound) {
    MemoryFileSystem memory;
    auto result = memory.read("nope.js");
    ASSERT_TRUE(is_ok(result));
    EXPECT_FALSE(unwrap(result).exists);
    EXPECT_EQ(memory.name(), "memory");
}

TEST(MemoryFileSystemTest, EmptyFileExists) {
    MemoryFileSystem memory;
    memory.set_file("empty.js", "");
    auto result = memory.read("empty.js");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), FileContent::from(""));
}

TEST(MemoryFileSystemTest, WritesAreCounted) {
    MemoryFileSystem memory;
    EXPECT_TRUE(memory.write("out/a.js", FileContent::from("a")).success);
    EXPECT_TRUE(memory.write("out/a.js", FileContent::from("b")).success);
    EXPECT_TRUE(memory.write("out/b.js", FileContent::from("c")).success);

    EXPECT_EQ(memory.write_count("out/a.js"), 2u);
    EXPECT_EQ(memory.write_count("out/c.js"), 0u);
    EXPECT_EQ(memory.total_writes(), 3u);
    EXPECT_EQ(memory.file("out/a.js"), "b");
}

TEST(MemoryFileSystemTest, WritingNotFoundRemoves) {
    MemoryFileSystem memory;
    memory.set_file("a.js", "x");
    EXPECT_TRUE(memory.write("a.js", FileContent::not_found()).success);
    EXPECT_FALSE(memory.file("a.js").has_value());
}

TEST(MemoryFileSystemTest, FailingPrefixRejectsWrites) {
    MemoryFileSystem memory;
    memory.fail_writes_under("dist/");
    auto completion = memory.write("dist/a.js", FileContent::from("a"));
    EXPECT_FALSE(completion.success);
    EXPECT_EQ(completion.error_message, "write to dist/a.js rejected");
    EXPECT_FALSE(memory.file("dist/a.js").has_value());
    EXPECT_EQ(memory.write_count("dist/a.js"), 0u);

    EXPECT_TRUE(memory.write("src/a.js", FileContent::from("a")).success);
}

TEST(MemoryFileSystemTest, FailingReadIsAnErrorNotAMissingFile) {
    MemoryFileSystem memory;
    memory.set_file("src/a.js", "a");
    memory.fail_reads_under("src/");
    auto result = memory.read("src/a.js");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "read of src/a.js failed");

    memory.clear_read_failures();
    auto retry = memory.read("src/a.js");
    ASSERT_TRUE(is_ok(retry));
    EXPECT_EQ(unwrap(retry).bytes, "a");
}

TEST(MemoryFileSystemTest, PathReadThrowsOnReadError) {
    auto memory = std::make_shared<MemoryFileSystem>("project");
    memory->set_file("src/a.js", "a");
    memory->fail_reads_under("src/a.js");
    FileSystemPath path{memory, "src/a.js"};
    try {
        (void)path.read();
        FAIL() << "expected ReadError";
    } catch (const ReadError& e) {
        EXPECT_EQ(std::string(e.what()), "unable to read [project] src/a.js: read of src/a.js failed");
    }
}

TEST(MemoryFileSystemTest, PathReadAndWrite) {
    auto memory = std::make_shared<MemoryFileSystem>("project");
    FileSystemPath path{memory, "src/a.js"};
    EXPECT_FALSE(path.read().exists);
    EXPECT_TRUE(path.write(FileContent::from("export {}")).success);
    EXPECT_EQ(path.read().bytes, "export {}");
}

// ============================================================================
// DiskFileSystem
// ============================================================================

class DiskFileSystemTest : public ::testing::Test {
protected:
    stdfs::path root;

    void SetUp() override {
        root = stdfs::temp_directory_path() / "weave_disk_fs_test";
        stdfs::remove_all(root);
        stdfs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        stdfs::remove_all(root, ec);
    }
};

TEST_F(DiskFileSystemTest, WriteCreatesParentDirectories) {
    DiskFileSystem disk("output", root.string());
    auto completion = disk.write("dist/chunks/a.js", FileContent::from("console.log(1)"));
    ASSERT_TRUE(completion.success) << completion.error_message;

    EXPECT_TRUE(stdfs::exists(root / "dist" / "chunks" / "a.js"));
    auto result = disk.read("dist/chunks/a.js");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).bytes, "console.log(1)");
}

TEST_F(DiskFileSystemTest, MissingFileAndDirectoryAreNotFound) {
    DiskFileSystem disk("output", root.string());
    stdfs::create_directories(root / "dir");

    auto missing = disk.read("missing.js");
    ASSERT_TRUE(is_ok(missing));
    EXPECT_FALSE(unwrap(missing).exists);

    auto dir = disk.read("dir");
    ASSERT_TRUE(is_ok(dir));
    EXPECT_FALSE(unwrap(dir).exists);
}

TEST_F(DiskFileSystemTest, UnchangedContentIsNotRewritten) {
    DiskFileSystem disk("output", root.string());
    ASSERT_TRUE(disk.write("a.js", FileContent::from("same")).success);
    auto before = stdfs::last_write_time(root / "a.js");

    ASSERT_TRUE(disk.write("a.js", FileContent::from("same")).success);
    EXPECT_EQ(stdfs::last_write_time(root / "a.js"), before);
}

TEST_F(DiskFileSystemTest, WritingNotFoundRemoves) {
    DiskFileSystem disk("output", root.string());
    ASSERT_TRUE(disk.write("a.js", FileContent::from("x")).success);
    ASSERT_TRUE(disk.write("a.js", FileContent::not_found()).success);
    EXPECT_FALSE(stdfs::exists(root / "a.js"));
}
