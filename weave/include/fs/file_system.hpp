//! # File System
//!
//! The file system collaborator consumed by the core: reading source
//! content, writing emitted assets, and navigating paths.
//!
//! Paths are `/`-separated and relative to the root of their file system.
//! The root itself is the empty path. A `FileSystemPath` pairs a path with
//! the file system it lives on; two paths on different file systems are
//! never equal and never contain one another.

#pragma once

#include "common.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace weave::fs {

// ============================================================================
// File Content
// ============================================================================

/// Content of a file, or the fact that it does not exist.
struct FileContent {
    bool exists = false;
    std::string bytes;

    static FileContent not_found() {
        return {};
    }

    static FileContent from(std::string bytes) {
        return {true, std::move(bytes)};
    }

    bool operator==(const FileContent&) const = default;
};

/// Raised when a file exists but cannot be read. Unlike a missing file,
/// this is never cached as a query result.
class ReadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Completion
// ============================================================================

/// Signals that every write issued by an operation has been handed to the
/// file system. `success == false` carries the first failure.
struct Completion {
    bool success = true;
    std::string error_message;

    static Completion ok() {
        return {};
    }

    static Completion failure(std::string message) {
        return {false, std::move(message)};
    }

    /// Folds another completion into this one, keeping the first error.
    void merge(const Completion& other) {
        if (success && !other.success) {
            success = false;
            error_message = other.error_message;
        }
    }
};

// ============================================================================
// File System Interface
// ============================================================================

class FileSystem {
public:
    virtual ~FileSystem() = default;

    /// Short name used when printing paths (e.g., "project", "output").
    [[nodiscard]] virtual std::string name() const = 0;

    /// Reads a file. A missing file is `FileContent::not_found()`, not an
    /// error; errors are reserved for I/O failures.
    [[nodiscard]] virtual Result<FileContent> read(const std::string& path) const = 0;

    /// Writes (or, for not-found content, removes) a file.
    virtual Completion write(const std::string& path, const FileContent& content) = 0;
};

/// A file system rooted at a directory on disk.
///
/// Writes create missing parent directories and are skipped when the file
/// already holds identical content.
class DiskFileSystem : public FileSystem {
public:
    DiskFileSystem(std::string name, std::string root);

    [[nodiscard]] std::string name() const override {
        return name_;
    }
    [[nodiscard]] Result<FileContent> read(const std::string& path) const override;
    Completion write(const std::string& path, const FileContent& content) override;

    [[nodiscard]] const std::string& root() const {
        return root_;
    }

private:
    std::string name_;
    std::string root_;
};

/// An in-memory file system, used by tests and by hosts that keep sources
/// in memory.
class MemoryFileSystem : public FileSystem {
public:
    explicit MemoryFileSystem(std::string name = "memory") : name_(std::move(name)) {}

    [[nodiscard]] std::string name() const override {
        return name_;
    }
    [[nodiscard]] Result<FileContent> read(const std::string& path) const override;
    Completion write(const std::string& path, const FileContent& content) override;

    void set_file(const std::string& path, std::string content);
    void remove_file(const std::string& path);

    /// Makes every subsequent write under `path` fail.
    void fail_writes_under(const std::string& path);

    /// Makes every subsequent read under `path` fail with an I/O error.
    void fail_reads_under(const std::string& path);
    void clear_read_failures();

    /// Number of writes issued for `path` so far.
    [[nodiscard]] size_t write_count(const std::string& path) const;

    /// Total number of writes issued.
    [[nodiscard]] size_t total_writes() const;

    [[nodiscard]] std::optional<std::string> file(const std::string& path) const;

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> files_;
    std::unordered_map<std::string, size_t> write_counts_;
    std::vector<std::string> failing_prefixes_;
    std::vector<std::string> failing_read_prefixes_;
};

// ============================================================================
// File System Path
// ============================================================================

/// A path on a specific file system. Cheap value type.
struct FileSystemPath {
    std::shared_ptr<FileSystem> fs;
    std::string path;

    /// The root of `fs`.
    static FileSystemPath root(std::shared_ptr<FileSystem> fs) {
        return {std::move(fs), ""};
    }

    /// The containing directory. The root's parent is the root.
    [[nodiscard]] FileSystemPath parent() const;

    /// Joins a relative path, normalizing `.` and `..` segments.
    /// Returns nullopt when the result would escape the root.
    [[nodiscard]] std::optional<FileSystemPath> join(std::string_view relative) const;

    /// Last path segment ("" for the root).
    [[nodiscard]] std::string_view file_name() const;

    /// Extension of the last segment without the dot, or "".
    [[nodiscard]] std::string_view extension() const;

    /// True if this path equals `dir` or lies below it, on the same file
    /// system.
    [[nodiscard]] bool is_inside(const FileSystemPath& dir) const;

    /// Path of this file relative to `dir`, or nullopt if not inside it.
    [[nodiscard]] std::optional<std::string> relative_to(const FileSystemPath& dir) const;

    /// Reads the file. Throws ReadError when the file system reports an
    /// I/O failure.
    [[nodiscard]] FileContent read() const;
    Completion write(const FileContent& content) const;

    /// `"[fs] path"` for diagnostics.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const FileSystemPath&) const = default;
};

/// Normalizes `.`/`..`/empty segments. Returns nullopt if `..` escapes.
[[nodiscard]] std::optional<std::string> normalize_path(std::string_view path);

} // namespace weave::fs
