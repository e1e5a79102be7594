#include "fs/file_system.hpp"

namespace weave::fs {

Result<FileContent> MemoryFileSystem::read(const std::string& path) const {
    std::lock_guard lock(mutex_);
    for (const auto& prefix : failing_read_prefixes_) {
        if (path.compare(0, prefix.size(), prefix) == 0) {
            return std::string("read of " + path + " failed");
        }
    }
    auto it = files_.find(path);
    if (it == files_.end()) {
        return FileContent::not_found();
    }
    return FileContent::from(it->second);
}

Completion MemoryFileSystem::write(const std::string& path, const FileContent& content) {
    std::lock_guard lock(mutex_);
    for (const auto& prefix : failing_prefixes_) {
        if (path.compare(0, prefix.size(), prefix) == 0) {
            return Completion::failure("write to " + path + " rejected");
        }
    }

    ++write_counts_[path];
    if (content.exists) {
        files_[path] = content.bytes;
    } else {
        files_.erase(path);
    }
    return Completion::ok();
}

void MemoryFileSystem::set_file(const std::string& path, std::string content) {
    std::lock_guard lock(mutex_);
    files_[path] = std::move(content);
}

void MemoryFileSystem::remove_file(const std::string& path) {
    std::lock_guard lock(mutex_);
    files_.erase(path);
}

void MemoryFileSystem::fail_writes_under(const std::string& path) {
    std::lock_guard lock(mutex_);
    failing_prefixes_.push_back(path);
}

void MemoryFileSystem::fail_reads_under(const std::string& path) {
    std::lock_guard lock(mutex_);
    failing_read_prefixes_.push_back(path);
}

void MemoryFileSystem::clear_read_failures() {
    std::lock_guard lock(mutex_);
    failing_read_prefixes_.clear();
}

size_t MemoryFileSystem::write_count(const std::string& path) const {
    std::lock_guard lock(mutex_);
    auto it = write_counts_.find(path);
    return it == write_counts_.end() ? 0 : it->second;
}

size_t MemoryFileSystem::total_writes() const {
    std::lock_guard lock(mutex_);
    size_t total = 0;
    for (const auto& [_, count] : write_counts_) {
        total += count;
    }
    return total;
}

std::optional<std::string> MemoryFileSystem::file(const std::string& path) const {
    std::lock_guard lock(mutex_);
    auto it = files_.find(path);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace weave::fs
