#include "fs/file_system.hpp"

#include "log/log.hpp"
#include "query/query_fingerprint.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace stdfs = std::filesystem;

namespace weave::fs {

DiskFileSystem::DiskFileSystem(std::string name, std::string root)
    : name_(std::move(name)), root_(std::move(root)) {}

Result<FileContent> DiskFileSystem::read(const std::string& path) const {
    stdfs::path full = stdfs::path(root_) / path;

    std::error_code ec;
    if (!stdfs::is_regular_file(full, ec)) {
        return FileContent::not_found();
    }

    try {
        std::ifstream file(full, std::ios::binary);
        if (!file) {
            return std::string("cannot open " + full.string());
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        return FileContent::from(ss.str());
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
}

Completion DiskFileSystem::write(const std::string& path, const FileContent& content) {
    stdfs::path full = stdfs::path(root_) / path;
    std::error_code ec;

    if (!content.exists) {
        stdfs::remove(full, ec);
        if (ec) {
            return Completion::failure("cannot remove " + full.string() + ": " + ec.message());
        }
        return Completion::ok();
    }

    // Unchanged files are left alone so their timestamps stay put
    auto existing = read(path);
    if (is_ok(existing)) {
        const auto& old = unwrap(existing);
        if (old.exists && query::fingerprint_string(old.bytes) ==
                              query::fingerprint_string(content.bytes)) {
            WEAVE_LOG_TRACE("fs", "unchanged " << full.string());
            return Completion::ok();
        }
    }

    stdfs::create_directories(full.parent_path(), ec);
    if (ec) {
        return Completion::failure("cannot create directory " + full.parent_path().string() +
                                   ": " + ec.message());
    }

    std::ofstream file(full, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Completion::failure("cannot open " + full.string() + " for writing");
    }
    file.write(content.bytes.data(), static_cast<std::streamsize>(content.bytes.size()));
    if (!file) {
        return Completion::failure("write to " + full.string() + " failed");
    }
    WEAVE_LOG_DEBUG("fs", "wrote " << full.string() << " (" << content.bytes.size() << " bytes)");
    return Completion::ok();
}

} // namespace weave::fs
