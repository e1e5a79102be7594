#include "fs/file_system.hpp"

#include "log/log.hpp"

#include <vector>

namespace weave::fs {

std::optional<std::string> normalize_path(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string_view::npos) {
            slash = path.size();
        }
        auto segment = path.substr(pos, slash - pos);
        if (segment == "..") {
            if (segments.empty()) {
                return std::nullopt;
            }
            segments.pop_back();
        } else if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
        pos = slash + 1;
    }

    std::string result;
    for (const auto& segment : segments) {
        if (!result.empty()) {
            result += '/';
        }
        result += segment;
    }
    return result;
}

FileSystemPath FileSystemPath::parent() const {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) {
        return {fs, ""};
    }
    return {fs, path.substr(0, slash)};
}

std::optional<FileSystemPath> FileSystemPath::join(std::string_view relative) const {
    std::string combined = path;
    if (!combined.empty() && !relative.empty()) {
        combined += '/';
    }
    combined += relative;

    auto normalized = normalize_path(combined);
    if (!normalized) {
        return std::nullopt;
    }
    return FileSystemPath{fs, std::move(*normalized)};
}

std::string_view FileSystemPath::file_name() const {
    std::string_view view = path;
    auto slash = view.rfind('/');
    return slash == std::string_view::npos ? view : view.substr(slash + 1);
}

std::string_view FileSystemPath::extension() const {
    auto name = file_name();
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        return {};
    }
    return name.substr(dot + 1);
}

bool FileSystemPath::is_inside(const FileSystemPath& dir) const {
    if (fs != dir.fs) {
        return false;
    }
    if (dir.path.empty() || path == dir.path) {
        return true;
    }
    return path.size() > dir.path.size() && path.compare(0, dir.path.size(), dir.path) == 0 &&
           path[dir.path.size()] == '/';
}

std::optional<std::string> FileSystemPath::relative_to(const FileSystemPath& dir) const {
    if (!is_inside(dir)) {
        return std::nullopt;
    }
    if (dir.path.empty()) {
        return path;
    }
    if (path == dir.path) {
        return std::string{};
    }
    return path.substr(dir.path.size() + 1);
}

FileContent FileSystemPath::read() const {
    auto result = fs->read(path);
    if (is_err(result)) {
        WEAVE_LOG_ERROR("fs", "failed to read " << to_string() << ": " << unwrap_err(result));
        throw ReadError("unable to read " + to_string() + ": " + unwrap_err(result));
    }
    return std::move(std::get<FileContent>(result));
}

Completion FileSystemPath::write(const FileContent& content) const {
    return fs->write(path, content);
}

std::string FileSystemPath::to_string() const {
    return "[" + (fs ? fs->name() : std::string("?")) + "] " + path;
}

} // namespace weave::fs
