#include "core/request.hpp"

#include <cctype>
#include <functional>

namespace weave::core {

static bool has_scheme(std::string_view request) {
    // "http://...", "node:fs", "data:..." but not Windows-looking "C:"
    auto colon = request.find(':');
    if (colon == std::string_view::npos || colon < 2) {
        return false;
    }
    for (size_t i = 0; i < colon; ++i) {
        char c = request[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

Request Request::parse(std::string_view request) {
    Request r;
    r.original = std::string(request);

    if (request.empty()) {
        r.kind = Kind::Empty;
        return r;
    }

    if (has_scheme(request) || request.find('\\') != std::string_view::npos ||
        request.find_first_of(" \t\n") != std::string_view::npos) {
        r.kind = Kind::Unknown;
        return r;
    }

    if (request == "." || request == ".." || request.starts_with("./") ||
        request.starts_with("../")) {
        r.kind = Kind::Relative;
        r.path = std::string(request);
        return r;
    }

    if (request.starts_with("/")) {
        r.kind = Kind::Absolute;
        r.path = std::string(request.substr(1));
        return r;
    }

    // Bare specifier: "pkg", "pkg/sub", "@scope/pkg", "@scope/pkg/sub"
    size_t name_end = request.find('/');
    if (request.front() == '@') {
        if (name_end == std::string_view::npos || name_end + 1 >= request.size()) {
            r.kind = Kind::Unknown;
            return r;
        }
        name_end = request.find('/', name_end + 1);
    }

    r.kind = Kind::Module;
    if (name_end == std::string_view::npos) {
        r.module = std::string(request);
    } else {
        r.module = std::string(request.substr(0, name_end));
        r.path = std::string(request.substr(name_end + 1));
    }
    return r;
}

size_t Request::hash() const {
    return std::hash<std::string>{}(original) ^ (static_cast<size_t>(kind) << 1);
}

const char* request_kind_name(Request::Kind kind) {
    switch (kind) {
    case Request::Kind::Empty:
        return "empty";
    case Request::Kind::Relative:
        return "relative";
    case Request::Kind::Absolute:
        return "absolute";
    case Request::Kind::Module:
        return "module";
    case Request::Kind::Unknown:
        return "unknown";
    }
    return "unknown";
}

size_t ResolveOptions::hash() const {
    size_t h = std::hash<bool>{}(types);
    auto mix = [&h](const std::string& s) { h = h * 31 + std::hash<std::string>{}(s); };
    for (const auto& ext : extensions) {
        mix(ext);
    }
    for (const auto& dir : modules) {
        mix(dir);
    }
    mix(index_stem);
    return h;
}

ResolveOptions resolve_options(const Environment& environment) {
    ResolveOptions options;
    if (environment.module_system == ModuleSystem::CommonJs) {
        options.extensions = {".js", ".cjs", ".mjs", ".json"};
    } else {
        options.extensions = {".mjs", ".js", ".cjs", ".json"};
    }
    return options;
}

ResolveOptions typescript_resolve_options(const Environment& environment) {
    ResolveOptions options = resolve_options(environment);
    options.extensions.insert(options.extensions.begin(), {".ts", ".tsx"});
    return options;
}

ResolveOptions types_resolve_options() {
    ResolveOptions options;
    options.extensions = {".d.ts", ".ts", ".tsx"};
    options.types = true;
    return options;
}

} // namespace weave::core
