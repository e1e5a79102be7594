//! # Import Requests and Resolve Options
//!
//! A `Request` is the parsed form of an import specifier as written in
//! source (`"./util"`, `"/abs/path"`, `"react-dom/client"`). `ResolveOptions`
//! controls how a request is turned into files.

#pragma once

#include "core/environment.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace weave::core {

// ============================================================================
// Request
// ============================================================================

struct Request {
    enum class Kind {
        Empty,    ///< ""
        Relative, ///< "./x", "../x", "."
        Absolute, ///< "/x" (relative to the file system root)
        Module,   ///< "pkg", "pkg/sub", "@scope/pkg/sub"
        Unknown   ///< Anything the resolver cannot handle (URLs, "node:fs", ...)
    };

    Kind kind = Kind::Empty;
    std::string original; ///< As written in source
    std::string path;     ///< Relative/absolute path, or sub path inside a module
    std::string module;   ///< Package name for Kind::Module

    [[nodiscard]] static Request parse(std::string_view request);

    /// Empty and unknown requests can never resolve.
    [[nodiscard]] bool is_malformed() const {
        return kind == Kind::Empty || kind == Kind::Unknown;
    }

    [[nodiscard]] size_t hash() const;

    [[nodiscard]] const std::string& to_string() const {
        return original;
    }

    bool operator==(const Request&) const = default;
};

[[nodiscard]] const char* request_kind_name(Request::Kind kind);

// ============================================================================
// Resolve Options
// ============================================================================

struct ResolveOptions {
    /// Extensions tried, in order, when a path does not name a file.
    std::vector<std::string> extensions;
    /// Directory names searched for module requests, walking up.
    std::vector<std::string> modules{"node_modules"};
    /// Stem of the file tried inside a directory.
    std::string index_stem = "index";
    /// Type-only resolution: prefer `types`/`typings` package fields and
    /// fall back to `@types/<pkg>`.
    bool types = false;

    [[nodiscard]] size_t hash() const;

    bool operator==(const ResolveOptions&) const = default;
};

/// Options for JavaScript resolution in `environment`.
[[nodiscard]] ResolveOptions resolve_options(const Environment& environment);

/// TypeScript-aware options: `.ts`/`.tsx` are tried before JavaScript.
[[nodiscard]] ResolveOptions typescript_resolve_options(const Environment& environment);

/// Options used to locate type declarations for a request.
[[nodiscard]] ResolveOptions types_resolve_options();

} // namespace weave::core
