//! # Resolver
//!
//! Node-style resolution of import requests to source assets.
//!
//! | Request        | Lookup                                                   |
//! |----------------|----------------------------------------------------------|
//! | `./x`, `../x`  | `x` relative to the context directory                    |
//! | `/x`           | `x` relative to the file system root                     |
//! | `pkg/sub`      | `node_modules/pkg/sub` in the context directory and its  |
//! |                | ancestors                                                |
//!
//! A path resolves as a file (exact name, then each extension appended), then
//! as a directory (`package.json` entry field, then `index` plus each
//! extension). Entry fields are `main`, or `types`/`typings` for type-only
//! resolution, which also searches `@types/<pkg>`.
//!
//! Resolution never fails hard: an unresolvable request yields an empty
//! result and the caller decides whether that is worth an issue.

#pragma once

#include "core/request.hpp"
#include "core/resolve_result.hpp"
#include "fs/file_system.hpp"

namespace weave::query {
class QueryContext;
} // namespace weave::query

namespace weave::core {

/// Resolves `request` from `context_path` to source assets. Memoized.
[[nodiscard]] ResolveResult resolve(query::QueryContext& ctx, const fs::FileSystemPath& context_path,
                                    const Request& request, const ResolveOptions& options);

/// The uncached resolver behind `resolve`. File lookups go through the
/// session so later edits invalidate the result.
[[nodiscard]] ResolveResult resolve_request(query::QueryContext& ctx,
                                            const fs::FileSystemPath& context_path,
                                            const Request& request,
                                            const ResolveOptions& options);

/// Name of the DefinitelyTyped package for `module`:
/// `"react"` -> `"@types/react"`, `"@scope/pkg"` -> `"@types/scope__pkg"`.
[[nodiscard]] std::string types_package_name(const std::string& module);

} // namespace weave::core
