//! # Asset Context
//!
//! The resolution authority. An asset context turns import requests into
//! processed assets for one environment and one directory. Contexts are
//! immutable: every `with_*` operation returns a new context with one field
//! replaced, so a context can be shared freely between resolutions.

#pragma once

#include "core/environment.hpp"
#include "core/fwd.hpp"
#include "core/request.hpp"
#include "core/resolve_result.hpp"
#include "fs/file_system.hpp"

#include <string>

namespace weave::core {

class AssetContext {
public:
    virtual ~AssetContext() = default;

    /// Base directory requests are resolved against.
    [[nodiscard]] virtual fs::FileSystemPath context_path() const = 0;

    [[nodiscard]] virtual Environment environment() const = 0;

    /// Resolve options for this context's environment.
    [[nodiscard]] virtual ResolveOptions resolve_options() const = 0;

    /// Resolves `request` from `context_path` and processes every resolved
    /// asset. Failures yield an empty result plus an issue.
    [[nodiscard]] virtual ResolveResult resolve_asset(const fs::FileSystemPath& context_path,
                                                      const Request& request,
                                                      const ResolveOptions& options) const = 0;

    /// Processes every primary asset of an already computed result.
    [[nodiscard]] virtual ResolveResult process_resolve_result(const ResolveResult& result) const = 0;

    /// Turns a source asset into the module this context builds for it.
    [[nodiscard]] virtual AssetPtr process(const AssetPtr& asset) const = 0;

    [[nodiscard]] virtual AssetContextPtr with_context_path(const fs::FileSystemPath& path) const = 0;

    [[nodiscard]] virtual AssetContextPtr with_environment(const Environment& environment) const = 0;

    /// Activates the transition called `name`. Unknown names report an issue
    /// and yield an equivalent context without a transition.
    [[nodiscard]] virtual AssetContextPtr with_transition(const std::string& name) const = 0;
};

} // namespace weave::core
