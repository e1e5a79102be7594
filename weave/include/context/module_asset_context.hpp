//! # Module Asset Context
//!
//! The `AssetContext` implementation used throughout the graph. A context is
//! a `ContextKey` plus the session it runs in; every operation that does
//! real work goes through a memoized query keyed by the context key, so two
//! contexts with equal keys share results.
//!
//! ## Processing
//!
//! Without a transition, `process(asset)` builds the module for the asset
//! in the context's environment. With a transition, the asset first goes
//! through `process_source`, the module is built for the environment
//! `process_environment` returns, and the module goes through
//! `process_module`.
//!
//! ## Deriving contexts
//!
//! `with_context_path` and `with_environment` return fresh contexts: the
//! active transition is dropped. `with_transition` looks the name up in the
//! transition table.
//!
//! The session must outlive every context created on it.

#pragma once

#include "core/asset_context.hpp"
#include "query/query_key.hpp"

namespace weave::query {
class QueryContext;
} // namespace weave::query

namespace weave::context {

class ModuleAssetContext : public core::AssetContext {
public:
    ModuleAssetContext(query::QueryContext* ctx, query::ContextKey key)
        : ctx_(ctx), key_(std::move(key)) {}

    /// A context without a transition.
    [[nodiscard]] static core::AssetContextPtr
    create(query::QueryContext* ctx, core::TransitionsPtr transitions,
           fs::FileSystemPath context_path, core::Environment environment,
           module_options::ModuleOptionsContextPtr module_options_context);

    [[nodiscard]] fs::FileSystemPath context_path() const override {
        return key_.context_path;
    }
    [[nodiscard]] core::Environment environment() const override {
        return key_.environment;
    }
    [[nodiscard]] core::ResolveOptions resolve_options() const override;

    [[nodiscard]] core::ResolveResult resolve_asset(const fs::FileSystemPath& context_path,
                                                    const core::Request& request,
                                                    const core::ResolveOptions& options) const override;
    [[nodiscard]] core::ResolveResult
    process_resolve_result(const core::ResolveResult& result) const override;
    [[nodiscard]] core::AssetPtr process(const core::AssetPtr& asset) const override;

    [[nodiscard]] core::AssetContextPtr
    with_context_path(const fs::FileSystemPath& path) const override;
    [[nodiscard]] core::AssetContextPtr
    with_environment(const core::Environment& environment) const override;
    [[nodiscard]] core::AssetContextPtr with_transition(const std::string& name) const override;

    [[nodiscard]] const query::ContextKey& key() const {
        return key_;
    }

private:
    query::QueryContext* ctx_;
    query::ContextKey key_;

    [[nodiscard]] core::AssetContextPtr derive(query::ContextKey key) const;
};

/// Work behind the `process` query.
[[nodiscard]] core::AssetPtr process_asset(query::QueryContext& ctx, const query::ContextKey& key,
                                           const core::AssetPtr& asset);

/// Work behind the `resolve_asset` query: resolves, reports unresolvable
/// and malformed requests, processes the result and attaches the types
/// reference when TypeScript is enabled.
[[nodiscard]] core::ResolveResult resolve_asset_in_context(query::QueryContext& ctx,
                                                           const query::ContextKey& key,
                                                           const fs::FileSystemPath& context_path,
                                                           const core::Request& request,
                                                           const core::ResolveOptions& options);

} // namespace weave::context
