//! # Query Context
//!
//! The build session. Owns the query cache, dependency tracker and provider
//! registry, plus the session services every stage needs (issue reporter,
//! module asset factory, aggregation node table). All memoized work goes
//! through `force()`.
//!
//! ## Memoization
//!
//! `force<R>(key)` returns the cached result for `key` or runs its provider.
//! Every `force` issued while a provider runs is recorded as a dependency of
//! that provider's key.
//!
//! ## Red-green reuse
//!
//! The session keeps a revision counter that `invalidate_file` bumps when a
//! file's content changes. A result verified at an older revision is green
//! when none of its dependencies changed after it was verified; it is then
//! reused as is. Otherwise it is red and recomputed. A recomputed result
//! equal to the previous one keeps its old `changed_at`, so its dependents
//! stay green.
//!
//! Failed queries are never cached. A query that failed with `fs::ReadError`
//! is still recorded as a dependency, so its callers retry after the file is
//! invalidated.
//!
//! ## Cycles
//!
//! A key that is forced while it is already being computed is a cycle.
//! Cycle-tolerant queries (recursive emission) short-circuit with a default
//! result; any other query throws `QueryCycleError`.

#pragma once

#include "core/issue.hpp"
#include "core/resolve_result.hpp"
#include "log/log.hpp"
#include "query/query_cache.hpp"
#include "query/query_deps.hpp"
#include "query/query_fingerprint.hpp"
#include "query/query_key.hpp"
#include "query/query_provider.hpp"

#include <array>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace weave::modules {
class ModuleAssetFactory;
} // namespace weave::modules

namespace weave::graph {
class NodeInterner;
struct AssetDominators;
using AssetDominatorsPtr = std::shared_ptr<const AssetDominators>;
} // namespace weave::graph

namespace weave::analysis {
struct ReferencesList;
using ReferencesListPtr = std::shared_ptr<const ReferencesList>;
} // namespace weave::analysis

namespace weave::query {

/// Session options.
struct QueryOptions {
    /// Log every computed query at Info under `query`.
    bool verbose = false;
    /// Log short-circuited re-entrant calls of cycle-tolerant queries.
    bool trace_cycles = false;
    /// Maximum number of children of one aggregation node.
    size_t max_fan_out = 8;
};

/// Thrown when a query that is not cycle tolerant depends on itself.
class QueryCycleError : public std::runtime_error {
public:
    explicit QueryCycleError(std::vector<QueryKey> cycle);

    [[nodiscard]] const std::vector<QueryKey>& cycle() const {
        return cycle_;
    }

private:
    std::vector<QueryKey> cycle_;
};

/// Central query context for the build session.
class QueryContext {
public:
    /// Construct with options. Registers all core providers. Without a
    /// factory the basic module asset factory is used.
    explicit QueryContext(const QueryOptions& options = {},
                          std::shared_ptr<modules::ModuleAssetFactory> module_assets = nullptr);
    ~QueryContext();

    QueryContext(const QueryContext&) = delete;
    QueryContext& operator=(const QueryContext&) = delete;

    /// Force-execute a query, returning the cached result or computing it.
    template <typename ResultType> ResultType force(const QueryKey& key);

    // ========================================================================
    // Convenience methods (construct key + call force)
    // ========================================================================

    fs::FileContent read_file(const fs::FileSystemPath& path);
    core::AssetPtr source(const fs::FileSystemPath& path);
    core::AssetPtr module(const core::AssetPtr& source, const core::TransitionsPtr& transitions,
                          const core::Environment& environment,
                          const module_options::ModuleOptionsContextPtr& module_options_context);
    core::AssetPtr process(const ContextKey& context, const core::AssetPtr& asset);
    core::ResolveResult resolve(const fs::FileSystemPath& context_path,
                                const core::Request& request,
                                const core::ResolveOptions& options);
    core::ResolveResult resolve_asset(const ContextKey& context,
                                      const fs::FileSystemPath& context_path,
                                      const core::Request& request,
                                      const core::ResolveOptions& options);
    std::vector<core::AssetPtr> referenced_assets(const core::AssetPtr& asset);
    core::AssetPtr rebase(const core::AssetPtr& source, const fs::FileSystemPath& input_dir,
                          const fs::FileSystemPath& output_dir);
    graph::AggregatedGraphPtr aggregate(const core::AssetPtr& asset);
    graph::AssetDominatorsPtr dominators(const core::AssetPtr& root);
    std::vector<core::AssetPtr> dominated(const core::AssetPtr& root, const core::AssetPtr& asset);
    graph::AggregatedGraphPtr aggregate_node(const core::AssetPtr& root,
                                             const core::AssetPtr& asset);
    analysis::ReferencesListPtr back_references(const graph::AggregatedGraphPtr& node);
    fs::Completion emit_asset(const core::AssetPtr& asset);
    fs::Completion emit_recursive(const core::AssetPtr& asset);
    fs::Completion emit_aggregated(const graph::AggregatedGraphPtr& node,
                                   const fs::FileSystemPath& output_dir);

    // ========================================================================
    // Cache management
    // ========================================================================

    /// Re-reads `path` and, if its content changed, starts a new revision in
    /// which results depending on it are re-verified on their next use.
    /// Returns true if a new revision was started.
    bool invalidate_file(const fs::FileSystemPath& path);

    /// Drops cached results keyed by aggregation nodes or tree positions
    /// that no cached aggregation tree uses any more, then sweeps expired
    /// nodes from the node table. Runs on every revision change. Returns the
    /// number of results dropped.
    size_t collect_garbage();

    void clear_cache() {
        cache_.clear();
    }

    [[nodiscard]] Revision revision() const {
        return revision_;
    }

    /// Number of times a provider of `kind` has run in this session.
    [[nodiscard]] size_t computations(QueryKind kind) const {
        return computations_[static_cast<size_t>(kind)];
    }

    [[nodiscard]] QueryCache::Stats cache_stats() const {
        return cache_.get_stats();
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] const QueryOptions& options() const {
        return options_;
    }
    [[nodiscard]] QueryProviderRegistry& providers() {
        return providers_;
    }
    [[nodiscard]] DependencyTracker& deps() {
        return deps_;
    }
    [[nodiscard]] QueryCache& cache() {
        return cache_;
    }
    [[nodiscard]] core::IssueReporter& issues() {
        return issues_;
    }
    [[nodiscard]] modules::ModuleAssetFactory& module_assets() {
        return *module_assets_;
    }
    [[nodiscard]] graph::NodeInterner& graph_nodes() {
        return *graph_nodes_;
    }

private:
    QueryOptions options_;
    QueryCache cache_;
    DependencyTracker deps_;
    QueryProviderRegistry providers_;
    core::IssueReporter issues_;
    std::shared_ptr<modules::ModuleAssetFactory> module_assets_;
    std::unique_ptr<graph::NodeInterner> graph_nodes_;
    Revision revision_ = 1;
    std::array<size_t, static_cast<size_t>(QueryKind::COUNT)> computations_{};

    /// Result of `key`, recorded as a dependency of the running query. Empty
    /// for a re-entrant call of a cycle-tolerant query.
    std::any fetch(const QueryKey& key);

    /// Brings the entry of `key` up to date at the current revision.
    /// Returns nullopt for a re-entrant call of a cycle-tolerant query.
    std::optional<CacheEntry> update(const QueryKey& key);

    /// True if no dependency of `entry` changed after it was verified.
    bool try_mark_green(const QueryKey& key, const CacheEntry& entry);

    CacheEntry execute(const QueryKey& key, const ProviderEntry& provider,
                       const std::optional<CacheEntry>& previous);

    Revision start_revision();

    /// Compute output fingerprint for a query result. Nullopt when the result
    /// type is unknown, in which case every recomputation counts as a change.
    std::optional<Fingerprint> compute_output_fingerprint(const QueryKey& key,
                                                          const std::any& raw_result) const;
};

// ============================================================================
// Template implementation of force<R>()
// ============================================================================

template <typename ResultType> ResultType QueryContext::force(const QueryKey& key) {
    auto raw_result = fetch(key);
    if (!raw_result.has_value()) {
        // Re-entrant call of a cycle-tolerant query
        return ResultType{};
    }

    const auto* typed = std::any_cast<ResultType>(&raw_result);
    if (!typed) {
        throw std::logic_error(std::string("provider returned the wrong result type for query ") +
                               query_kind_name(query_kind(key)));
    }
    return *typed;
}

} // namespace weave::query
