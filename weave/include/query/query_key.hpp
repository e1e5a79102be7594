//! # Query Keys
//!
//! Defines every query key (the inputs of a memoized operation). A key
//! identifies one computation: two calls with equal keys share one cached
//! result for the lifetime of the session.
//!
//! Shared entities (assets, transitions, module options, graph nodes) take
//! part in keys by pointer identity. Value types (paths, environments,
//! requests, resolve options) take part by value.

#pragma once

#include "core/environment.hpp"
#include "core/fwd.hpp"
#include "core/request.hpp"
#include "fs/file_system.hpp"

#include <cstdint>
#include <memory>
#include <variant>

namespace weave::module_options {
struct ModuleOptionsContext;
using ModuleOptionsContextPtr = std::shared_ptr<const ModuleOptionsContext>;
} // namespace weave::module_options

namespace weave::graph {
class AggregatedGraph;
using AggregatedGraphPtr = std::shared_ptr<const AggregatedGraph>;
} // namespace weave::graph

namespace weave::query {

// ============================================================================
// Context Identity
// ============================================================================

/// The five fields that identify a module asset context. Two contexts with
/// equal keys are interchangeable.
struct ContextKey {
    core::TransitionsPtr transitions;
    fs::FileSystemPath context_path;
    core::Environment environment;
    module_options::ModuleOptionsContextPtr module_options_context;
    core::TransitionPtr transition; ///< nullptr when no transition is active

    bool operator==(const ContextKey&) const = default;
};

// ============================================================================
// Query Key Types
// ============================================================================

/// Key for reading a file's content.
struct ReadFileKey {
    fs::FileSystemPath path;
    bool operator==(const ReadFileKey&) const = default;
};

/// Key for the source asset of a path.
struct SourceAssetKey {
    fs::FileSystemPath path;
    bool operator==(const SourceAssetKey&) const = default;
};

/// Key for building the module of a source asset.
struct ModuleKey {
    core::AssetPtr source;
    core::TransitionsPtr transitions;
    core::Environment environment;
    module_options::ModuleOptionsContextPtr module_options_context;
    bool operator==(const ModuleKey&) const = default;
};

/// Key for processing an asset through a context.
struct ProcessKey {
    ContextKey context;
    core::AssetPtr asset;
    bool operator==(const ProcessKey&) const = default;
};

/// Key for raw resolution of a request to source assets.
struct ResolveKey {
    fs::FileSystemPath context_path;
    core::Request request;
    core::ResolveOptions options;
    bool operator==(const ResolveKey&) const = default;
};

/// Key for resolving a request through a context (resolve + process).
struct ResolveAssetKey {
    ContextKey context;
    fs::FileSystemPath context_path;
    core::Request request;
    core::ResolveOptions options;
    bool operator==(const ResolveAssetKey&) const = default;
};

/// Key for the deduplicated set of assets an asset references.
struct ReferencedAssetsKey {
    core::AssetPtr asset;
    bool operator==(const ReferencedAssetsKey&) const = default;
};

/// Key for an asset moved from one directory tree into another.
struct RebaseKey {
    core::AssetPtr source;
    fs::FileSystemPath input_dir;
    fs::FileSystemPath output_dir;
    bool operator==(const RebaseKey&) const = default;
};

/// Key for the aggregation tree rooted at an asset.
struct AggregateKey {
    core::AssetPtr asset;
    bool operator==(const AggregateKey&) const = default;
};

/// Key for the reference graph and dominator tree below a root asset.
struct DominatorsKey {
    core::AssetPtr root;
    bool operator==(const DominatorsKey&) const = default;
};

/// Key for the assets one asset immediately dominates below a root.
struct DominatedKey {
    core::AssetPtr root;
    core::AssetPtr asset;
    bool operator==(const DominatedKey&) const = default;
};

/// Key for the aggregation node of one asset in the tree below a root.
struct AggregateNodeKey {
    core::AssetPtr root;
    core::AssetPtr asset;
    bool operator==(const AggregateNodeKey&) const = default;
};

/// Key for the back references below an aggregation node.
struct BackReferencesKey {
    graph::AggregatedGraphPtr node;
    bool operator==(const BackReferencesKey&) const = default;
};

/// Key for writing one asset to its own path.
struct EmitAssetKey {
    core::AssetPtr asset;
    bool operator==(const EmitAssetKey&) const = default;
};

/// Key for writing an asset and everything it reaches. Cycle tolerant.
struct EmitRecursiveKey {
    core::AssetPtr asset;
    bool operator==(const EmitRecursiveKey&) const = default;
};

/// Key for writing the leaves below an aggregation node that lie inside a
/// directory.
struct EmitAggregatedKey {
    graph::AggregatedGraphPtr node;
    fs::FileSystemPath output_dir;
    bool operator==(const EmitAggregatedKey&) const = default;
};

/// Union of all query keys.
using QueryKey =
    std::variant<ReadFileKey, SourceAssetKey, ModuleKey, ProcessKey, ResolveKey, ResolveAssetKey,
                 ReferencedAssetsKey, RebaseKey, AggregateKey, DominatorsKey, DominatedKey,
                 AggregateNodeKey, BackReferencesKey, EmitAssetKey, EmitRecursiveKey,
                 EmitAggregatedKey>;

/// Tag enum for fast query type discrimination. Order matches `QueryKey`.
enum class QueryKind : uint8_t {
    ReadFile,
    SourceAsset,
    Module,
    Process,
    Resolve,
    ResolveAsset,
    ReferencedAssets,
    Rebase,
    Aggregate,
    Dominators,
    Dominated,
    AggregateNode,
    BackReferences,
    EmitAsset,
    EmitRecursive,
    EmitAggregated,
    COUNT
};

/// Extract the QueryKind from a QueryKey variant.
[[nodiscard]] QueryKind query_kind(const QueryKey& key);

/// Get a human-readable name for a query kind.
[[nodiscard]] const char* query_kind_name(QueryKind kind);

/// Short description of a key for logs and cycle reports, e.g.
/// `"module([project] src/a.js)"`.
[[nodiscard]] std::string describe_key(const QueryKey& key);

/// Hash functor for QueryKey (for use in unordered_map).
struct QueryKeyHash {
    size_t operator()(const QueryKey& key) const;
};

/// Equality functor for QueryKey.
struct QueryKeyEqual {
    bool operator()(const QueryKey& a, const QueryKey& b) const {
        return a == b;
    }
};

} // namespace weave::query
