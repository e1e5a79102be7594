//! # Core Query Providers
//!
//! Provider implementations for every query kind. Each provider unpacks its
//! key, runs the stage, and returns the result as std::any.

#pragma once

#include "query/query_key.hpp"

#include <any>

namespace weave::query {

class QueryContext;

namespace providers {

/// Provider: read a file through its file system.
std::any provide_read_file(QueryContext& ctx, const QueryKey& key);

/// Provider: the source asset of a path.
std::any provide_source_asset(QueryContext& ctx, const QueryKey& key);

/// Provider: classify a source and build its module.
std::any provide_module(QueryContext& ctx, const QueryKey& key);

/// Provider: run an asset through a context's transition and the module factory.
std::any provide_process(QueryContext& ctx, const QueryKey& key);

/// Provider: resolve a request to source assets.
std::any provide_resolve(QueryContext& ctx, const QueryKey& key);

/// Provider: resolve a request through a context.
std::any provide_resolve_asset(QueryContext& ctx, const QueryKey& key);

/// Provider: the deduplicated assets an asset references.
std::any provide_referenced_assets(QueryContext& ctx, const QueryKey& key);

/// Provider: rebase an asset into another directory tree.
std::any provide_rebase(QueryContext& ctx, const QueryKey& key);

/// Provider: build the aggregation tree rooted at an asset.
std::any provide_aggregate(QueryContext& ctx, const QueryKey& key);

/// Provider: reference graph and dominator tree below a root asset.
std::any provide_dominators(QueryContext& ctx, const QueryKey& key);

/// Provider: the assets one asset immediately dominates below a root.
std::any provide_dominated(QueryContext& ctx, const QueryKey& key);

/// Provider: the aggregation node of one asset below a root.
std::any provide_aggregate_node(QueryContext& ctx, const QueryKey& key);

/// Provider: back references below an aggregation node.
std::any provide_back_references(QueryContext& ctx, const QueryKey& key);

/// Provider: write one asset to its path.
std::any provide_emit_asset(QueryContext& ctx, const QueryKey& key);

/// Provider: write an asset and everything it reaches (cycle tolerant).
std::any provide_emit_recursive(QueryContext& ctx, const QueryKey& key);

/// Provider: write the in-directory leaves below an aggregation node.
std::any provide_emit_aggregated(QueryContext& ctx, const QueryKey& key);

} // namespace providers

} // namespace weave::query
