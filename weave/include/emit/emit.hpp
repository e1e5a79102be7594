//! # Emission
//!
//! Writes assets to their paths. Two strategies:
//!
//! - `emit(asset)` writes the asset and everything it reaches. Re-entrant
//!   calls on a reference cycle short-circuit, and each asset is written at
//!   most once per session.
//! - `emit_with_completion(asset, output_dir)` walks the aggregation tree
//!   of the asset and writes only the leaves inside `output_dir`. Leaves
//!   outside it complete without writing.
//!
//! A failed write reports an `E001` issue and fails the enclosing
//! completion; the walk continues with the remaining assets and the first
//! error is kept.

#pragma once

#include "core/fwd.hpp"
#include "fs/file_system.hpp"
#include "graph/aggregated_graph.hpp"

namespace weave::query {
class QueryContext;
} // namespace weave::query

namespace weave::emit {

/// Writes `asset` and every asset it reaches.
fs::Completion emit(query::QueryContext& ctx, const core::AssetPtr& asset);

/// Writes the assets reachable from `asset` that lie inside `output_dir`.
fs::Completion emit_with_completion(query::QueryContext& ctx, const core::AssetPtr& asset,
                                    const fs::FileSystemPath& output_dir);

/// Work behind the `emit_asset` query: writes the content of `asset` to
/// its path.
fs::Completion write_asset(query::QueryContext& ctx, const core::AssetPtr& asset);

/// Work behind the `emit_recursive` query.
fs::Completion emit_assets_recursive(query::QueryContext& ctx, const core::AssetPtr& asset);

/// Work behind the `emit_aggregated` query.
fs::Completion emit_aggregated_assets(query::QueryContext& ctx,
                                      const graph::AggregatedGraphPtr& node,
                                      const fs::FileSystemPath& output_dir);

} // namespace weave::emit
