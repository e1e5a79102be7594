//! # Reference Graph Dominators
//!
//! The reference graph reachable from an entry asset and its dominator tree.
//! Asset X dominates Y when every reference path from the entry to Y passes
//! through X. The dominator tree is computed with the Cooper-Harvey-Kennedy
//! iterative algorithm over reverse post-order.
//!
//! Nodes are indexed in breadth-first discovery order, entry first. A
//! dominator is never farther from the entry than the nodes it dominates, so
//! every node's immediate dominator has a smaller index.

#pragma once

#include "core/fwd.hpp"

#include <cstddef>
#include <memory>
#include <unordered_map>
#include <vector>

namespace weave::query {
class QueryContext;
} // namespace weave::query

namespace weave::graph {

struct ReferenceGraph {
    std::vector<core::AssetPtr> nodes;
    std::vector<std::vector<size_t>> successors;

    [[nodiscard]] size_t size() const {
        return nodes.size();
    }
};

/// Walks `referenced_assets` from `entry`. Cycles and shared assets are
/// visited once.
[[nodiscard]] ReferenceGraph collect_reference_graph(query::QueryContext& ctx,
                                                     const core::AssetPtr& entry);

struct DominatorTree {
    /// Immediate dominator per node. The entry is its own dominator.
    std::vector<size_t> idom;
    /// Nodes immediately dominated by each node, in discovery order.
    std::vector<std::vector<size_t>> children;

    [[nodiscard]] bool dominates(size_t a, size_t b) const;
};

[[nodiscard]] DominatorTree compute_dominator_tree(const ReferenceGraph& graph);

/// The reference graph below a root asset with its dominator tree. Result
/// of the `dominators` query.
struct AssetDominators {
    ReferenceGraph graph;
    DominatorTree tree;
    std::unordered_map<core::AssetPtr, size_t> index;

    /// Assets `asset` immediately dominates, in discovery order. Empty for
    /// an asset that is not reachable from the root.
    [[nodiscard]] std::vector<core::AssetPtr> dominated_by(const core::AssetPtr& asset) const;
};

using AssetDominatorsPtr = std::shared_ptr<const AssetDominators>;

/// Work behind the `dominators` query.
[[nodiscard]] AssetDominatorsPtr compute_asset_dominators(query::QueryContext& ctx,
                                                          const core::AssetPtr& root);

} // namespace weave::graph
