//! # Aggregated Graph
//!
//! A tree over the assets reachable from a root asset, used to walk the
//! reference graph without revisiting shared subgraphs and without looping
//! on cycles. A node is either a leaf holding one asset or an ordered list
//! of child nodes.
//!
//! ## Shape
//!
//! The tree follows the dominator tree of the reference graph:
//!
//! ```text
//! node(X) = leaf(X)                                   X dominates nothing
//! node(X) = children[leaf(X), node(D1), ..., node(Dk)] otherwise
//! ```
//!
//! where `D1..Dk` are the assets X immediately dominates, in discovery
//! order. Every reachable asset is the leaf of exactly one node. Child lists
//! longer than the session's `max_fan_out` are split into groups of at most
//! `max_fan_out` nodes, level by level, so wide nodes get logarithmic depth.
//!
//! ## Identity
//!
//! Nodes are hash-consed in the session's `NodeInterner`: two nodes with the
//! same content are the same object. After an edit only the nodes whose
//! content changed are new, so queries keyed by the other nodes stay cached.
//!
//! ## Incrementality
//!
//! Each node is its own query (`aggregate_node(root, asset)`), depending on
//! the list of assets its asset immediately dominates (`dominated`). An
//! edit that leaves a dominated list unchanged leaves that node's query,
//! and every node above it whose children are unchanged, verified without
//! recomputation.

#pragma once

#include "core/fwd.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>
#include <variant>
#include <vector>

namespace weave::query {
class QueryContext;
} // namespace weave::query

namespace weave::graph {

class AggregatedGraph;
using AggregatedGraphPtr = std::shared_ptr<const AggregatedGraph>;

class AggregatedGraph {
public:
    using Children = std::vector<AggregatedGraphPtr>;
    using Content = std::variant<core::AssetPtr, Children>;

    explicit AggregatedGraph(Content content) : content_(std::move(content)) {}

    [[nodiscard]] const Content& content() const {
        return content_;
    }

    [[nodiscard]] bool is_leaf() const {
        return std::holds_alternative<core::AssetPtr>(content_);
    }

    /// The leaf asset. Only valid for leaves.
    [[nodiscard]] const core::AssetPtr& asset() const {
        return std::get<core::AssetPtr>(content_);
    }

    /// The child nodes. Only valid for inner nodes.
    [[nodiscard]] const Children& children() const {
        return std::get<Children>(content_);
    }

private:
    Content content_;
};

/// Leaf assets below `node`, depth first, in child order.
[[nodiscard]] std::vector<core::AssetPtr> leaf_assets(const AggregatedGraphPtr& node);

/// Number of edges on the longest root-to-leaf path.
[[nodiscard]] size_t tree_depth(const AggregatedGraphPtr& node);

/// Session-wide table of aggregation nodes. Thread-safe.
///
/// The table holds nodes weakly: a node lives as long as a cached result or
/// a caller holds it, and its slot is reused once it expires. Keys compare
/// addresses only, which stay unique while the node that owns them is alive.
class NodeInterner {
public:
    [[nodiscard]] AggregatedGraphPtr leaf(const core::AssetPtr& asset);

    /// The inner node with exactly these children. A single child is
    /// returned as is.
    [[nodiscard]] AggregatedGraphPtr children(AggregatedGraph::Children children);

    /// Number of live nodes.
    [[nodiscard]] size_t size() const;

    /// Drops the slots of expired nodes. Returns the number dropped.
    size_t sweep();

private:
    using ChildKey = std::vector<const AggregatedGraph*>;
    using NodeSlot = std::weak_ptr<const AggregatedGraph>;

    struct ChildKeyHash {
        size_t operator()(const ChildKey& key) const;
    };

    size_t sweep_locked();
    void note_insert_locked();

    mutable std::mutex mutex_;
    std::unordered_map<const core::Asset*, NodeSlot> leaves_;
    std::unordered_map<ChildKey, NodeSlot, ChildKeyHash> inner_;
    size_t sweep_threshold_ = 64;
};

/// Work behind the `dominated` query.
[[nodiscard]] std::vector<core::AssetPtr>
dominated_assets(query::QueryContext& ctx, const core::AssetPtr& root, const core::AssetPtr& asset);

/// Work behind the `aggregate_node` query: the node of `asset` in the tree
/// below `root`, built from the nodes of the assets it dominates.
[[nodiscard]] AggregatedGraphPtr build_aggregate_node(query::QueryContext& ctx,
                                                      const core::AssetPtr& root,
                                                      const core::AssetPtr& asset);

/// Work behind the `aggregate` query.
[[nodiscard]] AggregatedGraphPtr build_aggregated_graph(query::QueryContext& ctx,
                                                        const core::AssetPtr& root);

/// The aggregation tree rooted at `root`. Memoized.
[[nodiscard]] AggregatedGraphPtr aggregate(query::QueryContext& ctx, const core::AssetPtr& root);

} // namespace weave::graph
