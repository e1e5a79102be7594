#include "graph/aggregated_graph.hpp"

#include "core/asset.hpp"
#include "graph/dominators.hpp"
#include "log/log.hpp"
#include "query/query_context.hpp"

#include <algorithm>

namespace weave::graph {

std::vector<core::AssetPtr> leaf_assets(const AggregatedGraphPtr& node) {
    std::vector<core::AssetPtr> assets;
    std::vector<const AggregatedGraph*> stack{node.get()};
    while (!stack.empty()) {
        const auto* current = stack.back();
        stack.pop_back();
        if (current->is_leaf()) {
            assets.push_back(current->asset());
            continue;
        }
        const auto& children = current->children();
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back(it->get());
        }
    }
    return assets;
}

size_t tree_depth(const AggregatedGraphPtr& node) {
    if (node->is_leaf()) {
        return 0;
    }
    size_t depth = 0;
    for (const auto& child : node->children()) {
        depth = std::max(depth, tree_depth(child) + 1);
    }
    return depth;
}

// ============================================================================
// NodeInterner
// ============================================================================

size_t NodeInterner::ChildKeyHash::operator()(const ChildKey& key) const {
    size_t h = key.size();
    for (const auto* child : key) {
        h ^= std::hash<const void*>{}(child) + 0x9e3779b9 + (h << 6) + (h >> 2);
    }
    return h;
}

AggregatedGraphPtr NodeInterner::leaf(const core::AssetPtr& asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = leaves_[asset.get()];
    if (auto node = slot.lock()) {
        return node;
    }
    auto node = std::make_shared<const AggregatedGraph>(AggregatedGraph::Content{asset});
    slot = node;
    note_insert_locked();
    return node;
}

AggregatedGraphPtr NodeInterner::children(AggregatedGraph::Children children) {
    if (children.size() == 1) {
        return children.front();
    }
    ChildKey key;
    key.reserve(children.size());
    for (const auto& child : children) {
        key.push_back(child.get());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = inner_[std::move(key)];
    if (auto node = slot.lock()) {
        return node;
    }
    auto node = std::make_shared<const AggregatedGraph>(AggregatedGraph::Content{std::move(children)});
    slot = node;
    note_insert_locked();
    return node;
}

size_t NodeInterner::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t live = 0;
    for (const auto& [_, slot] : leaves_) {
        live += slot.expired() ? 0 : 1;
    }
    for (const auto& [_, slot] : inner_) {
        live += slot.expired() ? 0 : 1;
    }
    return live;
}

size_t NodeInterner::sweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweep_locked();
}

size_t NodeInterner::sweep_locked() {
    size_t dropped = 0;
    for (auto it = leaves_.begin(); it != leaves_.end();) {
        if (it->second.expired()) {
            it = leaves_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    for (auto it = inner_.begin(); it != inner_.end();) {
        if (it->second.expired()) {
            it = inner_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    sweep_threshold_ = std::max<size_t>(64, 2 * (leaves_.size() + inner_.size()));
    return dropped;
}

/// Sweeps once the table doubles, keeping the cost amortized per insert.
void NodeInterner::note_insert_locked() {
    if (leaves_.size() + inner_.size() >= sweep_threshold_) {
        sweep_locked();
    }
}

// ============================================================================
// Building
// ============================================================================

/// Splits `nodes` into groups of at most `max_fan_out` until one level fits.
static AggregatedGraphPtr group(NodeInterner& interner, AggregatedGraph::Children nodes,
                                size_t max_fan_out) {
    while (nodes.size() > max_fan_out) {
        AggregatedGraph::Children level;
        for (size_t i = 0; i < nodes.size(); i += max_fan_out) {
            auto end = std::min(nodes.size(), i + max_fan_out);
            level.push_back(interner.children({nodes.begin() + static_cast<std::ptrdiff_t>(i),
                                               nodes.begin() + static_cast<std::ptrdiff_t>(end)}));
        }
        nodes = std::move(level);
    }
    return interner.children(std::move(nodes));
}

std::vector<core::AssetPtr> dominated_assets(query::QueryContext& ctx, const core::AssetPtr& root,
                                             const core::AssetPtr& asset) {
    return ctx.dominators(root)->dominated_by(asset);
}

AggregatedGraphPtr build_aggregate_node(query::QueryContext& ctx, const core::AssetPtr& root,
                                        const core::AssetPtr& asset) {
    auto& interner = ctx.graph_nodes();
    auto leaf = interner.leaf(asset);
    auto dominated = ctx.dominated(root, asset);
    if (dominated.empty()) {
        return leaf;
    }

    AggregatedGraph::Children children;
    children.reserve(dominated.size() + 1);
    children.push_back(std::move(leaf));
    for (const auto& child : dominated) {
        children.push_back(ctx.aggregate_node(root, child));
    }
    return group(interner, std::move(children), ctx.options().max_fan_out);
}

AggregatedGraphPtr build_aggregated_graph(query::QueryContext& ctx, const core::AssetPtr& root) {
    auto dominators = ctx.dominators(root);
    const auto& nodes = dominators->graph.nodes;

    // Immediate dominators have smaller indices, so walking backwards brings
    // every child node up to date before its parent asks for it
    for (size_t i = nodes.size(); i-- > 1;) {
        (void)ctx.aggregate_node(root, nodes[i]);
    }
    auto tree = ctx.aggregate_node(root, root);

    WEAVE_LOG_DEBUG("graph", "aggregated " << nodes.size() << " assets below "
                                           << root->path().to_string() << ", depth "
                                           << tree_depth(tree));
    return tree;
}

AggregatedGraphPtr aggregate(query::QueryContext& ctx, const core::AssetPtr& root) {
    return ctx.aggregate(root);
}

} // namespace weave::graph
