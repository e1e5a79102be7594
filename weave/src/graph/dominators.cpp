#include "graph/dominators.hpp"

#include "core/asset.hpp"
#include "query/query_context.hpp"

#include <deque>
#include <unordered_map>
#include <utility>

namespace weave::graph {

ReferenceGraph collect_reference_graph(query::QueryContext& ctx, const core::AssetPtr& entry) {
    ReferenceGraph graph;
    std::unordered_map<core::AssetPtr, size_t> index;

    auto intern = [&](const core::AssetPtr& asset) -> std::pair<size_t, bool> {
        auto [it, inserted] = index.emplace(asset, graph.nodes.size());
        if (inserted) {
            graph.nodes.push_back(asset);
            graph.successors.emplace_back();
        }
        return {it->second, inserted};
    };

    std::deque<size_t> queue;
    queue.push_back(intern(entry).first);
    while (!queue.empty()) {
        size_t current = queue.front();
        queue.pop_front();

        // Copy: interning may reallocate `graph.nodes`
        auto asset = graph.nodes[current];
        for (const auto& referenced : ctx.referenced_assets(asset)) {
            auto [target, inserted] = intern(referenced);
            graph.successors[current].push_back(target);
            if (inserted) {
                queue.push_back(target);
            }
        }
    }
    return graph;
}

bool DominatorTree::dominates(size_t a, size_t b) const {
    if (a >= idom.size() || b >= idom.size()) {
        return false;
    }
    while (true) {
        if (a == b) {
            return true;
        }
        if (idom[b] == b) {
            return false;
        }
        b = idom[b];
    }
}

/// Reverse post-order from node 0, iterative so deep chains do not
/// overflow the stack.
static std::vector<size_t> reverse_post_order(const ReferenceGraph& graph) {
    std::vector<size_t> post_order;
    std::vector<bool> visited(graph.size(), false);
    std::vector<std::pair<size_t, size_t>> stack; // node, next successor

    visited[0] = true;
    stack.emplace_back(0, 0);
    while (!stack.empty()) {
        auto& [node, next] = stack.back();
        if (next < graph.successors[node].size()) {
            size_t succ = graph.successors[node][next++];
            if (!visited[succ]) {
                visited[succ] = true;
                stack.emplace_back(succ, 0);
            }
            continue;
        }
        post_order.push_back(node);
        stack.pop_back();
    }
    return {post_order.rbegin(), post_order.rend()};
}

DominatorTree compute_dominator_tree(const ReferenceGraph& graph) {
    DominatorTree tree;
    size_t n = graph.size();
    if (n == 0) {
        return tree;
    }

    constexpr size_t UNDEFINED = static_cast<size_t>(-1);

    auto rpo = reverse_post_order(graph);
    std::vector<size_t> rpo_index(n, UNDEFINED);
    for (size_t i = 0; i < rpo.size(); ++i) {
        rpo_index[rpo[i]] = i;
    }

    std::vector<std::vector<size_t>> predecessors(n);
    for (size_t from = 0; from < n; ++from) {
        for (size_t to : graph.successors[from]) {
            predecessors[to].push_back(from);
        }
    }

    tree.idom.assign(n, UNDEFINED);
    tree.idom[0] = 0;

    auto intersect = [&](size_t b1, size_t b2) {
        while (b1 != b2) {
            while (rpo_index[b1] > rpo_index[b2]) {
                b1 = tree.idom[b1];
            }
            while (rpo_index[b2] > rpo_index[b1]) {
                b2 = tree.idom[b2];
            }
        }
        return b1;
    };

    bool changed = true;
    while (changed) {
        changed = false;
        for (size_t i = 1; i < rpo.size(); ++i) {
            size_t b = rpo[i];
            size_t new_idom = UNDEFINED;
            for (size_t p : predecessors[b]) {
                if (tree.idom[p] == UNDEFINED) {
                    continue;
                }
                new_idom = new_idom == UNDEFINED ? p : intersect(p, new_idom);
            }
            if (new_idom != UNDEFINED && tree.idom[b] != new_idom) {
                tree.idom[b] = new_idom;
                changed = true;
            }
        }
    }

    tree.children.resize(n);
    for (size_t node = 1; node < n; ++node) {
        tree.children[tree.idom[node]].push_back(node);
    }
    return tree;
}

// ============================================================================
// AssetDominators
// ============================================================================

std::vector<core::AssetPtr> AssetDominators::dominated_by(const core::AssetPtr& asset) const {
    auto it = index.find(asset);
    if (it == index.end()) {
        return {};
    }
    std::vector<core::AssetPtr> dominated;
    dominated.reserve(tree.children[it->second].size());
    for (size_t child : tree.children[it->second]) {
        dominated.push_back(graph.nodes[child]);
    }
    return dominated;
}

AssetDominatorsPtr compute_asset_dominators(query::QueryContext& ctx, const core::AssetPtr& root) {
    auto dominators = std::make_shared<AssetDominators>();
    dominators->graph = collect_reference_graph(ctx, root);
    dominators->tree = compute_dominator_tree(dominators->graph);
    for (size_t i = 0; i < dominators->graph.size(); ++i) {
        dominators->index.emplace(dominators->graph.nodes[i], i);
    }
    return dominators;
}

} // namespace weave::graph
