#include "analysis/back_references.hpp"

#include "core/asset.hpp"
#include "log/log.hpp"
#include "query/query_context.hpp"

#include <ostream>
#include <utility>

namespace weave::analysis {

ReferencesListPtr back_references(query::QueryContext& ctx, const graph::AggregatedGraphPtr& node) {
    return ctx.back_references(node);
}

ReferencesListPtr compute_back_references(query::QueryContext& ctx,
                                          const graph::AggregatedGraphPtr& node) {
    auto list = std::make_shared<ReferencesList>();
    auto& referenced_by = list->referenced_by;

    if (node->is_leaf()) {
        const auto& asset = node->asset();
        for (const auto& referenced : ctx.referenced_assets(asset)) {
            referenced_by[referenced].insert(asset);
        }
        return list;
    }

    for (const auto& child : node->children()) {
        auto child_list = ctx.back_references(child);
        for (const auto& [asset, referrers] : child_list->referenced_by) {
            referenced_by[asset].insert(referrers.begin(), referrers.end());
        }
    }
    return list;
}

std::vector<ReferenceEntry> top_references(const ReferencesList& list, size_t n) {
    std::vector<ReferenceEntry> top;
    if (n == 0) {
        return top;
    }
    top.reserve(n);

    for (const auto& [asset, referrers] : list.referenced_by) {
        // The candidate sinks through the working set; whatever is carried
        // out at the end is the smallest of the set plus candidate
        ReferenceEntry carried{asset, referrers};
        for (auto& member : top) {
            if (member.referenced_by.size() < carried.referenced_by.size()) {
                std::swap(member, carried);
            }
        }
        if (top.size() < n) {
            top.push_back(std::move(carried));
        }
    }
    return top;
}

void print_references(const std::vector<ReferenceEntry>& entries, std::ostream& out) {
    out << "TOP REFERENCES:\n";
    for (const auto& entry : entries) {
        out << entry.asset->path().path << " -> " << entry.referenced_by.size()
            << " times referenced\n";
    }
}

void print_most_referenced(query::QueryContext& ctx, const core::AssetPtr& asset,
                           std::ostream& out) {
    auto aggregated = ctx.aggregate(asset);
    auto list = ctx.back_references(aggregated);
    auto top = top_references(*list);
    WEAVE_LOG_DEBUG("analysis", list->referenced_by.size()
                                    << " referenced assets below " << asset->path().to_string());
    print_references(top, out);
}

} // namespace weave::analysis
