#include "core/asset.hpp"

#include "log/log.hpp"
#include "query/query_context.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>

namespace weave::core {

std::vector<AssetReferencePtr> Asset::references(query::QueryContext& /*ctx*/) const {
    return {};
}

fs::FileContent FileSource::content(query::QueryContext& ctx) const {
    return ctx.read_file(path_);
}

ResolveResult SingleAssetReference::resolve_reference(query::QueryContext& /*ctx*/) const {
    return ResolveResult::single(asset_);
}

// ============================================================================
// ResolveResult
// ============================================================================

void ResolveResult::add_primary(AssetPtr asset) {
    if (std::find(primary_.begin(), primary_.end(), asset) == primary_.end()) {
        primary_.push_back(std::move(asset));
    }
}

void ResolveResult::add_reference(AssetReferencePtr reference) {
    if (std::find(references_.begin(), references_.end(), reference) == references_.end()) {
        references_.push_back(std::move(reference));
    }
}

// ============================================================================
// Referenced assets
// ============================================================================

std::vector<AssetPtr> all_referenced_assets(query::QueryContext& ctx, const AssetPtr& asset) {
    return ctx.referenced_assets(asset);
}

std::vector<AssetPtr> collect_referenced_assets(query::QueryContext& ctx, const AssetPtr& asset) {
    std::vector<AssetPtr> assets;
    std::unordered_set<AssetPtr> seen_assets;
    std::unordered_set<AssetReferencePtr> seen_references;

    std::deque<AssetReferencePtr> queue;
    for (auto& reference : asset->references(ctx)) {
        if (seen_references.insert(reference).second) {
            queue.push_back(std::move(reference));
        }
    }

    while (!queue.empty()) {
        auto reference = std::move(queue.front());
        queue.pop_front();

        auto result = reference->resolve_reference(ctx);
        for (const auto& primary : result.primary_assets()) {
            if (seen_assets.insert(primary).second) {
                assets.push_back(primary);
            }
        }
        for (const auto& attached : result.references()) {
            if (seen_references.insert(attached).second) {
                queue.push_back(attached);
            }
        }
    }

    WEAVE_LOG_TRACE("graph", asset->path().path << " references " << assets.size() << " assets");
    return assets;
}

} // namespace weave::core
