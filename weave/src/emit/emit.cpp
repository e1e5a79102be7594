#include "emit/emit.hpp"

#include "core/asset.hpp"
#include "core/issue.hpp"
#include "log/log.hpp"
#include "query/query_context.hpp"

namespace weave::emit {

fs::Completion emit(query::QueryContext& ctx, const core::AssetPtr& asset) {
    return ctx.emit_recursive(asset);
}

fs::Completion emit_with_completion(query::QueryContext& ctx, const core::AssetPtr& asset,
                                    const fs::FileSystemPath& output_dir) {
    return ctx.emit_aggregated(ctx.aggregate(asset), output_dir);
}

fs::Completion write_asset(query::QueryContext& ctx, const core::AssetPtr& asset) {
    auto path = asset->path();
    fs::FileContent content;
    try {
        content = asset->content(ctx);
    } catch (const fs::ReadError& e) {
        // Never write what could not be read; a not-found write would delete
        ctx.issues().report({core::IssueSeverity::Error, core::IssueCodes::WRITE_FAILED, "emit",
                             path.to_string(), e.what()});
        return fs::Completion::failure(e.what());
    }

    auto completion = path.write(content);
    if (!completion.success) {
        ctx.issues().report({core::IssueSeverity::Error, core::IssueCodes::WRITE_FAILED, "emit",
                             path.to_string(), completion.error_message});
        return completion;
    }
    WEAVE_LOG_DEBUG("emit", "wrote " << path.to_string());
    return completion;
}

fs::Completion emit_assets_recursive(query::QueryContext& ctx, const core::AssetPtr& asset) {
    auto completion = ctx.emit_asset(asset);
    std::vector<core::AssetPtr> referenced;
    try {
        referenced = ctx.referenced_assets(asset);
    } catch (const fs::ReadError& e) {
        // emit_asset already reported the unreadable content
        completion.merge(fs::Completion::failure(e.what()));
        return completion;
    }
    for (const auto& target : referenced) {
        completion.merge(ctx.emit_recursive(target));
    }
    return completion;
}

fs::Completion emit_aggregated_assets(query::QueryContext& ctx,
                                      const graph::AggregatedGraphPtr& node,
                                      const fs::FileSystemPath& output_dir) {
    if (node->is_leaf()) {
        const auto& asset = node->asset();
        if (!asset->path().is_inside(output_dir)) {
            WEAVE_LOG_TRACE("emit", "skipping " << asset->path().to_string() << " outside "
                                                << output_dir.to_string());
            return fs::Completion::ok();
        }
        return ctx.emit_asset(asset);
    }

    auto completion = fs::Completion::ok();
    for (const auto& child : node->children()) {
        completion.merge(ctx.emit_aggregated(child, output_dir));
    }
    return completion;
}

} // namespace weave::emit
