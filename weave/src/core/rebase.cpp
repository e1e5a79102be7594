#include "core/rebase.hpp"

#include "query/query_context.hpp"

namespace weave::core {

RebasedAsset::RebasedAsset(AssetPtr source, fs::FileSystemPath input_dir,
                           fs::FileSystemPath output_dir)
    : source_(std::move(source)), input_dir_(std::move(input_dir)),
      output_dir_(std::move(output_dir)) {}

fs::FileSystemPath RebasedAsset::path() const {
    auto original = source_->path();
    auto relative = original.relative_to(input_dir_);
    if (!relative) {
        return original;
    }
    auto rebased = output_dir_.join(*relative);
    return rebased ? *rebased : original;
}

fs::FileContent RebasedAsset::content(query::QueryContext& ctx) const {
    return source_->content(ctx);
}

std::vector<AssetReferencePtr> RebasedAsset::references(query::QueryContext& ctx) const {
    std::vector<AssetReferencePtr> references;
    for (auto& reference : source_->references(ctx)) {
        references.push_back(
            std::make_shared<RebasedAssetReference>(std::move(reference), input_dir_, output_dir_));
    }
    return references;
}

ResolveResult RebasedAssetReference::resolve_reference(query::QueryContext& ctx) const {
    auto result = reference_->resolve_reference(ctx);

    ResolveResult rebased;
    for (const auto& asset : result.primary_assets()) {
        rebased.add_primary(ctx.rebase(asset, input_dir_, output_dir_));
    }
    for (const auto& attached : result.references()) {
        rebased.add_reference(
            std::make_shared<RebasedAssetReference>(attached, input_dir_, output_dir_));
    }
    return rebased;
}

std::string RebasedAssetReference::to_string() const {
    return "rebased " + reference_->to_string();
}

AssetPtr rebase(query::QueryContext& ctx, const AssetPtr& source,
                const fs::FileSystemPath& input_dir, const fs::FileSystemPath& output_dir) {
    return ctx.rebase(source, input_dir, output_dir);
}

} // namespace weave::core
