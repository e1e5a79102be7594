#include "query/query_core.hpp"

#include "query/query_context.hpp"

// Full includes for every stage
#include "analysis/back_references.hpp"
#include "context/module_asset_context.hpp"
#include "context/module_factory.hpp"
#include "core/asset.hpp"
#include "core/rebase.hpp"
#include "core/resolve.hpp"
#include "emit/emit.hpp"
#include "graph/aggregated_graph.hpp"
#include "graph/dominators.hpp"
#include "log/log.hpp"

namespace weave::query::providers {

// ============================================================================
// ReadFile Provider
// ============================================================================

std::any provide_read_file(QueryContext& /*ctx*/, const QueryKey& key) {
    const auto& rk = std::get<ReadFileKey>(key);
    return rk.path.read();
}

// ============================================================================
// SourceAsset Provider
// ============================================================================

std::any provide_source_asset(QueryContext& /*ctx*/, const QueryKey& key) {
    const auto& sk = std::get<SourceAssetKey>(key);
    core::AssetPtr source = std::make_shared<core::FileSource>(sk.path);
    return source;
}

// ============================================================================
// Module Provider
// ============================================================================

std::any provide_module(QueryContext& ctx, const QueryKey& key) {
    const auto& mk = std::get<ModuleKey>(key);
    return context::build_module(ctx, mk);
}

// ============================================================================
// Process Provider
// ============================================================================

std::any provide_process(QueryContext& ctx, const QueryKey& key) {
    const auto& pk = std::get<ProcessKey>(key);
    return context::process_asset(ctx, pk.context, pk.asset);
}

// ============================================================================
// Resolve Providers
// ============================================================================

std::any provide_resolve(QueryContext& ctx, const QueryKey& key) {
    const auto& rk = std::get<ResolveKey>(key);
    return core::resolve_request(ctx, rk.context_path, rk.request, rk.options);
}

std::any provide_resolve_asset(QueryContext& ctx, const QueryKey& key) {
    const auto& rk = std::get<ResolveAssetKey>(key);
    return context::resolve_asset_in_context(ctx, rk.context, rk.context_path, rk.request,
                                             rk.options);
}

// ============================================================================
// Graph Providers
// ============================================================================

std::any provide_referenced_assets(QueryContext& ctx, const QueryKey& key) {
    const auto& rk = std::get<ReferencedAssetsKey>(key);
    return core::collect_referenced_assets(ctx, rk.asset);
}

std::any provide_rebase(QueryContext& /*ctx*/, const QueryKey& key) {
    const auto& rk = std::get<RebaseKey>(key);
    core::AssetPtr rebased =
        std::make_shared<core::RebasedAsset>(rk.source, rk.input_dir, rk.output_dir);
    return rebased;
}

std::any provide_aggregate(QueryContext& ctx, const QueryKey& key) {
    const auto& ak = std::get<AggregateKey>(key);
    return graph::build_aggregated_graph(ctx, ak.asset);
}

std::any provide_dominators(QueryContext& ctx, const QueryKey& key) {
    const auto& dk = std::get<DominatorsKey>(key);
    return graph::compute_asset_dominators(ctx, dk.root);
}

std::any provide_dominated(QueryContext& ctx, const QueryKey& key) {
    const auto& dk = std::get<DominatedKey>(key);
    return graph::dominated_assets(ctx, dk.root, dk.asset);
}

std::any provide_aggregate_node(QueryContext& ctx, const QueryKey& key) {
    const auto& nk = std::get<AggregateNodeKey>(key);
    return graph::build_aggregate_node(ctx, nk.root, nk.asset);
}

std::any provide_back_references(QueryContext& ctx, const QueryKey& key) {
    const auto& bk = std::get<BackReferencesKey>(key);
    return analysis::compute_back_references(ctx, bk.node);
}

// ============================================================================
// Emit Providers
// ============================================================================

std::any provide_emit_asset(QueryContext& ctx, const QueryKey& key) {
    const auto& ek = std::get<EmitAssetKey>(key);
    return emit::write_asset(ctx, ek.asset);
}

std::any provide_emit_recursive(QueryContext& ctx, const QueryKey& key) {
    const auto& ek = std::get<EmitRecursiveKey>(key);
    return emit::emit_assets_recursive(ctx, ek.asset);
}

std::any provide_emit_aggregated(QueryContext& ctx, const QueryKey& key) {
    const auto& ek = std::get<EmitAggregatedKey>(key);
    return emit::emit_aggregated_assets(ctx, ek.node, ek.output_dir);
}

} // namespace weave::query::providers
