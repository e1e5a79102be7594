#include "query/query_provider.hpp"

#include "query/query_core.hpp"

namespace weave::query {

void QueryProviderRegistry::register_provider(QueryKind kind, ProviderFn provider,
                                              bool cycle_tolerant) {
    auto idx = static_cast<size_t>(kind);
    if (idx < providers_.size()) {
        providers_[idx] = {std::move(provider), cycle_tolerant};
    }
}

const ProviderEntry* QueryProviderRegistry::get_provider(QueryKind kind) const {
    auto idx = static_cast<size_t>(kind);
    if (idx < providers_.size() && providers_[idx].fn) {
        return &providers_[idx];
    }
    return nullptr;
}

void QueryProviderRegistry::register_core_providers() {
    register_provider(QueryKind::ReadFile, providers::provide_read_file);
    register_provider(QueryKind::SourceAsset, providers::provide_source_asset);
    register_provider(QueryKind::Module, providers::provide_module);
    register_provider(QueryKind::Process, providers::provide_process);
    register_provider(QueryKind::Resolve, providers::provide_resolve);
    register_provider(QueryKind::ResolveAsset, providers::provide_resolve_asset);
    register_provider(QueryKind::ReferencedAssets, providers::provide_referenced_assets);
    register_provider(QueryKind::Rebase, providers::provide_rebase);
    register_provider(QueryKind::Aggregate, providers::provide_aggregate);
    register_provider(QueryKind::Dominators, providers::provide_dominators);
    register_provider(QueryKind::Dominated, providers::provide_dominated);
    register_provider(QueryKind::AggregateNode, providers::provide_aggregate_node);
    register_provider(QueryKind::BackReferences, providers::provide_back_references);
    register_provider(QueryKind::EmitAsset, providers::provide_emit_asset);
    register_provider(QueryKind::EmitRecursive, providers::provide_emit_recursive,
                      /*cycle_tolerant=*/true);
    register_provider(QueryKind::EmitAggregated, providers::provide_emit_aggregated);
}

} // namespace weave::query
