#include "modules/module_reference.hpp"

#include "core/asset_context.hpp"
#include "core/resolve.hpp"
#include "log/log.hpp"

namespace weave::modules {

core::ResolveResult RequestAssetReference::resolve_reference(query::QueryContext& /*ctx*/) const {
    return context_->resolve_asset(context_->context_path(), request_,
                                   context_->resolve_options());
}

std::string RequestAssetReference::to_string() const {
    return "import '" + request_.to_string() + "' in " + context_->context_path().to_string();
}

core::ResolveResult TypescriptTypesAssetReference::resolve_reference(query::QueryContext& ctx) const {
    auto result =
        core::resolve(ctx, context_->context_path(), request_, core::types_resolve_options());
    if (result.is_unresolvable()) {
        WEAVE_LOG_TRACE("resolve", "no type declarations for '" << request_.to_string() << "'");
        return result;
    }
    return context_->process_resolve_result(result);
}

std::string TypescriptTypesAssetReference::to_string() const {
    return "types of '" + request_.to_string() + "' in " + context_->context_path().to_string();
}

} // namespace weave::modules
