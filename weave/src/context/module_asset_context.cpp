#include "context/module_asset_context.hpp"

#include "core/asset.hpp"
#include "core/issue.hpp"
#include "core/resolve.hpp"
#include "core/transition.hpp"
#include "log/log.hpp"
#include "modules/module_reference.hpp"
#include "query/query_context.hpp"

namespace weave::context {

core::AssetContextPtr
ModuleAssetContext::create(query::QueryContext* ctx, core::TransitionsPtr transitions,
                           fs::FileSystemPath context_path, core::Environment environment,
                           module_options::ModuleOptionsContextPtr module_options_context) {
    return std::make_shared<ModuleAssetContext>(
        ctx, query::ContextKey{std::move(transitions), std::move(context_path), environment,
                               std::move(module_options_context), nullptr});
}

core::ResolveOptions ModuleAssetContext::resolve_options() const {
    if (key_.environment.is_typescript_enabled()) {
        return core::typescript_resolve_options(key_.environment);
    }
    return core::resolve_options(key_.environment);
}

core::ResolveResult ModuleAssetContext::resolve_asset(const fs::FileSystemPath& context_path,
                                                      const core::Request& request,
                                                      const core::ResolveOptions& options) const {
    return ctx_->resolve_asset(key_, context_path, request, options);
}

core::ResolveResult
ModuleAssetContext::process_resolve_result(const core::ResolveResult& result) const {
    return result.map([this](const core::AssetPtr& asset) { return process(asset); });
}

core::AssetPtr ModuleAssetContext::process(const core::AssetPtr& asset) const {
    return ctx_->process(key_, asset);
}

core::AssetContextPtr ModuleAssetContext::derive(query::ContextKey key) const {
    return std::make_shared<ModuleAssetContext>(ctx_, std::move(key));
}

core::AssetContextPtr ModuleAssetContext::with_context_path(const fs::FileSystemPath& path) const {
    return derive({key_.transitions, path, key_.environment, key_.module_options_context, nullptr});
}

core::AssetContextPtr
ModuleAssetContext::with_environment(const core::Environment& environment) const {
    return derive(
        {key_.transitions, key_.context_path, environment, key_.module_options_context, nullptr});
}

core::AssetContextPtr ModuleAssetContext::with_transition(const std::string& name) const {
    core::TransitionPtr transition;
    if (key_.transitions) {
        transition = key_.transitions->find(name);
    }
    if (!transition) {
        ctx_->issues().report({core::IssueSeverity::Warning, core::IssueCodes::UNKNOWN_TRANSITION,
                               "transition", key_.context_path.to_string(),
                               "unknown transition '" + name + "', continuing without one"});
    } else {
        WEAVE_LOG_DEBUG("transition", "entering '" << name << "' in "
                                                   << key_.context_path.to_string());
    }
    return derive({key_.transitions, key_.context_path, key_.environment,
                   key_.module_options_context, std::move(transition)});
}

// ============================================================================
// Query work
// ============================================================================

core::AssetPtr process_asset(query::QueryContext& ctx, const query::ContextKey& key,
                             const core::AssetPtr& asset) {
    if (!key.transition) {
        return ctx.module(asset, key.transitions, key.environment, key.module_options_context);
    }

    const auto& transition = *key.transition;
    auto source = transition.process_source(ctx, asset);
    auto environment = transition.process_environment(key.environment);
    auto module = ctx.module(source, key.transitions, environment, key.module_options_context);
    return transition.process_module(ctx, module);
}

core::ResolveResult resolve_asset_in_context(query::QueryContext& ctx, const query::ContextKey& key,
                                             const fs::FileSystemPath& context_path,
                                             const core::Request& request,
                                             const core::ResolveOptions& options) {
    if (request.is_malformed()) {
        ctx.issues().report({core::IssueSeverity::Warning, core::IssueCodes::MALFORMED_REQUEST,
                             "resolve", context_path.to_string(),
                             "malformed request '" + request.to_string() + "'"});
    }

    auto resolved = core::resolve(ctx, context_path, request, options);
    if (resolved.is_unresolvable() && !request.is_malformed()) {
        ctx.issues().report({core::IssueSeverity::Warning, core::IssueCodes::UNRESOLVED_REQUEST,
                             "resolve", context_path.to_string(),
                             "unable to resolve '" + request.to_string() + "'"});
    }

    auto result = resolved.map(
        [&](const core::AssetPtr& asset) { return ctx.process(key, asset); });

    if (key.environment.is_typescript_enabled()) {
        auto types_context = ModuleAssetContext::create(
            &ctx, key.transitions, context_path, key.environment, key.module_options_context);
        result.add_reference(
            std::make_shared<modules::TypescriptTypesAssetReference>(types_context, request));
    }
    return result;
}

} // namespace weave::context
