#include "context/module_factory.hpp"

#include "context/module_asset_context.hpp"
#include "log/log.hpp"
#include "module_options/module_options.hpp"
#include "modules/module_asset.hpp"
#include "query/query_context.hpp"

namespace weave::context {

using namespace module_options;

core::AssetPtr build_module(query::QueryContext& ctx, const query::ModuleKey& key) {
    const auto& source = key.source;
    if (std::dynamic_pointer_cast<const modules::ModuleAsset>(source)) {
        return source;
    }

    auto path = source->path();
    auto dir = path.parent();

    static const ModuleOptionsContext default_options;
    const auto& options_context =
        key.module_options_context ? *key.module_options_context : default_options;

    auto options = ModuleOptions::build(dir, options_context);
    auto type = resolve_module_type(resolve_module_effects(options, path));
    WEAVE_LOG_DEBUG("module", path.to_string() << " -> " << module_type_name(type) << " ("
                                               << key.environment.to_string() << ")");

    auto& factory = ctx.module_assets();
    auto nested = [&](const core::Environment& environment) {
        return ModuleAssetContext::create(&ctx, key.transitions, dir, environment,
                                          key.module_options_context);
    };

    return std::visit(
        [&](const auto& t) -> core::AssetPtr {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, module_type::Raw>) {
                return source;
            } else if constexpr (std::is_same_v<T, module_type::Ecmascript>) {
                return factory.ecmascript(source, nested(key.environment),
                                          modules::ModuleAssetType::Ecmascript, t.transforms,
                                          key.environment);
            } else if constexpr (std::is_same_v<T, module_type::Typescript>) {
                return factory.ecmascript(source, nested(key.environment.with_typescript()),
                                          modules::ModuleAssetType::Typescript, t.transforms,
                                          key.environment);
            } else if constexpr (std::is_same_v<T, module_type::TypescriptDeclaration>) {
                return factory.ecmascript(source, nested(key.environment.with_typescript()),
                                          modules::ModuleAssetType::TypescriptDeclaration,
                                          t.transforms, key.environment);
            } else if constexpr (std::is_same_v<T, module_type::Json>) {
                return factory.json(source);
            } else if constexpr (std::is_same_v<T, module_type::Css>) {
                return factory.css(source, nested(key.environment));
            } else if constexpr (std::is_same_v<T, module_type::Static>) {
                return factory.static_asset(source, nested(key.environment));
            } else {
                static_assert(std::is_same_v<T, module_type::Custom>, "unhandled module type");
                throw ModuleConfigError("custom module type '" + t.name +
                                        "' is not implemented (" + path.to_string() + ")");
            }
        },
        type);
}

} // namespace weave::context
