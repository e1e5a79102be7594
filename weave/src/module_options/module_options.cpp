#include "module_options/module_options.hpp"

#include "log/log.hpp"

namespace weave::module_options {

using Condition = ModuleRuleCondition;

static bool is_in_node_modules(const fs::FileSystemPath& dir) {
    std::string_view path = dir.path;
    return path == "node_modules" || path.starts_with("node_modules/") ||
           path.find("/node_modules/") != std::string_view::npos ||
           path.ends_with("/node_modules");
}

ModuleOptions ModuleOptions::build(const fs::FileSystemPath& context_dir,
                                   const ModuleOptionsContext& context) {
    bool app_code = !is_in_node_modules(context_dir);

    EcmascriptTransforms js_transforms;
    EcmascriptTransforms ts_transforms;
    EcmascriptTransforms dts_transforms;
    if (app_code) {
        js_transforms = {EcmascriptTransform::React};
        ts_transforms = {EcmascriptTransform::React, EcmascriptTransform::TypeScript};
        dts_transforms = {EcmascriptTransform::TypeScript};
    }

    ModuleOptions options;
    auto& rules = options.rules;

    rules.push_back(module_type_rule(
        Condition::any({Condition::extension(".mjs"), Condition::extension(".js"),
                        Condition::extension(".cjs")}),
        module_type::Ecmascript{js_transforms}));

    if (context.enable_typescript) {
        rules.push_back(
            module_type_rule(Condition::any({Condition::extension(".ts"), Condition::extension(".tsx")}),
                             module_type::Typescript{ts_transforms}));
        // After ".ts" so declarations win for "x.d.ts"
        rules.push_back(module_type_rule(Condition::extension(".d.ts"),
                                         module_type::TypescriptDeclaration{dts_transforms}));
    }

    rules.push_back(module_type_rule(Condition::extension(".json"), module_type::Json{}));

    if (context.enable_css) {
        rules.push_back(module_type_rule(Condition::extension(".css"), module_type::Css{}));
    }

    std::vector<Condition> static_files;
    for (const char* ext : {".png", ".jpg", ".jpeg", ".gif", ".svg", ".webp", ".ico", ".woff",
                            ".woff2", ".ttf", ".otf", ".eot"}) {
        static_files.push_back(Condition::extension(ext));
    }
    rules.push_back(module_type_rule(Condition::any(std::move(static_files)), module_type::Static{}));

    rules.insert(rules.end(), context.rules.begin(), context.rules.end());
    return options;
}

ModuleRuleEffects resolve_module_effects(const ModuleOptions& options,
                                         const fs::FileSystemPath& path) {
    ModuleRuleEffects effects;
    for (const auto& rule : options.rules) {
        if (!rule.matches(path)) {
            continue;
        }
        WEAVE_LOG_TRACE("module",
                        path.to_string() << " matches " << rule.condition.description());
        for (const auto& [key, effect] : rule.effects) {
            effects.insert_or_assign(key, effect);
        }
    }
    return effects;
}

static void append_transforms(EcmascriptTransforms& target, const EcmascriptTransforms& extra) {
    target.insert(target.end(), extra.begin(), extra.end());
}

ModuleType resolve_module_type(const ModuleRuleEffects& effects) {
    ModuleType type = module_type::Raw{};

    auto it = effects.find(ModuleRuleEffectKey::ModuleType);
    if (it != effects.end()) {
        const auto* selected = std::get_if<ModuleType>(&it->second);
        if (!selected) {
            throw ModuleConfigError(
                "module rule effect under the module-type key is not a module type");
        }
        type = *selected;
    }

    auto extra = effects.find(ModuleRuleEffectKey::AddEcmascriptTransforms);
    if (extra != effects.end()) {
        const auto* transforms = std::get_if<EcmascriptTransforms>(&extra->second);
        if (!transforms) {
            throw ModuleConfigError(
                "module rule effect under the add-ecmascript-transforms key is not a transform "
                "list");
        }
        if (auto* t = std::get_if<module_type::Ecmascript>(&type)) {
            append_transforms(t->transforms, *transforms);
        } else if (auto* t = std::get_if<module_type::Typescript>(&type)) {
            append_transforms(t->transforms, *transforms);
        } else if (auto* t = std::get_if<module_type::TypescriptDeclaration>(&type)) {
            append_transforms(t->transforms, *transforms);
        }
    }

    return type;
}

} // namespace weave::module_options
