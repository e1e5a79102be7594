#include "module_options/module_rule.hpp"

namespace weave::module_options {

// ============================================================================
// Module types
// ============================================================================

const char* ecmascript_transform_name(EcmascriptTransform transform) {
    switch (transform) {
    case EcmascriptTransform::CommonJs:
        return "commonjs";
    case EcmascriptTransform::React:
        return "react";
    case EcmascriptTransform::TypeScript:
        return "typescript";
    case EcmascriptTransform::PresetEnv:
        return "preset-env";
    }
    return "unknown";
}

const char* module_type_name(const ModuleType& type) {
    return std::visit(
        [](const auto& t) -> const char* {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, module_type::Raw>) {
                return "raw";
            } else if constexpr (std::is_same_v<T, module_type::Ecmascript>) {
                return "ecmascript";
            } else if constexpr (std::is_same_v<T, module_type::Typescript>) {
                return "typescript";
            } else if constexpr (std::is_same_v<T, module_type::TypescriptDeclaration>) {
                return "typescript-declaration";
            } else if constexpr (std::is_same_v<T, module_type::Json>) {
                return "json";
            } else if constexpr (std::is_same_v<T, module_type::Css>) {
                return "css";
            } else if constexpr (std::is_same_v<T, module_type::Static>) {
                return "static";
            } else {
                return "custom";
            }
        },
        type);
}

// ============================================================================
// Conditions
// ============================================================================

ModuleRuleCondition ModuleRuleCondition::extension(std::string suffix) {
    std::string description = "*" + suffix;
    return {std::move(description), [suffix = std::move(suffix)](const fs::FileSystemPath& path) {
                return path.file_name().ends_with(suffix);
            }};
}

ModuleRuleCondition ModuleRuleCondition::path_prefix(fs::FileSystemPath dir) {
    std::string description = dir.to_string() + "/**";
    return {std::move(description), [dir = std::move(dir)](const fs::FileSystemPath& path) {
                return path.is_inside(dir);
            }};
}

ModuleRuleCondition ModuleRuleCondition::path_segment(std::string segment) {
    std::string description = "**/" + segment + "/**";
    return {std::move(description), [segment = std::move(segment)](const fs::FileSystemPath& path) {
                std::string_view rest = path.path;
                while (!rest.empty()) {
                    auto slash = rest.find('/');
                    if (slash == std::string_view::npos) {
                        // Last segment is the file name
                        return false;
                    }
                    if (rest.substr(0, slash) == segment) {
                        return true;
                    }
                    rest.remove_prefix(slash + 1);
                }
                return false;
            }};
}

static std::string join_descriptions(const std::vector<ModuleRuleCondition>& conditions,
                                     const char* separator) {
    std::string s = "(";
    for (size_t i = 0; i < conditions.size(); ++i) {
        if (i > 0) {
            s += separator;
        }
        s += conditions[i].description();
    }
    s += ")";
    return s;
}

ModuleRuleCondition ModuleRuleCondition::all(std::vector<ModuleRuleCondition> conditions) {
    std::string description = join_descriptions(conditions, " && ");
    return {std::move(description),
            [conditions = std::move(conditions)](const fs::FileSystemPath& path) {
                for (const auto& condition : conditions) {
                    if (!condition.matches(path)) {
                        return false;
                    }
                }
                return true;
            }};
}

ModuleRuleCondition ModuleRuleCondition::any(std::vector<ModuleRuleCondition> conditions) {
    std::string description = join_descriptions(conditions, " || ");
    return {std::move(description),
            [conditions = std::move(conditions)](const fs::FileSystemPath& path) {
                for (const auto& condition : conditions) {
                    if (condition.matches(path)) {
                        return true;
                    }
                }
                return false;
            }};
}

ModuleRuleCondition ModuleRuleCondition::not_(ModuleRuleCondition condition) {
    std::string description = "!" + condition.description();
    return {std::move(description),
            [condition = std::move(condition)](const fs::FileSystemPath& path) {
                return !condition.matches(path);
            }};
}

// ============================================================================
// Effects and rules
// ============================================================================

const char* effect_key_name(ModuleRuleEffectKey key) {
    switch (key) {
    case ModuleRuleEffectKey::ModuleType:
        return "module-type";
    case ModuleRuleEffectKey::AddEcmascriptTransforms:
        return "add-ecmascript-transforms";
    case ModuleRuleEffectKey::Custom:
        return "custom";
    }
    return "unknown";
}

ModuleRule module_type_rule(ModuleRuleCondition condition, ModuleType type) {
    ModuleRuleEffects effects;
    effects.emplace(ModuleRuleEffectKey::ModuleType, ModuleRuleEffect{std::move(type)});
    return {std::move(condition), std::move(effects)};
}

} // namespace weave::module_options
