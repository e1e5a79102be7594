//! # Module Rules
//!
//! A rule pairs a condition over a path with a set of effects. Effects are
//! keyed: when several matching rules set the same key, the rule configured
//! last wins.

#pragma once

#include "fs/file_system.hpp"
#include "module_options/module_type.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace weave::module_options {

// ============================================================================
// Conditions
// ============================================================================

/// A predicate over a path with a description for diagnostics.
class ModuleRuleCondition {
public:
    using Predicate = std::function<bool(const fs::FileSystemPath&)>;

    ModuleRuleCondition(std::string description, Predicate predicate)
        : description_(std::move(description)), predicate_(std::move(predicate)) {}

    [[nodiscard]] bool matches(const fs::FileSystemPath& path) const {
        return predicate_(path);
    }

    [[nodiscard]] const std::string& description() const {
        return description_;
    }

    /// File name ends with `suffix` (".js", ".d.ts").
    static ModuleRuleCondition extension(std::string suffix);

    /// Path lies inside `dir`.
    static ModuleRuleCondition path_prefix(fs::FileSystemPath dir);

    /// Some directory segment of the path equals `segment`.
    static ModuleRuleCondition path_segment(std::string segment);

    static ModuleRuleCondition all(std::vector<ModuleRuleCondition> conditions);
    static ModuleRuleCondition any(std::vector<ModuleRuleCondition> conditions);
    static ModuleRuleCondition not_(ModuleRuleCondition condition);

private:
    std::string description_;
    Predicate predicate_;
};

// ============================================================================
// Effects
// ============================================================================

enum class ModuleRuleEffectKey {
    ModuleType,              ///< Value: ModuleType
    AddEcmascriptTransforms, ///< Value: EcmascriptTransforms
    Custom                   ///< Value: opaque string for host extensions
};

[[nodiscard]] const char* effect_key_name(ModuleRuleEffectKey key);

using ModuleRuleEffect = std::variant<ModuleType, EcmascriptTransforms, std::string>;

using ModuleRuleEffects = std::map<ModuleRuleEffectKey, ModuleRuleEffect>;

// ============================================================================
// Rules
// ============================================================================

struct ModuleRule {
    ModuleRuleCondition condition;
    ModuleRuleEffects effects;

    [[nodiscard]] bool matches(const fs::FileSystemPath& path) const {
        return condition.matches(path);
    }
};

/// Convenience: a rule that sets the module type of matching paths.
[[nodiscard]] ModuleRule module_type_rule(ModuleRuleCondition condition, ModuleType type);

} // namespace weave::module_options
