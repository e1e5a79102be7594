//! # Module Options
//!
//! Classifies a path into a module type. The rule set for a directory is the
//! built-in defaults followed by the user's rules, so user rules override the
//! defaults for any effect key they set.
//!
//! ## Default Rules
//!
//! | Files                         | Module type                                |
//! |-------------------------------|--------------------------------------------|
//! | `.mjs`, `.js`, `.cjs`         | Ecmascript                                 |
//! | `.ts`, `.tsx`                 | Typescript (when TypeScript is enabled)    |
//! | `.d.ts`                       | TypescriptDeclaration                      |
//! | `.json`                       | Json                                       |
//! | `.css`                        | Css (when CSS is enabled)                  |
//! | images and fonts              | Static                                     |
//!
//! Code outside `node_modules` also gets the React transform (and
//! TypeScript stripping for TypeScript files). Code inside `node_modules`
//! gets no default transforms.

#pragma once

#include "fs/file_system.hpp"
#include "module_options/module_rule.hpp"
#include "module_options/module_type.hpp"

#include <memory>
#include <vector>

namespace weave::module_options {

/// User configuration of the rule engine. Shared by pointer; contexts
/// compare it by identity.
struct ModuleOptionsContext {
    std::vector<ModuleRule> rules;
    bool enable_typescript = true;
    bool enable_css = true;
};

using ModuleOptionsContextPtr = std::shared_ptr<const ModuleOptionsContext>;

/// The effective rule list for one directory.
struct ModuleOptions {
    std::vector<ModuleRule> rules;

    /// Default rules for `context_dir` followed by `context.rules`.
    [[nodiscard]] static ModuleOptions build(const fs::FileSystemPath& context_dir,
                                             const ModuleOptionsContext& context);
};

/// Merges the effects of every rule matching `path`, in configuration
/// order. A later rule replaces the effect an earlier rule set for the same
/// key.
[[nodiscard]] ModuleRuleEffects resolve_module_effects(const ModuleOptions& options,
                                                       const fs::FileSystemPath& path);

/// The module type selected by `effects`, `Raw` when none is set.
/// Transforms under `AddEcmascriptTransforms` are appended to ECMAScript
/// family types.
///
/// Throws `ModuleConfigError` if the ModuleType key holds something other
/// than a module type.
[[nodiscard]] ModuleType resolve_module_type(const ModuleRuleEffects& effects);

} // namespace weave::module_options
