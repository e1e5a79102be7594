//! # Module Types
//!
//! The closed set of module kinds a source can become. Each kind carries
//! the parameters its constructor needs; the module factory dispatches over
//! the variant exhaustively.
//!
//! | Type                    | Result                                      |
//! |-------------------------|---------------------------------------------|
//! | `Raw`                   | The source itself, unchanged (the default)  |
//! | `Ecmascript`            | ECMAScript module                           |
//! | `Typescript`            | ECMAScript module, TypeScript resolution    |
//! | `TypescriptDeclaration` | ECMAScript module for a `.d.ts` file        |
//! | `Json`                  | JSON module                                 |
//! | `Css`                   | CSS module                                  |
//! | `Static`                | Static file module                          |
//! | `Custom`                | Not implemented, a configuration error      |

#pragma once

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace weave::module_options {

/// Thrown when the rule configuration cannot produce a module: a `Custom`
/// module type, or a non-module-type value under the ModuleType effect key.
class ModuleConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Input transforms recorded on ECMAScript modules.
enum class EcmascriptTransform { CommonJs, React, TypeScript, PresetEnv };

[[nodiscard]] const char* ecmascript_transform_name(EcmascriptTransform transform);

using EcmascriptTransforms = std::vector<EcmascriptTransform>;

namespace module_type {

struct Raw {
    bool operator==(const Raw&) const = default;
};

struct Ecmascript {
    EcmascriptTransforms transforms;
    bool operator==(const Ecmascript&) const = default;
};

struct Typescript {
    EcmascriptTransforms transforms;
    bool operator==(const Typescript&) const = default;
};

struct TypescriptDeclaration {
    EcmascriptTransforms transforms;
    bool operator==(const TypescriptDeclaration&) const = default;
};

struct Json {
    bool operator==(const Json&) const = default;
};

struct Css {
    bool operator==(const Css&) const = default;
};

struct Static {
    bool operator==(const Static&) const = default;
};

struct Custom {
    std::string name;
    bool operator==(const Custom&) const = default;
};

} // namespace module_type

using ModuleType =
    std::variant<module_type::Raw, module_type::Ecmascript, module_type::Typescript,
                 module_type::TypescriptDeclaration, module_type::Json, module_type::Css,
                 module_type::Static, module_type::Custom>;

/// "raw", "ecmascript", "typescript", ...
[[nodiscard]] const char* module_type_name(const ModuleType& type);

} // namespace weave::module_options
