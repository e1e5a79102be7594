//! # Module Factory
//!
//! Builds the module for a source asset. The module type comes from the
//! module rules of the source's directory; each type maps to one
//! constructor of the session's `ModuleAssetFactory`.
//!
//! | Module type             | Module                       | Nested context env  |
//! |-------------------------|------------------------------|---------------------|
//! | Raw                     | the source itself            | none                |
//! | Ecmascript              | ecmascript                   | unchanged           |
//! | Typescript              | ecmascript (Typescript)      | `with_typescript()` |
//! | TypescriptDeclaration   | ecmascript (Declaration)     | `with_typescript()` |
//! | Json                    | json                         | none                |
//! | Css                     | css                          | unchanged           |
//! | Static                  | static                       | unchanged           |
//! | Custom                  | `ModuleConfigError`          |                     |
//!
//! Nested contexts are fresh contexts in the source's parent directory
//! sharing the transitions and module options.

#pragma once

#include "core/fwd.hpp"
#include "query/query_key.hpp"

namespace weave::query {
class QueryContext;
} // namespace weave::query

namespace weave::context {

/// Work behind the `module` query. A source that already is a module is
/// returned unchanged.
[[nodiscard]] core::AssetPtr build_module(query::QueryContext& ctx, const query::ModuleKey& key);

} // namespace weave::context
