//! # Module Assets
//!
//! The per-filetype modules the module factory builds. A module wraps its
//! source asset: it keeps the source path, passes the content through and
//! derives its references from import requests found in the content. The
//! transform list of an ECMAScript module is recorded for downstream code
//! generation and not executed here.
//!
//! Module assets do not cache what they scan. References are recomputed on
//! every call so that `referenced_assets` (which is memoized and depends on
//! the file reads) is the only cache and edits invalidate it.
//!
//! ## Factory
//!
//! `ModuleAssetFactory` is the constructor contract the module factory
//! consumes. The session owns one; `BasicModuleAssetFactory` builds the
//! assets in this file.

#pragma once

#include "core/asset.hpp"
#include "core/environment.hpp"
#include "core/fwd.hpp"
#include "json/json.hpp"
#include "module_options/module_type.hpp"

namespace weave::modules {

using module_options::EcmascriptTransforms;

/// Flavor of an ECMAScript-family module.
enum class ModuleAssetType { Ecmascript, Typescript, TypescriptDeclaration };

[[nodiscard]] const char* module_asset_type_name(ModuleAssetType type);

// ============================================================================
// Module assets
// ============================================================================

/// Base of every module: same path and content as the source.
class ModuleAsset : public core::Asset {
public:
    explicit ModuleAsset(core::AssetPtr source) : source_(std::move(source)) {}

    [[nodiscard]] fs::FileSystemPath path() const override {
        return source_->path();
    }
    [[nodiscard]] fs::FileContent content(query::QueryContext& ctx) const override {
        return source_->content(ctx);
    }

    [[nodiscard]] const core::AssetPtr& source() const {
        return source_;
    }

protected:
    core::AssetPtr source_;
};

/// JavaScript or TypeScript module. Each import request becomes a
/// `RequestAssetReference` resolved through the module's context.
class EcmascriptModuleAsset : public ModuleAsset {
public:
    EcmascriptModuleAsset(core::AssetPtr source, core::AssetContextPtr context,
                          ModuleAssetType type, EcmascriptTransforms transforms,
                          core::Environment environment);

    [[nodiscard]] std::vector<core::AssetReferencePtr>
    references(query::QueryContext& ctx) const override;

    [[nodiscard]] const core::AssetContextPtr& context() const {
        return context_;
    }
    [[nodiscard]] ModuleAssetType type() const {
        return type_;
    }
    [[nodiscard]] const EcmascriptTransforms& transforms() const {
        return transforms_;
    }
    [[nodiscard]] const core::Environment& environment() const {
        return environment_;
    }

private:
    core::AssetContextPtr context_;
    ModuleAssetType type_;
    EcmascriptTransforms transforms_;
    core::Environment environment_;
};

/// JSON module. Has no references.
class JsonModuleAsset : public ModuleAsset {
public:
    using ModuleAsset::ModuleAsset;

    /// Parses the content. A missing file is an error too.
    [[nodiscard]] Result<json::JsonValue, json::JsonError> parse(query::QueryContext& ctx) const;
};

/// CSS module. `@import` rules become references.
class CssModuleAsset : public ModuleAsset {
public:
    CssModuleAsset(core::AssetPtr source, core::AssetContextPtr context)
        : ModuleAsset(std::move(source)), context_(std::move(context)) {}

    [[nodiscard]] std::vector<core::AssetReferencePtr>
    references(query::QueryContext& ctx) const override;

    [[nodiscard]] const core::AssetContextPtr& context() const {
        return context_;
    }

private:
    core::AssetContextPtr context_;
};

/// Image, font or other file copied as is.
class StaticModuleAsset : public ModuleAsset {
public:
    StaticModuleAsset(core::AssetPtr source, core::AssetContextPtr context)
        : ModuleAsset(std::move(source)), context_(std::move(context)) {}

    [[nodiscard]] const core::AssetContextPtr& context() const {
        return context_;
    }

private:
    core::AssetContextPtr context_;
};

// ============================================================================
// Factory
// ============================================================================

class ModuleAssetFactory {
public:
    virtual ~ModuleAssetFactory() = default;

    [[nodiscard]] virtual core::AssetPtr ecmascript(core::AssetPtr source,
                                                    core::AssetContextPtr context,
                                                    ModuleAssetType type,
                                                    EcmascriptTransforms transforms,
                                                    core::Environment environment) const = 0;

    [[nodiscard]] virtual core::AssetPtr json(core::AssetPtr source) const = 0;

    [[nodiscard]] virtual core::AssetPtr css(core::AssetPtr source,
                                             core::AssetContextPtr context) const = 0;

    [[nodiscard]] virtual core::AssetPtr static_asset(core::AssetPtr source,
                                                      core::AssetContextPtr context) const = 0;
};

class BasicModuleAssetFactory : public ModuleAssetFactory {
public:
    [[nodiscard]] core::AssetPtr ecmascript(core::AssetPtr source, core::AssetContextPtr context,
                                            ModuleAssetType type, EcmascriptTransforms transforms,
                                            core::Environment environment) const override;
    [[nodiscard]] core::AssetPtr json(core::AssetPtr source) const override;
    [[nodiscard]] core::AssetPtr css(core::AssetPtr source,
                                     core::AssetContextPtr context) const override;
    [[nodiscard]] core::AssetPtr static_asset(core::AssetPtr source,
                                              core::AssetContextPtr context) const override;
};

} // namespace weave::modules
