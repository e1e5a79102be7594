//! # Module References
//!
//! References module assets hand out. Both resolve through an asset
//! context, so the resolved assets come back as processed modules.

#pragma once

#include "core/asset.hpp"
#include "core/request.hpp"

namespace weave::modules {

/// An import request found in a module, resolved with the context's own
/// resolve options.
class RequestAssetReference : public core::AssetReference {
public:
    RequestAssetReference(core::AssetContextPtr context, core::Request request)
        : context_(std::move(context)), request_(std::move(request)) {}

    [[nodiscard]] core::ResolveResult resolve_reference(query::QueryContext& ctx) const override;

    /// `"import './util' in [project] src"`
    [[nodiscard]] std::string to_string() const override;

    [[nodiscard]] const core::Request& request() const {
        return request_;
    }

private:
    core::AssetContextPtr context_;
    core::Request request_;
};

/// Type declarations of a request. Resolves with the types options and
/// processes what it finds. A request without declarations resolves to
/// nothing and reports no issue.
class TypescriptTypesAssetReference : public core::AssetReference {
public:
    TypescriptTypesAssetReference(core::AssetContextPtr context, core::Request request)
        : context_(std::move(context)), request_(std::move(request)) {}

    [[nodiscard]] core::ResolveResult resolve_reference(query::QueryContext& ctx) const override;

    [[nodiscard]] std::string to_string() const override;

    [[nodiscard]] const core::Request& request() const {
        return request_;
    }

private:
    core::AssetContextPtr context_;
    core::Request request_;
};

} // namespace weave::modules
