#include "modules/module_asset.hpp"

#include "log/log.hpp"
#include "modules/module_reference.hpp"
#include "modules/request_scanner.hpp"

namespace weave::modules {

const char* module_asset_type_name(ModuleAssetType type) {
    switch (type) {
    case ModuleAssetType::Ecmascript:
        return "ecmascript";
    case ModuleAssetType::Typescript:
        return "typescript";
    case ModuleAssetType::TypescriptDeclaration:
        return "typescript-declaration";
    }
    return "unknown";
}

static std::vector<core::AssetReferencePtr>
request_references(const core::AssetContextPtr& context, const std::vector<std::string>& requests) {
    std::vector<core::AssetReferencePtr> references;
    references.reserve(requests.size());
    for (const auto& request : requests) {
        references.push_back(
            std::make_shared<RequestAssetReference>(context, core::Request::parse(request)));
    }
    return references;
}

// ============================================================================
// EcmascriptModuleAsset
// ============================================================================

EcmascriptModuleAsset::EcmascriptModuleAsset(core::AssetPtr source, core::AssetContextPtr context,
                                             ModuleAssetType type, EcmascriptTransforms transforms,
                                             core::Environment environment)
    : ModuleAsset(std::move(source)), context_(std::move(context)), type_(type),
      transforms_(std::move(transforms)), environment_(environment) {}

std::vector<core::AssetReferencePtr>
EcmascriptModuleAsset::references(query::QueryContext& ctx) const {
    auto content = source_->content(ctx);
    if (!content.exists) {
        return {};
    }
    auto requests = scan_ecmascript_requests(content.bytes);
    WEAVE_LOG_TRACE("module", path().to_string() << " (" << module_asset_type_name(type_) << ") has "
                                                 << requests.size() << " requests");
    return request_references(context_, requests);
}

// ============================================================================
// JsonModuleAsset
// ============================================================================

Result<json::JsonValue, json::JsonError> JsonModuleAsset::parse(query::QueryContext& ctx) const {
    auto content = source_->content(ctx);
    if (!content.exists) {
        return json::JsonError::make("file not found: " + path().to_string(), 0, 0);
    }
    return json::parse_json(content.bytes);
}

// ============================================================================
// CssModuleAsset
// ============================================================================

std::vector<core::AssetReferencePtr> CssModuleAsset::references(query::QueryContext& ctx) const {
    auto content = source_->content(ctx);
    if (!content.exists) {
        return {};
    }
    return request_references(context_, scan_css_requests(content.bytes));
}

// ============================================================================
// BasicModuleAssetFactory
// ============================================================================

core::AssetPtr BasicModuleAssetFactory::ecmascript(core::AssetPtr source,
                                                   core::AssetContextPtr context,
                                                   ModuleAssetType type,
                                                   EcmascriptTransforms transforms,
                                                   core::Environment environment) const {
    return std::make_shared<EcmascriptModuleAsset>(std::move(source), std::move(context), type,
                                                   std::move(transforms), environment);
}

core::AssetPtr BasicModuleAssetFactory::json(core::AssetPtr source) const {
    return std::make_shared<JsonModuleAsset>(std::move(source));
}

core::AssetPtr BasicModuleAssetFactory::css(core::AssetPtr source,
                                            core::AssetContextPtr context) const {
    return std::make_shared<CssModuleAsset>(std::move(source), std::move(context));
}

core::AssetPtr BasicModuleAssetFactory::static_asset(core::AssetPtr source,
                                                     core::AssetContextPtr context) const {
    return std::make_shared<StaticModuleAsset>(std::move(source), std::move(context));
}

} // namespace weave::modules
