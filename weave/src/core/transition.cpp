#include "core/transition.hpp"

namespace weave::core {

AssetPtr Transition::process_source(query::QueryContext& /*ctx*/, const AssetPtr& asset) const {
    return asset;
}

Environment Transition::process_environment(const Environment& environment) const {
    return environment;
}

AssetPtr Transition::process_module(query::QueryContext& /*ctx*/, const AssetPtr& module) const {
    return module;
}

Environment EnvironmentTransition::process_environment(const Environment& /*environment*/) const {
    return environment_;
}

TransitionPtr TransitionsByName::find(const std::string& name) const {
    auto it = transitions_.find(name);
    return it == transitions_.end() ? nullptr : it->second;
}

} // namespace weave::core
