//! # Transitions
//!
//! A transition is a named hook applied when resolution crosses an
//! environment boundary (for example from server code into a client-only
//! subtree). A context with an active transition routes every processed
//! asset through three stages:
//!
//! 1. `process_source` may substitute the source asset,
//! 2. `process_environment` may replace the environment the module is
//!    built for,
//! 3. `process_module` may wrap the constructed module.
//!
//! All hooks default to the identity.

#pragma once

#include "core/environment.hpp"
#include "core/fwd.hpp"

#include <map>
#include <string>

namespace weave::query {
class QueryContext;
} // namespace weave::query

namespace weave::core {

class Transition {
public:
    virtual ~Transition() = default;

    [[nodiscard]] virtual AssetPtr process_source(query::QueryContext& ctx,
                                                  const AssetPtr& asset) const;

    [[nodiscard]] virtual Environment process_environment(const Environment& environment) const;

    [[nodiscard]] virtual AssetPtr process_module(query::QueryContext& ctx,
                                                  const AssetPtr& module) const;
};

/// Builds modules for a fixed environment regardless of the caller's.
class EnvironmentTransition : public Transition {
public:
    explicit EnvironmentTransition(Environment environment) : environment_(environment) {}

    [[nodiscard]] Environment process_environment(const Environment& environment) const override;

private:
    Environment environment_;
};

/// Immutable table of named transitions.
class TransitionsByName {
public:
    TransitionsByName() = default;
    explicit TransitionsByName(std::map<std::string, TransitionPtr> transitions)
        : transitions_(std::move(transitions)) {}

    /// The transition called `name`, or nullptr.
    [[nodiscard]] TransitionPtr find(const std::string& name) const;

    [[nodiscard]] size_t size() const {
        return transitions_.size();
    }

private:
    std::map<std::string, TransitionPtr> transitions_;
};

} // namespace weave::core
