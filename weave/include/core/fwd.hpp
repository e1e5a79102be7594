//! # Core Forward Declarations
//!
//! Pointer aliases for the shared, immutable core entities.

#pragma once

#include <memory>

namespace weave::core {

class Asset;
class AssetReference;
class AssetContext;
class Transition;
class TransitionsByName;
class ResolveResult;

using AssetPtr = std::shared_ptr<const Asset>;
using AssetReferencePtr = std::shared_ptr<const AssetReference>;
using AssetContextPtr = std::shared_ptr<const AssetContext>;
using TransitionPtr = std::shared_ptr<const Transition>;
using TransitionsPtr = std::shared_ptr<const TransitionsByName>;

} // namespace weave::core
