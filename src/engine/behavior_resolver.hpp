#pragma once

#include <string>
#include <string_view>

#include "engine/options.hpp"
#include "engine/schema.hpp"

namespace sid::engine {

/// Turn a behavior handle into a BehaviorRef. Never fails: degrades from
/// by-name to by-source-hash to by-signature and reports each fallback to `sink`.
auto resolve_behavior(const BehaviorHandle& handle, const DegradedSink& sink = {}) -> BehaviorRef;

/// Line endings folded to '\n', trailing whitespace stripped per line.
auto normalize_source(std::string_view source) -> std::string;

}  // namespace sid::engine
