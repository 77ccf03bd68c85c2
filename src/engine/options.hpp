#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "engine/error.hpp"
#include "engine/schema.hpp"

namespace sid::engine {

/// Raised (not thrown) when a behavior could not be fingerprinted by name.
struct BehaviorResolutionDegraded {
  std::string qualified_name;
  BehaviorRole role = BehaviorRole::Validator;
  FingerprintStrategy strategy = FingerprintStrategy::BySignature;
};

using DegradedSink = std::function<void(const BehaviorResolutionDegraded&)>;

inline constexpr std::size_t kMinDigestLength = 8;
inline constexpr std::size_t kMaxDigestLength = 32;

struct FingerprintOptions {
  bool track_descriptions = false;
  bool track_field_order = false;
  bool track_type_order = false;
  bool track_default_values = false;
  Json tracked_extra_data = nullptr;
  std::size_t digest_length = kMaxDigestLength;
  std::size_t max_nodes = 100000;
  std::size_t max_depth = 512;
  /// Observer for degraded behavior resolution. Not part of the identity.
  DegradedSink on_degraded;
};

auto validate_options(const FingerprintOptions& options) -> Expected<void>;

/// Stable text covering every option that affects the canonical form.
auto options_key(const FingerprintOptions& options) -> std::string;

auto options_to_json(const FingerprintOptions& options) -> Json;

}  // namespace sid::engine
