#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "engine/error.hpp"
#include "engine/identifier.hpp"

namespace sid::engine {

struct IdentityKey {
  std::uint64_t provider = 0;
  std::string options;
  std::string model;

  auto operator==(const IdentityKey&) const -> bool = default;
};

struct IdentityKeyHash {
  auto operator()(const IdentityKey& key) const -> std::size_t {
    std::size_t h = std::hash<std::uint64_t>{}(key.provider);
    h ^= std::hash<std::string>{}(key.options) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    h ^= std::hash<std::string>{}(key.model) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
  }
};

/// Process-wide memo of computed identifiers.
///
/// The computation runs outside any lock. Two callers racing on the same key
/// may both compute; the results are equal, the first insert is kept and
/// both callers see it. Errors are never cached. Entries of a provider are
/// dropped when that provider is destroyed.
class IdentityCache {
 public:
  using ComputeFn = std::function<Expected<Identifier>()>;

  /// Created on first use and never destroyed, so providers outliving static
  /// destruction can still unregister.
  static auto global() -> IdentityCache&;

  auto get_or_compute(const IdentityKey& key, const ComputeFn& compute) -> Expected<Identifier>;
  auto find(const IdentityKey& key) const -> std::optional<Identifier>;
  auto invalidate(const IdentityKey& key) -> bool;
  /// Drop every entry computed through `provider`; returns how many were removed.
  auto invalidate_provider(std::uint64_t provider) -> std::size_t;
  auto size() const -> std::size_t;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<IdentityKey, Identifier, IdentityKeyHash> entries_;
};

}  // namespace sid::engine
