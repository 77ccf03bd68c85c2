#pragma once

#include <cstdint>
#include <format>
#include <functional>
#include <string>
#include <string_view>

#include "engine/error.hpp"

namespace sid::engine {

/// Bumped whenever canonicalization changes the bytes of an unchanged schema.
inline constexpr std::uint32_t kAlgorithmVersion = 1;

enum class IdentifierMatch {
  Equal,
  Different,
  Incomparable,
};

/// Versioned schema fingerprint, "v<version>:<hex digest>".
struct Identifier {
  std::uint32_t algorithm_version = kAlgorithmVersion;
  std::string digest;

  /// Equality never holds across algorithm versions.
  auto operator==(const Identifier&) const -> bool = default;

  auto to_string() const -> std::string;

  /// Parse "v1:3f9a..." (hex digest, lower or upper case).
  static auto parse(std::string_view str) -> Expected<Identifier>;
};

/// Digests from different algorithm versions are incomparable, never equal.
auto compare_identifiers(const Identifier& lhs, const Identifier& rhs) -> IdentifierMatch;

}  // namespace sid::engine

template <>
struct std::hash<sid::engine::Identifier> {
  auto operator()(const sid::engine::Identifier& id) const -> std::size_t {
    std::size_t h1 = std::hash<std::uint32_t>{}(id.algorithm_version);
    std::size_t h2 = std::hash<std::string>{}(id.digest);
    return h1 ^ (h2 << 1);
  }
};

template <>
struct std::formatter<sid::engine::Identifier> : std::formatter<std::string> {
  auto format(const sid::engine::Identifier& id, std::format_context& ctx) const {
    return formatter<std::string>::format(id.to_string(), ctx);
  }
};
