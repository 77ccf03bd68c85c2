#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "engine/canonical_encoding.hpp"
#include "engine/identifier.hpp"

namespace sid::engine {

/// 128-bit digest used for node labels and identifiers.
struct Digest {
  std::array<std::uint8_t, 16> bytes{};

  auto operator<=>(const Digest&) const = default;

  auto hex() const -> std::string { return to_hex(bytes.data(), bytes.size()); }
};

/// Unseeded BLAKE3, truncated to 128 bits.
auto hash_bytes(std::string_view payload) -> Digest;

/// Incremental form of hash_bytes for multi-part inputs.
class Blake3Hasher {
 public:
  Blake3Hasher();
  ~Blake3Hasher();

  Blake3Hasher(const Blake3Hasher&) = delete;
  Blake3Hasher& operator=(const Blake3Hasher&) = delete;

  auto update(std::string_view payload) -> void;
  auto update(const std::uint8_t* data, std::size_t size) -> void;
  auto finish() const -> Digest;

 private:
  struct State;
  std::unique_ptr<State> state_;
};

/// Reduce canonical bytes to a version-tagged identifier, keeping `digest_length` hex chars.
auto hash_canonical(const CanonicalForm& form, std::size_t digest_length) -> Identifier;

}  // namespace sid::engine
