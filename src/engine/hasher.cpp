#include "engine/hasher.hpp"

#include <algorithm>

extern "C" {
#include "blake3.h"
}

namespace sid::engine {

struct Blake3Hasher::State {
  blake3_hasher hasher;
};

Blake3Hasher::Blake3Hasher() : state_(std::make_unique<State>()) {
  blake3_hasher_init(&state_->hasher);
}

Blake3Hasher::~Blake3Hasher() = default;

auto Blake3Hasher::update(std::string_view payload) -> void {
  blake3_hasher_update(&state_->hasher, payload.data(), payload.size());
}

auto Blake3Hasher::update(const std::uint8_t* data, std::size_t size) -> void {
  blake3_hasher_update(&state_->hasher, data, size);
}

auto Blake3Hasher::finish() const -> Digest {
  Digest digest{};
  blake3_hasher_finalize(&state_->hasher, digest.bytes.data(), digest.bytes.size());
  return digest;
}

auto hash_bytes(std::string_view payload) -> Digest {
  Blake3Hasher hasher;
  hasher.update(payload);
  return hasher.finish();
}

auto hash_canonical(const CanonicalForm& form, std::size_t digest_length) -> Identifier {
  auto hex = hash_bytes(form.view()).hex();
  hex.resize(std::min(digest_length, hex.size()));
  return Identifier{kAlgorithmVersion, std::move(hex)};
}

}  // namespace sid::engine
