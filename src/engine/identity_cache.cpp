#include "engine/identity_cache.hpp"

#include <mutex>

namespace sid::engine {

auto IdentityCache::global() -> IdentityCache& {
  static auto* cache = new IdentityCache();
  return *cache;
}

auto IdentityCache::get_or_compute(const IdentityKey& key, const ComputeFn& compute) -> Expected<Identifier> {
  if (auto cached = find(key)) {
    return *cached;
  }

  auto computed = compute();
  if (!computed) {
    return computed;
  }

  std::unique_lock lock(mutex_);
  auto it = entries_.try_emplace(key, std::move(*computed)).first;
  return it->second;
}

auto IdentityCache::find(const IdentityKey& key) const -> std::optional<Identifier> {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto IdentityCache::invalidate(const IdentityKey& key) -> bool {
  std::unique_lock lock(mutex_);
  return entries_.erase(key) > 0;
}

auto IdentityCache::invalidate_provider(std::uint64_t provider) -> std::size_t {
  std::unique_lock lock(mutex_);
  return std::erase_if(entries_, [provider](const auto& entry) { return entry.first.provider == provider; });
}

auto IdentityCache::size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

}  // namespace sid::engine
