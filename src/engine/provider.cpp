#include "engine/provider.hpp"

#include <atomic>

#include "engine/identity_cache.hpp"

namespace sid::engine {
namespace {

std::atomic<std::uint64_t> g_next_instance_id{1};

}  // namespace

SchemaProvider::SchemaProvider()
    : instance_id_(g_next_instance_id.fetch_add(1, std::memory_order_relaxed)) {}

SchemaProvider::~SchemaProvider() {
  IdentityCache::global().invalidate_provider(instance_id_);
}

}  // namespace sid::engine
