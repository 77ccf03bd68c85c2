#include <mutex>

#include "engine/identity.hpp"
#include "test_support.hpp"

namespace {

auto wide_catalog() -> sid::engine::Json {
  std::vector<sid::engine::Json> fields;
  for (int i = 0; i < 32; ++i) {
    fields.push_back(schema::field(std::format("f{}", i),
                                   i % 2 == 0 ? schema::type("int") : schema::list_of(schema::type("str"))));
  }
  fields.push_back(schema::field("next", schema::nullable(schema::ref("Wide"))));
  return schema::catalog({{"Wide", schema::model(std::move(fields))}});
}

}  // namespace

auto test_concurrent_first_access() -> bool {
  auto provider = schema::load(wide_catalog());
  auto expected = sid::engine::compute_identifier(*provider, "Wide");
  if (!expected) {
    std::cerr << "compute error: " << expected.error().message << "\n";
    return false;
  }

  auto &cache = sid::engine::IdentityCache::global();
  const auto before = cache.size();

  std::mutex error_mutex;
  std::string error_message;
  auto ok = run_concurrent(8, 25, [&](int, int) {
    auto id = sid::engine::identifier_for(*provider, "Wide");
    if (!id || *id != *expected) {
      std::lock_guard<std::mutex> lock(error_mutex);
      error_message = id ? std::format("mismatch: {} vs {}", *id, *expected) : id.error().message;
      return false;
    }
    return true;
  });
  if (!ok) {
    std::cerr << error_message << "\n";
    return false;
  }
  return cache.size() == before + 1;
}

auto test_compute_races_keep_first_insert() -> bool {
  sid::engine::IdentityCache cache;
  sid::engine::IdentityKey key{1, "{}", "M"};
  std::atomic<int> computed{0};

  auto ok = run_concurrent(6, 20, [&](int, int) {
    auto id = cache.get_or_compute(key, [&]() -> sid::engine::Expected<sid::engine::Identifier> {
      computed.fetch_add(1, std::memory_order_relaxed);
      return sid::engine::Identifier{1, "00112233445566778899aabbccddeeff"};
    });
    return id && id->digest == "00112233445566778899aabbccddeeff";
  });
  // Racing callers may each compute once, but never more than there are threads.
  return ok && cache.size() == 1 && computed.load() >= 1 && computed.load() <= 6;
}

auto test_failures_are_not_cached() -> bool {
  sid::engine::IdentityCache cache;
  sid::engine::IdentityKey key{2, "{}", "Broken"};
  int calls = 0;
  auto fail = [&]() -> sid::engine::Expected<sid::engine::Identifier> {
    ++calls;
    return tl::unexpected(sid::engine::make_error(sid::engine::ErrorCode::ProviderFailure, "boom"));
  };
  auto first = cache.get_or_compute(key, fail);
  auto second = cache.get_or_compute(key, fail);
  return !first && !second && calls == 2 && cache.size() == 0 &&
         first.error().code == sid::engine::ErrorCode::ProviderFailure;
}

auto test_invalidate() -> bool {
  sid::engine::IdentityCache cache;
  sid::engine::IdentityKey key{3, "{}", "M"};
  int calls = 0;
  auto compute = [&]() -> sid::engine::Expected<sid::engine::Identifier> {
    ++calls;
    return sid::engine::Identifier{1, std::format("{:08x}", calls)};
  };
  auto first = cache.get_or_compute(key, compute);
  auto cached = cache.get_or_compute(key, compute);
  if (!first || !cached || *first != *cached || calls != 1) {
    return false;
  }
  if (!cache.invalidate(key) || cache.invalidate(key) || cache.find(key)) {
    return false;
  }
  auto rebuilt = cache.get_or_compute(key, compute);
  return rebuilt && calls == 2 && rebuilt->digest == "00000002";
}

auto test_keys_separate_providers_and_options() -> bool {
  auto catalog = wide_catalog();
  auto lhs = schema::load(catalog);
  auto rhs = schema::load(catalog);
  sid::engine::FingerprintOptions tracked;
  tracked.track_field_order = true;

  auto a = sid::engine::make_identity_key(*lhs, "Wide", {});
  auto b = sid::engine::make_identity_key(*rhs, "Wide", {});
  auto c = sid::engine::make_identity_key(*lhs, "Wide", tracked);
  return !(a == b) && !(a == c) && a == sid::engine::make_identity_key(*lhs, "Wide", {});
}

auto test_invalidate_provider() -> bool {
  sid::engine::IdentityCache cache;
  auto compute = []() -> sid::engine::Expected<sid::engine::Identifier> {
    return sid::engine::Identifier{1, "abcdef0123456789"};
  };
  for (const auto *model : {"A", "B", "C"}) {
    if (!cache.get_or_compute(sid::engine::IdentityKey{7, "{}", model}, compute)) {
      return false;
    }
  }
  if (!cache.get_or_compute(sid::engine::IdentityKey{8, "{}", "A"}, compute)) {
    return false;
  }
  return cache.invalidate_provider(7) == 3 && cache.size() == 1 && cache.invalidate_provider(7) == 0 &&
         cache.find(sid::engine::IdentityKey{8, "{}", "A"}).has_value();
}

auto test_destroyed_provider_releases_entries() -> bool {
  auto &cache = sid::engine::IdentityCache::global();
  const auto before = cache.size();
  for (int round = 0; round < 50; ++round) {
    auto provider = schema::load(wide_catalog());
    auto id = sid::engine::identifier_for(*provider, "Wide");
    if (!id || cache.size() != before + 1) {
      return false;
    }
  }
  return cache.size() == before;
}

int main() {
  TestStats stats;
  run_test("concurrent_first_access", test_concurrent_first_access, stats);
  run_test("compute_races_keep_first_insert", test_compute_races_keep_first_insert, stats);
  run_test("failures_are_not_cached", test_failures_are_not_cached, stats);
  run_test("invalidate", test_invalidate, stats);
  run_test("keys_separate_providers_and_options", test_keys_separate_providers_and_options, stats);
  run_test("invalidate_provider", test_invalidate_provider, stats);
  run_test("destroyed_provider_releases_entries", test_destroyed_provider_releases_entries, stats);

  std::cout << "Passed: " << stats.passed << ", Failed: " << stats.failed << "\n";
  return stats.failed == 0 ? 0 : 1;
}
