#pragma once

#include <string>
#include <string_view>

#include "engine/canonical_encoding.hpp"
#include "engine/error.hpp"
#include "engine/identifier.hpp"
#include "engine/identity_cache.hpp"
#include "engine/options.hpp"
#include "engine/provider.hpp"

namespace sid::engine {

/// Identifying information about a model schema, for logs and stored records.
struct IdentityReport {
  std::string fullname;
  std::string process_start;
  Identifier identifier;
  Json settings;

  auto to_json() const -> Json;
};

/// Identifier of `model`, computed once per process and options, then cached.
auto identifier_for(const SchemaProvider& provider, std::string_view model, const FingerprintOptions& options = {})
  -> Expected<Identifier>;

/// Runs extraction, canonicalization and hashing without touching the cache.
auto compute_identifier(const SchemaProvider& provider, std::string_view model,
                        const FingerprintOptions& options = {}) -> Expected<Identifier>;

/// Drop the cached identifier for `model` and compute it again.
auto rebuild_identifier(const SchemaProvider& provider, std::string_view model,
                        const FingerprintOptions& options = {}) -> Expected<Identifier>;

auto same_schema(const SchemaProvider& provider, std::string_view lhs, std::string_view rhs,
                 const FingerprintOptions& options = {}) -> Expected<bool>;
auto same_schema(const SchemaProvider& lhs_provider, std::string_view lhs, const SchemaProvider& rhs_provider,
                 std::string_view rhs, const FingerprintOptions& options = {}) -> Expected<bool>;

/// Exact bytes handed to the hasher for `model`.
auto canonical_input(const SchemaProvider& provider, std::string_view model, const FingerprintOptions& options = {})
  -> Expected<CanonicalForm>;

auto identity_report(const SchemaProvider& provider, std::string_view model, const FingerprintOptions& options = {})
  -> Expected<IdentityReport>;

auto make_identity_key(const SchemaProvider& provider, std::string_view model, const FingerprintOptions& options)
  -> IdentityKey;

/// UTC timestamp of process start, ISO-8601.
auto process_start_time() -> const std::string&;

}  // namespace sid::engine
