#include "engine/identity.hpp"

#include <chrono>
#include <format>

#include "common/logging/log.hpp"
#include "engine/canonicalizer.hpp"
#include "engine/extractor.hpp"
#include "engine/hasher.hpp"

namespace sid::engine {
namespace {

const auto g_process_start = std::chrono::system_clock::now();

}  // namespace

auto IdentityReport::to_json() const -> Json {
  return Json{
    {"fullname", fullname},
    {"date", process_start},
    {"hash", identifier.to_string()},
    {"hash_settings", settings},
  };
}

auto process_start_time() -> const std::string& {
  static const std::string formatted =
    std::format("{:%Y-%m-%dT%H:%M:%SZ}", std::chrono::floor<std::chrono::seconds>(g_process_start));
  return formatted;
}

auto make_identity_key(const SchemaProvider& provider, std::string_view model, const FingerprintOptions& options)
  -> IdentityKey {
  return IdentityKey{provider.instance_id(), options_key(options), std::string(model)};
}

auto canonical_input(const SchemaProvider& provider, std::string_view model, const FingerprintOptions& options)
  -> Expected<CanonicalForm> {
  if (auto res = validate_options(options); !res) {
    return tl::unexpected(res.error());
  }
  auto graph = extract_schema(provider, model, options);
  if (!graph) {
    return tl::unexpected(graph.error());
  }
  return canonicalize(*graph, options);
}

auto compute_identifier(const SchemaProvider& provider, std::string_view model, const FingerprintOptions& options)
  -> Expected<Identifier> {
  auto form = canonical_input(provider, model, options);
  if (!form) {
    return tl::unexpected(form.error());
  }
  auto id = hash_canonical(*form, options.digest_length);
  sid::log::info("schema.identity.computed", {{"model", std::string(model)}, {"identifier", id.to_string()}});
  return id;
}

auto identifier_for(const SchemaProvider& provider, std::string_view model, const FingerprintOptions& options)
  -> Expected<Identifier> {
  return IdentityCache::global().get_or_compute(
    make_identity_key(provider, model, options),
    [&]() { return compute_identifier(provider, model, options); });
}

auto rebuild_identifier(const SchemaProvider& provider, std::string_view model, const FingerprintOptions& options)
  -> Expected<Identifier> {
  IdentityCache::global().invalidate(make_identity_key(provider, model, options));
  return identifier_for(provider, model, options);
}

auto same_schema(const SchemaProvider& provider, std::string_view lhs, std::string_view rhs,
                 const FingerprintOptions& options) -> Expected<bool> {
  return same_schema(provider, lhs, provider, rhs, options);
}

auto same_schema(const SchemaProvider& lhs_provider, std::string_view lhs, const SchemaProvider& rhs_provider,
                 std::string_view rhs, const FingerprintOptions& options) -> Expected<bool> {
  auto lhs_id = identifier_for(lhs_provider, lhs, options);
  if (!lhs_id) {
    return tl::unexpected(lhs_id.error());
  }
  auto rhs_id = identifier_for(rhs_provider, rhs, options);
  if (!rhs_id) {
    return tl::unexpected(rhs_id.error());
  }
  return compare_identifiers(*lhs_id, *rhs_id) == IdentifierMatch::Equal;
}

auto identity_report(const SchemaProvider& provider, std::string_view model, const FingerprintOptions& options)
  -> Expected<IdentityReport> {
  auto desc = provider.describe_schema(model);
  if (!desc) {
    return tl::unexpected(desc.error());
  }
  auto id = identifier_for(provider, model, options);
  if (!id) {
    return tl::unexpected(id.error());
  }
  IdentityReport report;
  report.fullname = desc->name.empty() ? std::string(model) : desc->name;
  report.process_start = process_start_time();
  report.identifier = std::move(*id);
  report.settings = options_to_json(options);
  return report;
}

}  // namespace sid::engine
