#include "engine/options.hpp"

#include <format>

namespace sid::engine {

auto validate_options(const FingerprintOptions& options) -> Expected<void> {
  if (options.digest_length < kMinDigestLength || options.digest_length > kMaxDigestLength) {
    return tl::unexpected(make_error(
      ErrorCode::InvalidOptions,
      std::format("digest_length must be within [{}, {}], got {}", kMinDigestLength, kMaxDigestLength,
                  options.digest_length)));
  }
  if (options.max_nodes == 0 || options.max_depth == 0) {
    return tl::unexpected(make_error(ErrorCode::InvalidOptions, "max_nodes and max_depth must be positive"));
  }
  return {};
}

auto options_key(const FingerprintOptions& options) -> std::string {
  return options_to_json(options).dump();
}

auto options_to_json(const FingerprintOptions& options) -> Json {
  return Json{
    {"track_descriptions", options.track_descriptions},
    {"track_field_order", options.track_field_order},
    {"track_type_order", options.track_type_order},
    {"track_default_values", options.track_default_values},
    {"tracked_extra_data", options.tracked_extra_data},
    {"digest_length", options.digest_length},
    {"max_nodes", options.max_nodes},
    {"max_depth", options.max_depth},
  };
}

}  // namespace sid::engine
