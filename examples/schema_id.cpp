#include <algorithm>
#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <memory>
#include <string>
#include <vector>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "engine/canonical_encoding.hpp"
#include "engine/identity.hpp"
#include "engine/json_provider.hpp"

DEFINE_string(catalog, "", "Path to a JSON model catalog");
DEFINE_string(model, "", "Model to fingerprint; every model in the catalog when empty");
DEFINE_bool(report, false, "Print an identity report (JSON) instead of the bare identifier");
DEFINE_bool(canonical, false, "Print the canonical input bytes as hex");
DEFINE_bool(track_descriptions, false, "Include descriptions in the identifier");
DEFINE_bool(track_field_order, false, "Make field order significant");
DEFINE_bool(track_type_order, false, "Make union member order significant");
DEFINE_bool(track_default_values, false, "Include default values, not only their presence");
DEFINE_string(extra_data, "", "JSON value mixed into every identifier");
DEFINE_int32(digest_length, 32, "Hex characters kept from the digest (8..32)");

namespace {

auto read_file(const std::string& path, std::string& out) -> bool {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  out = buffer.str();
  return true;
}

auto options_from_flags() -> sid::engine::Expected<sid::engine::FingerprintOptions> {
  sid::engine::FingerprintOptions options;
  options.track_descriptions = FLAGS_track_descriptions;
  options.track_field_order = FLAGS_track_field_order;
  options.track_type_order = FLAGS_track_type_order;
  options.track_default_values = FLAGS_track_default_values;
  options.digest_length = static_cast<std::size_t>(std::max(FLAGS_digest_length, 0));
  if (!FLAGS_extra_data.empty()) {
    auto extra = sid::engine::Json::parse(FLAGS_extra_data, nullptr, false);
    if (extra.is_discarded()) {
      return tl::unexpected(sid::engine::make_error(sid::engine::ErrorCode::InvalidOptions,
                                                    "--extra_data is not valid JSON"));
    }
    options.tracked_extra_data = std::move(extra);
  }
  options.on_degraded = [](const sid::engine::BehaviorResolutionDegraded& event) {
    std::cerr << std::format("degraded: {} ({}) fingerprinted {}\n", event.qualified_name,
                             sid::engine::to_string(event.role), sid::engine::to_string(event.strategy));
  };
  return options;
}

auto print_model(const sid::engine::SchemaProvider& provider, const std::string& model,
                 const sid::engine::FingerprintOptions& options) -> bool {
  if (FLAGS_canonical) {
    auto form = sid::engine::canonical_input(provider, model, options);
    if (!form) {
      std::cerr << std::format("{}: {}: {}\n", model, sid::engine::to_string(form.error().code),
                               form.error().message);
      return false;
    }
    std::cout << model << " " << sid::engine::to_hex(form->bytes.data(), form->bytes.size()) << "\n";
    return true;
  }
  if (FLAGS_report) {
    auto report = sid::engine::identity_report(provider, model, options);
    if (!report) {
      std::cerr << std::format("{}: {}: {}\n", model, sid::engine::to_string(report.error().code),
                               report.error().message);
      return false;
    }
    std::cout << report->to_json().dump(2) << "\n";
    return true;
  }
  auto id = sid::engine::identifier_for(provider, model, options);
  if (!id) {
    std::cerr << std::format("{}: {}: {}\n", model, sid::engine::to_string(id.error().code), id.error().message);
    return false;
  }
  std::cout << model << " " << id->to_string() << "\n";
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("schema_id --catalog=<file> [--model=<name>] [--report] [--canonical]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  sid::log::init();

  int status = 0;
  std::string text;
  if (FLAGS_catalog.empty() || !read_file(FLAGS_catalog, text)) {
    std::cerr << "cannot read catalog '" << FLAGS_catalog << "'\n";
    status = 2;
  }

  std::unique_ptr<sid::engine::JsonSchemaProvider> provider;
  if (status == 0) {
    auto loaded = sid::engine::JsonSchemaProvider::from_string(text);
    if (!loaded) {
      std::cerr << loaded.error().message << "\n";
      status = 2;
    } else {
      provider = std::move(*loaded);
    }
  }

  auto options = options_from_flags();
  if (status == 0 && !options) {
    std::cerr << options.error().message << "\n";
    status = 2;
  }

  if (status == 0) {
    auto models = FLAGS_model.empty() ? provider->model_names() : std::vector<std::string>{FLAGS_model};
    for (const auto& model : models) {
      if (!print_model(*provider, model, *options)) {
        status = 1;
      }
    }
  }

  sid::log::shutdown();
  gflags::ShutDownCommandLineFlags();
  return status;
}
