#include "engine/behavior_resolver.hpp"

#include <format>

#include "common/logging/log.hpp"
#include "engine/hasher.hpp"

namespace sid::engine {
namespace {

auto is_blank(char c) -> bool {
  return c == ' ' || c == '\t' || c == '\f' || c == '\v';
}

auto signature_payload(const BehaviorHandle& handle) -> std::string {
  // Length-prefixed parts keep ("ab", "") and ("a", "b") apart.
  auto payload = std::format("params={}", handle.parameters.size());
  for (const auto& param : handle.parameters) {
    payload += std::format(";{}:{}={}:{}", param.name.size(), param.name, param.annotation.size(),
                           param.annotation);
  }
  return payload;
}

}  // namespace

auto normalize_source(std::string_view source) -> std::string {
  std::string out;
  out.reserve(source.size());
  std::size_t line_start = 0;
  for (std::size_t i = 0; i < source.size(); ++i) {
    char c = source[i];
    if (c == '\r') {
      if (i + 1 < source.size() && source[i + 1] == '\n') {
        continue;
      }
      c = '\n';
    }
    if (c == '\n') {
      while (out.size() > line_start && is_blank(out.back())) {
        out.pop_back();
      }
      out.push_back('\n');
      line_start = out.size();
      continue;
    }
    out.push_back(c);
  }
  while (out.size() > line_start && is_blank(out.back())) {
    out.pop_back();
  }
  return out;
}

auto resolve_behavior(const BehaviorHandle& handle, const DegradedSink& sink) -> BehaviorRef {
  BehaviorRef ref;
  ref.role = handle.role;
  ref.mode = handle.mode;
  ref.qualified_name = handle.qualified_name;

  if (handle.module_level && !handle.qualified_name.empty()) {
    ref.strategy = FingerprintStrategy::ByName;
    ref.payload = handle.qualified_name;
    return ref;
  }

  if (handle.source_text) {
    ref.strategy = FingerprintStrategy::BySourceHash;
    ref.payload = hash_bytes(normalize_source(*handle.source_text)).hex();
  } else {
    ref.strategy = FingerprintStrategy::BySignature;
    ref.payload = signature_payload(handle);
  }

  sid::log::warn("behavior resolution degraded: name='{}' role={} strategy={}", handle.qualified_name,
                 to_string(handle.role), to_string(ref.strategy));
  if (sink) {
    sink(BehaviorResolutionDegraded{handle.qualified_name, handle.role, ref.strategy});
  }
  return ref;
}

}  // namespace sid::engine
