#include "engine/schema.hpp"

namespace sid::engine {

auto to_string(NodeKind kind) -> std::string_view {
  switch (kind) {
    case NodeKind::Scalar:
      return "scalar";
    case NodeKind::Container:
      return "container";
    case NodeKind::Union:
      return "union";
    case NodeKind::Literal:
      return "literal";
    case NodeKind::Model:
      return "model";
    case NodeKind::RecursiveRef:
      return "recursive-ref";
  }
  return "unknown";
}

auto to_string(BehaviorRole role) -> std::string_view {
  switch (role) {
    case BehaviorRole::Validator:
      return "validator";
    case BehaviorRole::Serializer:
      return "serializer";
  }
  return "unknown";
}

auto to_string(FingerprintStrategy strategy) -> std::string_view {
  switch (strategy) {
    case FingerprintStrategy::ByName:
      return "by-name";
    case FingerprintStrategy::BySourceHash:
      return "by-source-hash";
    case FingerprintStrategy::BySignature:
      return "by-signature";
  }
  return "unknown";
}

}  // namespace sid::engine
