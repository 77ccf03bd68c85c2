#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace sid::engine {

using Json = nlohmann::json;

using NodeIndex = std::uint32_t;

inline constexpr NodeIndex kNoNode = std::numeric_limits<NodeIndex>::max();

enum class NodeKind : std::uint8_t {
  Scalar = 1,
  Container = 2,
  Union = 3,
  Literal = 4,
  Model = 5,
  RecursiveRef = 6,
};

enum class BehaviorRole : std::uint8_t {
  Validator = 1,
  Serializer = 2,
};

enum class BehaviorScope : std::uint8_t {
  Field = 1,
  Model = 2,
};

enum class FingerprintStrategy : std::uint8_t {
  ByName = 1,
  BySourceHash = 2,
  BySignature = 3,
};

struct ParameterDesc {
  std::string name;
  std::string annotation;
};

/// Validator or serializer attached to a field or a model, as reported by a provider.
struct BehaviorHandle {
  BehaviorRole role = BehaviorRole::Validator;
  std::string mode;
  std::string qualified_name;
  bool module_level = false;
  std::optional<std::string> source_text;
  std::vector<ParameterDesc> parameters;
};

/// Symbolic, portable stand-in for a behavior inside the canonical form.
struct BehaviorRef {
  BehaviorRole role = BehaviorRole::Validator;
  BehaviorScope scope = BehaviorScope::Field;
  std::string mode;
  std::string qualified_name;
  FingerprintStrategy strategy = FingerprintStrategy::BySignature;
  std::string payload;
};

struct Constraint {
  std::string name;
  std::string value;
};

struct SchemaNode {
  NodeKind kind = NodeKind::Scalar;
  std::string tag;
  std::vector<Constraint> constraints;
  std::vector<NodeIndex> children;
  std::optional<std::string> field_name;
  std::optional<std::string> alias;
  bool default_present = false;
  std::optional<std::string> default_value;
  std::optional<std::string> field_description;
  // Type-level documentation (model docstring or type expression description).
  std::optional<std::string> description;
  std::vector<BehaviorRef> behavior_refs;
  NodeIndex target = kNoNode;
};

/// Arena of schema nodes; edges are indices so cycles need no shared ownership.
struct SchemaGraph {
  std::vector<SchemaNode> nodes;
  NodeIndex root = kNoNode;
};

struct FieldDesc {
  std::string name;
  std::optional<std::string> alias;
  Json schema;
  bool has_default = false;
  Json default_value;
  std::optional<std::string> description;
};

struct ModelDesc {
  std::string name;
  std::optional<std::string> description;
  std::vector<FieldDesc> fields;
};

auto to_string(NodeKind kind) -> std::string_view;
auto to_string(BehaviorRole role) -> std::string_view;
auto to_string(FingerprintStrategy strategy) -> std::string_view;

}  // namespace sid::engine
