#include "engine/extractor.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <functional>
#include <iterator>
#include <span>
#include <limits>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "common/logging/log.hpp"
#include "engine/behavior_resolver.hpp"

namespace sid::engine {
namespace {

constexpr std::array<std::string_view, 14> kScalarTags{
  "any", "none", "bool", "int", "float", "str", "bytes",
  "decimal", "date", "time", "datetime", "timedelta", "uuid", "url"};

constexpr std::array<std::string_view, 3> kMetadataKeys{"description", "title", "examples"};

constexpr std::array<std::string_view, 1> kItemsKeys{"items"};
constexpr std::array<std::string_view, 2> kDictKeys{"keys", "values"};
constexpr std::array<std::string_view, 1> kNullableKeys{"schema"};
constexpr std::array<std::string_view, 1> kUnionKeys{"choices"};
constexpr std::array<std::string_view, 1> kLiteralKeys{"expected"};
constexpr std::array<std::string_view, 1> kEnumKeys{"members"};
constexpr std::array<std::string_view, 1> kModelKeys{"model"};

auto contains(std::span<const std::string_view> set, std::string_view value) -> bool {
  return std::find(set.begin(), set.end(), value) != set.end();
}

auto unsupported(std::string_view context, std::string_view message) -> SchemaError {
  return make_error(ErrorCode::UnsupportedSchemaNode, std::format("{}: {}", context, message));
}

struct StringHash {
  using is_transparent = void;

  auto operator()(std::string_view value) const -> std::size_t { return std::hash<std::string_view>{}(value); }
};

class GraphBuilder {
 public:
  GraphBuilder(const SchemaProvider& provider, const FingerprintOptions& options)
      : provider_(provider), options_(options) {}

  auto build(std::string_view model) -> Expected<SchemaGraph> {
    auto root = expand_model(model, 0);
    if (!root) {
      return tl::unexpected(root.error());
    }
    graph_.root = *root;
    return std::move(graph_);
  }

 private:
  struct PathEntry {
    std::string model;
    NodeIndex node = kNoNode;
  };

  /// Model whose expansion referenced nothing at or above itself on the path.
  /// Later uses clone the root and share the field subgraphs.
  struct SharedModel {
    SchemaNode root;
    std::size_t height = 0;
  };

  static constexpr std::size_t kNoPathRef = std::numeric_limits<std::size_t>::max();

  auto add_node(SchemaNode node) -> Expected<NodeIndex> {
    if (graph_.nodes.size() >= options_.max_nodes) {
      return tl::unexpected(make_error(
        ErrorCode::CycleDepthExceeded,
        std::format("schema graph exceeds the node bound of {}", options_.max_nodes)));
    }
    graph_.nodes.push_back(std::move(node));
    return static_cast<NodeIndex>(graph_.nodes.size() - 1);
  }

  auto check_depth(std::size_t depth, std::string_view context) -> Expected<void> {
    if (depth > options_.max_depth) {
      return tl::unexpected(make_error(
        ErrorCode::CycleDepthExceeded,
        std::format("{}: schema nesting exceeds the depth bound of {}", context, options_.max_depth)));
    }
    deepest_ = std::max(deepest_, depth);
    return {};
  }

  auto resolve_all(const std::vector<BehaviorHandle>& handles, BehaviorScope scope) const
    -> std::vector<BehaviorRef> {
    std::vector<BehaviorRef> refs;
    refs.reserve(handles.size());
    for (const auto& handle : handles) {
      auto ref = resolve_behavior(handle, options_.on_degraded);
      ref.scope = scope;
      refs.push_back(std::move(ref));
    }
    return refs;
  }

  auto apply_constraints(NodeIndex index, const Json& expr, std::span<const std::string_view> structural) -> void {
    auto& node = graph_.nodes[index];
    for (const auto& [key, value] : expr.items()) {
      if (key == "type" || contains(structural, key)) {
        continue;
      }
      if (contains(kMetadataKeys, key)) {
        if (options_.track_descriptions) {
          node.constraints.push_back(Constraint{"meta." + key, value.dump()});
        }
        continue;
      }
      node.constraints.push_back(Constraint{key, value.dump()});
    }
  }

  auto add_simple(NodeKind kind, std::string tag) -> Expected<NodeIndex> {
    SchemaNode node;
    node.kind = kind;
    node.tag = std::move(tag);
    return add_node(std::move(node));
  }

  auto append_child(NodeIndex parent, Expected<NodeIndex> child) -> Expected<void> {
    if (!child) {
      return tl::unexpected(child.error());
    }
    graph_.nodes[parent].children.push_back(*child);
    return {};
  }

  /// A missing item schema means "any", as for an unparameterized container.
  auto expand_optional(const Json& expr, std::string_view key, std::string_view context, std::size_t depth)
    -> Expected<NodeIndex> {
    auto it = expr.find(std::string(key));
    if (it == expr.end() || it->is_null()) {
      return add_simple(NodeKind::Scalar, "any");
    }
    return expand_type(*it, std::format("{}.{}", context, key), depth + 1);
  }

  auto expand_list(const Json& expr, std::string_view key, std::string_view context, std::size_t depth,
                   NodeIndex parent) -> Expected<void> {
    auto it = expr.find(std::string(key));
    if (it == expr.end() || !it->is_array() || it->empty()) {
      return tl::unexpected(unsupported(context, std::format("'{}' must be a non-empty array", key)));
    }
    std::size_t position = 0;
    for (const auto& item : *it) {
      auto child = expand_type(item, std::format("{}.{}[{}]", context, key, position++), depth + 1);
      if (auto res = append_child(parent, std::move(child)); !res) {
        return res;
      }
    }
    return {};
  }

  auto expand_values(const Json& expr, std::string_view key, std::string_view constraint,
                     std::string_view context, NodeIndex node) -> Expected<void> {
    auto it = expr.find(std::string(key));
    if (it == expr.end() || !it->is_array() || it->empty()) {
      return tl::unexpected(unsupported(context, std::format("'{}' must be a non-empty array", key)));
    }
    for (const auto& value : *it) {
      graph_.nodes[node].constraints.push_back(Constraint{std::string(constraint), value.dump()});
    }
    return {};
  }

  auto expand_type(const Json& expr, const std::string& context, std::size_t depth) -> Expected<NodeIndex> {
    if (auto res = check_depth(depth, context); !res) {
      return tl::unexpected(res.error());
    }
    if (!expr.is_object()) {
      return tl::unexpected(unsupported(context, "type expression must be an object"));
    }
    auto type_it = expr.find("type");
    if (type_it == expr.end() || !type_it->is_string()) {
      return tl::unexpected(unsupported(context, "type expression has no 'type' tag"));
    }
    const auto tag = type_it->get<std::string>();

    if (contains(kScalarTags, tag)) {
      auto index = add_simple(NodeKind::Scalar, tag);
      if (index) {
        apply_constraints(*index, expr, {});
      }
      return index;
    }

    if (tag == "list" || tag == "set" || tag == "frozenset") {
      auto index = add_simple(NodeKind::Container, tag);
      if (!index) {
        return index;
      }
      if (auto res = append_child(*index, expand_optional(expr, "items", context, depth)); !res) {
        return tl::unexpected(res.error());
      }
      apply_constraints(*index, expr, kItemsKeys);
      return index;
    }

    if (tag == "dict") {
      auto index = add_simple(NodeKind::Container, tag);
      if (!index) {
        return index;
      }
      for (auto key : kDictKeys) {
        if (auto res = append_child(*index, expand_optional(expr, key, context, depth)); !res) {
          return tl::unexpected(res.error());
        }
      }
      apply_constraints(*index, expr, kDictKeys);
      return index;
    }

    if (tag == "tuple") {
      auto items_it = expr.find("items");
      const bool positional = items_it != expr.end() && items_it->is_array();
      auto index = add_simple(NodeKind::Container, positional ? "tuple" : "tuple-variadic");
      if (!index) {
        return index;
      }
      if (positional) {
        std::size_t position = 0;
        for (const auto& item : *items_it) {
          auto child = expand_type(item, std::format("{}.items[{}]", context, position++), depth + 1);
          if (auto res = append_child(*index, std::move(child)); !res) {
            return tl::unexpected(res.error());
          }
        }
      } else if (auto res = append_child(*index, expand_optional(expr, "items", context, depth)); !res) {
        return tl::unexpected(res.error());
      }
      apply_constraints(*index, expr, kItemsKeys);
      return index;
    }

    if (tag == "nullable") {
      auto schema_it = expr.find("schema");
      if (schema_it == expr.end()) {
        return tl::unexpected(unsupported(context, "nullable requires 'schema'"));
      }
      // Same shape as union[T, none], so both spellings fingerprint alike.
      auto index = add_simple(NodeKind::Union, "union");
      if (!index) {
        return index;
      }
      if (auto res = append_child(*index, expand_type(*schema_it, context + ".schema", depth + 1)); !res) {
        return tl::unexpected(res.error());
      }
      if (auto res = append_child(*index, add_simple(NodeKind::Scalar, "none")); !res) {
        return tl::unexpected(res.error());
      }
      apply_constraints(*index, expr, kNullableKeys);
      return index;
    }

    if (tag == "union") {
      auto index = add_simple(NodeKind::Union, "union");
      if (!index) {
        return index;
      }
      if (auto res = expand_list(expr, "choices", context, depth, *index); !res) {
        return tl::unexpected(res.error());
      }
      apply_constraints(*index, expr, kUnionKeys);
      return index;
    }

    if (tag == "literal" || tag == "enum") {
      const bool literal = tag == "literal";
      auto index = add_simple(NodeKind::Literal, tag);
      if (!index) {
        return index;
      }
      auto res = literal ? expand_values(expr, "expected", "expected", context, *index)
                         : expand_values(expr, "members", "member", context, *index);
      if (!res) {
        return tl::unexpected(res.error());
      }
      apply_constraints(*index, expr, literal ? std::span<const std::string_view>(kLiteralKeys)
                                              : std::span<const std::string_view>(kEnumKeys));
      return index;
    }

    if (tag == "model") {
      auto model_it = expr.find("model");
      if (model_it == expr.end() || !model_it->is_string()) {
        return tl::unexpected(unsupported(context, "model reference requires a 'model' name"));
      }
      auto index = expand_model(model_it->get<std::string>(), depth + 1);
      if (index) {
        apply_constraints(*index, expr, kModelKeys);
      }
      return index;
    }

    return tl::unexpected(unsupported(context, std::format("unsupported schema construct '{}'", tag)));
  }

  auto expand_model(std::string_view model, std::size_t depth) -> Expected<NodeIndex> {
    const auto context = std::format("model '{}'", model);
    if (auto res = check_depth(depth, context); !res) {
      return tl::unexpected(res.error());
    }
    for (std::size_t position = 0; position < path_.size(); ++position) {
      if (path_[position].model == model) {
        lowest_path_ref_ = std::min(lowest_path_ref_, position);
        SchemaNode ref;
        ref.kind = NodeKind::RecursiveRef;
        ref.target = path_[position].node;
        return add_node(std::move(ref));
      }
    }

    if (auto shared = shared_.find(model); shared != shared_.end()) {
      // The subtree was bounded at its first use; it must also fit here.
      if (auto res = check_depth(depth + shared->second.height, context); !res) {
        return tl::unexpected(res.error());
      }
      return add_node(shared->second.root);
    }

    auto desc = provider_.describe_schema(model);
    if (!desc) {
      return tl::unexpected(desc.error());
    }

    SchemaNode node;
    node.kind = NodeKind::Model;
    if (options_.track_descriptions) {
      node.description = desc->description;
    }
    node.behavior_refs = resolve_all(provider_.list_behaviors(model, std::nullopt), BehaviorScope::Model);
    auto index = add_node(std::move(node));
    if (!index) {
      return index;
    }

    const auto position = path_.size();
    const auto outer_lowest = std::exchange(lowest_path_ref_, kNoPathRef);
    const auto outer_deepest = std::exchange(deepest_, depth);
    path_.push_back(PathEntry{std::string(model), *index});
    for (const auto& field : desc->fields) {
      const auto field_context = std::format("{} field '{}'", context, field.name);
      auto child = expand_type(field.schema, field_context, depth + 1);
      if (!child) {
        path_.pop_back();
        return child;
      }
      auto refs = resolve_all(provider_.list_behaviors(model, field.name), BehaviorScope::Field);

      auto& slot = graph_.nodes[*child];
      slot.field_name = field.name;
      if (field.alias && *field.alias != field.name) {
        slot.alias = field.alias;
      }
      slot.default_present = field.has_default;
      if (field.has_default && options_.track_default_values) {
        slot.default_value = field.default_value.dump();
      }
      if (options_.track_descriptions) {
        slot.field_description = field.description;
      }
      std::move(refs.begin(), refs.end(), std::back_inserter(slot.behavior_refs));
      graph_.nodes[*index].children.push_back(*child);
    }
    path_.pop_back();

    // A back reference to this model or an ancestor ties the subtree to the
    // current path; only path-independent subtrees are shared.
    if (lowest_path_ref_ > position) {
      shared_.emplace(std::string(model), SharedModel{graph_.nodes[*index], deepest_ - depth});
    }
    lowest_path_ref_ = std::min(outer_lowest, lowest_path_ref_);
    deepest_ = std::max(outer_deepest, deepest_);
    return index;
  }

  const SchemaProvider& provider_;
  const FingerprintOptions& options_;
  SchemaGraph graph_;
  std::vector<PathEntry> path_;
  std::unordered_map<std::string, SharedModel, StringHash, std::equal_to<>> shared_;
  std::size_t lowest_path_ref_ = kNoPathRef;
  std::size_t deepest_ = 0;
};

}  // namespace

auto extract_schema(const SchemaProvider& provider, std::string_view model, const FingerprintOptions& options)
  -> Expected<SchemaGraph> {
  GraphBuilder builder(provider, options);
  auto graph = builder.build(model);
  if (graph) {
    sid::log::debug("extracted schema graph: model={} nodes={}", model, graph->nodes.size());
  }
  return graph;
}

}  // namespace sid::engine
