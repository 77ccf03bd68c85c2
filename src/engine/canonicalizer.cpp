#include "engine/canonicalizer.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <string_view>

#include "common/logging/log.hpp"
#include "engine/identifier.hpp"

namespace sid::engine {
namespace {

constexpr std::string_view kCanonicalMagic = "sid.canonical";
constexpr std::string_view kLabelDomain = "sid.label";

auto malformed(std::string message) -> SchemaError {
  return make_error(ErrorCode::UnsupportedSchemaNode, "malformed schema graph: " + std::move(message));
}

auto validate_graph(const SchemaGraph& graph) -> Expected<void> {
  const auto size = graph.nodes.size();
  if (graph.root >= size) {
    return tl::unexpected(malformed("root index out of range"));
  }
  for (std::size_t i = 0; i < size; ++i) {
    const auto& node = graph.nodes[i];
    for (auto child : node.children) {
      if (child >= size) {
        return tl::unexpected(malformed(std::format("node {} has child {} out of range", i, child)));
      }
    }
    if (node.kind == NodeKind::RecursiveRef) {
      if (node.target >= size || graph.nodes[node.target].kind != NodeKind::Model) {
        return tl::unexpected(malformed(std::format("recursive reference {} has no model target", i)));
      }
      if (!node.children.empty()) {
        return tl::unexpected(malformed(std::format("recursive reference {} has children", i)));
      }
    }
  }
  return {};
}

auto write_optional(CanonicalWriter& writer, const std::optional<std::string>& value) -> void {
  writer.write_bool(value.has_value());
  if (value) {
    writer.write_string(*value);
  }
}

/// Attributes of a node that do not depend on other nodes.
auto local_signature(const SchemaNode& node, const FingerprintOptions& options) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> bytes;
  CanonicalWriter writer(bytes);
  writer.write_u8(static_cast<std::uint8_t>(node.kind));
  writer.write_string(node.tag);

  auto constraints = node.constraints;
  if (options.track_type_order) {
    std::stable_sort(constraints.begin(), constraints.end(),
                     [](const Constraint& a, const Constraint& b) { return a.name < b.name; });
  } else {
    std::sort(constraints.begin(), constraints.end(), [](const Constraint& a, const Constraint& b) {
      return a.name != b.name ? a.name < b.name : a.value < b.value;
    });
  }
  writer.write_u32(static_cast<std::uint32_t>(constraints.size()));
  for (const auto& constraint : constraints) {
    writer.write_string(constraint.name);
    writer.write_string(constraint.value);
  }

  write_optional(writer, node.field_name);
  write_optional(writer, node.alias);
  writer.write_bool(node.default_present);
  write_optional(writer, node.default_value);
  write_optional(writer, node.field_description);
  write_optional(writer, node.description);

  // Validator chains run in declaration order, so behaviors keep it.
  writer.write_u32(static_cast<std::uint32_t>(node.behavior_refs.size()));
  for (const auto& ref : node.behavior_refs) {
    writer.write_u8(static_cast<std::uint8_t>(ref.role));
    writer.write_u8(static_cast<std::uint8_t>(ref.scope));
    writer.write_u8(static_cast<std::uint8_t>(ref.strategy));
    writer.write_string(ref.mode);
    writer.write_string(ref.payload);
  }
  return bytes;
}

/// Children in canonical order for the given labels.
auto ordered_children(const SchemaGraph& graph, const SchemaNode& node, const std::vector<Digest>& labels,
                      const FingerprintOptions& options) -> std::vector<NodeIndex> {
  if (node.kind == NodeKind::RecursiveRef) {
    return {node.target};
  }
  auto children = node.children;
  if (node.kind == NodeKind::Union && !options.track_type_order) {
    std::stable_sort(children.begin(), children.end(),
                     [&](NodeIndex a, NodeIndex b) { return labels[a] < labels[b]; });
  } else if (node.kind == NodeKind::Model && !options.track_field_order) {
    std::stable_sort(children.begin(), children.end(), [&](NodeIndex a, NodeIndex b) {
      return graph.nodes[a].field_name.value_or("") < graph.nodes[b].field_name.value_or("");
    });
  }
  return children;
}

auto count_distinct(std::vector<Digest> labels) -> std::size_t {
  std::sort(labels.begin(), labels.end());
  return static_cast<std::size_t>(std::unique(labels.begin(), labels.end()) - labels.begin());
}

auto refine(const SchemaGraph& graph, const FingerprintOptions& options) -> NodeLabels {
  const auto size = graph.nodes.size();
  std::vector<std::vector<std::uint8_t>> signatures;
  signatures.reserve(size);
  for (const auto& node : graph.nodes) {
    signatures.push_back(local_signature(node, options));
  }

  NodeLabels result;
  result.labels.resize(size);
  for (std::size_t i = 0; i < size; ++i) {
    Blake3Hasher hasher;
    hasher.update(kLabelDomain);
    const auto kind = static_cast<std::uint8_t>(graph.nodes[i].kind);
    hasher.update(&kind, 1);
    result.labels[i] = hasher.finish();
  }
  result.classes = count_distinct(result.labels);

  std::vector<Digest> next(size);
  while (result.rounds <= size) {
    ++result.rounds;
    for (std::size_t i = 0; i < size; ++i) {
      const auto& node = graph.nodes[i];
      Blake3Hasher hasher;
      hasher.update(result.labels[i].bytes.data(), result.labels[i].bytes.size());
      hasher.update(signatures[i].data(), signatures[i].size());
      for (auto child : ordered_children(graph, node, result.labels, options)) {
        hasher.update(result.labels[child].bytes.data(), result.labels[child].bytes.size());
      }
      next[i] = hasher.finish();
    }
    result.labels.swap(next);
    const auto classes = count_distinct(result.labels);
    // Labels fold in their previous value, so the partition only ever splits;
    // an unchanged class count means it is stable.
    if (classes == result.classes) {
      break;
    }
    result.classes = classes;
  }
  return result;
}

}  // namespace

auto label_nodes(const SchemaGraph& graph, const FingerprintOptions& options) -> Expected<NodeLabels> {
  if (auto res = validate_graph(graph); !res) {
    return tl::unexpected(res.error());
  }
  return refine(graph, options);
}

auto canonicalize(const SchemaGraph& graph, const FingerprintOptions& options) -> Expected<CanonicalForm> {
  auto labeled = label_nodes(graph, options);
  if (!labeled) {
    return tl::unexpected(labeled.error());
  }
  const auto& labels = labeled->labels;

  // One table entry per distinct label, ordered by label. The representative
  // is the first node carrying the label; every member serializes the same.
  std::map<Digest, NodeIndex> representatives;
  for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
    representatives.try_emplace(labels[i], static_cast<NodeIndex>(i));
  }
  std::map<Digest, std::uint32_t> table_index;
  std::vector<NodeIndex> table;
  table.reserve(representatives.size());
  for (const auto& [label, node] : representatives) {
    table_index.emplace(label, static_cast<std::uint32_t>(table.size()));
    table.push_back(node);
  }

  CanonicalForm form;
  CanonicalWriter writer(form.bytes);
  writer.write_string(kCanonicalMagic);
  writer.write_u32(kAlgorithmVersion);
  writer.write_bool(options.track_descriptions);
  writer.write_bool(options.track_field_order);
  writer.write_bool(options.track_type_order);
  writer.write_bool(options.track_default_values);
  writer.write_string(options.tracked_extra_data.dump());

  writer.write_u32(static_cast<std::uint32_t>(table.size()));
  writer.write_u32(table_index.at(labels[graph.root]));
  for (auto index : table) {
    const auto& node = graph.nodes[index];
    const auto signature = local_signature(node, options);
    writer.write_bytes(signature.data(), signature.size());
    const auto children = ordered_children(graph, node, labels, options);
    writer.write_u32(static_cast<std::uint32_t>(children.size()));
    for (auto child : children) {
      writer.write_u32(table_index.at(labels[child]));
    }
  }

  sid::log::debug("canonicalized schema graph: nodes={} table={} rounds={} bytes={}", graph.nodes.size(),
                  table.size(), labeled->rounds, form.bytes.size());
  return form;
}

}  // namespace sid::engine
