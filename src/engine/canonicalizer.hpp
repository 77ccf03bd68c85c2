#pragma once

#include <cstddef>
#include <vector>

#include "engine/canonical_encoding.hpp"
#include "engine/error.hpp"
#include "engine/hasher.hpp"
#include "engine/options.hpp"
#include "engine/schema.hpp"

namespace sid::engine {

/// Result of the fixpoint labeling pass, one label per graph node.
struct NodeLabels {
  std::vector<Digest> labels;
  std::size_t rounds = 0;
  /// Number of distinct labels, i.e. entries of the deduplicated node table.
  std::size_t classes = 0;
};

/// Refine node labels until the label partition stops splitting.
///
/// A label folds in the previous label, the node's own attributes and the
/// labels of its children (sorted for unions and by field name for models,
/// positional for containers). Recursive references read their target's
/// current label, so cyclic graphs converge in at most N + 1 rounds.
auto label_nodes(const SchemaGraph& graph, const FingerprintOptions& options) -> Expected<NodeLabels>;

/// Serialize the deduplicated, label-ordered node table of `graph`.
auto canonicalize(const SchemaGraph& graph, const FingerprintOptions& options) -> Expected<CanonicalForm>;

}  // namespace sid::engine
