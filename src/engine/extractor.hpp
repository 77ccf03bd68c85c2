#pragma once

#include <string_view>

#include "engine/error.hpp"
#include "engine/options.hpp"
#include "engine/provider.hpp"
#include "engine/schema.hpp"

namespace sid::engine {

/// Build the schema graph reachable from `model`.
///
/// Model references are expanded depth-first; a reference to a model that is
/// still being expanded on the current path becomes a RecursiveRef node that
/// points at the ancestor. Model names never enter the graph, field names do.
///
/// Errors: UnsupportedSchemaNode for unknown or malformed type constructs,
/// CycleDepthExceeded when the node or depth bound is crossed, and provider
/// failures as reported.
auto extract_schema(const SchemaProvider& provider, std::string_view model, const FingerprintOptions& options)
  -> Expected<SchemaGraph>;

}  // namespace sid::engine
