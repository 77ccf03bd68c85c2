#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "engine/error.hpp"
#include "engine/schema.hpp"

namespace sid::engine {

/// Adapter over an external model-validation library.
///
/// Implementations describe one model at a time; references to other models
/// stay symbolic (`{"type": "model", "model": "<name>"}`) and are resolved by
/// the extractor. Const calls must be safe from multiple threads.
class SchemaProvider {
 public:
  SchemaProvider();
  /// Evicts this provider's identifiers from the identity cache.
  virtual ~SchemaProvider();

  SchemaProvider(const SchemaProvider&) = delete;
  SchemaProvider& operator=(const SchemaProvider&) = delete;

  virtual auto describe_schema(std::string_view model) const -> Expected<ModelDesc> = 0;

  /// Behaviors bound to `field` of `model`, or to the model itself when `field` is empty.
  virtual auto list_behaviors(std::string_view model, std::optional<std::string_view> field) const
    -> std::vector<BehaviorHandle> = 0;

  /// Process-unique id of this provider, used to key the identity cache.
  auto instance_id() const -> std::uint64_t { return instance_id_; }

 private:
  std::uint64_t instance_id_;
};

}  // namespace sid::engine
