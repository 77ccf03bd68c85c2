#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "engine/error.hpp"
#include "engine/provider.hpp"
#include "engine/schema.hpp"

namespace sid::engine {

/// SchemaProvider over a JSON catalog:
///
///   { "models": { "<name>": { "description": "...",
///                             "fields": [ { "name", "alias", "schema", "default",
///                                           "description", "validators", "serializers" } ],
///                             "validators": [...], "serializers": [...] } } }
///
/// A behavior entry is { "name", "module_level", "source", "mode", "params" }.
class JsonSchemaProvider final : public SchemaProvider {
 public:
  static auto from_json(const Json& catalog) -> Expected<std::unique_ptr<JsonSchemaProvider>>;
  static auto from_string(std::string_view text) -> Expected<std::unique_ptr<JsonSchemaProvider>>;

  auto describe_schema(std::string_view model) const -> Expected<ModelDesc> override;
  auto list_behaviors(std::string_view model, std::optional<std::string_view> field) const
    -> std::vector<BehaviorHandle> override;

  auto model_names() const -> std::vector<std::string>;

 private:
  struct Entry {
    ModelDesc desc;
    std::vector<BehaviorHandle> model_behaviors;
    std::unordered_map<std::string, std::vector<BehaviorHandle>> field_behaviors;
  };

  JsonSchemaProvider() = default;

  std::map<std::string, Entry, std::less<>> models_;
};

}  // namespace sid::engine
