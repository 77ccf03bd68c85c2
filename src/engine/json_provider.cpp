#include "engine/json_provider.hpp"

#include <format>
#include <unordered_set>

namespace sid::engine {
namespace {

auto provider_error(std::string message) -> SchemaError {
  return make_error(ErrorCode::ProviderFailure, std::move(message));
}

auto get_optional_string(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::optional<std::string>> {
  auto it = obj.find(std::string(field));
  if (it == obj.end() || it->is_null()) {
    return std::optional<std::string>{};
  }
  if (!it->is_string()) {
    return tl::unexpected(provider_error(std::format("{}: field '{}' must be a string", context, field)));
  }
  return std::optional<std::string>{it->get<std::string>()};
}

auto parse_params(const Json& params, std::string_view context) -> Expected<std::vector<ParameterDesc>> {
  if (!params.is_array()) {
    return tl::unexpected(provider_error(std::format("{}: params must be an array", context)));
  }
  std::vector<ParameterDesc> out;
  for (const auto& param : params) {
    if (param.is_string()) {
      out.push_back(ParameterDesc{param.get<std::string>(), {}});
      continue;
    }
    if (!param.is_object()) {
      return tl::unexpected(provider_error(std::format("{}: param entry must be a string or object", context)));
    }
    auto name = get_optional_string(param, "name", context);
    if (!name) {
      return tl::unexpected(name.error());
    }
    if (!*name) {
      return tl::unexpected(provider_error(std::format("{}: param entry missing 'name'", context)));
    }
    auto annotation = get_optional_string(param, "annotation", context);
    if (!annotation) {
      return tl::unexpected(annotation.error());
    }
    out.push_back(ParameterDesc{std::move(**name), annotation->value_or("")});
  }
  return out;
}

auto parse_behaviors(const Json& owner, std::string_view key, BehaviorRole role, std::string_view context,
                     std::vector<BehaviorHandle>& out) -> Expected<void> {
  auto it = owner.find(std::string(key));
  if (it == owner.end()) {
    return {};
  }
  if (!it->is_array()) {
    return tl::unexpected(provider_error(std::format("{}: {} must be an array", context, key)));
  }
  for (const auto& entry : *it) {
    if (!entry.is_object()) {
      return tl::unexpected(provider_error(std::format("{}: behavior entry must be an object", context)));
    }
    BehaviorHandle handle;
    handle.role = role;
    auto name = get_optional_string(entry, "name", context);
    if (!name) {
      return tl::unexpected(name.error());
    }
    handle.qualified_name = name->value_or("");
    auto mode = get_optional_string(entry, "mode", context);
    if (!mode) {
      return tl::unexpected(mode.error());
    }
    handle.mode = mode->value_or("");
    auto source = get_optional_string(entry, "source", context);
    if (!source) {
      return tl::unexpected(source.error());
    }
    handle.source_text = std::move(*source);
    if (auto level_it = entry.find("module_level"); level_it != entry.end()) {
      if (!level_it->is_boolean()) {
        return tl::unexpected(provider_error(std::format("{}: module_level must be a boolean", context)));
      }
      handle.module_level = level_it->get<bool>();
    }
    if (auto params_it = entry.find("params"); params_it != entry.end()) {
      auto params = parse_params(*params_it, context);
      if (!params) {
        return tl::unexpected(params.error());
      }
      handle.parameters = std::move(*params);
    }
    out.push_back(std::move(handle));
  }
  return {};
}

auto parse_all_behaviors(const Json& owner, std::string_view context, std::vector<BehaviorHandle>& out)
  -> Expected<void> {
  if (auto res = parse_behaviors(owner, "validators", BehaviorRole::Validator, context, out); !res) {
    return res;
  }
  return parse_behaviors(owner, "serializers", BehaviorRole::Serializer, context, out);
}

}  // namespace

auto JsonSchemaProvider::from_json(const Json& catalog) -> Expected<std::unique_ptr<JsonSchemaProvider>> {
  if (!catalog.is_object()) {
    return tl::unexpected(provider_error("catalog json must be an object"));
  }
  auto models_it = catalog.find("models");
  if (models_it == catalog.end() || !models_it->is_object()) {
    return tl::unexpected(provider_error("catalog.models must be an object"));
  }

  std::unique_ptr<JsonSchemaProvider> provider(new JsonSchemaProvider());
  for (const auto& [name, model_json] : models_it->items()) {
    const auto context = std::format("model '{}'", name);
    if (!model_json.is_object()) {
      return tl::unexpected(provider_error(context + ": entry must be an object"));
    }

    Entry entry;
    entry.desc.name = name;
    auto description = get_optional_string(model_json, "description", context);
    if (!description) {
      return tl::unexpected(description.error());
    }
    entry.desc.description = std::move(*description);

    auto fields_it = model_json.find("fields");
    if (fields_it == model_json.end() || !fields_it->is_array()) {
      return tl::unexpected(provider_error(context + ": fields must be an array"));
    }
    std::unordered_set<std::string> field_names;
    for (const auto& field_json : *fields_it) {
      if (!field_json.is_object()) {
        return tl::unexpected(provider_error(context + ": field entry must be an object"));
      }
      auto field_name = get_optional_string(field_json, "name", context);
      if (!field_name) {
        return tl::unexpected(field_name.error());
      }
      if (!*field_name || (*field_name)->empty()) {
        return tl::unexpected(provider_error(context + ": field entry missing 'name'"));
      }
      if (!field_names.insert(**field_name).second) {
        return tl::unexpected(provider_error(std::format("{}: duplicate field '{}'", context, **field_name)));
      }
      const auto field_context = std::format("{} field '{}'", context, **field_name);

      FieldDesc field;
      field.name = **field_name;
      auto alias = get_optional_string(field_json, "alias", field_context);
      if (!alias) {
        return tl::unexpected(alias.error());
      }
      field.alias = std::move(*alias);
      auto field_description = get_optional_string(field_json, "description", field_context);
      if (!field_description) {
        return tl::unexpected(field_description.error());
      }
      field.description = std::move(*field_description);

      auto schema_it = field_json.find("schema");
      if (schema_it == field_json.end()) {
        return tl::unexpected(provider_error(field_context + ": missing 'schema'"));
      }
      field.schema = *schema_it;
      if (auto default_it = field_json.find("default"); default_it != field_json.end()) {
        field.has_default = true;
        field.default_value = *default_it;
      }

      std::vector<BehaviorHandle> behaviors;
      if (auto res = parse_all_behaviors(field_json, field_context, behaviors); !res) {
        return tl::unexpected(res.error());
      }
      if (!behaviors.empty()) {
        entry.field_behaviors.emplace(field.name, std::move(behaviors));
      }
      entry.desc.fields.push_back(std::move(field));
    }

    if (auto res = parse_all_behaviors(model_json, context, entry.model_behaviors); !res) {
      return tl::unexpected(res.error());
    }
    provider->models_.emplace(name, std::move(entry));
  }
  return provider;
}

auto JsonSchemaProvider::from_string(std::string_view text) -> Expected<std::unique_ptr<JsonSchemaProvider>> {
  auto catalog = Json::parse(text, nullptr, false);
  if (catalog.is_discarded()) {
    return tl::unexpected(provider_error("catalog is not valid json"));
  }
  return from_json(catalog);
}

auto JsonSchemaProvider::describe_schema(std::string_view model) const -> Expected<ModelDesc> {
  auto it = models_.find(model);
  if (it == models_.end()) {
    return tl::unexpected(provider_error(std::format("unknown model '{}'", model)));
  }
  return it->second.desc;
}

auto JsonSchemaProvider::list_behaviors(std::string_view model, std::optional<std::string_view> field) const
  -> std::vector<BehaviorHandle> {
  auto it = models_.find(model);
  if (it == models_.end()) {
    return {};
  }
  if (!field) {
    return it->second.model_behaviors;
  }
  auto field_it = it->second.field_behaviors.find(std::string(*field));
  if (field_it == it->second.field_behaviors.end()) {
    return {};
  }
  return field_it->second;
}

auto JsonSchemaProvider::model_names() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(models_.size());
  for (const auto& [name, entry] : models_) {
    names.push_back(name);
  }
  return names;
}

}  // namespace sid::engine
