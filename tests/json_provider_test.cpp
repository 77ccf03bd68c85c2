#include "engine/json_provider.hpp"

#include <gtest/gtest.h>

#include "test_support.hpp"

using sid::engine::BehaviorRole;
using sid::engine::ErrorCode;
using sid::engine::JsonSchemaProvider;

namespace {

constexpr const char *kCatalog = R"JSON(
{
  "models": {
    "shop.Item": {
      "description": "An item in the shop.",
      "fields": [
        { "name": "sku", "alias": "SKU", "schema": { "type": "str", "min_length": 1 },
          "validators": [ { "name": "shop.validators.upper", "module_level": true, "mode": "after" } ] },
        { "name": "price", "schema": { "type": "float", "ge": 0 }, "default": 0.0,
          "description": "Unit price." }
      ],
      "serializers": [
        { "source": "lambda self: self.sku", "params": [ { "name": "self" } ] }
      ]
    },
    "shop.Cart": {
      "fields": [
        { "name": "items", "schema": { "type": "list", "items": { "type": "model", "model": "shop.Item" } } }
      ]
    }
  }
}
)JSON";

}  // namespace

TEST(JsonProvider, DescribesModels) {
  auto provider = schema::load_text(kCatalog);
  auto desc = provider->describe_schema("shop.Item");
  ASSERT_TRUE(desc.has_value()) << desc.error().message;
  EXPECT_EQ(desc->name, "shop.Item");
  EXPECT_EQ(desc->description, "An item in the shop.");
  ASSERT_EQ(desc->fields.size(), 2u);
  EXPECT_EQ(desc->fields[0].name, "sku");
  EXPECT_EQ(desc->fields[0].alias, "SKU");
  EXPECT_FALSE(desc->fields[0].has_default);
  EXPECT_EQ(desc->fields[1].name, "price");
  EXPECT_TRUE(desc->fields[1].has_default);
  EXPECT_EQ(desc->fields[1].description, "Unit price.");
}

TEST(JsonProvider, ListsBehaviorsPerFieldAndModel) {
  auto provider = schema::load_text(kCatalog);

  auto sku = provider->list_behaviors("shop.Item", "sku");
  ASSERT_EQ(sku.size(), 1u);
  EXPECT_EQ(sku[0].role, BehaviorRole::Validator);
  EXPECT_TRUE(sku[0].module_level);
  EXPECT_EQ(sku[0].qualified_name, "shop.validators.upper");
  EXPECT_EQ(sku[0].mode, "after");

  EXPECT_TRUE(provider->list_behaviors("shop.Item", "price").empty());

  auto model_level = provider->list_behaviors("shop.Item", std::nullopt);
  ASSERT_EQ(model_level.size(), 1u);
  EXPECT_EQ(model_level[0].role, BehaviorRole::Serializer);
  EXPECT_FALSE(model_level[0].module_level);
  ASSERT_TRUE(model_level[0].source_text.has_value());
  ASSERT_EQ(model_level[0].parameters.size(), 1u);
  EXPECT_EQ(model_level[0].parameters[0].name, "self");
}

TEST(JsonProvider, ModelNamesAreSorted) {
  auto provider = schema::load_text(kCatalog);
  auto names = provider->model_names();
  ASSERT_EQ(names.size(), 2u);
  EXPECT_EQ(names[0], "shop.Cart");
  EXPECT_EQ(names[1], "shop.Item");
}

TEST(JsonProvider, UnknownModelIsProviderFailure) {
  auto provider = schema::load_text(kCatalog);
  auto desc = provider->describe_schema("shop.Missing");
  ASSERT_FALSE(desc.has_value());
  EXPECT_EQ(desc.error().code, ErrorCode::ProviderFailure);
  EXPECT_TRUE(provider->list_behaviors("shop.Missing", std::nullopt).empty());
}

TEST(JsonProvider, RejectsMalformedCatalogs) {
  const char *bad[] = {
    "not json",
    R"JSON([])JSON",
    R"JSON({ "models": [] })JSON",
    R"JSON({ "models": { "A": { } } })JSON",
    R"JSON({ "models": { "A": { "fields": [ { "schema": { "type": "int" } } ] } } })JSON",
    R"JSON({ "models": { "A": { "fields": [ { "name": "x" } ] } } })JSON",
    R"JSON({ "models": { "A": { "fields": [ { "name": "x", "schema": { "type": "int" } },
                                             { "name": "x", "schema": { "type": "str" } } ] } } })JSON",
    R"JSON({ "models": { "A": { "fields": [], "validators": [ { "module_level": "yes" } ] } } })JSON",
    R"JSON({ "models": { "A": { "fields": [], "validators": [ { "params": [ 3 ] } ] } } })JSON",
  };
  for (const char *text : bad) {
    auto provider = JsonSchemaProvider::from_string(text);
    ASSERT_FALSE(provider.has_value()) << text;
    EXPECT_EQ(provider.error().code, ErrorCode::ProviderFailure) << text;
  }
}

TEST(JsonProvider, ProvidersHaveDistinctInstanceIds) {
  auto a = schema::load_text(kCatalog);
  auto b = schema::load_text(kCatalog);
  EXPECT_NE(a->instance_id(), b->instance_id());
}
