#include <benchmark/benchmark.h>

#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "engine/identity.hpp"
#include "engine/json_provider.hpp"

namespace {

/// Catalog of `models` chained models, each with `fields` fields and a back edge to the first.
auto make_catalog(int models, int fields) -> sid::engine::Json {
  sid::engine::Json catalog = sid::engine::Json::object();
  catalog["models"] = sid::engine::Json::object();
  for (int m = 0; m < models; ++m) {
    sid::engine::Json body = sid::engine::Json::object();
    body["fields"] = sid::engine::Json::array();
    for (int f = 0; f < fields; ++f) {
      sid::engine::Json schema = f % 3 == 0 ? sid::engine::Json{{"type", "int"}, {"ge", 0}}
                                 : f % 3 == 1 ? sid::engine::Json{{"type", "list"}, {"items", {{"type", "str"}}}}
                                              : sid::engine::Json{{"type", "union"},
                                                                  {"choices", {{{"type", "int"}}, {{"type", "none"}}}}};
      body["fields"].push_back({{"name", std::format("f{}", f)}, {"schema", schema}});
    }
    const auto next = m + 1 < models ? std::format("M{}", m + 1) : std::string("M0");
    body["fields"].push_back({{"name", "next"},
                              {"schema", {{"type", "nullable"}, {"schema", {{"type", "model"}, {"model", next}}}}}});
    catalog["models"][std::format("M{}", m)] = std::move(body);
  }
  return catalog;
}

auto make_provider(int models, int fields) -> std::unique_ptr<sid::engine::JsonSchemaProvider> {
  auto provider = sid::engine::JsonSchemaProvider::from_json(make_catalog(models, fields));
  if (!provider) {
    throw std::runtime_error(provider.error().message);
  }
  return std::move(*provider);
}

void BM_ComputeIdentifier(benchmark::State& state) {
  auto provider = make_provider(static_cast<int>(state.range(0)), static_cast<int>(state.range(1)));
  for (auto _ : state) {
    auto id = sid::engine::compute_identifier(*provider, "M0");
    if (!id) {
      state.SkipWithError(id.error().message.c_str());
      break;
    }
    benchmark::DoNotOptimize(id->digest);
  }
}

void BM_CachedIdentifier(benchmark::State& state) {
  auto provider = make_provider(static_cast<int>(state.range(0)), static_cast<int>(state.range(1)));
  auto warm = sid::engine::identifier_for(*provider, "M0");
  if (!warm) {
    state.SkipWithError(warm.error().message.c_str());
    return;
  }
  for (auto _ : state) {
    auto id = sid::engine::identifier_for(*provider, "M0");
    benchmark::DoNotOptimize(id);
  }
}

}  // namespace

BENCHMARK(BM_ComputeIdentifier)->Args({1, 8})->Args({4, 16})->Args({16, 32})->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_CachedIdentifier)->Args({4, 16})->Threads(1)->Threads(4)->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();
