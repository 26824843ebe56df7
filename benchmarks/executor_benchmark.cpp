#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include "block/sample_blocks.hpp"
#include "engine/plan.hpp"
#include "runtime/executor.hpp"

namespace {

using wf::engine::Json;

/// Fan-out/fan-in workflow: `width` detectors over the same image, each counted,
/// then chained through Expression steps into one sum.
auto make_fan_spec(int width) -> Json {
  Json steps = Json::array();
  for (int i = 0; i < width; ++i) {
    steps.push_back(Json{{"type", "ThresholdDetector"},
                         {"name", fmt::format("detect_{}", i)},
                         {"image", "$inputs.image"},
                         {"threshold", 0.1 + 0.8 * i / std::max(1, width)}});
    steps.push_back(Json{{"type", "DetectionsCounter"},
                         {"name", fmt::format("count_{}", i)},
                         {"predictions", fmt::format("$steps.detect_{}.predictions", i)}});
  }
  std::string previous = "$steps.count_0.count";
  for (int i = 1; i < width; ++i) {
    steps.push_back(Json{{"type", "Expression"},
                         {"name", fmt::format("sum_{}", i)},
                         {"lhs", previous},
                         {"rhs", fmt::format("$steps.count_{}.count", i)}});
    previous = fmt::format("$steps.sum_{}.result", i);
  }
  return Json{
    {"inputs", Json::array({Json{{"type", "WorkflowImage"}, {"name", "image"}}})},
    {"steps", std::move(steps)},
    {"outputs", Json::array({Json{{"name", "total"}, {"selector", previous}}})},
  };
}

auto make_images(int batch, int side) -> Json {
  Json images = Json::array();
  for (int b = 0; b < batch; ++b) {
    std::vector<int> pixels(static_cast<std::size_t>(side * side));
    for (std::size_t p = 0; p < pixels.size(); ++p) {
      pixels[p] = static_cast<int>((p * 37 + static_cast<std::size_t>(b) * 11) % 256);
    }
    images.push_back(wf::block::make_image(side, side, std::move(pixels)));
  }
  return Json{{"image", std::move(images)}};
}

auto make_registry() -> wf::engine::BlockRegistry {
  wf::engine::BlockRegistry registry;
  wf::block::register_sample_blocks(registry);
  return registry;
}

void BM_CompileFanWorkflow(benchmark::State& state) {
  auto registry = make_registry();
  const auto spec = make_fan_spec(static_cast<int>(state.range(0)));
  for (auto _ : state) {
    auto plan = wf::engine::compile_plan_json(spec, registry);
    if (!plan) {
      state.SkipWithError(plan.error().message.c_str());
      break;
    }
    benchmark::DoNotOptimize(plan->levels.size());
  }
}

BENCHMARK(BM_CompileFanWorkflow)->Arg(4)->Arg(16)->Arg(64);

void BM_RunFanWorkflow(benchmark::State& state) {
  auto registry = make_registry();
  auto plan = wf::engine::compile_plan_json(make_fan_spec(static_cast<int>(state.range(0))), registry);
  if (!plan) {
    state.SkipWithError(plan.error().message.c_str());
    return;
  }
  wf::engine::ExecutorConfig config;
  config.max_concurrency = static_cast<int>(state.range(2));
  wf::engine::Executor executor(config);
  const auto inputs = make_images(static_cast<int>(state.range(1)), 32);

  for (auto _ : state) {
    wf::engine::RunContext ctx;
    auto result = executor.run(*plan, inputs, ctx);
    if (!result) {
      state.SkipWithError(result.error().message.c_str());
      break;
    }
    benchmark::DoNotOptimize(result->outputs);
  }
  state.SetItemsProcessed(state.iterations() * state.range(1));
}

BENCHMARK(BM_RunFanWorkflow)
  ->Args({8, 1, 1})
  ->Args({8, 1, 0})
  ->Args({8, 8, 0})
  ->Args({32, 4, 0})
  ->UseRealTime();

}  // namespace

BENCHMARK_MAIN();
