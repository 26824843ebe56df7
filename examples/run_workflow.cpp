#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <gflags/gflags.h>

#include "block/sample_blocks.hpp"
#include "common/logging/log.hpp"
#include "runtime/runtime.hpp"

DEFINE_string(spec_file, "", "Workflow specification JSON (built-in demo workflow when empty)");
DEFINE_string(inputs_file, "", "Runtime inputs JSON (built-in demo images when empty)");
DEFINE_string(api_key, "", "Api key attributed to usage records");
DEFINE_bool(print_usage, false, "Print usage records on exit instead of discarding them");

namespace {

const char* kDemoSpec = R"JSON(
{
  "version": "1.0",
  "inputs": [
    { "type": "WorkflowImage", "name": "image" },
    { "type": "WorkflowParameter", "name": "threshold", "kind": ["float_zero_to_one"], "default_value": 0.5 }
  ],
  "steps": [
    { "type": "ThresholdDetector", "name": "detector", "image": "$inputs.image", "threshold": "$inputs.threshold" },
    { "type": "ImageDimensions", "name": "dimensions", "image": "$inputs.image" },
    { "type": "DetectionsCounter", "name": "counter", "predictions": "$steps.detector.predictions" },
    { "type": "DetectionsOverlay", "name": "overlay", "image": "$inputs.image",
      "predictions": "$steps.detector.predictions" }
  ],
  "outputs": [
    { "type": "JsonField", "name": "count", "selector": "$steps.counter.count" },
    { "type": "JsonField", "name": "width", "selector": "$steps.dimensions.dimensions.width" },
    { "type": "JsonField", "name": "overlay", "selector": "$steps.overlay.image" }
  ]
}
)JSON";

class StdoutUsageSender final : public wf::usage::UsageSender {
 public:
  auto send(const std::string& api_key, const std::vector<wf::usage::UsageRecord>& records)
    -> wf::engine::Expected<void> override {
    for (const auto& record : records) {
      std::cout << fmt::format("[usage] api_key={} {}\n", api_key, wf::usage::to_json(record).dump());
    }
    return {};
  }
};

auto load_json(const std::string& path, const char* fallback) -> wf::engine::Expected<wf::engine::Json> {
  try {
    if (path.empty()) {
      return wf::engine::Json::parse(fallback);
    }
    std::ifstream in(path);
    if (!in) {
      return tl::unexpected(wf::engine::make_error(wf::engine::ErrorCode::Io, fmt::format("cannot open {}", path)));
    }
    return wf::engine::Json::parse(in);
  } catch (const std::exception& ex) {
    return tl::unexpected(wf::engine::make_error(wf::engine::ErrorCode::InvalidSpecification,
                                                 fmt::format("invalid JSON in {}: {}", path, ex.what())));
  }
}

auto demo_inputs() -> wf::engine::Json {
  // two 4x2 images; the first has one bright run, the second two
  auto first = wf::block::make_image(4, 2, {0, 200, 210, 0, 0, 0, 0, 0});
  auto second = wf::block::make_image(4, 2, {250, 0, 0, 0, 0, 0, 220, 230});
  return wf::engine::Json{{"image", wf::engine::Json::array({first, second})}};
}

}  // namespace

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  wf::log::init();

  auto config = wf::engine::runtime_config_from_flags();
  if (!config) {
    std::cerr << wf::engine::to_string(config.error()) << "\n";
    return 1;
  }
  wf::engine::RuntimeServices services;
  if (FLAGS_print_usage) {
    services.usage_sender = std::make_shared<StdoutUsageSender>();
  }

  int status = 0;
  {
    wf::engine::Runtime runtime(*config, services);
    wf::block::register_sample_blocks(runtime.registry());

    auto spec = load_json(FLAGS_spec_file, kDemoSpec);
    if (!spec) {
      std::cerr << wf::engine::to_string(spec.error()) << "\n";
      return 1;
    }
    wf::engine::Json inputs;
    if (FLAGS_inputs_file.empty()) {
      inputs = demo_inputs();
    } else {
      auto loaded = load_json(FLAGS_inputs_file, "{}");
      if (!loaded) {
        std::cerr << wf::engine::to_string(loaded.error()) << "\n";
        return 1;
      }
      inputs = std::move(*loaded);
    }

    wf::engine::RunContext ctx;
    ctx.api_key = FLAGS_api_key;
    auto result = runtime.run_json(*spec, inputs, ctx);
    if (!result) {
      std::cerr << wf::engine::to_string(result.error()) << "\n";
      status = 1;
    } else {
      wf::engine::Json outputs(result->outputs);
      std::cout << outputs.dump(2) << "\n";
      for (const auto& failure : result->failures) {
        std::cerr << fmt::format("step {} failed: {}\n", failure.step, failure.message);
      }
    }
  }

  wf::log::shutdown();
  gflags::ShutDownCommandLineFlags();
  return status;
}
