#include "block/sample_blocks.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "engine/block.hpp"
#include "engine/error.hpp"
#include "engine/kinds.hpp"

namespace wf::block {
namespace {

using engine::BlockInputs;
using engine::BlockOutputs;
using engine::BlockSchema;
using engine::Expected;
using engine::FieldSchema;
using engine::Json;
using engine::OutputSchema;
using engine::RunContextView;
namespace kinds = engine::kinds;

struct Image {
  int width = 0;
  int height = 0;
  const Json* pixels = nullptr;
};

auto read_image(const BlockInputs& inputs, const char* field) -> Expected<Image> {
  auto it = inputs.find(field);
  if (it == inputs.end() || !it->second.is_object()) {
    return tl::unexpected(engine::block_error(fmt::format("field '{}' is not an image", field)));
  }
  const auto& value = it->second;
  Image image;
  image.width = value.value("width", 0);
  image.height = value.value("height", 0);
  if (image.width <= 0 || image.height <= 0) {
    return tl::unexpected(engine::block_error(fmt::format("image in field '{}' has no dimensions", field)));
  }
  if (auto pixels = value.find("pixels"); pixels != value.end()) {
    if (!pixels->is_array() ||
        pixels->size() != static_cast<std::size_t>(image.width) * static_cast<std::size_t>(image.height)) {
      return tl::unexpected(engine::block_error(fmt::format("image in field '{}' has {}x{} dimensions but {} pixels",
                                                            field, image.width, image.height,
                                                            pixels->is_array() ? pixels->size() : 0)));
    }
    image.pixels = &*pixels;
  }
  return image;
}

auto get_number(const BlockInputs& inputs, const char* field, double fallback) -> double {
  auto it = inputs.find(field);
  if (it != inputs.end() && it->second.is_number()) {
    return it->second.get<double>();
  }
  return fallback;
}

auto get_string(const BlockInputs& inputs, const char* field, std::string fallback) -> std::string {
  auto it = inputs.find(field);
  if (it != inputs.end() && it->second.is_string()) {
    return it->second.get<std::string>();
  }
  return fallback;
}

auto stopped() -> engine::EngineError {
  return engine::make_error(engine::ErrorCode::Cancelled, "run cancelled");
}

class ImageDimensions final : public engine::Block {
 public:
  auto schema() const -> const BlockSchema& override {
    static const BlockSchema schema{{FieldSchema{"image", {kinds::kImage}}}};
    return schema;
  }

  auto declare_outputs() const -> std::vector<OutputSchema> override {
    return {OutputSchema{"dimensions", {kinds::kDictionary}}};
  }

  auto run(const BlockInputs& inputs, const RunContextView&) -> Expected<BlockOutputs> override {
    auto image = read_image(inputs, "image");
    if (!image) {
      return tl::unexpected(image.error());
    }
    return BlockOutputs{{"dimensions", Json{{"width", image->width}, {"height", image->height}}}};
  }
};

/// Emits one box per horizontal run of pixels brighter than `threshold`.
class ThresholdDetector final : public engine::Block {
 public:
  auto schema() const -> const BlockSchema& override {
    static const BlockSchema schema{{
      FieldSchema{"image", {kinds::kImage}},
      FieldSchema{"threshold", {kinds::kFloatZeroToOne, kinds::kFloat}, false, Json(0.5)},
      FieldSchema{"class_name", {}, false, Json("object")},
    }};
    return schema;
  }

  auto declare_outputs() const -> std::vector<OutputSchema> override {
    return {OutputSchema{"predictions", {kinds::kObjectDetection}}};
  }

  auto run(const BlockInputs& inputs, const RunContextView& ctx) -> Expected<BlockOutputs> override {
    auto image = read_image(inputs, "image");
    if (!image) {
      return tl::unexpected(image.error());
    }
    const double threshold = get_number(inputs, "threshold", 0.5);
    if (threshold < 0.0 || threshold > 1.0) {
      return tl::unexpected(engine::block_error(fmt::format("threshold {} is outside [0, 1]", threshold)));
    }
    const auto class_name = get_string(inputs, "class_name", "object");

    Json predictions = Json::array();
    if (image->pixels) {
      const auto& pixels = *image->pixels;
      for (int y = 0; y < image->height; ++y) {
        if (ctx.should_stop()) {
          return tl::unexpected(stopped());
        }
        int start = -1;
        double peak = 0.0;
        for (int x = 0; x <= image->width; ++x) {
          double level = 0.0;
          if (x < image->width) {
            const auto& pixel = pixels[static_cast<std::size_t>(y * image->width + x)];
            level = pixel.is_number() ? pixel.get<double>() / 255.0 : 0.0;
          }
          if (x < image->width && level > threshold) {
            if (start < 0) {
              start = x;
              peak = 0.0;
            }
            peak = std::max(peak, level);
            continue;
          }
          if (start >= 0) {
            predictions.push_back(Json{
              {"x", start},
              {"y", y},
              {"width", x - start},
              {"height", 1},
              {"confidence", peak},
              {"class", class_name},
            });
            start = -1;
          }
        }
      }
    }

    return BlockOutputs{{"predictions", Json{{"image", Json{{"width", image->width}, {"height", image->height}}},
                                             {"predictions", std::move(predictions)}}}};
  }
};

auto count_predictions(const Json& value, double min_confidence) -> Expected<std::int64_t> {
  if (!value.is_object() || !value.contains("predictions") || !value["predictions"].is_array()) {
    return tl::unexpected(engine::block_error("predictions value has no 'predictions' array"));
  }
  std::int64_t count = 0;
  for (const auto& prediction : value["predictions"]) {
    if (prediction.value("confidence", 1.0) >= min_confidence) {
      ++count;
    }
  }
  return count;
}

/// Counts predictions per batch item in one invocation.
class DetectionsCounter final : public engine::Block {
 public:
  auto schema() const -> const BlockSchema& override {
    static const BlockSchema schema{{
      FieldSchema{"predictions",
                  {kinds::kObjectDetection, kinds::kInstanceSegmentation, kinds::kKeypointDetection}},
      FieldSchema{"min_confidence", {kinds::kFloatZeroToOne, kinds::kFloat}, false, Json(0.0)},
    }};
    return schema;
  }

  auto declare_outputs() const -> std::vector<OutputSchema> override {
    return {OutputSchema{"count", {kinds::kInteger}}};
  }

  auto accepts_batch_input() const -> bool override { return true; }

  auto run(const BlockInputs& inputs, const RunContextView&) -> Expected<BlockOutputs> override {
    const auto& predictions = inputs.at("predictions");
    const double min_confidence = get_number(inputs, "min_confidence", 0.0);
    if (!predictions.is_array()) {
      auto count = count_predictions(predictions, min_confidence);
      if (!count) {
        return tl::unexpected(count.error());
      }
      return BlockOutputs{{"count", *count}};
    }

    Json counts = Json::array();
    for (const auto& item : predictions) {
      auto count = count_predictions(item, min_confidence);
      if (!count) {
        return tl::unexpected(count.error());
      }
      counts.push_back(*count);
    }
    return BlockOutputs{{"count", std::move(counts)}};
  }
};

/// Paints every predicted box onto a copy of the image.
class DetectionsOverlay final : public engine::Block {
 public:
  auto schema() const -> const BlockSchema& override {
    static const BlockSchema schema{{
      FieldSchema{"image", {kinds::kImage}},
      FieldSchema{"predictions", {kinds::kObjectDetection, kinds::kInstanceSegmentation}},
      FieldSchema{"color", {kinds::kInteger}, false, Json(255)},
    }};
    return schema;
  }

  auto declare_outputs() const -> std::vector<OutputSchema> override {
    return {OutputSchema{"image", {kinds::kImage}}};
  }

  auto run(const BlockInputs& inputs, const RunContextView&) -> Expected<BlockOutputs> override {
    auto image = read_image(inputs, "image");
    if (!image) {
      return tl::unexpected(image.error());
    }
    const auto& predictions = inputs.at("predictions");
    if (!predictions.is_object() || !predictions.contains("predictions")) {
      return tl::unexpected(engine::block_error("predictions value has no 'predictions' array"));
    }
    const int color = std::clamp(static_cast<int>(get_number(inputs, "color", 255)), 0, 255);

    Json output = inputs.at("image");
    if (!image->pixels) {
      return BlockOutputs{{"image", std::move(output)}};
    }
    auto& pixels = output["pixels"];
    for (const auto& box : predictions["predictions"]) {
      const int x0 = std::max(0, box.value("x", 0));
      const int y0 = std::max(0, box.value("y", 0));
      const int x1 = std::min(image->width, x0 + box.value("width", 0));
      const int y1 = std::min(image->height, y0 + box.value("height", 0));
      for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
          pixels[static_cast<std::size_t>(y * image->width + x)] = color;
        }
      }
    }
    return BlockOutputs{{"image", std::move(output)}};
  }
};

/// Binary arithmetic on two numbers.
class Expression final : public engine::Block {
 public:
  auto schema() const -> const BlockSchema& override {
    static const BlockSchema schema{{
      FieldSchema{"lhs", {kinds::kFloat, kinds::kInteger}},
      FieldSchema{"rhs", {kinds::kFloat, kinds::kInteger}, false, Json(0.0)},
      FieldSchema{"operation", {}, false, Json("add")},
    }};
    return schema;
  }

  auto declare_outputs() const -> std::vector<OutputSchema> override {
    return {OutputSchema{"result", {kinds::kFloat}}};
  }

  auto run(const BlockInputs& inputs, const RunContextView&) -> Expected<BlockOutputs> override {
    auto lhs_it = inputs.find("lhs");
    if (lhs_it == inputs.end() || !lhs_it->second.is_number()) {
      return tl::unexpected(engine::block_error("field 'lhs' is not a number"));
    }
    auto rhs_it = inputs.find("rhs");
    if (rhs_it != inputs.end() && !rhs_it->second.is_number()) {
      return tl::unexpected(engine::block_error("field 'rhs' is not a number"));
    }
    const double lhs = lhs_it->second.get<double>();
    const double rhs = get_number(inputs, "rhs", 0.0);
    const auto operation = get_string(inputs, "operation", "add");

    double result = 0.0;
    if (operation == "add") {
      result = lhs + rhs;
    } else if (operation == "subtract") {
      result = lhs - rhs;
    } else if (operation == "multiply") {
      result = lhs * rhs;
    } else if (operation == "divide") {
      if (rhs == 0.0) {
        return tl::unexpected(engine::block_error("division by zero"));
      }
      result = lhs / rhs;
    } else {
      return tl::unexpected(engine::block_error(fmt::format("unknown operation: {}", operation)));
    }
    return BlockOutputs{{"result", result}};
  }
};

}  // namespace

auto register_sample_blocks(engine::BlockRegistry& registry) -> void {
  registry.register_block<ImageDimensions>({kImageDimensions, "wf/image_dimensions@v1"});
  registry.register_block<ThresholdDetector>({kThresholdDetector, "wf/threshold_detector@v1"});
  registry.register_block<DetectionsCounter>({kDetectionsCounter, "wf/detections_counter@v1"});
  registry.register_block<DetectionsOverlay>({kDetectionsOverlay, "wf/detections_overlay@v1"});
  registry.register_block<Expression>({kExpression, "wf/expression@v1"});
}

auto make_image(int width, int height, std::vector<int> pixels) -> engine::Json {
  return Json{{"width", width}, {"height", height}, {"pixels", std::move(pixels)}};
}

}  // namespace wf::block
