#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "block/sample_blocks.hpp"
#include "engine/block.hpp"
#include "engine/registry.hpp"

using wf::engine::BlockInputs;
using wf::engine::BlockPtr;
using wf::engine::ErrorCode;
using wf::engine::Json;
using wf::engine::RunContext;
using wf::engine::RunContextView;

namespace {

auto make_block(std::string_view type) -> BlockPtr {
  wf::engine::BlockRegistry registry;
  wf::block::register_sample_blocks(registry);
  const auto* factory = registry.find(type);
  if (!factory) {
    return nullptr;
  }
  auto block = (*factory)(Json{{"type", std::string(type)}, {"name", "step"}});
  if (!block) {
    return nullptr;
  }
  return *block;
}

auto detections(Json boxes) -> Json {
  return Json{{"image", Json{{"width", 4}, {"height", 2}}}, {"predictions", std::move(boxes)}};
}

// 4x2: a bright pair on row 0, a bright pixel and a dimmer one on row 1
auto scene() -> Json {
  return wf::block::make_image(4, 2, {0, 255, 255, 0, 255, 0, 0, 153});
}

}  // namespace

TEST(SampleBlocks, RegisteredUnderShortAndVersionedNames) {
  wf::engine::BlockRegistry registry;
  wf::block::register_sample_blocks(registry);
  for (const char* type : {"ImageDimensions", "wf/image_dimensions@v1", "ThresholdDetector",
                           "wf/threshold_detector@v1", "DetectionsCounter", "wf/detections_counter@v1",
                           "DetectionsOverlay", "wf/detections_overlay@v1", "Expression", "wf/expression@v1"}) {
    EXPECT_NE(registry.find(type), nullptr) << type;
  }
}

TEST(SampleBlocks, ImageDimensions) {
  auto block = make_block("ImageDimensions");
  ASSERT_NE(block, nullptr);
  auto outputs = block->run(BlockInputs{{"image", scene()}}, RunContextView{});
  ASSERT_TRUE(outputs) << outputs.error().message;
  EXPECT_EQ(outputs->at("dimensions"), (Json{{"width", 4}, {"height", 2}}));

  auto invalid = block->run(BlockInputs{{"image", Json("not an image")}}, RunContextView{});
  ASSERT_FALSE(invalid);
  EXPECT_EQ(invalid.error().code, ErrorCode::StepExecution);
}

TEST(SampleBlocks, ThresholdDetectorFindsBrightRuns) {
  auto block = make_block("ThresholdDetector");
  ASSERT_NE(block, nullptr);
  auto outputs = block->run(BlockInputs{{"image", scene()}, {"threshold", 0.5}, {"class_name", "spot"}},
                            RunContextView{});
  ASSERT_TRUE(outputs) << outputs.error().message;
  const auto& value = outputs->at("predictions");
  EXPECT_EQ(value["image"], (Json{{"width", 4}, {"height", 2}}));
  const auto& boxes = value["predictions"];
  ASSERT_EQ(boxes.size(), 3u);
  EXPECT_EQ(boxes[0]["x"], 1);
  EXPECT_EQ(boxes[0]["y"], 0);
  EXPECT_EQ(boxes[0]["width"], 2);
  EXPECT_EQ(boxes[0]["class"], "spot");
  EXPECT_DOUBLE_EQ(boxes[0]["confidence"].get<double>(), 1.0);
  EXPECT_EQ(boxes[1]["x"], 0);
  EXPECT_EQ(boxes[1]["y"], 1);
  EXPECT_EQ(boxes[2]["x"], 3);
  EXPECT_DOUBLE_EQ(boxes[2]["confidence"].get<double>(), 0.6);

  auto strict = block->run(BlockInputs{{"image", scene()}, {"threshold", 0.9}, {"class_name", "spot"}},
                           RunContextView{});
  ASSERT_TRUE(strict);
  EXPECT_EQ(strict->at("predictions")["predictions"].size(), 2u);
}

TEST(SampleBlocks, ThresholdDetectorRejectsBadInputs) {
  auto block = make_block("ThresholdDetector");
  ASSERT_NE(block, nullptr);
  auto out_of_range = block->run(BlockInputs{{"image", scene()}, {"threshold", 1.5}}, RunContextView{});
  ASSERT_FALSE(out_of_range);
  EXPECT_NE(out_of_range.error().message.find("outside [0, 1]"), std::string::npos);

  auto short_pixels = block->run(BlockInputs{{"image", wf::block::make_image(3, 3, {1, 2})}}, RunContextView{});
  ASSERT_FALSE(short_pixels);
  EXPECT_EQ(short_pixels.error().code, ErrorCode::StepExecution);
}

TEST(SampleBlocks, ThresholdDetectorObservesCancellation) {
  auto block = make_block("ThresholdDetector");
  ASSERT_NE(block, nullptr);
  RunContext ctx;
  ctx.cancel();
  auto outputs = block->run(BlockInputs{{"image", scene()}}, RunContextView(ctx));
  ASSERT_FALSE(outputs);
  EXPECT_EQ(outputs.error().code, ErrorCode::Cancelled);
}

TEST(SampleBlocks, DetectionsCounterHandlesSingleValuesAndBatches) {
  auto block = make_block("DetectionsCounter");
  ASSERT_NE(block, nullptr);
  EXPECT_TRUE(block->accepts_batch_input());

  auto boxes = Json::array({Json{{"confidence", 0.9}}, Json{{"confidence", 0.2}}});
  auto single = block->run(BlockInputs{{"predictions", detections(boxes)}, {"min_confidence", 0.5}},
                           RunContextView{});
  ASSERT_TRUE(single) << single.error().message;
  EXPECT_EQ(single->at("count"), 1);

  auto batch = block->run(BlockInputs{{"predictions", Json::array({detections(boxes), detections(Json::array())})},
                                      {"min_confidence", 0.0}},
                          RunContextView{});
  ASSERT_TRUE(batch) << batch.error().message;
  EXPECT_EQ(batch->at("count"), Json::array({2, 0}));

  auto malformed = block->run(BlockInputs{{"predictions", Json{{"boxes", 1}}}}, RunContextView{});
  ASSERT_FALSE(malformed);
}

TEST(SampleBlocks, DetectionsOverlayPaintsBoxes) {
  auto block = make_block("DetectionsOverlay");
  ASSERT_NE(block, nullptr);
  auto box = Json{{"x", 1}, {"y", 0}, {"width", 2}, {"height", 2}};
  auto outputs = block->run(
    BlockInputs{{"image", wf::block::make_image(4, 2, {0, 0, 0, 0, 0, 0, 0, 0})},
                {"predictions", detections(Json::array({box}))},
                {"color", 7}},
    RunContextView{});
  ASSERT_TRUE(outputs) << outputs.error().message;
  EXPECT_EQ(outputs->at("image")["pixels"], Json::array({0, 7, 7, 0, 0, 7, 7, 0}));
}

TEST(SampleBlocks, ExpressionArithmetic) {
  auto block = make_block("Expression");
  ASSERT_NE(block, nullptr);
  auto eval = [&](double lhs, double rhs, const char* operation) {
    return block->run(BlockInputs{{"lhs", lhs}, {"rhs", rhs}, {"operation", operation}}, RunContextView{});
  };

  EXPECT_DOUBLE_EQ(eval(2, 3, "add")->at("result").get<double>(), 5.0);
  EXPECT_DOUBLE_EQ(eval(2, 3, "subtract")->at("result").get<double>(), -1.0);
  EXPECT_DOUBLE_EQ(eval(2, 3, "multiply")->at("result").get<double>(), 6.0);
  EXPECT_DOUBLE_EQ(eval(3, 2, "divide")->at("result").get<double>(), 1.5);

  auto by_zero = eval(1, 0, "divide");
  ASSERT_FALSE(by_zero);
  EXPECT_EQ(by_zero.error().message, "division by zero");

  auto unknown = eval(1, 1, "power");
  ASSERT_FALSE(unknown);
  EXPECT_EQ(unknown.error().message, "unknown operation: power");

  auto not_number = block->run(BlockInputs{{"lhs", "x"}, {"rhs", 1}, {"operation", "add"}}, RunContextView{});
  ASSERT_FALSE(not_number);
}
