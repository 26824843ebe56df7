#include <gtest/gtest.h>

#include "engine/dsl.hpp"

using wf::engine::ErrorCode;
using wf::engine::InputType;
using wf::engine::Json;

namespace {

auto parse(const char* text) {
  return wf::engine::parse_workflow_json(Json::parse(text));
}

}  // namespace

TEST(WorkflowDsl, ParsesInputsStepsAndOutputs) {
  auto workflow = parse(R"JSON(
  {
    "version": "1.0",
    "inputs": [
      { "type": "WorkflowImage", "name": "image" },
      { "type": "WorkflowParameter", "name": "threshold", "kind": ["float_zero_to_one"], "default_value": 0.3 },
      { "type": "InferenceParameter", "name": "anything" },
      { "type": "WorkflowBatchInput", "name": "labels", "kind": [{"name": "string"}] }
    ],
    "steps": [
      { "type": "ThresholdDetector", "name": "detector", "image": "$inputs.image", "threshold": 0.4 }
    ],
    "outputs": [
      { "type": "JsonField", "name": "result", "selector": "$steps.detector.predictions" }
    ]
  }
  )JSON");
  ASSERT_TRUE(workflow) << workflow.error().message;
  EXPECT_EQ(workflow->version, "1.0");
  ASSERT_EQ(workflow->inputs.size(), 4u);

  const auto& image = workflow->inputs[0];
  EXPECT_EQ(image.type, InputType::Image);
  EXPECT_TRUE(image.batch_shaped());
  EXPECT_EQ(image.kinds, wf::engine::KindSet{"image"});

  const auto& threshold = workflow->inputs[1];
  EXPECT_EQ(threshold.type, InputType::Parameter);
  EXPECT_FALSE(threshold.batch_shaped());
  EXPECT_TRUE(threshold.has_default);
  EXPECT_EQ(threshold.default_value, Json(0.3));

  EXPECT_EQ(workflow->inputs[2].kinds, wf::engine::KindSet{"*"});
  EXPECT_EQ(workflow->inputs[3].type, InputType::Batch);
  EXPECT_EQ(workflow->inputs[3].kinds, wf::engine::KindSet{"string"});

  ASSERT_EQ(workflow->steps.size(), 1u);
  EXPECT_EQ(workflow->steps[0].type, "ThresholdDetector");
  EXPECT_EQ(workflow->steps[0].fields.size(), 2u);
  EXPECT_FALSE(workflow->steps[0].fields.contains("name"));
  ASSERT_EQ(workflow->outputs.size(), 1u);
  EXPECT_EQ(workflow->outputs[0].selector, "$steps.detector.predictions");
}

TEST(WorkflowDsl, InputsAreOptional) {
  auto workflow = parse(R"({"steps": [], "outputs": []})");
  ASSERT_TRUE(workflow);
  EXPECT_TRUE(workflow->inputs.empty());
}

TEST(WorkflowDsl, RejectsStructuralErrors) {
  const char* cases[] = {
    R"([])",
    R"({"outputs": []})",
    R"({"steps": {}, "outputs": []})",
    R"({"steps": []})",
    R"({"steps": [], "outputs": [], "version": 2})",
    R"({"steps": [{"type": "A", "name": "x"}, {"type": "B", "name": "x"}], "outputs": []})",
    R"({"steps": [{"type": "A", "name": ""}], "outputs": []})",
    R"({"steps": [{"type": "A", "name": "has.dot"}], "outputs": []})",
    R"({"steps": [{"name": "x"}], "outputs": []})",
    R"({"inputs": [{"type": "WorkflowImage", "name": "i"}, {"type": "WorkflowImage", "name": "i"}],
        "steps": [], "outputs": []})",
    R"({"inputs": [{"type": "Mystery", "name": "i"}], "steps": [], "outputs": []})",
    R"({"steps": [], "outputs": [{"name": "o", "selector": "$inputs.a"}, {"name": "o", "selector": "$inputs.b"}]})",
    R"({"steps": [], "outputs": [{"name": "o"}]})",
    R"({"steps": [], "outputs": [{"name": "o", "selector": ""}]})",
  };
  for (const char* text : cases) {
    auto workflow = parse(text);
    ASSERT_FALSE(workflow) << text;
    EXPECT_EQ(workflow.error().code, ErrorCode::InvalidSpecification) << text;
  }
}

TEST(WorkflowDsl, DuplicateStepNameIsNamedInTheError) {
  auto workflow = parse(R"({"steps": [{"type": "A", "name": "dup"}, {"type": "B", "name": "dup"}], "outputs": []})");
  ASSERT_FALSE(workflow);
  EXPECT_EQ(workflow.error().message, "duplicate step name: dup");
}
