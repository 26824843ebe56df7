#include <gtest/gtest.h>

#include "engine/kinds.hpp"
#include "engine/selector.hpp"

using wf::engine::ErrorCode;
using wf::engine::FieldValueKind;
using wf::engine::Json;
using wf::engine::KindSet;
using wf::engine::SelectorScope;

TEST(Selector, ParsesInputSelector) {
  auto selector = wf::engine::parse_selector("$inputs.image", "detector.image");
  ASSERT_TRUE(selector);
  EXPECT_EQ(selector->scope, SelectorScope::Input);
  EXPECT_EQ(selector->name, "image");
  EXPECT_TRUE(selector->output.empty());
  EXPECT_FALSE(selector->has_property());
  EXPECT_EQ(selector->raw, "$inputs.image");
}

TEST(Selector, ParsesStepOutputWithProperty) {
  auto selector = wf::engine::parse_selector("$steps.dims.dimensions.width", "out");
  ASSERT_TRUE(selector);
  EXPECT_EQ(selector->scope, SelectorScope::StepOutput);
  EXPECT_EQ(selector->name, "dims");
  EXPECT_EQ(selector->output, "dimensions");
  ASSERT_EQ(selector->property.size(), 1u);
  EXPECT_EQ(selector->property[0], "width");
}

TEST(Selector, RejectsMalformedSelectorsNamingTheField) {
  for (const char* text : {"$inputs", "$inputs.", "$steps.only_step", "$steps.a..b", "$inputsx.image",
                           "$inputs.bad name", "$steps.a.b.c d"}) {
    auto selector = wf::engine::parse_selector(text, "step.field[1].key");
    ASSERT_FALSE(selector) << text;
    EXPECT_EQ(selector.error().code, ErrorCode::MalformedSelector) << text;
    EXPECT_NE(selector.error().message.find("step.field[1].key"), std::string::npos) << text;
    EXPECT_NE(selector.error().message.find(text), std::string::npos) << text;
  }
}

TEST(Selector, PlainStringsAreLiterals) {
  auto value = wf::engine::parse_field_value(Json("hello $inputs"), "s.f");
  ASSERT_TRUE(value);
  EXPECT_EQ(value->kind, FieldValueKind::Literal);
  EXPECT_EQ(value->literal, Json("hello $inputs"));
}

TEST(Selector, CollapsesSelectorFreeContainersToLiterals) {
  auto value = wf::engine::parse_field_value(Json::parse(R"({"a": [1, 2], "b": "x"})"), "s.f");
  ASSERT_TRUE(value);
  EXPECT_EQ(value->kind, FieldValueKind::Literal);
  EXPECT_EQ(value->literal["a"][1], 2);
}

TEST(Selector, ParsesNestedContainersRecursively) {
  auto json = Json::parse(R"({"images": ["$inputs.a", 3, {"inner": "$steps.s.out"}]})");
  auto value = wf::engine::parse_field_value(json, "step.field");
  ASSERT_TRUE(value);
  ASSERT_EQ(value->kind, FieldValueKind::Map);
  ASSERT_EQ(value->keys.size(), 1u);
  const auto& list = value->items[0];
  ASSERT_EQ(list.kind, FieldValueKind::List);
  EXPECT_EQ(list.items[0].kind, FieldValueKind::Selector);
  EXPECT_EQ(list.items[1].kind, FieldValueKind::Literal);
  EXPECT_EQ(list.items[2].kind, FieldValueKind::Map);

  std::vector<const wf::engine::Selector*> selectors;
  wf::engine::collect_selectors(*value, selectors);
  ASSERT_EQ(selectors.size(), 2u);
  EXPECT_EQ(selectors[0]->raw, "$inputs.a");
  EXPECT_EQ(selectors[1]->raw, "$steps.s.out");
}

TEST(Selector, NestedMalformedSelectorReportsItsPath) {
  auto json = Json::parse(R"(["ok", {"key": "$steps.broken"}])");
  auto value = wf::engine::parse_field_value(json, "step.field");
  ASSERT_FALSE(value);
  EXPECT_EQ(value.error().code, ErrorCode::MalformedSelector);
  EXPECT_NE(value.error().message.find("step.field[1].key"), std::string::npos);
}

TEST(Selector, ApplyPropertyReturnsNullWhenMissing) {
  auto selector = wf::engine::parse_selector("$steps.a.out.meta.size", "f");
  ASSERT_TRUE(selector);
  EXPECT_EQ(wf::engine::apply_property(Json::parse(R"({"meta": {"size": 4}})"), *selector), Json(4));
  EXPECT_TRUE(wf::engine::apply_property(Json::parse(R"({"meta": {}})"), *selector).is_null());
  EXPECT_TRUE(wf::engine::apply_property(Json(7), *selector).is_null());
}

TEST(Kinds, CompatibilityIsNonEmptyIntersection) {
  EXPECT_TRUE(wf::engine::kinds_compatible(KindSet{"image"}, KindSet{"image", "string"}));
  EXPECT_FALSE(wf::engine::kinds_compatible(KindSet{"integer"}, KindSet{"float", "string"}));
  EXPECT_TRUE(wf::engine::kinds_compatible(KindSet{"float"}, KindSet{"float", "string"}));
  EXPECT_FALSE(wf::engine::kinds_compatible(KindSet{}, KindSet{"float"}));
}

TEST(Kinds, WildcardMatchesAnySet) {
  EXPECT_TRUE(wf::engine::kinds_compatible(KindSet{"*"}, KindSet{"image"}));
  EXPECT_TRUE(wf::engine::kinds_compatible(KindSet{"object_detection_prediction"}, KindSet{"*"}));
}

TEST(Kinds, RegistryValidatesKindNames) {
  auto registry = wf::engine::KindRegistry::with_builtin_kinds();
  EXPECT_TRUE(registry.contains("image"));
  EXPECT_TRUE(registry.contains("*"));
  EXPECT_TRUE(registry.validate(KindSet{"image", "float"}, "ctx"));

  auto unknown = registry.validate(KindSet{"lidar_points"}, "field 'x' of step 'y'");
  ASSERT_FALSE(unknown);
  EXPECT_EQ(unknown.error().code, ErrorCode::InvalidSpecification);
  EXPECT_NE(unknown.error().message.find("lidar_points"), std::string::npos);

  ASSERT_TRUE(registry.register_kind("lidar_points", "3d point cloud"));
  EXPECT_TRUE(registry.validate(KindSet{"lidar_points"}, "ctx"));
  EXPECT_EQ(registry.lookup("lidar_points")->description, "3d point cloud");
  EXPECT_FALSE(registry.register_kind(""));
}

TEST(Kinds, FormatsKindSets) {
  EXPECT_EQ(wf::engine::format_kinds(KindSet{"string", "float"}), "{float, string}");
  EXPECT_EQ(wf::engine::format_kinds(KindSet{}), "{}");
}
