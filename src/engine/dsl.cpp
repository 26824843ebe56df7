#include "engine/dsl.hpp"

#include <string_view>
#include <unordered_set>

#include <fmt/format.h>

namespace wf::engine {
namespace {

auto invalid(std::string message) -> EngineError {
  return make_error(ErrorCode::InvalidSpecification, std::move(message));
}

auto get_string_field(const Json& obj, std::string_view field, std::string_view context) -> Expected<std::string> {
  auto it = obj.find(std::string(field));
  if (it == obj.end() || !it->is_string()) {
    return tl::unexpected(invalid(fmt::format("{}: missing or invalid field '{}'", context, field)));
  }
  return it->get<std::string>();
}

auto is_name_char(char c) -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

auto is_valid_name(std::string_view name) -> bool {
  if (name.empty()) {
    return false;
  }
  for (char c : name) {
    if (!is_name_char(c)) {
      return false;
    }
  }
  return true;
}

auto parse_input_type(std::string_view type) -> Expected<InputType> {
  if (type == "WorkflowImage" || type == "InferenceImage") {
    return InputType::Image;
  }
  if (type == "WorkflowParameter" || type == "InferenceParameter") {
    return InputType::Parameter;
  }
  if (type == "WorkflowBatchInput") {
    return InputType::Batch;
  }
  return tl::unexpected(invalid(fmt::format("unknown input type: {}", type)));
}

auto parse_kind_list(const Json& input_json, std::string_view context) -> Expected<KindSet> {
  KindSet kinds;
  auto it = input_json.find("kind");
  if (it == input_json.end()) {
    return kinds;
  }
  if (!it->is_array()) {
    return tl::unexpected(invalid(fmt::format("{}: 'kind' must be an array", context)));
  }
  for (const auto& kind : *it) {
    // kinds may be given as plain names or as {"name": ...} objects
    if (kind.is_string()) {
      kinds.insert(kind.get<std::string>());
    } else if (kind.is_object() && kind.contains("name") && kind["name"].is_string()) {
      kinds.insert(kind["name"].get<std::string>());
    } else {
      return tl::unexpected(invalid(fmt::format("{}: invalid kind entry", context)));
    }
  }
  return kinds;
}

auto parse_input(const Json& input_json) -> Expected<InputDef> {
  if (!input_json.is_object()) {
    return tl::unexpected(invalid("input entry must be an object"));
  }
  auto type = get_string_field(input_json, "type", "input");
  if (!type) {
    return tl::unexpected(type.error());
  }
  auto name = get_string_field(input_json, "name", "input");
  if (!name) {
    return tl::unexpected(name.error());
  }
  auto input_type = parse_input_type(*type);
  if (!input_type) {
    return tl::unexpected(input_type.error());
  }
  auto kinds = parse_kind_list(input_json, fmt::format("input '{}'", *name));
  if (!kinds) {
    return tl::unexpected(kinds.error());
  }

  InputDef input;
  input.type = *input_type;
  input.name = std::move(*name);
  input.kinds = std::move(*kinds);
  if (input.type == InputType::Image) {
    input.kinds = KindSet{kinds::kImage};
  } else if (input.kinds.empty()) {
    input.kinds = KindSet{std::string(kWildcardKind)};
  }
  if (auto it = input_json.find("default_value"); it != input_json.end()) {
    input.has_default = true;
    input.default_value = *it;
  }
  return input;
}

auto parse_step(const Json& step_json) -> Expected<StepDef> {
  if (!step_json.is_object()) {
    return tl::unexpected(invalid("step entry must be an object"));
  }
  auto type = get_string_field(step_json, "type", "step");
  if (!type) {
    return tl::unexpected(type.error());
  }
  auto name = get_string_field(step_json, "name", "step");
  if (!name) {
    return tl::unexpected(name.error());
  }
  StepDef step;
  step.type = std::move(*type);
  step.name = std::move(*name);
  for (const auto& [key, value] : step_json.items()) {
    if (key == "type" || key == "name") {
      continue;
    }
    step.fields[key] = value;
  }
  return step;
}

auto parse_output(const Json& output_json) -> Expected<OutputDef> {
  if (!output_json.is_object()) {
    return tl::unexpected(invalid("output entry must be an object"));
  }
  auto name = get_string_field(output_json, "name", "output");
  if (!name) {
    return tl::unexpected(name.error());
  }
  auto selector = get_string_field(output_json, "selector", fmt::format("output '{}'", *name));
  if (!selector) {
    return tl::unexpected(selector.error());
  }
  return OutputDef{std::move(*name), std::move(*selector)};
}

}  // namespace

auto parse_workflow_json(const Json& json) -> Expected<WorkflowDef> {
  if (!json.is_object()) {
    return tl::unexpected(invalid("workflow specification must be an object"));
  }

  WorkflowDef workflow;
  if (auto it = json.find("version"); it != json.end()) {
    if (!it->is_string()) {
      return tl::unexpected(invalid("version must be a string"));
    }
    workflow.version = it->get<std::string>();
  }

  auto inputs_it = json.find("inputs");
  if (inputs_it != json.end()) {
    if (!inputs_it->is_array()) {
      return tl::unexpected(invalid("inputs must be an array"));
    }
    for (const auto& input_json : *inputs_it) {
      auto input = parse_input(input_json);
      if (!input) {
        return tl::unexpected(input.error());
      }
      workflow.inputs.push_back(std::move(*input));
    }
  }

  auto steps_it = json.find("steps");
  if (steps_it == json.end() || !steps_it->is_array()) {
    return tl::unexpected(invalid("steps must be an array"));
  }
  for (const auto& step_json : *steps_it) {
    auto step = parse_step(step_json);
    if (!step) {
      return tl::unexpected(step.error());
    }
    workflow.steps.push_back(std::move(*step));
  }

  auto outputs_it = json.find("outputs");
  if (outputs_it == json.end() || !outputs_it->is_array()) {
    return tl::unexpected(invalid("outputs must be an array"));
  }
  for (const auto& output_json : *outputs_it) {
    auto output = parse_output(output_json);
    if (!output) {
      return tl::unexpected(output.error());
    }
    workflow.outputs.push_back(std::move(*output));
  }

  if (auto result = validate_workflow(workflow); !result) {
    return tl::unexpected(result.error());
  }
  return workflow;
}

auto validate_workflow(const WorkflowDef& workflow) -> Expected<void> {
  std::unordered_set<std::string> input_names;
  for (const auto& input : workflow.inputs) {
    if (!is_valid_name(input.name)) {
      return tl::unexpected(invalid(fmt::format("invalid input name: '{}'", input.name)));
    }
    if (!input_names.insert(input.name).second) {
      return tl::unexpected(invalid(fmt::format("duplicate input name: {}", input.name)));
    }
  }

  std::unordered_set<std::string> step_names;
  for (const auto& step : workflow.steps) {
    if (!is_valid_name(step.name)) {
      return tl::unexpected(invalid(fmt::format("invalid step name: '{}'", step.name)));
    }
    if (step.type.empty()) {
      return tl::unexpected(invalid(fmt::format("step '{}' has an empty type", step.name)));
    }
    if (!step_names.insert(step.name).second) {
      return tl::unexpected(invalid(fmt::format("duplicate step name: {}", step.name)));
    }
  }

  std::unordered_set<std::string> output_names;
  for (const auto& output : workflow.outputs) {
    if (output.name.empty()) {
      return tl::unexpected(invalid("output name must not be empty"));
    }
    if (!output_names.insert(output.name).second) {
      return tl::unexpected(invalid(fmt::format("duplicate output name: {}", output.name)));
    }
    if (output.selector.empty()) {
      return tl::unexpected(invalid(fmt::format("output '{}' has an empty selector", output.name)));
    }
  }
  return {};
}

}  // namespace wf::engine
