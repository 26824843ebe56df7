#pragma once

#include <string>
#include <vector>

#include "engine/error.hpp"
#include "engine/kinds.hpp"
#include "engine/types.hpp"

namespace wf::engine {

enum class InputType {
  Image,
  Parameter,
  Batch,
};

struct InputDef {
  InputType type = InputType::Parameter;
  std::string name;
  /// Declared kinds; `image` for image inputs, wildcard when a parameter declares none.
  KindSet kinds;
  bool has_default = false;
  Json default_value;

  auto batch_shaped() const -> bool { return type != InputType::Parameter; }
};

struct StepDef {
  std::string type;
  std::string name;
  /// Raw field values, every key of the step object except `type` and `name`.
  Json fields = Json::object();
};

struct OutputDef {
  std::string name;
  std::string selector;
};

struct WorkflowDef {
  std::string version;
  std::vector<InputDef> inputs;
  std::vector<StepDef> steps;
  std::vector<OutputDef> outputs;
};

/// Parses the specification document `{"inputs": [...], "steps": [...], "outputs": [...]}`
/// and runs validate_workflow on the result.
auto parse_workflow_json(const Json& json) -> Expected<WorkflowDef>;

/// Structural checks: unique, well-formed names and outputs carrying a selector.
auto validate_workflow(const WorkflowDef& workflow) -> Expected<void>;

}  // namespace wf::engine
