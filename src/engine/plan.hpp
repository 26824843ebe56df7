#pragma once

#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "engine/dsl.hpp"
#include "engine/error.hpp"
#include "engine/graph.hpp"
#include "engine/registry.hpp"
#include "engine/selector.hpp"
#include "engine/types.hpp"

namespace wf::engine {

struct CompiledStep {
  StepManifest manifest;
  BlockPtr block;
  std::vector<OutputSchema> outputs;
  std::set<std::string> producer_step_names;
  int level_index = 0;
  /// Position of the step in the specification's `steps` array.
  int declaration_index = 0;
};

struct CompiledOutput {
  std::string name;
  Selector selector;
};

/// Validated, levelled workflow. Immutable once built and safe to share across
/// concurrent runs.
struct CompiledPlan {
  std::string hash;
  std::string version;
  std::string resource_id;
  std::vector<InputDef> inputs;
  /// Each level only depends on strictly earlier levels; steps within a level
  /// follow declaration order.
  std::vector<std::vector<CompiledStep>> levels;
  std::vector<CompiledOutput> outputs;

  auto step_count() const -> std::size_t;
  auto find_step(std::string_view name) const -> const CompiledStep*;
  /// Step names level by level, for diagnostics and determinism checks.
  auto level_names() const -> std::vector<std::vector<std::string>>;
};

struct CompileOptions {
  /// Cache key stored on the plan; left empty when compiling a parsed definition.
  std::string hash;
};

auto compile_plan(const WorkflowDef& workflow, const BlockRegistry& registry, const CompileOptions& options = {})
  -> Expected<CompiledPlan>;

/// Parses, validates and compiles a specification document; the plan hash is
/// derived from the document.
auto compile_plan_json(const Json& json, const BlockRegistry& registry) -> Expected<CompiledPlan>;

}  // namespace wf::engine
