#pragma once

#include <map>
#include <string>
#include <vector>

#include "engine/block.hpp"
#include "engine/dsl.hpp"
#include "engine/error.hpp"
#include "engine/selector.hpp"

namespace wf::engine {

/// A step with its fields parsed into FieldValue trees.
struct StepManifest {
  std::string type;
  std::string name;
  /// Field name to parsed value; ordered for deterministic iteration.
  std::map<std::string, FieldValue> fields;
  bool declares_batch_input = false;
};

/// Graph node: the manifest plus what the step's block declares.
struct StepNode {
  StepManifest manifest;
  BlockPtr block;
  std::vector<OutputSchema> outputs;

  auto find_output(std::string_view name) const -> const OutputSchema*;
};

/// One resolved selector. `producer_step` is -1 when the selector targets a workflow input.
struct DependencyEdge {
  int producer_step = -1;
  int producer_input = -1;
  int consumer_step = -1;
  std::string field;
  Selector selector;
};

struct DependencyGraph {
  std::vector<DependencyEdge> edges;
  /// Distinct producer step indices per step, ascending.
  std::vector<std::vector<int>> producers;
  /// Distinct consumer step indices per step, ascending.
  std::vector<std::vector<int>> consumers;
};

/// Resolves `selector` against the declared inputs and steps. Fails with
/// UnknownReference quoting the selector text verbatim.
auto resolve_reference(const Selector& selector, const WorkflowDef& workflow, const std::vector<StepNode>& steps,
                       int& producer_step, int& producer_input) -> Expected<void>;

/// Collects every selector of every step into edges, then rejects cycles.
auto build_dependency_graph(const WorkflowDef& workflow, const std::vector<StepNode>& steps)
  -> Expected<DependencyGraph>;

/// Step indices of the first cycle found (in cycle order), or empty when acyclic.
auto find_cycle(const DependencyGraph& graph) -> std::vector<int>;

}  // namespace wf::engine
