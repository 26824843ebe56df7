#include "engine/graph.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace wf::engine {
namespace {

enum class VisitState : unsigned char {
  Unvisited,
  OnStack,
  Done,
};

struct CycleFinder {
  const DependencyGraph& graph;
  std::vector<VisitState> state;
  std::vector<int> stack;
  std::vector<int> cycle;

  explicit CycleFinder(const DependencyGraph& graph_ref)
      : graph(graph_ref), state(graph_ref.consumers.size(), VisitState::Unvisited) {}

  /// Depth-first walk from `root` with an explicit stack; fills `cycle` with
  /// the path of the first back edge found.
  auto visit(int root) -> bool {
    std::vector<std::size_t> next_edge;
    auto enter = [&](int node) {
      state[static_cast<std::size_t>(node)] = VisitState::OnStack;
      stack.push_back(node);
      next_edge.push_back(0);
    };
    enter(root);
    while (!stack.empty()) {
      const int node = stack.back();
      const auto& consumers = graph.consumers[static_cast<std::size_t>(node)];
      auto& edge = next_edge.back();
      if (edge == consumers.size()) {
        state[static_cast<std::size_t>(node)] = VisitState::Done;
        stack.pop_back();
        next_edge.pop_back();
        continue;
      }
      const int next = consumers[edge++];
      auto next_state = state[static_cast<std::size_t>(next)];
      if (next_state == VisitState::OnStack) {
        auto begin = std::find(stack.begin(), stack.end(), next);
        cycle.assign(begin, stack.end());
        return true;
      }
      if (next_state == VisitState::Unvisited) {
        enter(next);
      }
    }
    return false;
  }
};

auto unique_sorted(std::vector<int>& values) -> void {
  std::sort(values.begin(), values.end());
  values.erase(std::unique(values.begin(), values.end()), values.end());
}

}  // namespace

auto StepNode::find_output(std::string_view name) const -> const OutputSchema* {
  for (const auto& output : outputs) {
    if (output.name == name) {
      return &output;
    }
  }
  return nullptr;
}

auto resolve_reference(const Selector& selector, const WorkflowDef& workflow, const std::vector<StepNode>& steps,
                       int& producer_step, int& producer_input) -> Expected<void> {
  producer_step = -1;
  producer_input = -1;
  if (selector.scope == SelectorScope::Input) {
    for (std::size_t i = 0; i < workflow.inputs.size(); ++i) {
      if (workflow.inputs[i].name == selector.name) {
        producer_input = static_cast<int>(i);
        return {};
      }
    }
    return tl::unexpected(make_error(ErrorCode::UnknownReference,
                                     fmt::format("selector '{}' references unknown input '{}'", selector.raw,
                                                 selector.name)));
  }

  for (std::size_t i = 0; i < steps.size(); ++i) {
    const auto& step = steps[i];
    if (step.manifest.name != selector.name) {
      continue;
    }
    if (!step.find_output(selector.output)) {
      return tl::unexpected(make_error(ErrorCode::UnknownReference,
                                       fmt::format("selector '{}' references unknown output '{}' of step '{}'",
                                                   selector.raw, selector.output, selector.name)));
    }
    producer_step = static_cast<int>(i);
    return {};
  }
  return tl::unexpected(make_error(
    ErrorCode::UnknownReference, fmt::format("selector '{}' references unknown step '{}'", selector.raw, selector.name)));
}

auto build_dependency_graph(const WorkflowDef& workflow, const std::vector<StepNode>& steps)
  -> Expected<DependencyGraph> {
  DependencyGraph graph;
  graph.producers.assign(steps.size(), {});
  graph.consumers.assign(steps.size(), {});

  std::vector<const Selector*> selectors;
  for (std::size_t consumer = 0; consumer < steps.size(); ++consumer) {
    const auto& manifest = steps[consumer].manifest;
    for (const auto& [field_name, value] : manifest.fields) {
      selectors.clear();
      collect_selectors(value, selectors);
      for (const auto* selector : selectors) {
        DependencyEdge edge;
        if (auto resolved = resolve_reference(*selector, workflow, steps, edge.producer_step, edge.producer_input);
            !resolved) {
          return tl::unexpected(resolved.error());
        }
        edge.consumer_step = static_cast<int>(consumer);
        edge.field = field_name;
        edge.selector = *selector;
        if (edge.producer_step >= 0) {
          graph.producers[consumer].push_back(edge.producer_step);
          graph.consumers[static_cast<std::size_t>(edge.producer_step)].push_back(static_cast<int>(consumer));
        }
        graph.edges.push_back(std::move(edge));
      }
    }
  }

  for (auto& producers : graph.producers) {
    unique_sorted(producers);
  }
  for (auto& consumers : graph.consumers) {
    unique_sorted(consumers);
  }

  auto cycle = find_cycle(graph);
  if (!cycle.empty()) {
    std::vector<std::string> names;
    names.reserve(cycle.size() + 1);
    for (int index : cycle) {
      names.push_back(steps[static_cast<std::size_t>(index)].manifest.name);
    }
    names.push_back(names.front());
    return tl::unexpected(
      make_error(ErrorCode::CyclicWorkflow, fmt::format("workflow contains a cycle: {}", fmt::join(names, " -> "))));
  }
  return graph;
}

auto find_cycle(const DependencyGraph& graph) -> std::vector<int> {
  CycleFinder finder(graph);
  for (std::size_t node = 0; node < graph.consumers.size(); ++node) {
    if (finder.state[node] == VisitState::Unvisited && finder.visit(static_cast<int>(node))) {
      return finder.cycle;
    }
  }
  return {};
}

}  // namespace wf::engine
