#include "engine/plan.hpp"

#include <algorithm>
#include <exception>
#include <unordered_set>

#include <fmt/format.h>

#include "common/logging/log.hpp"
#include "engine/hash.hpp"

namespace wf::engine {
namespace {

auto invalid(std::string message) -> EngineError {
  return make_error(ErrorCode::InvalidSpecification, std::move(message));
}

auto validate_outputs(const std::vector<OutputSchema>& outputs, const KindRegistry& kinds, std::string_view step_name)
  -> Expected<void> {
  std::unordered_set<std::string> seen;
  for (const auto& output : outputs) {
    if (output.name.empty()) {
      return tl::unexpected(invalid(fmt::format("block of step '{}' declares an unnamed output", step_name)));
    }
    if (!seen.insert(output.name).second) {
      return tl::unexpected(
        invalid(fmt::format("block of step '{}' declares output '{}' twice", step_name, output.name)));
    }
    if (auto known = kinds.validate(output.kinds, fmt::format("output '{}' of step '{}'", output.name, step_name));
        !known) {
      return tl::unexpected(known.error());
    }
  }
  return {};
}

struct PlanBuilder {
  const WorkflowDef& workflow;
  const BlockRegistry& registry;

  std::vector<StepNode> steps;
  DependencyGraph graph;
  std::vector<CompiledOutput> outputs;
  std::vector<int> level_of;

  auto validate_inputs() -> Expected<void> {
    for (const auto& input : workflow.inputs) {
      if (auto known = registry.kinds().validate(input.kinds, fmt::format("input '{}'", input.name)); !known) {
        return tl::unexpected(known.error());
      }
    }
    return {};
  }

  auto build_steps() -> Expected<void> {
    steps.reserve(workflow.steps.size());
    for (const auto& step_def : workflow.steps) {
      auto factory = registry.find(step_def.type);
      if (!factory) {
        return tl::unexpected(
          invalid(fmt::format("block type not registered: {} (step '{}')", step_def.type, step_def.name)));
      }
      Json step_json = step_def.fields;
      step_json["type"] = step_def.type;
      step_json["name"] = step_def.name;
      Expected<BlockPtr> block;
      try {
        block = (*factory)(step_json);
      } catch (const std::exception& ex) {
        return tl::unexpected(
          invalid(fmt::format("block factory failed for step '{}': {}", step_def.name, ex.what())));
      }
      if (!block) {
        return tl::unexpected(invalid(fmt::format("block factory failed for step '{}': {}", step_def.name,
                                                  block.error().message)));
      }
      if (!*block) {
        return tl::unexpected(invalid(fmt::format("block factory returned null for step '{}'", step_def.name)));
      }

      StepNode node;
      node.block = std::move(*block);
      node.outputs = node.block->declare_outputs();
      if (auto valid = validate_outputs(node.outputs, registry.kinds(), step_def.name); !valid) {
        return tl::unexpected(valid.error());
      }

      node.manifest.type = step_def.type;
      node.manifest.name = step_def.name;
      node.manifest.declares_batch_input = node.block->accepts_batch_input();

      if (auto fields = bind_fields(step_def, node); !fields) {
        return tl::unexpected(fields.error());
      }
      steps.push_back(std::move(node));
    }
    return {};
  }

  auto bind_fields(const StepDef& step_def, StepNode& node) -> Expected<void> {
    const auto& schema = node.block->schema();
    for (const auto& field : schema.fields) {
      if (auto known = registry.kinds().validate(
            field.kinds, fmt::format("field '{}' of step '{}'", field.name, step_def.name));
          !known) {
        return tl::unexpected(known.error());
      }
    }

    for (const auto& [field_name, raw_value] : step_def.fields.items()) {
      if (!schema.find(field_name)) {
        return tl::unexpected(invalid(
          fmt::format("unknown field '{}' for step '{}' of type {}", field_name, step_def.name, step_def.type)));
      }
      auto value = parse_field_value(raw_value, fmt::format("{}.{}", step_def.name, field_name));
      if (!value) {
        return tl::unexpected(value.error());
      }
      node.manifest.fields.emplace(field_name, std::move(*value));
    }

    for (const auto& field : schema.fields) {
      if (node.manifest.fields.contains(field.name)) {
        continue;
      }
      if (field.required) {
        return tl::unexpected(
          invalid(fmt::format("missing required field '{}' for step '{}'", field.name, step_def.name)));
      }
      node.manifest.fields.emplace(field.name, FieldValue::make_literal(field.default_value));
    }
    return {};
  }

  auto build_graph() -> Expected<void> {
    auto built = build_dependency_graph(workflow, steps);
    if (!built) {
      return tl::unexpected(built.error());
    }
    graph = std::move(*built);
    return {};
  }

  auto bind_outputs() -> Expected<void> {
    for (const auto& output : workflow.outputs) {
      auto context = fmt::format("outputs.{}", output.name);
      if (!is_reserved_selector(output.selector)) {
        return tl::unexpected(make_error(
          ErrorCode::MalformedSelector,
          fmt::format("malformed selector '{}' in field '{}': expected a selector", output.selector, context)));
      }
      auto selector = parse_selector(output.selector, context);
      if (!selector) {
        return tl::unexpected(selector.error());
      }
      int producer_step = -1;
      int producer_input = -1;
      if (auto resolved = resolve_reference(*selector, workflow, steps, producer_step, producer_input); !resolved) {
        return tl::unexpected(resolved.error());
      }
      outputs.push_back(CompiledOutput{output.name, std::move(*selector)});
    }
    return {};
  }

  auto producer_kinds(const DependencyEdge& edge) const -> const KindSet& {
    if (edge.producer_step >= 0) {
      return steps[static_cast<std::size_t>(edge.producer_step)].find_output(edge.selector.output)->kinds;
    }
    return workflow.inputs[static_cast<std::size_t>(edge.producer_input)].kinds;
  }

  auto check_kinds(const DependencyEdge& edge) const -> Expected<void> {
    const auto& consumer = steps[static_cast<std::size_t>(edge.consumer_step)];
    const auto* field = consumer.block->schema().find(edge.field);
    const bool literal_only = !field || field->kinds.empty();
    if (edge.selector.has_property() && !literal_only) {
      return {};
    }
    const auto& produced = producer_kinds(edge);
    if (!literal_only && kinds_compatible(produced, field->kinds)) {
      return {};
    }
    KindSet accepted = field ? field->kinds : KindSet{};
    std::string producer = edge.producer_step >= 0
                             ? fmt::format("step '{}' output '{}'", edge.selector.name, edge.selector.output)
                             : fmt::format("input '{}'", edge.selector.name);
    return tl::unexpected(make_error(
      ErrorCode::KindMismatch,
      fmt::format("kind mismatch: {} produces {} but field '{}' of step '{}' accepts {} (selector '{}')", producer,
                  format_kinds(produced), edge.field, consumer.manifest.name, format_kinds(accepted),
                  edge.selector.raw)));
  }

  /// Kahn layering: a level holds every step whose producers are all placed in
  /// earlier levels. Edges are kind-checked as their consumer is placed.
  auto assign_levels() -> Expected<std::vector<std::vector<int>>> {
    std::vector<std::vector<const DependencyEdge*>> edges_by_consumer(steps.size());
    for (const auto& edge : graph.edges) {
      edges_by_consumer[static_cast<std::size_t>(edge.consumer_step)].push_back(&edge);
    }

    std::vector<int> pending(steps.size(), 0);
    std::vector<int> frontier;
    for (std::size_t i = 0; i < steps.size(); ++i) {
      pending[i] = static_cast<int>(graph.producers[i].size());
      if (pending[i] == 0) {
        frontier.push_back(static_cast<int>(i));
      }
    }

    level_of.assign(steps.size(), -1);
    std::vector<std::vector<int>> levels;
    std::size_t placed = 0;
    while (!frontier.empty()) {
      std::sort(frontier.begin(), frontier.end());
      int level_index = static_cast<int>(levels.size());
      std::vector<int> next;
      for (int step : frontier) {
        for (const auto* edge : edges_by_consumer[static_cast<std::size_t>(step)]) {
          if (auto kinds_ok = check_kinds(*edge); !kinds_ok) {
            return tl::unexpected(kinds_ok.error());
          }
        }
        level_of[static_cast<std::size_t>(step)] = level_index;
        for (int consumer : graph.consumers[static_cast<std::size_t>(step)]) {
          if (--pending[static_cast<std::size_t>(consumer)] == 0) {
            next.push_back(consumer);
          }
        }
      }
      placed += frontier.size();
      levels.push_back(std::move(frontier));
      frontier = std::move(next);
    }

    if (placed != steps.size()) {
      // build_dependency_graph rejects cycles, so this only guards planner/graph disagreement
      return tl::unexpected(make_error(ErrorCode::CyclicWorkflow, "workflow steps could not be levelled"));
    }
    return levels;
  }

  auto build_plan(std::vector<std::vector<int>> level_indices, const CompileOptions& options)
    -> Expected<CompiledPlan> {
    auto resource_id = workflow_resource_id(workflow.steps);
    if (!resource_id) {
      return tl::unexpected(resource_id.error());
    }
    CompiledPlan plan;
    plan.hash = options.hash;
    plan.version = workflow.version;
    plan.resource_id = std::move(*resource_id);
    plan.inputs = workflow.inputs;
    plan.outputs = std::move(outputs);

    plan.levels.reserve(level_indices.size());
    for (const auto& indices : level_indices) {
      std::vector<CompiledStep> level;
      level.reserve(indices.size());
      for (int index : indices) {
        auto& node = steps[static_cast<std::size_t>(index)];
        CompiledStep step;
        step.level_index = level_of[static_cast<std::size_t>(index)];
        step.declaration_index = index;
        for (int producer : graph.producers[static_cast<std::size_t>(index)]) {
          step.producer_step_names.insert(steps[static_cast<std::size_t>(producer)].manifest.name);
        }
        step.manifest = std::move(node.manifest);
        step.block = std::move(node.block);
        step.outputs = std::move(node.outputs);
        level.push_back(std::move(step));
      }
      plan.levels.push_back(std::move(level));
    }
    return plan;
  }
};

}  // namespace

auto CompiledPlan::step_count() const -> std::size_t {
  std::size_t count = 0;
  for (const auto& level : levels) {
    count += level.size();
  }
  return count;
}

auto CompiledPlan::find_step(std::string_view name) const -> const CompiledStep* {
  for (const auto& level : levels) {
    for (const auto& step : level) {
      if (step.manifest.name == name) {
        return &step;
      }
    }
  }
  return nullptr;
}

auto CompiledPlan::level_names() const -> std::vector<std::vector<std::string>> {
  std::vector<std::vector<std::string>> names;
  names.reserve(levels.size());
  for (const auto& level : levels) {
    std::vector<std::string> level_names;
    level_names.reserve(level.size());
    for (const auto& step : level) {
      level_names.push_back(step.manifest.name);
    }
    names.push_back(std::move(level_names));
  }
  return names;
}

auto compile_plan(const WorkflowDef& workflow, const BlockRegistry& registry, const CompileOptions& options)
  -> Expected<CompiledPlan> {
  if (auto valid = validate_workflow(workflow); !valid) {
    return tl::unexpected(valid.error());
  }

  PlanBuilder builder{workflow, registry};
  if (auto result = builder.validate_inputs(); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = builder.build_steps(); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = builder.build_graph(); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = builder.bind_outputs(); !result) {
    return tl::unexpected(result.error());
  }
  auto levels = builder.assign_levels();
  if (!levels) {
    return tl::unexpected(levels.error());
  }

  auto plan = builder.build_plan(std::move(*levels), options);
  if (!plan) {
    return tl::unexpected(plan.error());
  }
  wf::log::debug("compiled workflow plan: hash={} steps={} levels={}", plan->hash, plan->step_count(),
                 plan->levels.size());
  return plan;
}

auto compile_plan_json(const Json& json, const BlockRegistry& registry) -> Expected<CompiledPlan> {
  auto workflow = parse_workflow_json(json);
  if (!workflow) {
    return tl::unexpected(workflow.error());
  }
  auto hash = hash_json(json);
  if (!hash) {
    return tl::unexpected(hash.error());
  }
  CompileOptions options;
  options.hash = std::move(*hash);
  return compile_plan(*workflow, registry, options);
}

}  // namespace wf::engine
