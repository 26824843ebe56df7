#include "runtime/context.hpp"

#include <utility>

#include <fmt/format.h>

namespace wf::engine {

auto BatchValue::broadcast(Json value) -> BatchValue {
  BatchValue result;
  result.batch_ = false;
  result.items_.clear();
  result.items_.push_back(std::move(value));
  return result;
}

auto BatchValue::batch(std::vector<Json> items) -> BatchValue {
  BatchValue result;
  result.batch_ = true;
  result.items_ = std::move(items);
  return result;
}

auto BatchValue::at(std::size_t index) const -> const Json& {
  if (!batch_ || items_.size() == 1) {
    return items_.front();
  }
  return items_.at(index);
}

auto ExecutionContext::set_input(const std::string& name, BatchValue value) -> void {
  inputs_[name] = std::move(value);
}

auto ExecutionContext::commit_step(const std::string& step, std::unordered_map<std::string, BatchValue> outputs)
  -> void {
  steps_[step] = std::move(outputs);
}

auto ExecutionContext::find_input(const std::string& name) const -> const BatchValue* {
  auto it = inputs_.find(name);
  return it == inputs_.end() ? nullptr : &it->second;
}

auto ExecutionContext::find_output(const std::string& step, const std::string& output) const -> const BatchValue* {
  auto step_it = steps_.find(step);
  if (step_it == steps_.end()) {
    return nullptr;
  }
  auto it = step_it->second.find(output);
  return it == step_it->second.end() ? nullptr : &it->second;
}

auto ExecutionContext::lookup(const Selector& selector) const -> const BatchValue* {
  if (selector.scope == SelectorScope::Input) {
    return find_input(selector.name);
  }
  return find_output(selector.name, selector.output);
}

auto bind_inputs(const CompiledPlan& plan, const Json& runtime_inputs) -> Expected<ExecutionContext> {
  if (!runtime_inputs.is_null() && !runtime_inputs.is_object()) {
    return tl::unexpected(make_error(ErrorCode::InvalidInput, "runtime inputs must be a JSON object"));
  }

  std::vector<std::pair<const InputDef*, BatchValue>> bound;
  bound.reserve(plan.inputs.size());
  std::size_t batch_size = 1;
  std::string sized_by;

  for (const auto& input : plan.inputs) {
    const Json* value = nullptr;
    if (runtime_inputs.is_object()) {
      auto it = runtime_inputs.find(input.name);
      if (it != runtime_inputs.end()) {
        value = &*it;
      }
    }
    if (!value) {
      if (!input.has_default) {
        return tl::unexpected(
          make_error(ErrorCode::InvalidInput, fmt::format("missing runtime input '{}'", input.name)));
      }
      value = &input.default_value;
    }

    if (!input.batch_shaped()) {
      bound.emplace_back(&input, BatchValue::broadcast(*value));
      continue;
    }

    std::vector<Json> items;
    if (value->is_array()) {
      items.assign(value->begin(), value->end());
    } else {
      items.push_back(*value);
    }
    if (items.empty()) {
      return tl::unexpected(
        make_error(ErrorCode::InvalidInput, fmt::format("batch input '{}' must not be empty", input.name)));
    }
    if (items.size() != 1) {
      if (batch_size != 1 && batch_size != items.size()) {
        return tl::unexpected(make_error(
          ErrorCode::InvalidInput, fmt::format("batch input '{}' has {} items but '{}' has {}", input.name,
                                               items.size(), sized_by, batch_size)));
      }
      batch_size = items.size();
      sized_by = input.name;
    }
    bound.emplace_back(&input, BatchValue::batch(std::move(items)));
  }

  ExecutionContext context(batch_size);
  for (auto& [input, value] : bound) {
    context.set_input(input->name, std::move(value));
  }
  return context;
}

}  // namespace wf::engine
