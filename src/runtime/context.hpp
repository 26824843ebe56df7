#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "engine/error.hpp"
#include "engine/plan.hpp"
#include "engine/selector.hpp"
#include "engine/types.hpp"

namespace wf::engine {

/// A value flowing between steps: either one item per batch element or a single
/// broadcast value shared by every element.
class BatchValue {
 public:
  BatchValue() = default;

  static auto broadcast(Json value) -> BatchValue;
  static auto batch(std::vector<Json> items) -> BatchValue;

  auto is_batch() const -> bool { return batch_; }
  /// Item count; 1 for broadcast values.
  auto size() const -> std::size_t { return items_.size(); }
  /// Item `index`; broadcast values return their single value for any index.
  auto at(std::size_t index) const -> const Json&;
  auto items() const -> const std::vector<Json>& { return items_; }

 private:
  bool batch_ = false;
  std::vector<Json> items_{Json()};
};

/// Per-run store of workflow inputs and committed step outputs. Written only by
/// the run's coordinating thread between levels; read concurrently by the
/// invocations of the level in flight.
class ExecutionContext {
 public:
  explicit ExecutionContext(std::size_t batch_size = 1) : batch_size_(batch_size) {}

  auto batch_size() const -> std::size_t { return batch_size_; }

  auto set_input(const std::string& name, BatchValue value) -> void;
  /// Publishes every output of `step` at once.
  auto commit_step(const std::string& step, std::unordered_map<std::string, BatchValue> outputs) -> void;

  auto find_input(const std::string& name) const -> const BatchValue*;
  auto find_output(const std::string& step, const std::string& output) const -> const BatchValue*;
  /// Value a selector points at, or null when it has not been produced.
  auto lookup(const Selector& selector) const -> const BatchValue*;

 private:
  std::size_t batch_size_ = 1;
  std::unordered_map<std::string, BatchValue> inputs_;
  std::unordered_map<std::string, std::unordered_map<std::string, BatchValue>> steps_;
};

/// Binds runtime inputs to the plan's declared inputs. Batch-shaped inputs take
/// an array or a single value; missing inputs take their default. Batch sizes
/// must agree, size-1 batches broadcast.
auto bind_inputs(const CompiledPlan& plan, const Json& runtime_inputs) -> Expected<ExecutionContext>;

}  // namespace wf::engine
