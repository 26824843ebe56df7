#include "runtime/executor.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <optional>
#include <semaphore>
#include <set>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <exec/static_thread_pool.hpp>
#include <fmt/format.h>
#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"
#include "runtime/context.hpp"
#include "usage/usage_collector.hpp"

namespace wf::engine {
namespace {

enum class InvocationMode {
  /// One invocation over broadcast values.
  Single,
  /// One invocation per batch item.
  PerItem,
  /// One invocation receiving whole batches.
  Batch,
};

struct StepRun {
  const CompiledStep* step = nullptr;
  InvocationMode mode = InvocationMode::Single;
  /// One slot per invocation; empty when the invocation never ran.
  std::vector<std::optional<Expected<BlockOutputs>>> results;
};

struct Unit {
  std::size_t run = 0;
  std::size_t item = 0;
};

auto resolve_field(const FieldValue& value, const ExecutionContext& context, InvocationMode mode, std::size_t item)
  -> Expected<Json> {
  switch (value.kind) {
    case FieldValueKind::Literal:
      return value.literal;
    case FieldValueKind::Selector: {
      const auto* source = context.lookup(value.selector);
      if (!source) {
        return tl::unexpected(make_error(ErrorCode::UnresolvedValue,
                                         fmt::format("selector '{}' has no value", value.selector.raw)));
      }
      if (mode == InvocationMode::Batch && source->is_batch()) {
        Json items = Json::array();
        for (std::size_t i = 0; i < context.batch_size(); ++i) {
          items.push_back(apply_property(source->at(i), value.selector));
        }
        return items;
      }
      return apply_property(source->at(mode == InvocationMode::PerItem ? item : 0), value.selector);
    }
    case FieldValueKind::List: {
      Json items = Json::array();
      for (const auto& entry : value.items) {
        auto resolved = resolve_field(entry, context, mode, item);
        if (!resolved) {
          return tl::unexpected(resolved.error());
        }
        items.push_back(std::move(*resolved));
      }
      return items;
    }
    case FieldValueKind::Map: {
      Json object = Json::object();
      for (std::size_t i = 0; i < value.items.size(); ++i) {
        auto resolved = resolve_field(value.items[i], context, mode, item);
        if (!resolved) {
          return tl::unexpected(resolved.error());
        }
        object[value.keys[i]] = std::move(*resolved);
      }
      return object;
    }
  }
  return Json();
}

auto is_batch_shaped(const CompiledStep& step, const ExecutionContext& context) -> bool {
  std::vector<const Selector*> selectors;
  for (const auto& [_, value] : step.manifest.fields) {
    collect_selectors(value, selectors);
  }
  return std::any_of(selectors.begin(), selectors.end(), [&](const Selector* selector) {
    const auto* value = context.lookup(*selector);
    return value && value->is_batch();
  });
}

auto invoke(const StepRun& run, std::size_t item, const ExecutionContext& context, const RunContextView& view)
  -> Expected<BlockOutputs> {
  BlockInputs inputs;
  for (const auto& [field, value] : run.step->manifest.fields) {
    auto resolved = resolve_field(value, context, run.mode, item);
    if (!resolved) {
      return tl::unexpected(resolved.error());
    }
    inputs.emplace(field, std::move(*resolved));
  }
  try {
    return run.step->block->run(inputs, view);
  } catch (const std::exception& ex) {
    return tl::unexpected(block_error(ex.what()));
  } catch (...) {
    return tl::unexpected(block_error("unknown exception"));
  }
}

auto interrupted_by_abort(const EngineError& error, bool aborted) -> bool {
  return aborted && error.code == ErrorCode::Cancelled;
}

/// Lowest-item failure of a step, if any. Once the run is aborted, items
/// stopped by the abort rank after genuine failures.
auto first_error(const StepRun& run, bool aborted) -> const EngineError* {
  const EngineError* interrupted = nullptr;
  for (const auto& result : run.results) {
    if (!result || *result) {
      continue;
    }
    if (interrupted_by_abort(result->error(), aborted)) {
      if (!interrupted) {
        interrupted = &result->error();
      }
      continue;
    }
    return &result->error();
  }
  return interrupted;
}

auto output_value(const BlockOutputs& outputs, const std::string& name) -> Json {
  auto it = outputs.find(name);
  return it == outputs.end() ? Json() : it->second;
}

auto gather_outputs(const StepRun& run, std::size_t batch_size)
  -> Expected<std::unordered_map<std::string, BatchValue>> {
  std::unordered_map<std::string, BatchValue> committed;
  for (const auto& result : run.results) {
    if (!result) {
      return tl::unexpected(make_error(ErrorCode::UnresolvedValue,
                                       fmt::format("step '{}' did not complete", run.step->manifest.name)));
    }
  }

  for (const auto& output : run.step->outputs) {
    switch (run.mode) {
      case InvocationMode::Single: {
        committed.emplace(output.name, BatchValue::broadcast(output_value(**run.results.front(), output.name)));
        break;
      }
      case InvocationMode::PerItem: {
        std::vector<Json> items;
        items.reserve(run.results.size());
        for (const auto& result : run.results) {
          items.push_back(output_value(**result, output.name));
        }
        committed.emplace(output.name, BatchValue::batch(std::move(items)));
        break;
      }
      case InvocationMode::Batch: {
        const auto& produced = **run.results.front();
        if (!produced.contains(output.name)) {
          committed.emplace(output.name, BatchValue::batch(std::vector<Json>(batch_size)));
          break;
        }
        const auto& value = produced.at(output.name);
        if (!value.is_array() || value.size() != batch_size) {
          return tl::unexpected(make_step_error(
            run.step->manifest.name,
            fmt::format("output '{}' must be an array of {} items", output.name, batch_size)));
        }
        committed.emplace(output.name,
                          BatchValue::batch(std::vector<Json>(value.begin(), value.end())));
        break;
      }
    }
  }
  return committed;
}

auto upstream_failure(const CompiledStep& step, const std::set<std::string>& failed) -> const std::string* {
  for (const auto& producer : step.producer_step_names) {
    if (auto it = failed.find(producer); it != failed.end()) {
      return &*it;
    }
  }
  return nullptr;
}

auto collect_outputs(const CompiledPlan& plan, const ExecutionContext& context, const std::set<std::string>& failed)
  -> Expected<RunOutput> {
  RunOutput outputs;
  for (const auto& output : plan.outputs) {
    const auto& selector = output.selector;
    if (selector.scope == SelectorScope::StepOutput && failed.contains(selector.name)) {
      continue;
    }
    const auto* value = context.lookup(selector);
    if (!value) {
      return tl::unexpected(make_error(
        ErrorCode::UnresolvedValue,
        fmt::format("workflow output '{}' selector '{}' has no value", output.name, selector.raw)));
    }
    if (value->is_batch()) {
      Json items = Json::array();
      for (std::size_t i = 0; i < context.batch_size(); ++i) {
        items.push_back(apply_property(value->at(i), selector));
      }
      outputs.emplace(output.name, std::move(items));
    } else {
      outputs.emplace(output.name, apply_property(value->at(0), selector));
    }
  }
  return outputs;
}

}  // namespace

auto parse_failure_policy(std::string_view name) -> Expected<FailurePolicy> {
  if (name == "fail_fast") {
    return FailurePolicy::FailFast;
  }
  if (name == "isolate") {
    return FailurePolicy::Isolate;
  }
  return tl::unexpected(make_error(ErrorCode::InvalidInput, fmt::format("unknown failure policy: {}", name)));
}

auto failure_policy_name(FailurePolicy policy) -> std::string_view {
  switch (policy) {
    case FailurePolicy::FailFast:
      return "fail_fast";
    case FailurePolicy::Isolate:
      return "isolate";
  }
  return "fail_fast";
}

struct Executor::Pools {
  Pools(int threads, int limit)
      : threads(threads), limit(limit), pool(static_cast<std::size_t>(threads)), slots(limit) {}

  /// Releases an invocation slot on scope exit.
  struct SlotGuard {
    std::counting_semaphore<>& slots;
    ~SlotGuard() { slots.release(); }
  };

  /// Runs `fn(index)` for every index in [0, count) with at most `width`
  /// lanes, returning once all have finished. Every `fn` call holds one of
  /// the `limit` slots shared by all runs of the executor.
  template <typename F>
  auto parallel_for(std::size_t count, std::size_t width, F&& fn) -> void {
    if (count == 0) {
      return;
    }
    std::atomic<std::size_t> next{0};
    const std::size_t lanes = std::min(count, width);

    stdexec::sender auto sender =
      stdexec::schedule(pool.get_scheduler()) |
      stdexec::bulk(stdexec::par, lanes, [&](std::size_t) {
        for (auto index = next.fetch_add(1, std::memory_order_relaxed); index < count;
             index = next.fetch_add(1, std::memory_order_relaxed)) {
          slots.acquire();
          SlotGuard guard{slots};
          fn(index);
        }
      });
    stdexec::sync_wait(std::move(sender));
  }

  int threads = 0;
  int limit = 0;
  exec::static_thread_pool pool;
  std::counting_semaphore<> slots;
};

Executor::Executor(ExecutorConfig config) : config_(std::move(config)) {
  int threads = config_.worker_threads;
  if (threads <= 0) {
    threads = static_cast<int>(std::thread::hardware_concurrency());
    if (threads <= 0) {
      threads = 4;
    }
  }
  const int limit = config_.max_concurrency <= 0 ? threads : std::min(config_.max_concurrency, threads);
  pools_ = std::make_shared<Pools>(threads, limit);
}

Executor::~Executor() = default;

auto Executor::worker_threads() const -> int {
  return pools_->threads;
}

auto Executor::max_concurrency() const -> int {
  return pools_->limit;
}

auto Executor::run(const CompiledPlan& plan, const Json& inputs, RunContext& ctx) const -> Expected<RunResult> {
  const auto started = std::chrono::steady_clock::now();
  if (auto state = ctx.check(); !state) {
    return tl::unexpected(state.error());
  }

  auto bound = bind_inputs(plan, inputs);
  if (!bound) {
    return tl::unexpected(bound.error());
  }
  auto& context = *bound;
  const std::size_t batch_size = context.batch_size();
  const bool fail_fast = config_.failure_policy == FailurePolicy::FailFast;
  // Set by the first failure that ends the run; running siblings observe it
  // through the view and stop early.
  std::atomic<bool> aborted{false};
  const RunContextView view(ctx, &aborted);

  wf::log::debug("workflow run started: plan={} steps={} levels={} batch={}", plan.hash, plan.step_count(),
                 plan.levels.size(), batch_size);

  RunResult result;
  result.batch_size = batch_size;
  std::set<std::string> failed;

  auto record_failure = [&](const std::string& step, std::string message, bool skipped) {
    if (skipped) {
      wf::log::debug("workflow step skipped: step={} reason={}", step, message);
    } else {
      wf::log::warn("workflow step failed: step={} error={}", step, message);
    }
    failed.insert(step);
    result.failures.push_back(StepFailure{step, std::move(message), skipped});
  };

  for (const auto& level : plan.levels) {
    if (auto state = ctx.check(); !state) {
      return tl::unexpected(state.error());
    }

    std::vector<StepRun> runs;
    runs.reserve(level.size());
    for (const auto& step : level) {
      if (const auto* upstream = upstream_failure(step, failed)) {
        record_failure(step.manifest.name, fmt::format("upstream step '{}' failed", *upstream), true);
        continue;
      }
      StepRun run;
      run.step = &step;
      const bool batched = is_batch_shaped(step, context);
      if (step.manifest.declares_batch_input) {
        run.mode = batched ? InvocationMode::Batch : InvocationMode::Single;
      } else {
        run.mode = batched ? InvocationMode::PerItem : InvocationMode::Single;
      }
      run.results.resize(run.mode == InvocationMode::PerItem ? batch_size : 1);
      runs.push_back(std::move(run));
    }

    std::vector<Unit> units;
    for (std::size_t r = 0; r < runs.size(); ++r) {
      for (std::size_t item = 0; item < runs[r].results.size(); ++item) {
        units.push_back(Unit{r, item});
      }
    }

    pools_->parallel_for(units.size(), static_cast<std::size_t>(max_concurrency()), [&](std::size_t index) {
      if (aborted.load(std::memory_order_acquire) || ctx.should_stop()) {
        return;
      }
      const auto& unit = units[index];
      auto& run = runs[unit.run];
      auto outcome = invoke(run, unit.item, context, view);
      if (!outcome && (fail_fast || outcome.error().code == ErrorCode::UnresolvedValue) &&
          !interrupted_by_abort(outcome.error(), aborted.load(std::memory_order_acquire))) {
        aborted.store(true, std::memory_order_release);
      }
      run.results[unit.item] = std::move(outcome);
    });

    if (auto state = ctx.check(); !state) {
      return tl::unexpected(state.error());
    }

    const bool level_aborted = aborted.load(std::memory_order_acquire);
    const EngineError* interrupted = nullptr;
    std::vector<bool> step_failed(runs.size(), false);
    for (std::size_t r = 0; r < runs.size(); ++r) {
      const auto* error = first_error(runs[r], level_aborted);
      if (!error) {
        continue;
      }
      if (interrupted_by_abort(*error, level_aborted)) {
        if (!interrupted) {
          interrupted = error;
        }
        continue;
      }
      if (error->code == ErrorCode::UnresolvedValue || error->code == ErrorCode::Cancelled ||
          error->code == ErrorCode::DeadlineExceeded) {
        return tl::unexpected(*error);
      }
      const auto& name = runs[r].step->manifest.name;
      if (fail_fast) {
        wf::log::warn("workflow step failed: step={} error={}", name, error->message);
        return tl::unexpected(make_step_error(name, error->message));
      }
      record_failure(name, error->message, false);
      step_failed[r] = true;
    }
    if (level_aborted) {
      // Only reached when every failure in the level was itself a stop.
      return tl::unexpected(interrupted ? *interrupted
                                        : make_error(ErrorCode::Cancelled, "run aborted"));
    }

    for (std::size_t r = 0; r < runs.size(); ++r) {
      if (step_failed[r]) {
        continue;
      }
      auto outputs = gather_outputs(runs[r], batch_size);
      if (!outputs) {
        if (outputs.error().code != ErrorCode::StepExecution || fail_fast) {
          return tl::unexpected(outputs.error());
        }
        record_failure(runs[r].step->manifest.name, outputs.error().cause, false);
        continue;
      }
      context.commit_step(runs[r].step->manifest.name, std::move(*outputs));
    }
  }

  auto outputs = collect_outputs(plan, context, failed);
  if (!outputs) {
    return tl::unexpected(outputs.error());
  }
  result.outputs = std::move(*outputs);

  const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
  wf::log::debug("workflow run finished: plan={} outputs={} failures={} seconds={:.6f}", plan.hash,
                 result.outputs.size(), result.failures.size(), elapsed);

  if (config_.usage) {
    usage::UsageEvent event;
    event.category = "workflows";
    event.resource_id = plan.resource_id;
    event.api_key = ctx.api_key;
    event.frames = static_cast<std::int64_t>(batch_size);
    event.fps = elapsed > 0.0 ? static_cast<double>(batch_size) / elapsed : 0.0;
    event.source_duration = elapsed;
    try {
      config_.usage->record_usage(event);
    } catch (const std::exception& ex) {
      wf::log::warn("failed to record workflow usage: {}", ex.what());
    }
  }
  return result;
}

}  // namespace wf::engine
