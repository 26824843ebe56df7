#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "engine/error.hpp"
#include "engine/plan.hpp"
#include "engine/types.hpp"

namespace wf::usage {
class UsageCollector;
}

namespace wf::engine {

enum class FailurePolicy {
  /// First step failure aborts the run.
  FailFast,
  /// A failed step poisons only its transitive dependents; the run completes
  /// with partial outputs.
  Isolate,
};

auto parse_failure_policy(std::string_view name) -> Expected<FailurePolicy>;
auto failure_policy_name(FailurePolicy policy) -> std::string_view;

/// Workflow output name to value. Batch-shaped values are arrays with one entry
/// per batch item.
using RunOutput = std::map<std::string, Json>;

struct StepFailure {
  std::string step;
  std::string message;
  /// True when the step never ran because an upstream step failed.
  bool skipped = false;
};

struct RunResult {
  RunOutput outputs;
  std::vector<StepFailure> failures;
  std::size_t batch_size = 0;
};

struct ExecutorConfig {
  /// Pool threads; 0 uses hardware concurrency.
  int worker_threads = 0;
  /// Upper bound on simultaneously running block invocations; 0 uses the pool size.
  int max_concurrency = 0;
  FailurePolicy failure_policy = FailurePolicy::FailFast;
  std::shared_ptr<usage::UsageCollector> usage;
};

/// Runs compiled plans level by level on a shared thread pool. One executor
/// serves any number of concurrent runs.
class Executor {
 public:
  explicit Executor(ExecutorConfig config = {});
  ~Executor();

  Executor(const Executor&) = default;
  Executor(Executor&&) noexcept = default;
  auto operator=(const Executor&) -> Executor& = default;
  auto operator=(Executor&&) noexcept -> Executor& = default;

  auto run(const CompiledPlan& plan, const Json& inputs, RunContext& ctx) const -> Expected<RunResult>;

  auto config() const -> const ExecutorConfig& { return config_; }
  auto worker_threads() const -> int;
  auto max_concurrency() const -> int;

 private:
  struct Pools;
  ExecutorConfig config_;
  std::shared_ptr<Pools> pools_;
};

}  // namespace wf::engine
