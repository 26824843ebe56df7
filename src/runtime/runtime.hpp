#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

#include "engine/error.hpp"
#include "engine/plan_store.hpp"
#include "engine/registry.hpp"
#include "runtime/executor.hpp"
#include "runtime/spec_source.hpp"
#include "usage/usage_collector.hpp"

namespace wf::engine {

/// Configuration for the runtime facade.
struct RuntimeConfig {
  /// Executor threads, concurrency bound and failure policy.
  ExecutorConfig executor;
  /// Compiled plan cache retention.
  PlanStoreConfig store;
  /// Usage telemetry; disabled when unset or when no sender is supplied.
  std::optional<usage::UsageCollectorConfig> usage;
  /// Root of the remote specification cache.
  std::filesystem::path cache_dir;
};

/// Collaborators supplied by the embedding application.
struct RuntimeServices {
  std::shared_ptr<usage::UsageSender> usage_sender;
  std::shared_ptr<SpecTransport> spec_transport;
};

/// Builds a RuntimeConfig from the --workflow_* and --usage_* flags.
auto runtime_config_from_flags() -> Expected<RuntimeConfig>;

/// High-level facade that owns the block registry, plan store, executor and
/// the optional telemetry and remote specification collaborators.
class Runtime {
 public:
  explicit Runtime(RuntimeConfig config = {}, RuntimeServices services = {});
  /// Stops the usage collector after a final flush.
  ~Runtime();

  Runtime(const Runtime&) = delete;
  auto operator=(const Runtime&) -> Runtime& = delete;

  /// Register blocks here before compiling.
  auto registry() -> BlockRegistry&;
  auto registry() const -> const BlockRegistry&;

  /// Compile a specification document, reusing the cached plan when unchanged.
  auto compile(const Json& specification) -> Expected<std::shared_ptr<const PlanSnapshot>>;
  /// Cached plan by specification hash.
  auto resolve(std::string_view hash) const -> std::shared_ptr<const PlanSnapshot>;
  auto evict(std::string_view hash) -> bool;

  /// Execute a compiled plan.
  auto run(const std::shared_ptr<const PlanSnapshot>& snapshot, const Json& inputs, RunContext& ctx) const
    -> Expected<RunResult>;
  /// Compile (or reuse) and execute a specification document.
  auto run_json(const Json& specification, const Json& inputs, RunContext& ctx) -> Expected<RunResult>;
  /// Fetch a specification through the spec source, then compile and execute it.
  auto run_remote(std::string_view workspace_id, std::string_view workflow_id, const Json& inputs, RunContext& ctx)
    -> Expected<RunResult>;

  auto executor() const -> const Executor&;
  auto plan_store() -> PlanStore&;
  auto usage_collector() const -> std::shared_ptr<usage::UsageCollector>;
  auto spec_source() -> WorkflowSpecSource*;

 private:
  BlockRegistry registry_;
  PlanStore store_;
  std::shared_ptr<usage::UsageCollector> usage_;
  std::unique_ptr<WorkflowSpecSource> spec_source_;
  Executor executor_;
};

}  // namespace wf::engine
