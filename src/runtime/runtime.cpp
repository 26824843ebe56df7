#include "runtime/runtime.hpp"

#include <utility>

#include "common/logging/log.hpp"

namespace wf::engine {
namespace {

auto make_usage_collector(const RuntimeConfig& config, const RuntimeServices& services)
  -> std::shared_ptr<usage::UsageCollector> {
  if (!config.usage || !services.usage_sender) {
    return {};
  }
  return std::make_shared<usage::UsageCollector>(*config.usage, services.usage_sender);
}

auto with_usage(ExecutorConfig config, std::shared_ptr<usage::UsageCollector> usage) -> ExecutorConfig {
  if (usage) {
    config.usage = std::move(usage);
  }
  return config;
}

}  // namespace

Runtime::Runtime(RuntimeConfig config, RuntimeServices services)
    : store_(config.store),
      usage_(make_usage_collector(config, services)),
      executor_(with_usage(config.executor, usage_)) {
  wf::log::init();
  if (services.spec_transport) {
    spec_source_ = std::make_unique<WorkflowSpecSource>(std::move(services.spec_transport),
                                                        SpecSourceConfig{config.cache_dir});
  }
  wf::log::debug("runtime started: threads={} max_concurrency={} failure_policy={} usage={}",
                 executor_.worker_threads(), executor_.max_concurrency(),
                 failure_policy_name(config.executor.failure_policy), usage_ != nullptr);
}

Runtime::~Runtime() {
  if (usage_) {
    usage_->shutdown();
  }
}

auto Runtime::registry() -> BlockRegistry& {
  return registry_;
}

auto Runtime::registry() const -> const BlockRegistry& {
  return registry_;
}

auto Runtime::compile(const Json& specification) -> Expected<std::shared_ptr<const PlanSnapshot>> {
  return store_.compile(specification, registry_);
}

auto Runtime::resolve(std::string_view hash) const -> std::shared_ptr<const PlanSnapshot> {
  return store_.resolve(hash);
}

auto Runtime::evict(std::string_view hash) -> bool {
  return store_.evict(hash);
}

auto Runtime::run(const std::shared_ptr<const PlanSnapshot>& snapshot, const Json& inputs, RunContext& ctx) const
  -> Expected<RunResult> {
  if (!snapshot) {
    return tl::unexpected(make_error(ErrorCode::InvalidSpecification, "plan snapshot is null"));
  }
  return executor_.run(snapshot->plan, inputs, ctx);
}

auto Runtime::run_json(const Json& specification, const Json& inputs, RunContext& ctx) -> Expected<RunResult> {
  auto snapshot = compile(specification);
  if (!snapshot) {
    return tl::unexpected(snapshot.error());
  }
  return run(*snapshot, inputs, ctx);
}

auto Runtime::run_remote(std::string_view workspace_id, std::string_view workflow_id, const Json& inputs,
                         RunContext& ctx) -> Expected<RunResult> {
  if (!spec_source_) {
    return tl::unexpected(make_error(ErrorCode::Transport, "no workflow specification source configured"));
  }
  auto specification = spec_source_->get_specification(ctx.api_key, workspace_id, workflow_id);
  if (!specification) {
    return tl::unexpected(specification.error());
  }
  return run_json(*specification, inputs, ctx);
}

auto Runtime::executor() const -> const Executor& {
  return executor_;
}

auto Runtime::plan_store() -> PlanStore& {
  return store_;
}

auto Runtime::usage_collector() const -> std::shared_ptr<usage::UsageCollector> {
  return usage_;
}

auto Runtime::spec_source() -> WorkflowSpecSource* {
  return spec_source_.get();
}

}  // namespace wf::engine
