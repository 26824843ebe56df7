#include <chrono>

#include <gflags/gflags.h>

#include "runtime/runtime.hpp"

DEFINE_int32(workflow_threads, 0, "Executor pool threads (0 uses hardware concurrency)");
DEFINE_int32(workflow_max_concurrency, 0, "Max concurrently running block invocations (0 uses the pool size)");
DEFINE_string(workflow_failure_policy, "fail_fast", "Step failure policy (fail_fast, isolate)");
DEFINE_string(workflow_cache_dir, "/tmp/wf_engine/cache", "Directory for cached remote workflow specifications");
DEFINE_int32(workflow_plan_cache_size, 64, "Compiled plans kept in the plan store (0 is unbounded)");
DEFINE_int32(usage_queue_size, 10, "Usage payloads queued before they are merged");
DEFINE_int32(usage_flush_interval_ms, 10000, "Usage collection and send interval in milliseconds");
DEFINE_bool(usage_opt_out, false, "Disable usage recording (enterprise usage is still recorded)");

namespace wf::engine {

auto runtime_config_from_flags() -> Expected<RuntimeConfig> {
  auto policy = parse_failure_policy(FLAGS_workflow_failure_policy);
  if (!policy) {
    return tl::unexpected(policy.error());
  }

  RuntimeConfig config;
  config.executor.worker_threads = FLAGS_workflow_threads;
  config.executor.max_concurrency = FLAGS_workflow_max_concurrency;
  config.executor.failure_policy = *policy;
  config.store.max_plans =
    FLAGS_workflow_plan_cache_size > 0 ? static_cast<std::size_t>(FLAGS_workflow_plan_cache_size) : 0;
  config.cache_dir = FLAGS_workflow_cache_dir;

  usage::UsageCollectorConfig usage;
  usage.queue_size = FLAGS_usage_queue_size > 0 ? static_cast<std::size_t>(FLAGS_usage_queue_size) : 1;
  usage.flush_interval = std::chrono::milliseconds(FLAGS_usage_flush_interval_ms);
  usage.opt_out = FLAGS_usage_opt_out;
  config.usage = usage;
  return config;
}

}  // namespace wf::engine
