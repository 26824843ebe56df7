#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "engine/error.hpp"
#include "engine/plan.hpp"
#include "engine/registry.hpp"

namespace wf::engine {

struct PlanSnapshot {
  std::string hash;
  CompiledPlan plan;
  std::chrono::system_clock::time_point compiled_at;
  /// Insertion order, used for retention.
  std::uint64_t sequence = 0;
};

struct PlanStoreConfig {
  /// Maximum cached plans; 0 keeps every plan.
  std::size_t max_plans = 64;
};

/// Compiled plan cache keyed by the specification hash.
class PlanStore {
 public:
  explicit PlanStore(PlanStoreConfig config = {});

  /// Returns the cached plan for an unchanged specification, otherwise compiles and caches it.
  auto compile(const Json& specification, const BlockRegistry& registry)
    -> Expected<std::shared_ptr<const PlanSnapshot>>;

  auto resolve(std::string_view hash) const -> std::shared_ptr<const PlanSnapshot>;
  auto evict(std::string_view hash) -> bool;
  auto size() const -> std::size_t;
  /// Cached hashes, oldest first.
  auto hashes() const -> std::vector<std::string>;

 private:
  auto enforce_retention() -> void;

  PlanStoreConfig config_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const PlanSnapshot>> entries_;
  std::uint64_t next_sequence_ = 0;
};

}  // namespace wf::engine
