#include "engine/plan_store.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

#include "common/logging/log.hpp"
#include "engine/hash.hpp"

namespace wf::engine {
namespace {

auto oldest_first(const std::unordered_map<std::string, std::shared_ptr<const PlanSnapshot>>& entries)
  -> std::vector<std::shared_ptr<const PlanSnapshot>> {
  std::vector<std::shared_ptr<const PlanSnapshot>> snapshots;
  snapshots.reserve(entries.size());
  for (const auto& [_, snapshot] : entries) {
    snapshots.push_back(snapshot);
  }
  std::sort(snapshots.begin(), snapshots.end(),
            [](const auto& lhs, const auto& rhs) { return lhs->sequence < rhs->sequence; });
  return snapshots;
}

}  // namespace

PlanStore::PlanStore(PlanStoreConfig config) : config_(config) {}

auto PlanStore::compile(const Json& specification, const BlockRegistry& registry)
  -> Expected<std::shared_ptr<const PlanSnapshot>> {
  auto hashed = hash_json(specification);
  if (!hashed) {
    return tl::unexpected(hashed.error());
  }
  const auto& hash = *hashed;
  if (auto cached = resolve(hash)) {
    return cached;
  }

  auto plan = compile_plan_json(specification, registry);
  if (!plan) {
    return tl::unexpected(plan.error());
  }

  auto snapshot = std::make_shared<PlanSnapshot>();
  snapshot->hash = hash;
  snapshot->plan = std::move(*plan);
  snapshot->compiled_at = std::chrono::system_clock::now();

  std::unique_lock lock(mutex_);
  // another caller may have compiled the same specification meanwhile
  if (auto existing = entries_.find(hash); existing != entries_.end()) {
    return existing->second;
  }
  snapshot->sequence = next_sequence_++;
  std::shared_ptr<const PlanSnapshot> stored = snapshot;
  entries_.emplace(hash, stored);
  enforce_retention();
  return stored;
}

auto PlanStore::resolve(std::string_view hash) const -> std::shared_ptr<const PlanSnapshot> {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(std::string(hash));
  if (it == entries_.end()) {
    return {};
  }
  return it->second;
}

auto PlanStore::evict(std::string_view hash) -> bool {
  std::unique_lock lock(mutex_);
  return entries_.erase(std::string(hash)) > 0;
}

auto PlanStore::size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

auto PlanStore::hashes() const -> std::vector<std::string> {
  std::shared_lock lock(mutex_);
  std::vector<std::string> result;
  for (const auto& snapshot : oldest_first(entries_)) {
    result.push_back(snapshot->hash);
  }
  return result;
}

auto PlanStore::enforce_retention() -> void {
  if (config_.max_plans == 0 || entries_.size() <= config_.max_plans) {
    return;
  }
  for (const auto& snapshot : oldest_first(entries_)) {
    if (entries_.size() <= config_.max_plans) {
      break;
    }
    wf::log::debug("evicting compiled plan: hash={}", snapshot->hash);
    entries_.erase(snapshot->hash);
  }
}

}  // namespace wf::engine
