#include "usage/usage_payload.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace wf::usage {
namespace {

auto min_set(std::int64_t lhs, std::int64_t rhs) -> std::int64_t {
  if (lhs == 0) {
    return rhs;
  }
  if (rhs == 0) {
    return lhs;
  }
  return std::min(lhs, rhs);
}

auto min_non_empty(const std::string& lhs, const std::string& rhs) -> const std::string& {
  if (lhs.empty()) {
    return rhs;
  }
  if (rhs.empty()) {
    return lhs;
  }
  return std::min(lhs, rhs);
}

}  // namespace

auto merge_records(const UsageRecord& lhs, const UsageRecord& rhs) -> Expected<UsageRecord> {
  if (lhs.api_key != rhs.api_key || lhs.category != rhs.category || lhs.resource_id != rhs.resource_id) {
    return tl::unexpected(engine::make_error(
      engine::ErrorCode::InvalidInput,
      fmt::format("cannot merge usage for different resources: {} vs {}", lhs.key(), rhs.key())));
  }

  UsageRecord merged = lhs;
  merged.timestamp_start = min_set(lhs.timestamp_start, rhs.timestamp_start);
  merged.timestamp_stop = std::max(lhs.timestamp_stop, rhs.timestamp_stop);
  merged.processed_frames = lhs.processed_frames + rhs.processed_frames;
  merged.source_duration = lhs.source_duration + rhs.source_duration;
  if (lhs.timestamp_stop != rhs.timestamp_stop) {
    merged.fps = lhs.timestamp_stop > rhs.timestamp_stop ? lhs.fps : rhs.fps;
  } else {
    merged.fps = std::max(lhs.fps, rhs.fps);
  }
  merged.exec_session_id = min_non_empty(lhs.exec_session_id, rhs.exec_session_id);
  merged.enterprise = lhs.enterprise || rhs.enterprise;
  merged.hosted = lhs.hosted || rhs.hosted;
  return merged;
}

auto merge_into(UsagePayload& target, const UsagePayload& source) -> void {
  for (const auto& [api_key, resources] : source) {
    auto& target_resources = target[api_key];
    for (const auto& [key, record] : resources) {
      auto it = target_resources.find(key);
      if (it == target_resources.end()) {
        target_resources.emplace(key, record);
        continue;
      }
      // records under the same api key and grouping key always share their identity
      auto merged = merge_records(it->second, record);
      if (merged) {
        it->second = std::move(*merged);
      }
    }
  }
}

auto merge_payloads(const std::vector<UsagePayload>& payloads) -> UsagePayload {
  UsagePayload merged;
  for (const auto& payload : payloads) {
    merge_into(merged, payload);
  }
  return merged;
}

auto payload_record_count(const UsagePayload& payload) -> std::size_t {
  std::size_t count = 0;
  for (const auto& [_, resources] : payload) {
    count += resources.size();
  }
  return count;
}

auto to_json(const UsageRecord& record) -> Json {
  return Json{
    {"api_key", record.api_key},
    {"category", record.category},
    {"resource_id", record.resource_id},
    {"timestamp_start", record.timestamp_start},
    {"timestamp_stop", record.timestamp_stop},
    {"processed_frames", record.processed_frames},
    {"fps", record.fps},
    {"source_duration", record.source_duration},
    {"exec_session_id", record.exec_session_id},
    {"enterprise", record.enterprise},
    {"hosted", record.hosted},
  };
}

}  // namespace wf::usage
