#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace wf::usage {

using engine::Expected;
using engine::Json;

/// Aggregated usage of one resource by one api key.
struct UsageRecord {
  std::string api_key;
  std::string category;
  std::string resource_id;
  /// Nanoseconds since epoch; 0 means unset.
  std::int64_t timestamp_start = 0;
  std::int64_t timestamp_stop = 0;
  std::int64_t processed_frames = 0;
  double fps = 0.0;
  double source_duration = 0.0;
  std::string exec_session_id;
  bool enterprise = false;
  bool hosted = false;

  /// "category:resource_id", the per-api-key grouping key.
  auto key() const -> std::string { return category + ":" + resource_id; }
};

/// "category:resource_id" to record.
using ResourceUsage = std::map<std::string, UsageRecord>;
/// api key to its resource usage.
using UsagePayload = std::map<std::string, ResourceUsage>;

/// Associative and commutative merge of two records sharing (api_key, category, resource_id):
/// earliest start, latest stop, summed counters, fps of the later stop (max on ties).
auto merge_records(const UsageRecord& lhs, const UsageRecord& rhs) -> Expected<UsageRecord>;

/// Folds `source` into `target`, merging records with equal keys.
auto merge_into(UsagePayload& target, const UsagePayload& source) -> void;

/// Merges any number of payloads; the result does not depend on their order.
auto merge_payloads(const std::vector<UsagePayload>& payloads) -> UsagePayload;

auto payload_record_count(const UsagePayload& payload) -> std::size_t;

auto to_json(const UsageRecord& record) -> Json;

}  // namespace wf::usage
