#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "test_support.hpp"
#include "usage/usage_collector.hpp"
#include "usage/usage_payload.hpp"

using wf::usage::UsageCollector;
using wf::usage::UsageCollectorConfig;
using wf::usage::UsageEvent;
using wf::usage::UsagePayload;
using wf::usage::UsageRecord;

namespace {

/// Records every send; fails while `failing` is set.
class RecordingSender final : public wf::usage::UsageSender {
 public:
  struct Batch {
    std::string api_key;
    std::vector<UsageRecord> records;
  };

  auto send(const std::string& api_key, const std::vector<UsageRecord>& records)
    -> wf::engine::Expected<void> override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++attempts_;
    if (failing_) {
      return tl::unexpected(wf::engine::make_error(wf::engine::ErrorCode::Transport, "usage endpoint down"));
    }
    batches_.push_back(Batch{api_key, records});
    return {};
  }

  auto set_failing(bool failing) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_ = failing;
  }

  auto batches() const -> std::vector<Batch> {
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_;
  }

  auto attempts() const -> int {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
  }

  auto total_frames() const -> std::int64_t {
    std::int64_t frames = 0;
    for (const auto& batch : batches()) {
      for (const auto& record : batch.records) {
        frames += record.processed_frames;
      }
    }
    return frames;
  }

 private:
  mutable std::mutex mutex_;
  bool failing_ = false;
  int attempts_ = 0;
  std::vector<Batch> batches_;
};

auto record(std::int64_t start, std::int64_t stop, std::int64_t frames, double fps, std::string session = "s1")
  -> UsageRecord {
  UsageRecord usage;
  usage.api_key = "key";
  usage.category = "workflows";
  usage.resource_id = "r1";
  usage.timestamp_start = start;
  usage.timestamp_stop = stop;
  usage.processed_frames = frames;
  usage.fps = fps;
  usage.source_duration = static_cast<double>(frames);
  usage.exec_session_id = std::move(session);
  return usage;
}

auto manual_config() -> UsageCollectorConfig {
  UsageCollectorConfig config;
  config.start_workers = false;
  config.default_api_key = "default-key";
  return config;
}

auto event(const std::string& resource, std::int64_t frames = 1, const std::string& api_key = "key") -> UsageEvent {
  UsageEvent usage;
  usage.category = "workflows";
  usage.resource_id = resource;
  usage.api_key = api_key;
  usage.frames = frames;
  usage.fps = 10.0;
  return usage;
}

auto same_record(const UsageRecord& lhs, const UsageRecord& rhs) -> bool {
  return wf::usage::to_json(lhs) == wf::usage::to_json(rhs);
}

}  // namespace

TEST(UsagePayload, MergeIsCommutativeAndAssociative) {
  auto a = record(100, 200, 2, 5.0, "s2");
  auto b = record(50, 300, 3, 7.0, "s1");
  auto c = record(0, 250, 1, 9.0, "");

  auto ab = wf::usage::merge_records(a, b);
  auto ba = wf::usage::merge_records(b, a);
  ASSERT_TRUE(ab);
  ASSERT_TRUE(ba);
  EXPECT_TRUE(same_record(*ab, *ba));

  auto ab_c = wf::usage::merge_records(*ab, c);
  auto bc = wf::usage::merge_records(b, c);
  ASSERT_TRUE(bc);
  auto a_bc = wf::usage::merge_records(a, *bc);
  ASSERT_TRUE(ab_c);
  ASSERT_TRUE(a_bc);
  EXPECT_TRUE(same_record(*ab_c, *a_bc));

  EXPECT_EQ(ab_c->timestamp_start, 50);
  EXPECT_EQ(ab_c->timestamp_stop, 300);
  EXPECT_EQ(ab_c->processed_frames, 6);
  EXPECT_DOUBLE_EQ(ab_c->source_duration, 6.0);
  EXPECT_DOUBLE_EQ(ab_c->fps, 7.0);
  EXPECT_EQ(ab_c->exec_session_id, "s1");
}

TEST(UsagePayload, EqualStopsKeepTheHigherFps) {
  auto merged = wf::usage::merge_records(record(1, 10, 1, 3.0), record(2, 10, 1, 4.5));
  ASSERT_TRUE(merged);
  EXPECT_DOUBLE_EQ(merged->fps, 4.5);
}

TEST(UsagePayload, RefusesToMergeDifferentResources) {
  auto other = record(1, 2, 1, 1.0);
  other.resource_id = "r2";
  auto merged = wf::usage::merge_records(record(1, 2, 1, 1.0), other);
  ASSERT_FALSE(merged);
  EXPECT_EQ(merged.error().code, wf::engine::ErrorCode::InvalidInput);
  EXPECT_NE(merged.error().message.find("workflows:r2"), std::string::npos);
}

TEST(UsagePayload, PayloadMergeIgnoresOrder) {
  UsagePayload first;
  first["key"]["workflows:r1"] = record(10, 20, 1, 1.0);
  UsagePayload second;
  second["key"]["workflows:r1"] = record(5, 30, 2, 2.0);
  auto other = record(1, 2, 4, 3.0);
  other.api_key = "other";
  second["other"]["workflows:r1"] = other;

  auto forward = wf::usage::merge_payloads({first, second});
  auto backward = wf::usage::merge_payloads({second, first});
  EXPECT_EQ(wf::usage::payload_record_count(forward), 2u);
  ASSERT_EQ(forward.size(), backward.size());
  EXPECT_TRUE(same_record(forward["key"]["workflows:r1"], backward["key"]["workflows:r1"]));
  EXPECT_EQ(forward["key"]["workflows:r1"].processed_frames, 3);
  EXPECT_EQ(forward["other"]["workflows:r1"].processed_frames, 4);
}

TEST(UsageCollector, AggregatesEventsPerResource) {
  auto sender = std::make_shared<RecordingSender>();
  UsageCollector collector(manual_config(), sender);
  collector.record_usage(event("r1", 2));
  collector.record_usage(event("r1", 3));
  collector.record_usage(event("r2"));
  collector.record_usage(event("r1", 1, ""));

  auto pending = collector.pending_usage();
  ASSERT_EQ(wf::usage::payload_record_count(pending), 3u);
  const auto& r1 = pending.at("key").at("workflows:r1");
  EXPECT_EQ(r1.processed_frames, 5);
  EXPECT_DOUBLE_EQ(r1.source_duration, 0.5);
  EXPECT_EQ(r1.exec_session_id, collector.exec_session_id());
  EXPECT_LE(r1.timestamp_start, r1.timestamp_stop);
  EXPECT_TRUE(pending.contains("default-key"));

  collector.push_usage_payloads();
  EXPECT_TRUE(collector.pending_usage().empty());
  EXPECT_EQ(collector.queued_payloads(), 0u);
  EXPECT_EQ(sender->batches().size(), 2u);
  EXPECT_EQ(sender->total_frames(), 7);
}

TEST(UsageCollector, RoundsFpsToTwoDecimals) {
  UsageCollector collector(manual_config(), std::make_shared<RecordingSender>());
  auto usage = event("r1");
  usage.fps = 12.3456;
  usage.source_duration = 0.25;
  collector.record_usage(usage);
  const auto& record = collector.pending_usage().at("key").at("workflows:r1");
  EXPECT_DOUBLE_EQ(record.fps, 12.35);
  EXPECT_DOUBLE_EQ(record.source_duration, 0.25);
}

TEST(UsageCollector, OptOutStillRecordsEnterpriseUsage) {
  auto config = manual_config();
  config.opt_out = true;
  UsageCollector collector(config, std::make_shared<RecordingSender>());
  collector.record_usage(event("r1"));
  EXPECT_TRUE(collector.pending_usage().empty());

  auto enterprise = event("r1");
  enterprise.enterprise = true;
  collector.record_usage(enterprise);
  auto pending = collector.pending_usage();
  ASSERT_EQ(wf::usage::payload_record_count(pending), 1u);
  EXPECT_TRUE(pending.at("key").at("workflows:r1").enterprise);
}

TEST(UsageCollector, FailedSendsAreRetriedWithoutLoss) {
  auto sender = std::make_shared<RecordingSender>();
  UsageCollector collector(manual_config(), sender);
  sender->set_failing(true);

  collector.record_usage(event("r1", 2));
  collector.push_usage_payloads();
  collector.record_usage(event("r1", 3));
  collector.push_usage_payloads();
  EXPECT_EQ(collector.queued_payloads(), 1u);
  EXPECT_TRUE(sender->batches().empty());
  EXPECT_GE(sender->attempts(), 2);

  sender->set_failing(false);
  collector.push_usage_payloads();
  EXPECT_EQ(collector.queued_payloads(), 0u);
  auto batches = sender->batches();
  ASSERT_EQ(batches.size(), 1u);
  ASSERT_EQ(batches[0].records.size(), 1u);
  EXPECT_EQ(batches[0].records[0].processed_frames, 5);
}

TEST(UsageCollector, WorkersFlushPeriodically) {
  auto sender = std::make_shared<RecordingSender>();
  UsageCollectorConfig config;
  config.flush_interval = std::chrono::milliseconds(20);
  UsageCollector collector(config, sender);
  collector.record_usage(event("r1", 4));

  EXPECT_TRUE(wf::test::wait_for_condition([&] { return sender->total_frames() == 4; },
                                           std::chrono::milliseconds(2000)));
  collector.shutdown();
}

TEST(UsageCollector, ShutdownFlushesEverything) {
  auto sender = std::make_shared<RecordingSender>();
  UsageCollectorConfig config;
  config.flush_interval = std::chrono::hours(1);
  UsageCollector collector(config, sender);
  collector.record_usage(event("r1", 2));
  collector.record_usage(event("r2", 1, "second-key"));

  collector.shutdown();
  EXPECT_EQ(sender->total_frames(), 3);
  EXPECT_EQ(sender->batches().size(), 2u);

  collector.shutdown();
  EXPECT_EQ(sender->batches().size(), 2u);
}
