#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "usage/usage_payload.hpp"

namespace wf::usage {

/// Delivers usage records for one api key. Implementations may block; they are
/// only called from the collector's sender worker or a synchronous flush.
class UsageSender {
 public:
  virtual ~UsageSender() = default;
  virtual auto send(const std::string& api_key, const std::vector<UsageRecord>& records) -> Expected<void> = 0;
};

struct UsageCollectorConfig {
  /// Payloads held before the queue is collapsed into one merged payload.
  std::size_t queue_size = 10;
  std::chrono::milliseconds flush_interval{10000};
  bool opt_out = false;
  /// Used when an event carries no api key.
  std::string default_api_key;
  bool hosted = false;
  /// Start the collector and sender workers. Tests drive flushing manually.
  bool start_workers = true;
};

struct UsageEvent {
  std::string category;
  std::string resource_id;
  std::string api_key;
  std::int64_t frames = 1;
  double fps = 0.0;
  /// Seconds of source material represented by the frames; derived from fps when zero.
  double source_duration = 0.0;
  bool enterprise = false;
};

/// Process-scoped usage aggregator. Events accumulate in memory, the collector
/// worker moves them into a bounded payload queue every flush interval and the
/// sender worker merges queued payloads and hands them to the sender.
class UsageCollector {
 public:
  UsageCollector(UsageCollectorConfig config, std::shared_ptr<UsageSender> sender);
  ~UsageCollector();

  UsageCollector(const UsageCollector&) = delete;
  auto operator=(const UsageCollector&) -> UsageCollector& = delete;

  auto record_usage(const UsageEvent& event) -> void;

  /// Moves in-memory usage into the queue and sends everything queued.
  auto push_usage_payloads() -> void;

  /// Final collect and flush, then stops and joins both workers. Idempotent.
  auto shutdown() -> void;

  auto queued_payloads() const -> std::size_t;
  /// Snapshot of usage not yet moved into the queue.
  auto pending_usage() const -> UsagePayload;
  auto exec_session_id() const -> const std::string& { return exec_session_id_; }

 private:
  auto enqueue_payload(UsagePayload payload) -> void;
  auto collect() -> void;
  auto flush() -> void;
  auto collector_loop() -> void;
  auto sender_loop() -> void;
  auto wait_for(std::chrono::milliseconds interval) -> bool;

  UsageCollectorConfig config_;
  std::shared_ptr<UsageSender> sender_;
  std::string exec_session_id_;

  mutable std::mutex usage_mutex_;
  UsagePayload usage_;

  mutable std::mutex queue_mutex_;
  std::deque<UsagePayload> queue_;

  std::mutex flush_mutex_;

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stopping_ = false;
  bool stopped_ = false;

  std::thread collector_;
  std::thread sender_thread_;
};

/// Current wall-clock time in nanoseconds since epoch.
auto now_ns() -> std::int64_t;

}  // namespace wf::usage
