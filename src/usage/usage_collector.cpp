#include "usage/usage_collector.hpp"

#include <cmath>
#include <exception>
#include <random>
#include <utility>

#include <fmt/format.h>

#include "common/logging/log.hpp"

namespace wf::usage {
namespace {

auto new_session_id() -> std::string {
  std::random_device device;
  std::mt19937_64 generator(device());
  return fmt::format("{:016x}", generator());
}

auto round_fps(double fps) -> double {
  return std::round(fps * 100.0) / 100.0;
}

}  // namespace

auto now_ns() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now().time_since_epoch())
    .count();
}

UsageCollector::UsageCollector(UsageCollectorConfig config, std::shared_ptr<UsageSender> sender)
    : config_(std::move(config)), sender_(std::move(sender)), exec_session_id_(new_session_id()) {
  if (config_.queue_size == 0) {
    config_.queue_size = 1;
  }
  if (config_.start_workers) {
    collector_ = std::thread([this]() { collector_loop(); });
    sender_thread_ = std::thread([this]() { sender_loop(); });
  }
}

UsageCollector::~UsageCollector() {
  shutdown();
}

auto UsageCollector::record_usage(const UsageEvent& event) -> void {
  if (config_.opt_out && !event.enterprise) {
    return;
  }
  const std::string& api_key = event.api_key.empty() ? config_.default_api_key : event.api_key;
  const auto now = now_ns();

  std::lock_guard<std::mutex> lock(usage_mutex_);
  auto& record = usage_[api_key][event.category + ":" + event.resource_id];
  if (record.timestamp_start == 0) {
    record.timestamp_start = now;
  }
  record.timestamp_stop = now;
  record.processed_frames += event.frames;
  record.fps = round_fps(event.fps);
  if (event.source_duration > 0.0) {
    record.source_duration += event.source_duration;
  } else if (event.fps > 0.0) {
    record.source_duration += static_cast<double>(event.frames) / event.fps;
  }
  record.api_key = api_key;
  record.category = event.category;
  record.resource_id = event.resource_id;
  record.exec_session_id = exec_session_id_;
  record.enterprise = record.enterprise || event.enterprise;
  record.hosted = config_.hosted;
}

auto UsageCollector::enqueue_payload(UsagePayload payload) -> void {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  if (queue_.size() < config_.queue_size) {
    queue_.push_back(std::move(payload));
    return;
  }
  std::vector<UsagePayload> drained(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
  drained.push_back(std::move(payload));
  queue_.clear();
  queue_.push_back(merge_payloads(drained));
}

auto UsageCollector::collect() -> void {
  UsagePayload payload;
  {
    std::lock_guard<std::mutex> lock(usage_mutex_);
    if (usage_.empty()) {
      return;
    }
    payload.swap(usage_);
  }
  enqueue_payload(std::move(payload));
}

auto UsageCollector::flush() -> void {
  std::lock_guard<std::mutex> flush_lock(flush_mutex_);
  std::vector<UsagePayload> drained;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    drained.assign(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
    queue_.clear();
  }
  if (drained.empty()) {
    return;
  }

  auto merged = merge_payloads(drained);
  UsagePayload failed;
  for (auto& [api_key, resources] : merged) {
    std::vector<UsageRecord> records;
    records.reserve(resources.size());
    for (const auto& [_, record] : resources) {
      records.push_back(record);
    }

    bool sent = false;
    if (sender_) {
      try {
        auto result = sender_->send(api_key, records);
        if (result) {
          sent = true;
        } else {
          wf::log::debug("usage send failed for {} records: {}", records.size(), result.error().message);
        }
      } catch (const std::exception& ex) {
        wf::log::debug("usage send threw for {} records: {}", records.size(), ex.what());
      }
    }
    if (!sent) {
      failed.emplace(api_key, std::move(resources));
    }
  }

  if (!failed.empty()) {
    enqueue_payload(std::move(failed));
  }
}

auto UsageCollector::push_usage_payloads() -> void {
  collect();
  flush();
}

auto UsageCollector::wait_for(std::chrono::milliseconds interval) -> bool {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  return stop_cv_.wait_for(lock, interval, [this]() { return stopping_; });
}

auto UsageCollector::collector_loop() -> void {
  while (!wait_for(config_.flush_interval)) {
    collect();
  }
  collect();
}

auto UsageCollector::sender_loop() -> void {
  while (!wait_for(config_.flush_interval)) {
    flush();
  }
}

auto UsageCollector::shutdown() -> void {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (stopped_) {
      return;
    }
    stopping_ = true;
    stopped_ = true;
  }
  stop_cv_.notify_all();
  if (collector_.joinable()) {
    collector_.join();
  }
  if (sender_thread_.joinable()) {
    sender_thread_.join();
  }
  collect();
  flush();

  auto leftover = queued_payloads();
  if (leftover > 0) {
    wf::log::debug("usage collector stopped with {} undelivered payloads", leftover);
  }
}

auto UsageCollector::queued_payloads() const -> std::size_t {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return queue_.size();
}

auto UsageCollector::pending_usage() const -> UsagePayload {
  std::lock_guard<std::mutex> lock(usage_mutex_);
  return usage_;
}

}  // namespace wf::usage
