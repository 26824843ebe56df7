#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "engine/error.hpp"

namespace wf::engine {

using Json = nlohmann::json;

/// Per-run request state shared between the caller and the executor.
struct RunContext {
  /// Attributed to usage records; empty falls back to the collector's key.
  std::string api_key;
  std::chrono::steady_clock::time_point deadline{std::chrono::steady_clock::time_point::max()};
  std::atomic<bool> cancelled{false};

  auto cancel() -> void { cancelled.store(true, std::memory_order_release); }

  auto is_cancelled() const -> bool { return cancelled.load(std::memory_order_acquire); }

  auto deadline_exceeded() const -> bool { return std::chrono::steady_clock::now() > deadline; }

  auto should_stop() const -> bool { return is_cancelled() || deadline_exceeded(); }

  /// Error describing why the run must stop, or success when it may continue.
  auto check() const -> Expected<void> {
    if (is_cancelled()) {
      return tl::unexpected(make_error(ErrorCode::Cancelled, "run cancelled"));
    }
    if (deadline_exceeded()) {
      return tl::unexpected(make_error(ErrorCode::DeadlineExceeded, "deadline exceeded"));
    }
    return {};
  }
};

/// Read-only view handed to blocks; exposes only the stop signal. The executor
/// may attach a per-run abort flag that fail-fast sets when a sibling step fails.
class RunContextView {
 public:
  RunContextView() = default;
  explicit RunContextView(const RunContext& base, const std::atomic<bool>* aborted = nullptr)
      : base_(&base), aborted_(aborted) {}

  auto is_cancelled() const -> bool {
    return (base_ && base_->is_cancelled()) || (aborted_ && aborted_->load(std::memory_order_acquire));
  }

  auto deadline_exceeded() const -> bool { return base_ && base_->deadline_exceeded(); }

  auto should_stop() const -> bool { return is_cancelled() || deadline_exceeded(); }

 private:
  const RunContext* base_ = nullptr;
  const std::atomic<bool>* aborted_ = nullptr;
};

}  // namespace wf::engine
