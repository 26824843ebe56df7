#include "common/logging/log.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <gflags/gflags.h>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

DECLARE_string(log_level);
DECLARE_string(log_file);
DECLARE_bool(log_to_stderr);
DECLARE_int32(log_max_size);
DECLARE_int32(log_max_files);

namespace wf::log {
namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::async_logger> g_logger;

auto make_file_sink(const std::string& path, std::size_t max_size, int max_files) -> spdlog::sink_ptr {
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, std::max<std::size_t>(max_size, 1024),
                                                                static_cast<std::size_t>(std::max(max_files, 1)));
}

}  // namespace

auto parse_level(std::string_view level) -> spdlog::level::level_enum {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn") return spdlog::level::warn;
  if (level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

void init() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_logger) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;
  if (FLAGS_log_to_stderr) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  if (!FLAGS_log_file.empty()) {
    sinks.push_back(make_file_sink(FLAGS_log_file, static_cast<std::size_t>(FLAGS_log_max_size), FLAGS_log_max_files));
  }

  spdlog::init_thread_pool(8192, 1);
  g_logger = std::make_shared<spdlog::async_logger>("wf_engine", sinks.begin(), sinks.end(), spdlog::thread_pool(),
                                                    spdlog::async_overflow_policy::block);

  const auto level = parse_level(FLAGS_log_level);
  spdlog::set_default_logger(g_logger);
  spdlog::set_level(level);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
  spdlog::info("logger initialized: level={} file={} stderr={}", FLAGS_log_level,
               FLAGS_log_file.empty() ? "-" : FLAGS_log_file, FLAGS_log_to_stderr);
}

void shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_logger) {
    return;
  }
  g_logger->flush();
  spdlog::shutdown();
  g_logger.reset();
}

}  // namespace wf::log
