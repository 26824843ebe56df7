#pragma once

#include <spdlog/spdlog.h>

#include <string_view>

namespace wf::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Installs the process logger configured from the --log_* flags. Idempotent.
/// Until then messages go to spdlog's default stdout logger.
void init();

/// Flushes and drops the process logger.
void shutdown();

/// Level named by --log_level style strings; unknown names map to info.
auto parse_level(std::string_view level) -> spdlog::level::level_enum;

}  // namespace wf::log
