#include "runtime/spec_source.hpp"

#include <cctype>
#include <fstream>
#include <optional>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "common/logging/log.hpp"

namespace wf::engine {
namespace {

auto malformed(std::string message) -> EngineError {
  return make_error(ErrorCode::MalformedWorkflowResponse, std::move(message));
}

}  // namespace

auto sanitize_path_segment(std::string_view segment) -> std::string {
  std::string result;
  result.reserve(segment.size());
  for (char ch : segment) {
    const auto byte = static_cast<unsigned char>(ch);
    if (std::isalnum(byte) || ch == '-' || ch == '_' || ch == '.') {
      result.push_back(ch);
    } else {
      result.push_back('_');
    }
  }
  if (result.empty() || result == "." || result == "..") {
    result = std::string(result.size() + 1, '_');
  }
  return result;
}

auto extract_specification(const Json& response) -> Expected<Json> {
  if (!response.is_object() || !response.contains("workflow") || !response["workflow"].is_object() ||
      !response["workflow"].contains("config")) {
    return tl::unexpected(malformed("could not find workflow specification in response"));
  }
  const auto& config = response["workflow"]["config"];
  if (!config.is_string()) {
    return tl::unexpected(malformed("could not decode workflow specification in response"));
  }
  auto decoded = Json::parse(config.get<std::string>(), nullptr, false);
  if (decoded.is_discarded() || !decoded.is_object()) {
    return tl::unexpected(malformed("could not decode workflow specification in response"));
  }
  if (!decoded.contains("specification")) {
    return tl::unexpected(malformed("workflow specification not found in response"));
  }
  return decoded["specification"];
}

WorkflowSpecSource::WorkflowSpecSource(std::shared_ptr<SpecTransport> transport, SpecSourceConfig config)
    : transport_(std::move(transport)), config_(std::move(config)) {}

auto WorkflowSpecSource::cache_file_path(std::string_view workspace_id, std::string_view workflow_id) const
  -> std::filesystem::path {
  return config_.cache_dir / "workflow" / sanitize_path_segment(workspace_id) /
         (sanitize_path_segment(workflow_id) + ".json");
}

auto WorkflowSpecSource::store_response(std::string_view workspace_id, std::string_view workflow_id,
                                        const Json& response) const -> Expected<void> {
  auto path = cache_file_path(workspace_id, workflow_id);
  std::string serialized;
  try {
    serialized = response.dump();
  } catch (const Json::type_error& ex) {
    return tl::unexpected(make_error(ErrorCode::MalformedWorkflowResponse,
                                     fmt::format("cannot serialize workflow response: {}", ex.what())));
  }
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    return tl::unexpected(
      make_error(ErrorCode::Io, fmt::format("cannot create {}: {}", path.parent_path().string(), ec.message())));
  }
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    return tl::unexpected(make_error(ErrorCode::Io, fmt::format("cannot write {}", path.string())));
  }
  out << serialized;
  if (!out) {
    return tl::unexpected(make_error(ErrorCode::Io, fmt::format("failed writing {}", path.string())));
  }
  return {};
}

auto WorkflowSpecSource::load_cached_response(std::string_view workspace_id, std::string_view workflow_id) const
  -> std::optional<Json> {
  auto path = cache_file_path(workspace_id, workflow_id);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  std::ifstream in(path);
  auto cached = in ? Json::parse(in, nullptr, false) : Json(Json::value_t::discarded);
  if (cached.is_discarded()) {
    wf::log::warn("removing unreadable cached workflow response: {}", path.string());
    in.close();
    std::filesystem::remove(path, ec);
    return std::nullopt;
  }
  return cached;
}

auto WorkflowSpecSource::get_specification(std::string_view api_key, std::string_view workspace_id,
                                           std::string_view workflow_id) -> Expected<Json> {
  if (!transport_) {
    return tl::unexpected(make_error(ErrorCode::Transport, "no workflow transport configured"));
  }
  const bool caching = !config_.cache_dir.empty();

  auto response = transport_->fetch(api_key, workspace_id, workflow_id);
  if (response) {
    if (caching) {
      if (auto stored = store_response(workspace_id, workflow_id, *response); !stored) {
        wf::log::warn("failed to cache workflow response: {}", stored.error().message);
      }
    }
    return extract_specification(*response);
  }

  if (response.error().code != ErrorCode::Transport || !caching) {
    return tl::unexpected(response.error());
  }
  auto cached = load_cached_response(workspace_id, workflow_id);
  if (!cached) {
    return tl::unexpected(response.error());
  }
  wf::log::info("workflow source unavailable, using cached response for {}/{}", workspace_id, workflow_id);
  return extract_specification(*cached);
}

}  // namespace wf::engine
