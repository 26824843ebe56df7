#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace wf::engine {

/// Fetches raw workflow descriptions from a remote registry. Transient failures
/// are reported with ErrorCode::Transport.
class SpecTransport {
 public:
  virtual ~SpecTransport() = default;
  virtual auto fetch(std::string_view api_key, std::string_view workspace_id, std::string_view workflow_id)
    -> Expected<Json> = 0;
};

struct SpecSourceConfig {
  /// Root of the local response cache; empty disables caching.
  std::filesystem::path cache_dir;
};

/// Replaces every character outside [A-Za-z0-9._-] with '_' so the result is a
/// single safe path component.
auto sanitize_path_segment(std::string_view segment) -> std::string;

/// Unwraps `{"workflow": {"config": "<json>"}}` into the embedded `specification`.
auto extract_specification(const Json& response) -> Expected<Json>;

/// Resolves workflow specifications through a transport, keeping the last good
/// response on disk as a fallback for transport outages.
class WorkflowSpecSource {
 public:
  WorkflowSpecSource(std::shared_ptr<SpecTransport> transport, SpecSourceConfig config);

  auto get_specification(std::string_view api_key, std::string_view workspace_id, std::string_view workflow_id)
    -> Expected<Json>;

  /// `<cache_dir>/workflow/<workspace>/<workflow>.json`, both ids sanitized.
  auto cache_file_path(std::string_view workspace_id, std::string_view workflow_id) const -> std::filesystem::path;

 private:
  auto store_response(std::string_view workspace_id, std::string_view workflow_id, const Json& response) const
    -> Expected<void>;
  auto load_cached_response(std::string_view workspace_id, std::string_view workflow_id) const
    -> std::optional<Json>;

  std::shared_ptr<SpecTransport> transport_;
  SpecSourceConfig config_;
};

}  // namespace wf::engine
