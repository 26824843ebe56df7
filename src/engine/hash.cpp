#include "engine/hash.hpp"

#include <fmt/format.h>

namespace wf::engine {
namespace {

auto finish_json(HashBuilder builder, const Json& json, std::string_view what) -> Expected<std::string> {
  try {
    builder.add_json(json);
  } catch (const Json::type_error& ex) {
    return tl::unexpected(make_error(ErrorCode::InvalidSpecification, fmt::format("{}: {}", what, ex.what())));
  }
  return builder.finish();
}

}  // namespace

auto HashBuilder::finish() const -> std::string {
  return fmt::format("{:016x}", value);
}

auto hash_json(const Json& json) -> Expected<std::string> {
  // nlohmann::json keeps object keys sorted, so dump() is canonical
  HashBuilder builder;
  builder.add("workflow");
  return finish_json(builder, json, "workflow specification is not serializable");
}

auto workflow_resource_id(const std::vector<StepDef>& steps) -> Expected<std::string> {
  Json details = Json::object();
  Json names = Json::array();
  for (const auto& step : steps) {
    names.push_back(fmt::format("{}:{}", step.type, step.name));
  }
  details["steps"] = std::move(names);
  return finish_json(HashBuilder{}, details, "workflow step names are not serializable");
}

}  // namespace wf::engine
