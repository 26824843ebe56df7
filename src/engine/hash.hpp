#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "engine/dsl.hpp"
#include "engine/types.hpp"

namespace wf::engine {

/// 64-bit FNV-1a accumulator; fields are separated so that ("ab","c") != ("a","bc").
struct HashBuilder {
  std::uint64_t value = 1469598103934665603ULL;

  void add_byte(unsigned char byte) {
    value ^= byte;
    value *= 1099511628211ULL;
  }

  void add(std::string_view text) {
    for (unsigned char byte : text) {
      add_byte(byte);
    }
    add_byte(0xff);
  }

  /// Throws nlohmann::json::type_error when a string in `json` is not valid UTF-8.
  void add_json(const Json& json) { add(json.dump()); }

  auto finish() const -> std::string;
};

/// Hash of the canonical (sorted-key) serialization of a specification document.
/// Documents holding invalid UTF-8 are rejected with InvalidSpecification.
auto hash_json(const Json& json) -> Expected<std::string>;

/// Usage resource id of a workflow: hash of the ordered "type:name" list of its steps.
auto workflow_resource_id(const std::vector<StepDef>& steps) -> Expected<std::string>;

}  // namespace wf::engine
