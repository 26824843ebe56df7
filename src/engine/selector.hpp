#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace wf::engine {

inline constexpr std::string_view kInputsPrefix = "$inputs";
inline constexpr std::string_view kStepsPrefix = "$steps";

enum class SelectorScope {
  Input,
  StepOutput,
};

/// Reference from a step field (or a workflow output) to a workflow input or a step output.
struct Selector {
  SelectorScope scope = SelectorScope::Input;
  /// Input name, or producing step name.
  std::string name;
  /// Output name of the producing step; empty for inputs.
  std::string output;
  /// Property accessor path applied to the referenced value.
  std::vector<std::string> property;
  /// Selector text as written in the specification.
  std::string raw;

  auto has_property() const -> bool { return !property.empty(); }
};

enum class FieldValueKind {
  Literal,
  Selector,
  List,
  Map,
};

/// Parsed field value. Lists and maps only appear when they contain a selector;
/// selector-free subtrees collapse to a single literal.
struct FieldValue {
  FieldValueKind kind = FieldValueKind::Literal;
  Json literal;
  Selector selector;
  std::vector<FieldValue> items;
  /// Map keys, aligned with `items`.
  std::vector<std::string> keys;

  static auto make_literal(Json value) -> FieldValue;
  static auto make_selector(Selector value) -> FieldValue;
};

/// True for strings carrying one of the reserved selector prefixes.
auto is_reserved_selector(std::string_view text) -> bool;

/// Parses `$inputs.<name>[.<property>...]` or `$steps.<step>.<output>[.<property>...]`.
/// Fails with MalformedSelector naming `field_path`.
auto parse_selector(std::string_view text, std::string_view field_path) -> Expected<Selector>;

/// Recursively turns a raw JSON field value into a FieldValue.
auto parse_field_value(const Json& value, std::string_view field_path) -> Expected<FieldValue>;

/// Appends every selector in `value` (depth first, in document order).
auto collect_selectors(const FieldValue& value, std::vector<const Selector*>& out) -> void;

/// Applies the selector's property path to `value`; missing properties yield null.
auto apply_property(const Json& value, const Selector& selector) -> Json;

}  // namespace wf::engine
