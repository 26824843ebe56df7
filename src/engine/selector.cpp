#include "engine/selector.hpp"

#include <fmt/format.h>

namespace wf::engine {
namespace {

auto is_segment_char(char c) -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

auto is_valid_segment(std::string_view segment) -> bool {
  if (segment.empty()) {
    return false;
  }
  for (char c : segment) {
    if (!is_segment_char(c)) {
      return false;
    }
  }
  return true;
}

auto split_segments(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> segments;
  std::size_t start = 0;
  while (true) {
    auto dot = text.find('.', start);
    if (dot == std::string_view::npos) {
      segments.push_back(text.substr(start));
      break;
    }
    segments.push_back(text.substr(start, dot - start));
    start = dot + 1;
  }
  return segments;
}

auto malformed(std::string_view text, std::string_view field_path, std::string_view reason) -> EngineError {
  return make_error(ErrorCode::MalformedSelector,
                    fmt::format("malformed selector '{}' in field '{}': {}", text, field_path, reason));
}

auto has_selector(const FieldValue& value) -> bool {
  return value.kind != FieldValueKind::Literal;
}

}  // namespace

auto FieldValue::make_literal(Json value) -> FieldValue {
  FieldValue field;
  field.kind = FieldValueKind::Literal;
  field.literal = std::move(value);
  return field;
}

auto FieldValue::make_selector(Selector value) -> FieldValue {
  FieldValue field;
  field.kind = FieldValueKind::Selector;
  field.selector = std::move(value);
  return field;
}

auto is_reserved_selector(std::string_view text) -> bool {
  return text.starts_with(kInputsPrefix) || text.starts_with(kStepsPrefix);
}

auto parse_selector(std::string_view text, std::string_view field_path) -> Expected<Selector> {
  auto segments = split_segments(text);
  const auto& head = segments.front();

  Selector selector;
  selector.raw = std::string(text);
  std::size_t first_property = 0;
  if (head == kInputsPrefix) {
    if (segments.size() < 2) {
      return tl::unexpected(malformed(text, field_path, "expected $inputs.<name>"));
    }
    selector.scope = SelectorScope::Input;
    first_property = 2;
  } else if (head == kStepsPrefix) {
    if (segments.size() < 3) {
      return tl::unexpected(malformed(text, field_path, "expected $steps.<step>.<output>"));
    }
    selector.scope = SelectorScope::StepOutput;
    first_property = 3;
  } else {
    return tl::unexpected(malformed(text, field_path, "unknown selector scope"));
  }

  for (std::size_t i = 1; i < segments.size(); ++i) {
    if (!is_valid_segment(segments[i])) {
      return tl::unexpected(malformed(text, field_path, fmt::format("invalid segment at position {}", i)));
    }
  }

  selector.name = std::string(segments[1]);
  if (selector.scope == SelectorScope::StepOutput) {
    selector.output = std::string(segments[2]);
  }
  for (std::size_t i = first_property; i < segments.size(); ++i) {
    selector.property.emplace_back(segments[i]);
  }
  return selector;
}

auto parse_field_value(const Json& value, std::string_view field_path) -> Expected<FieldValue> {
  if (value.is_string()) {
    const auto& text = value.get_ref<const std::string&>();
    if (!is_reserved_selector(text)) {
      return FieldValue::make_literal(value);
    }
    auto selector = parse_selector(text, field_path);
    if (!selector) {
      return tl::unexpected(selector.error());
    }
    return FieldValue::make_selector(std::move(*selector));
  }

  if (value.is_array()) {
    FieldValue list;
    list.kind = FieldValueKind::List;
    list.items.reserve(value.size());
    bool any_selector = false;
    for (std::size_t i = 0; i < value.size(); ++i) {
      auto item = parse_field_value(value[i], fmt::format("{}[{}]", field_path, i));
      if (!item) {
        return tl::unexpected(item.error());
      }
      any_selector = any_selector || has_selector(*item);
      list.items.push_back(std::move(*item));
    }
    if (!any_selector) {
      return FieldValue::make_literal(value);
    }
    return list;
  }

  if (value.is_object()) {
    FieldValue map;
    map.kind = FieldValueKind::Map;
    bool any_selector = false;
    for (const auto& [key, item_json] : value.items()) {
      auto item = parse_field_value(item_json, fmt::format("{}.{}", field_path, key));
      if (!item) {
        return tl::unexpected(item.error());
      }
      any_selector = any_selector || has_selector(*item);
      map.keys.push_back(key);
      map.items.push_back(std::move(*item));
    }
    if (!any_selector) {
      return FieldValue::make_literal(value);
    }
    return map;
  }

  return FieldValue::make_literal(value);
}

auto collect_selectors(const FieldValue& value, std::vector<const Selector*>& out) -> void {
  switch (value.kind) {
    case FieldValueKind::Literal:
      break;
    case FieldValueKind::Selector:
      out.push_back(&value.selector);
      break;
    case FieldValueKind::List:
    case FieldValueKind::Map:
      for (const auto& item : value.items) {
        collect_selectors(item, out);
      }
      break;
  }
}

auto apply_property(const Json& value, const Selector& selector) -> Json {
  const Json* current = &value;
  for (const auto& key : selector.property) {
    if (!current->is_object()) {
      return Json();
    }
    auto it = current->find(key);
    if (it == current->end()) {
      return Json();
    }
    current = &*it;
  }
  return *current;
}

}  // namespace wf::engine
