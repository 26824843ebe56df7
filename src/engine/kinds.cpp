#include "engine/kinds.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace wf::engine {
namespace {

struct BuiltinKind {
  const char* name;
  const char* description;
};

constexpr BuiltinKind kBuiltinKinds[] = {
  {"*", "matches any kind"},
  {kinds::kImage, "image with its parent metadata"},
  {kinds::kObjectDetection, "bounding boxes with class and confidence"},
  {kinds::kInstanceSegmentation, "bounding boxes with masks"},
  {kinds::kKeypointDetection, "bounding boxes with keypoints"},
  {kinds::kClassification, "class predictions for a whole image"},
  {kinds::kBarCodeDetection, "detected bar codes with decoded data"},
  {kinds::kQrCodeDetection, "detected qr codes with decoded data"},
  {kinds::kBoolean, "boolean flag"},
  {kinds::kInteger, "integer value"},
  {kinds::kFloat, "floating point value"},
  {kinds::kFloatZeroToOne, "float in range [0, 1]"},
  {kinds::kString, "string value"},
  {kinds::kDictionary, "json object"},
  {kinds::kListOfValues, "json array"},
  {kinds::kModelId, "model identifier"},
};

}  // namespace

auto KindRegistry::with_builtin_kinds() -> KindRegistry {
  KindRegistry registry;
  for (const auto& kind : kBuiltinKinds) {
    registry.kinds_.emplace(kind.name, KindInfo{kind.name, kind.description});
  }
  return registry;
}

auto KindRegistry::register_kind(std::string name, std::string description) -> Expected<void> {
  if (name.empty()) {
    return tl::unexpected(make_error(ErrorCode::InvalidSpecification, "kind name must not be empty"));
  }
  auto it = kinds_.find(name);
  if (it != kinds_.end()) {
    if (!description.empty() && it->second.description.empty()) {
      it->second.description = std::move(description);
    }
    return {};
  }
  KindInfo info{name, std::move(description)};
  kinds_.emplace(std::move(name), std::move(info));
  return {};
}

auto KindRegistry::contains(std::string_view name) const -> bool {
  return kinds_.contains(std::string(name));
}

auto KindRegistry::lookup(std::string_view name) const -> const KindInfo* {
  auto it = kinds_.find(std::string(name));
  if (it == kinds_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto KindRegistry::validate(const KindSet& kinds, std::string_view context) const -> Expected<void> {
  for (const auto& kind : kinds) {
    if (!contains(kind)) {
      return tl::unexpected(
        make_error(ErrorCode::InvalidSpecification, fmt::format("unknown kind '{}' in {}", kind, context)));
    }
  }
  return {};
}

auto is_wildcard(const KindSet& kinds) -> bool {
  return kinds.contains(std::string(kWildcardKind));
}

auto kinds_compatible(const KindSet& produced, const KindSet& accepted) -> bool {
  if (is_wildcard(produced) || is_wildcard(accepted)) {
    return true;
  }
  // both sides are ordered, walk them in lockstep
  auto p = produced.begin();
  auto a = accepted.begin();
  while (p != produced.end() && a != accepted.end()) {
    if (*p == *a) {
      return true;
    }
    if (*p < *a) {
      ++p;
    } else {
      ++a;
    }
  }
  return false;
}

auto format_kinds(const KindSet& kinds) -> std::string {
  return fmt::format("{{{}}}", fmt::join(kinds, ", "));
}

}  // namespace wf::engine
