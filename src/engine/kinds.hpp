#pragma once

#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

#include "engine/error.hpp"

namespace wf::engine {

/// Ordered set of kind names attached to an input, a block field or a block output.
using KindSet = std::set<std::string>;

inline constexpr std::string_view kWildcardKind = "*";

namespace kinds {

inline constexpr const char* kImage = "image";
inline constexpr const char* kObjectDetection = "object_detection_prediction";
inline constexpr const char* kInstanceSegmentation = "instance_segmentation_prediction";
inline constexpr const char* kKeypointDetection = "keypoint_detection_prediction";
inline constexpr const char* kClassification = "classification_prediction";
inline constexpr const char* kBarCodeDetection = "bar_code_detection";
inline constexpr const char* kQrCodeDetection = "qr_code_detection";
inline constexpr const char* kBoolean = "boolean";
inline constexpr const char* kInteger = "integer";
inline constexpr const char* kFloat = "float";
inline constexpr const char* kFloatZeroToOne = "float_zero_to_one";
inline constexpr const char* kString = "string";
inline constexpr const char* kDictionary = "dictionary";
inline constexpr const char* kListOfValues = "list_of_values";
inline constexpr const char* kModelId = "roboflow_model_id";

}  // namespace kinds

struct KindInfo {
  std::string name;
  std::string description;
};

/// Catalog of known kind names. Populated before compilation, read-only afterwards.
class KindRegistry {
 public:
  KindRegistry() = default;

  /// Registry pre-populated with the wildcard and the built-in kinds.
  static auto with_builtin_kinds() -> KindRegistry;

  auto register_kind(std::string name, std::string description = {}) -> Expected<void>;
  auto contains(std::string_view name) const -> bool;
  auto lookup(std::string_view name) const -> const KindInfo*;
  auto size() const -> std::size_t { return kinds_.size(); }

  /// Fails with InvalidSpecification naming `context` when a kind is not registered.
  auto validate(const KindSet& kinds, std::string_view context) const -> Expected<void>;

 private:
  std::unordered_map<std::string, KindInfo> kinds_;
};

auto is_wildcard(const KindSet& kinds) -> bool;

/// True if either side holds the wildcard or the sets intersect.
auto kinds_compatible(const KindSet& produced, const KindSet& accepted) -> bool;

/// Renders a kind set as "{a, b}".
auto format_kinds(const KindSet& kinds) -> std::string;

}  // namespace wf::engine
