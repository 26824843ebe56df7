#pragma once

#include <string_view>
#include <vector>

#include "engine/registry.hpp"
#include "engine/types.hpp"

namespace wf::block {

inline constexpr std::string_view kImageDimensions = "ImageDimensions";
inline constexpr std::string_view kThresholdDetector = "ThresholdDetector";
inline constexpr std::string_view kDetectionsCounter = "DetectionsCounter";
inline constexpr std::string_view kDetectionsOverlay = "DetectionsOverlay";
inline constexpr std::string_view kExpression = "Expression";

/// Registers the sample blocks, each under its short name and a versioned alias
/// (`wf/threshold_detector@v1`, ...).
auto register_sample_blocks(engine::BlockRegistry& registry) -> void;

/// Grayscale image value: `{"width": W, "height": H, "pixels": [W*H values 0..255]}`.
auto make_image(int width, int height, std::vector<int> pixels) -> engine::Json;

}  // namespace wf::block
