#pragma once

#include <string>

namespace ridgeline::scene {

// Everything a scene is generated from, apart from the palette and the random source.
//
// Fractions are relative to the image height unless noted. Generation takes
// this by value and never changes it.
struct SceneParameters {
  int width{3840};
  int height{2160};

  // Sun centre height above the bottom edge and sun radius.
  double sunHeight{0.85};
  double sunSize{0.10};

  // fogHeight is persisted but not consumed by the composer yet.
  double fogHeight{0.80};
  double fogThickness{1.0};

  int mountainRangeCount{8};
  // Vertical sweep of the ridge bands, back layer to front layer.
  double mountainPositionStart{0.15};
  double mountainPositionEnd{0.70};
  // Visible peaks per ridge, inclusive.
  int mountainPeaksMin{9};
  int mountainPeaksMax{22};
  double mountainRoughness{0.2};
  // Scales the start of the upper band bound.
  double mountainPeakiness{4.0};
};

// Upper limits accepted by validateSceneParameters.
inline constexpr int kMaxImageSide = 32768;
inline constexpr int kMaxMountainRangeCount = 1024;
// Fraction fields (sun, fog, positions, roughness, peakiness) must be finite
// and within +-kMaxFraction.
inline constexpr double kMaxFraction = 100.0;

// Checks the parameters the generators divide by, draw ranges from or turn
// into pixel coordinates. Returns false with a human-readable reason on the
// first problem found.
bool validateSceneParameters(const SceneParameters& p, std::string* outError = nullptr);

// Default config file path (relative to the working directory).
std::string defaultSceneParametersPath();

// Text format:
//   RidgelineScene 1
//   # comment
//   width 3840
//   mountainPeaks 9 22
//   ...
// Keys are case-insensitive. Unknown keys are skipped.
bool saveSceneParametersToFile(const SceneParameters& p, const std::string& path);
bool loadSceneParametersFromFile(const std::string& path, SceneParameters& out);

} // namespace ridgeline::scene
