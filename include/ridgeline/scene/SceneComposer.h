#pragma once

#include "ridgeline/core/Random.h"
#include "ridgeline/proc/Terrain.h"
#include "ridgeline/render/Palette.h"
#include "ridgeline/scene/DrawList.h"
#include "ridgeline/scene/SceneParameters.h"

#include <string>

namespace ridgeline::scene {

// Per-ridge values swept across the layers, back (index 0) to front.
struct RidgePlan {
  int index{0};
  // Peak heights as fractions of the image height.
  proc::Bounds band{};
  double peakiness{0.0};
  double darken{0.0};
  double desaturate{0.0};
  double fogThickness{0.0};
};

// Pure: no randomness. Requires p.mountainRangeCount >= 2.
RidgePlan planRidge(const SceneParameters& p, int index);

// Individual passes, each appending to `out`.
void composeSky(const SceneParameters& p, const render::ColorGradients& palette, DrawList& out);
void composeSun(const SceneParameters& p, DrawList& out);
bool composeRidge(const SceneParameters& p,
                  const render::ColorGradients& palette,
                  const RidgePlan& plan,
                  core::RandomSource& rng,
                  DrawList& out,
                  std::string* outError = nullptr);

// Build the whole picture: sky, sun, then each ridge followed by its fog pass.
//
// Validates `p` first. On any failure returns false, leaves `out` untouched and
// writes the reason to outError.
bool composeScene(const SceneParameters& p,
                  const render::ColorGradients& palette,
                  core::RandomSource& rng,
                  DrawList& out,
                  std::string* outError = nullptr);

} // namespace ridgeline::scene
