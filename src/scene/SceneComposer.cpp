#include "ridgeline/scene/SceneComposer.h"

#include "ridgeline/core/Log.h"
#include "ridgeline/math/Interpolation.h"

#include <algorithm>
#include <sstream>

namespace ridgeline::scene {

using math::sampleLinear;

RidgePlan planRidge(const SceneParameters& p, int index) {
  const double n = static_cast<double>(p.mountainRangeCount);
  const double last = n - 1.0;
  const double i = static_cast<double>(index);

  RidgePlan plan;
  plan.index = index;
  plan.band.min = sampleLinear(p.mountainPositionStart, p.mountainPositionEnd, i, n);
  plan.band.max = sampleLinear(p.mountainPositionStart * p.mountainPeakiness, p.mountainPositionEnd, i + 1.0, n);

  // Nearer ridges get sharper peaks.
  plan.peakiness = sampleLinear(0.4, 0.1, i, last);

  // The nearest ridge ends up darkest and fully desaturated.
  plan.darken = sampleLinear(0.0, 0.85, i, last);
  plan.desaturate = sampleLinear(0.0, 1.0, i, last);

  plan.fogThickness = sampleLinear(p.fogThickness, p.fogThickness / 4.0, i, last);
  return plan;
}

void composeSky(const SceneParameters& p, const render::ColorGradients& palette, DrawList& out) {
  const double w = static_cast<double>(p.width);
  const double h = static_cast<double>(p.height);

  DrawCommand cmd;
  cmd.shape = ShapeKind::Rect;
  cmd.layer = DrawLayer::Sky;
  cmd.origin = {0.0, 0.0};
  cmd.size = {w, h};
  cmd.fill = palette.skyBlue.toLinearGradient(0.0, 0.0, w, h);
  out.push_back(std::move(cmd));
}

void composeSun(const SceneParameters& p, DrawList& out) {
  const double w = static_cast<double>(p.width);
  const double h = static_cast<double>(p.height);

  DrawCommand cmd;
  cmd.shape = ShapeKind::Circle;
  cmd.layer = DrawLayer::Sun;
  cmd.origin = {w * 0.85, h * (1.0 - p.sunHeight)};
  cmd.radius = h * p.sunSize;
  cmd.fill = render::Rgba{1.0, 1.0, 1.0, 1.0};
  out.push_back(std::move(cmd));
}

bool composeRidge(const SceneParameters& p,
                  const render::ColorGradients& palette,
                  const RidgePlan& plan,
                  core::RandomSource& rng,
                  DrawList& out,
                  std::string* outError) {
  const proc::Dimensions dims{p.width, p.height};
  std::string err;
  auto outline = proc::generatePeaks(rng,
                                     proc::IntRange{p.mountainPeaksMin, p.mountainPeaksMax},
                                     plan.band,
                                     dims,
                                     plan.peakiness,
                                     p.mountainRoughness,
                                     &err);
  if (!outline) {
    if (outError) *outError = "Ridge " + std::to_string(plan.index) + ": " + err;
    return false;
  }

  const double w = static_cast<double>(p.width);
  const double h = static_cast<double>(p.height);

  const double darken = plan.darken;
  const double desaturate = plan.desaturate;
  const render::Gradient shade = palette.mountainRed.map([darken, desaturate](std::size_t, const render::Hsv& c) {
    return c.darken(darken).desaturate(desaturate);
  });

  double topY = h;
  for (const math::Vec2d& pt : *outline) topY = std::min(topY, pt.y);
  // Fog fades out halfway up from the bottom edge to the highest peak.
  const double fogEnd = (h - topY) / 2.0;

  DrawCommand ridge;
  ridge.shape = ShapeKind::Polygon;
  ridge.layer = DrawLayer::Mountain;
  ridge.ridge = plan.index;
  ridge.points = *outline;
  ridge.fill = shade.toLinearGradient(0.0, 0.0, w, h);

  DrawCommand fog;
  fog.shape = ShapeKind::Polygon;
  fog.layer = DrawLayer::Fog;
  fog.ridge = plan.index;
  fog.points = std::move(*outline);
  fog.fill = palette.fogAtLevel(plan.fogThickness).toLinearGradient(0.0, h, 0.0, fogEnd);

  out.push_back(std::move(ridge));
  out.push_back(std::move(fog));
  return true;
}

bool composeScene(const SceneParameters& p,
                  const render::ColorGradients& palette,
                  core::RandomSource& rng,
                  DrawList& out,
                  std::string* outError) {
  if (!validateSceneParameters(p, outError)) return false;

  DrawList list;
  list.reserve(2 + 2 * static_cast<std::size_t>(p.mountainRangeCount));

  composeSky(p, palette, list);
  composeSun(p, list);

  for (int i = 0; i < p.mountainRangeCount; ++i) {
    const RidgePlan plan = planRidge(p, i);
    {
      std::ostringstream oss;
      oss << "Scene: ridge " << i << " band=[" << plan.band.min << ", " << plan.band.max << "]"
          << " peakiness=" << plan.peakiness << " darken=" << plan.darken
          << " fog=" << plan.fogThickness;
      RIDGELINE_LOG_DEBUG(oss.str());
    }
    if (!composeRidge(p, palette, plan, rng, list, outError)) return false;
  }

  out = std::move(list);
  return true;
}

} // namespace ridgeline::scene
