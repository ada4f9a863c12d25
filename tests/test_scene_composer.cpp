#include "test_harness.h"

#include "ridgeline/math/Interpolation.h"
#include "ridgeline/scene/SceneComposer.h"

#include <algorithm>
#include <string>
#include <variant>

using namespace ridgeline;

namespace {

// Counts what reaches the surface, in order.
class RecordingSurface final : public render::Surface {
public:
  int width() const override { return 0; }
  int height() const override { return 0; }

  void fillRect(double, double, double, double, const render::Fill&) override { calls += 'R'; }
  void fillPolygon(const std::vector<math::Vec2d>&, const render::Fill&) override { calls += 'P'; }
  void fillCircle(const math::Vec2d&, double, const render::Fill&) override { calls += 'C'; }

  std::string calls;
};

scene::SceneParameters smallScene() {
  scene::SceneParameters p;
  p.width = 400;
  p.height = 200;
  return p;
}

} // namespace

int test_scene_composer() {
  int failures = 0;

  const render::ColorGradients& palette = render::defaultPalette();

  // Layout of a full scene.
  {
    const scene::SceneParameters p = smallScene();
    core::SplitMixRandom rng(2024);
    scene::DrawList list;
    std::string err;
    CHECK(scene::composeScene(p, palette, rng, list, &err));
    CHECK(err.empty());
    CHECK(list.size() == 2u + 2u * (std::size_t)p.mountainRangeCount);

    if (list.size() == 18) {
      const scene::DrawCommand& sky = list[0];
      CHECK(sky.shape == scene::ShapeKind::Rect);
      CHECK(sky.layer == scene::DrawLayer::Sky);
      CHECK(sky.origin == math::Vec2d(0.0, 0.0));
      CHECK(sky.size == math::Vec2d(400.0, 200.0));
      const auto* skyGrad = std::get_if<render::LinearGradient>(&sky.fill);
      CHECK(skyGrad != nullptr);
      if (skyGrad) {
        CHECK(skyGrad->p0 == math::Vec2d(0.0, 0.0));
        CHECK(skyGrad->p1 == math::Vec2d(400.0, 200.0));
        CHECK(skyGrad->stops.size() == palette.skyBlue.size());
        CHECK(skyGrad->stops[0].color == palette.skyBlue.start().toRgba());
      }

      const scene::DrawCommand& sun = list[1];
      CHECK(sun.shape == scene::ShapeKind::Circle);
      CHECK(sun.layer == scene::DrawLayer::Sun);
      CHECK_NEAR(sun.origin.x, 400.0 * 0.85, 1e-9);
      CHECK_NEAR(sun.origin.y, 200.0 * (1.0 - 0.85), 1e-9);
      CHECK_NEAR(sun.radius, 200.0 * 0.1, 1e-9);
      const auto* sunFill = std::get_if<render::Rgba>(&sun.fill);
      CHECK(sunFill != nullptr);
      if (sunFill) CHECK(*sunFill == (render::Rgba{1.0, 1.0, 1.0, 1.0}));

      for (int i = 0; i < p.mountainRangeCount; ++i) {
        const scene::DrawCommand& ridge = list[2 + 2 * (std::size_t)i];
        const scene::DrawCommand& fog = list[3 + 2 * (std::size_t)i];

        CHECK(ridge.shape == scene::ShapeKind::Polygon);
        CHECK(ridge.layer == scene::DrawLayer::Mountain);
        CHECK(ridge.ridge == i);
        CHECK(fog.shape == scene::ShapeKind::Polygon);
        CHECK(fog.layer == scene::DrawLayer::Fog);
        CHECK(fog.ridge == i);

        // The fog pass reuses the ridge outline.
        CHECK(fog.points == ridge.points);
        const std::size_t n = ridge.points.size();
        CHECK(n >= (std::size_t)p.mountainPeaksMin + 4 && n <= (std::size_t)p.mountainPeaksMax + 4);
        if (n < 2) continue;
        CHECK(ridge.points[n - 2] == math::Vec2d(0.0, 200.0));
        CHECK(ridge.points[n - 1] == math::Vec2d(400.0, 200.0));

        const auto* shade = std::get_if<render::LinearGradient>(&ridge.fill);
        CHECK(shade != nullptr);
        if (shade) {
          CHECK(shade->p0 == math::Vec2d(0.0, 0.0));
          CHECK(shade->p1 == math::Vec2d(400.0, 200.0));
        }

        double topY = 200.0;
        for (const auto& pt : ridge.points) topY = std::min(topY, pt.y);
        const auto* haze = std::get_if<render::LinearGradient>(&fog.fill);
        CHECK(haze != nullptr);
        if (haze) {
          CHECK(haze->p0 == math::Vec2d(0.0, 200.0));
          CHECK_NEAR(haze->p1.x, 0.0, 1e-12);
          CHECK_NEAR(haze->p1.y, (200.0 - topY) / 2.0, 1e-9);
          const double thickness = math::sampleLinear(p.fogThickness, p.fogThickness / 4.0, i, p.mountainRangeCount - 1);
          CHECK(haze->stops.size() == 2);
          if (haze->stops.size() == 2) {
            CHECK_NEAR(haze->stops[0].color.a, thickness, 1e-12);
            CHECK(haze->stops[1].color.a == 0.0);
          }
        }
      }

      // Back ridge keeps the palette colours; the front ridge is fully desaturated.
      const auto* back = std::get_if<render::LinearGradient>(&list[2].fill);
      const auto* front = std::get_if<render::LinearGradient>(&list[list.size() - 2].fill);
      CHECK(back && front);
      if (back && front) {
        CHECK(back->stops[0].color == palette.mountainRed.start().toRgba());
        CHECK(back->stops[1].color == palette.mountainRed.end().toRgba());
        for (const auto& s : front->stops) {
          CHECK_NEAR(s.color.r, s.color.g, 1e-12);
          CHECK_NEAR(s.color.g, s.color.b, 1e-12);
        }
        CHECK_NEAR(front->stops[0].color.r, 0.65 * 0.15, 1e-9);
      }
    }
  }

  // Same seed, same scene.
  {
    const scene::SceneParameters p = smallScene();
    core::SplitMixRandom a(31337);
    core::SplitMixRandom b(31337);
    scene::DrawList la, lb;
    CHECK(scene::composeScene(p, palette, a, la));
    CHECK(scene::composeScene(p, palette, b, lb));
    CHECK(la.size() == lb.size());
    for (std::size_t i = 0; i < std::min(la.size(), lb.size()); ++i) {
      CHECK(la[i].points == lb[i].points);
    }
  }

  // Per-ridge sweeps.
  {
    scene::SceneParameters p = smallScene();
    p.fogThickness = 0.8;

    const scene::RidgePlan first = scene::planRidge(p, 0);
    CHECK(first.index == 0);
    CHECK(first.darken == 0.0);
    CHECK(first.desaturate == 0.0);
    CHECK_NEAR(first.peakiness, 0.4, 1e-12);
    CHECK_NEAR(first.fogThickness, 0.8, 1e-12);
    CHECK_NEAR(first.band.min, p.mountainPositionStart, 1e-12);
    CHECK_NEAR(first.band.max,
               math::sampleLinear(p.mountainPositionStart * p.mountainPeakiness, p.mountainPositionEnd, 1, p.mountainRangeCount),
               1e-12);

    const scene::RidgePlan last = scene::planRidge(p, p.mountainRangeCount - 1);
    CHECK_NEAR(last.darken, 0.85, 1e-12);
    CHECK_NEAR(last.desaturate, 1.0, 1e-12);
    CHECK_NEAR(last.peakiness, 0.1, 1e-12);
    CHECK_NEAR(last.fogThickness, 0.2, 1e-12);
    CHECK_NEAR(last.band.max, p.mountainPositionEnd, 1e-12);

    for (int i = 1; i < p.mountainRangeCount; ++i) {
      const scene::RidgePlan prev = scene::planRidge(p, i - 1);
      const scene::RidgePlan cur = scene::planRidge(p, i);
      CHECK(cur.darken > prev.darken);
      CHECK(cur.peakiness < prev.peakiness);
      CHECK(cur.fogThickness < prev.fogThickness);
    }
  }

  // A single ridge cannot be swept and is rejected up front.
  {
    scene::SceneParameters p = smallScene();
    p.mountainRangeCount = 1;
    core::SplitMixRandom rng(1);

    scene::DrawList list(1);
    std::string err;
    CHECK(!scene::composeScene(p, palette, rng, list, &err));
    CHECK(err.find("mountainRangeCount") != std::string::npos);
    CHECK(list.size() == 1);
  }

  // Bad peak ranges fail the whole scene.
  {
    scene::SceneParameters p = smallScene();
    p.mountainPeaksMin = 0;
    core::SplitMixRandom rng(1);
    scene::DrawList list;
    std::string err;
    CHECK(!scene::composeScene(p, palette, rng, list, &err));
    CHECK(!err.empty());
    CHECK(list.empty());
  }

  // composeRidge reports the failing ridge when called directly.
  {
    scene::SceneParameters p = smallScene();
    p.mountainPeaksMin = 6;
    p.mountainPeaksMax = 3;
    core::SplitMixRandom rng(5);
    scene::DrawList list;
    std::string err;
    CHECK(!scene::composeRidge(p, palette, scene::planRidge(p, 2), rng, list, &err));
    CHECK(err.rfind("Ridge 2", 0) == 0);
    CHECK(list.empty());
  }

  // replay() issues the commands in painter's order.
  {
    scene::SceneParameters p = smallScene();
    p.mountainRangeCount = 3;
    core::SplitMixRandom rng(8);
    scene::DrawList list;
    CHECK(scene::composeScene(p, palette, rng, list));

    RecordingSurface surface;
    scene::replay(list, surface);
    CHECK(surface.calls == "RCPPPPPP");
  }

  CHECK(scene::toString(scene::DrawLayer::Fog) == "fog");

  return failures;
}
