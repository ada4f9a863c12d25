#include "test_harness.h"

#include "ridgeline/render/Palette.h"

using ridgeline::render::ColorGradients;
using ridgeline::render::Gradient;
using ridgeline::render::Hsv;

int test_palette() {
  int failures = 0;

  const ColorGradients& palette = ridgeline::render::defaultPalette();
  CHECK(&palette == &ridgeline::render::defaultPalette());

  // Literal values.
  {
    CHECK(palette.mountainRed.size() == 2);
    CHECK(palette.mountainRed.start() == Hsv(347, 0.67, 0.65));
    CHECK(palette.mountainRed.end() == Hsv(14, 0.80, 0.95));
    CHECK(palette.skyBlue.start() == Hsv(228, 0.85, 1.0));
    CHECK(palette.skyBlue.end() == Hsv(196, 1.0, 1.0));
    CHECK(palette.sunYellow.end() == Hsv(43, 1.0, 1.0));
    CHECK(palette.fog.start() == Hsv(0, 0.0, 1.0, 1.0));
    CHECK(palette.fog.end() == Hsv(0, 0.0, 0.0, 0.0));
  }

  // Half-thickness fog over a [1, 0] alpha base.
  {
    const Gradient half = palette.fogAtLevel(0.5);
    CHECK(half.size() == 2);
    CHECK(half[0].alpha == 0.5);
    CHECK(half[1].alpha == 0.0);
    for (std::size_t i = 0; i < half.size(); ++i) {
      CHECK(half[i].hue == palette.fog[i].hue);
      CHECK(half[i].saturation == palette.fog[i].saturation);
      CHECK(half[i].value == palette.fog[i].value);
    }
    // The registry itself is unchanged.
    CHECK(palette.fog[0].alpha == 1.0);
  }

  // Every stop is scaled by exactly the thickness.
  {
    ColorGradients custom;
    custom.fog = Gradient{Hsv(200, 0.2, 0.9, 0.8), Hsv(200, 0.2, 0.7, 0.4), Hsv(200, 0.2, 0.5, 0.1)};

    const double thicknesses[] = {0.0, 0.25, 1.0, 1.5};
    for (double t : thicknesses) {
      const Gradient g = custom.fogAtLevel(t);
      CHECK(g.size() == custom.fog.size());
      for (std::size_t i = 0; i < g.size(); ++i) {
        CHECK(g[i].alpha == custom.fog[i].alpha * t);
        CHECK(g[i].hue == custom.fog[i].hue);
        CHECK(g[i].saturation == custom.fog[i].saturation);
        CHECK(g[i].value == custom.fog[i].value);
      }
    }
  }

  return failures;
}
