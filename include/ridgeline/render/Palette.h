#pragma once

#include "ridgeline/render/Color.h"

namespace ridgeline::render {

// The named gradients a scene is painted with.
struct ColorGradients {
  Gradient mountainRed{Hsv(347, 0.67, 0.65), Hsv(14, 0.80, 0.95)};
  Gradient skyBlue{Hsv(228, 0.85, 1.0), Hsv(196, 1.0, 1.0)};
  Gradient sunYellow{Hsv(0, 0.0, 1.0), Hsv(43, 1.0, 1.0)};
  // White to fully transparent.
  Gradient fog{Hsv(0, 0.0, 1.0, 1.0), Hsv(0, 0.0, 0.0, 0.0)};

  // Fog with every stop's alpha scaled by thickness.
  Gradient fogAtLevel(double thickness) const;
};

// Process-wide palette. Built on first use and never modified.
const ColorGradients& defaultPalette();

} // namespace ridgeline::render
