#include "ridgeline/render/Palette.h"

namespace ridgeline::render {

Gradient ColorGradients::fogAtLevel(double thickness) const {
  return fog.map([thickness](std::size_t, const Hsv& c) {
    return c.withOverrides(std::nullopt, std::nullopt, std::nullopt, c.alpha * thickness);
  });
}

const ColorGradients& defaultPalette() {
  static const ColorGradients palette{};
  return palette;
}

} // namespace ridgeline::render
