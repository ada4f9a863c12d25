#pragma once

#include "ridgeline/render/Surface.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ridgeline::render {

struct Image {
  int w{0};
  int h{0};
  std::vector<std::uint8_t> rgba; // size = w*h*4, straight alpha, row 0 at the top
};

// Evaluate a linear gradient at a point.
//
// The point is projected onto p0 -> p1; offsets outside the first/last stop
// take that stop's colour (pad). Colours are interpolated in straight alpha.
// A gradient with p0 == p1 paints its last stop everywhere.
Rgba sampleLinearGradient(const LinearGradient& g, const math::Vec2d& p);

// Software rasterizer producing an RGBA8 image.
//
// Pixels are sampled once at their centre (no anti-aliasing). Shapes are
// composited source-over onto what is already there.
class RasterSurface final : public Surface {
public:
  RasterSurface(int width, int height, Rgba clearColor = Rgba{0.0, 0.0, 0.0, 0.0});

  int width() const override { return image_.w; }
  int height() const override { return image_.h; }

  void fillRect(double x, double y, double w, double h, const Fill& fill) override;
  void fillPolygon(const std::vector<math::Vec2d>& points, const Fill& fill) override;
  void fillCircle(const math::Vec2d& center, double radius, const Fill& fill) override;

  void clear(const Rgba& c);

  // Pixel read-back in [0,1]. Out-of-range coordinates return transparent black.
  Rgba pixel(int x, int y) const;

  const Image& image() const { return image_; }

private:
  void fillSpan(int y, int x0, int x1, const Fill& fill);
  void blend(std::size_t idx, const Rgba& src);

  Image image_;
};

} // namespace ridgeline::render
