#pragma once

#include "ridgeline/math/Vec2.h"
#include "ridgeline/render/Color.h"

#include <variant>
#include <vector>

namespace ridgeline::render {

// A shape is painted either with one colour or with a linear gradient.
using Fill = std::variant<Rgba, LinearGradient>;

// 2D vector drawing target. Coordinates are pixels with y pointing down.
//
// Polygons are closed implicitly (last point connects back to the first) and
// filled with the nonzero winding rule.
class Surface {
public:
  virtual ~Surface() = default;

  virtual int width() const = 0;
  virtual int height() const = 0;

  virtual void fillRect(double x, double y, double w, double h, const Fill& fill) = 0;
  virtual void fillPolygon(const std::vector<math::Vec2d>& points, const Fill& fill) = 0;
  virtual void fillCircle(const math::Vec2d& center, double radius, const Fill& fill) = 0;
};

} // namespace ridgeline::render
