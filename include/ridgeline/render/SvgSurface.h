#pragma once

#include "ridgeline/render/Surface.h"

#include <cstddef>
#include <sstream>
#include <string>

namespace ridgeline::render {

// Records draw calls as an SVG document.
//
// Every gradient fill becomes its own <linearGradient> in user space, emitted
// right before the shape that uses it, so the document order matches the
// painter's order of the calls.
class SvgSurface final : public Surface {
public:
  SvgSurface(int width, int height);

  int width() const override { return width_; }
  int height() const override { return height_; }

  void fillRect(double x, double y, double w, double h, const Fill& fill) override;
  void fillPolygon(const std::vector<math::Vec2d>& points, const Fill& fill) override;
  void fillCircle(const math::Vec2d& center, double radius, const Fill& fill) override;

  std::size_t shapeCount() const { return shapes_; }
  std::size_t gradientCount() const { return gradients_; }

  // Complete document, including the closing tag.
  std::string str() const;

  bool writeToFile(const std::string& path, std::string* outError = nullptr) const;

private:
  // Writes any <defs> the fill needs and returns the fill attributes.
  std::string paint(const Fill& fill);

  int width_{0};
  int height_{0};
  std::size_t shapes_{0};
  std::size_t gradients_{0};
  std::ostringstream body_;
};

} // namespace ridgeline::render
