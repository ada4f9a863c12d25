#pragma once

#include "ridgeline/core/Types.h"
#include "ridgeline/math/Vec2.h"
#include "ridgeline/render/Surface.h"

#include <string_view>
#include <vector>

namespace ridgeline::scene {

enum class ShapeKind : core::u8 {
  Rect = 0,
  Polygon,
  Circle
};

// What part of the picture a command paints.
enum class DrawLayer : core::u8 {
  Sky = 0,
  Sun,
  Mountain,
  Fog
};

std::string_view toString(DrawLayer layer);

struct DrawCommand {
  ShapeKind shape{ShapeKind::Rect};
  DrawLayer layer{DrawLayer::Sky};
  // Ridge index for Mountain/Fog (0 = furthest), -1 otherwise.
  int ridge{-1};

  // Rect: top-left corner and size. Circle: centre in `origin`, `radius`.
  math::Vec2d origin{};
  math::Vec2d size{};
  double radius{0.0};
  // Polygon outline.
  std::vector<math::Vec2d> points;

  render::Fill fill{render::Rgba{}};
};

// Painter's order: earlier commands end up underneath later ones.
using DrawList = std::vector<DrawCommand>;

// Issue every command to the surface, in order.
void replay(const DrawList& list, render::Surface& surface);

} // namespace ridgeline::scene
