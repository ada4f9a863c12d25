#include "ridgeline/scene/DrawList.h"

namespace ridgeline::scene {

std::string_view toString(DrawLayer layer) {
  switch (layer) {
    case DrawLayer::Sky: return "sky";
    case DrawLayer::Sun: return "sun";
    case DrawLayer::Mountain: return "mountain";
    case DrawLayer::Fog: return "fog";
  }
  return "?";
}

void replay(const DrawList& list, render::Surface& surface) {
  for (const DrawCommand& cmd : list) {
    switch (cmd.shape) {
      case ShapeKind::Rect:
        surface.fillRect(cmd.origin.x, cmd.origin.y, cmd.size.x, cmd.size.y, cmd.fill);
        break;
      case ShapeKind::Polygon:
        surface.fillPolygon(cmd.points, cmd.fill);
        break;
      case ShapeKind::Circle:
        surface.fillCircle(cmd.origin, cmd.radius, cmd.fill);
        break;
    }
  }
}

} // namespace ridgeline::scene
