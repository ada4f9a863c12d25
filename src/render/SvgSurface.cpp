#include "ridgeline/render/SvgSurface.h"

#include <algorithm>
#include <cmath>
#include <fstream>

namespace ridgeline::render {

static int toByte(double v) {
  return (int)std::lround(std::clamp(v, 0.0, 1.0) * 255.0);
}

static std::string rgbText(const Rgba& c) {
  return "rgb(" + std::to_string(toByte(c.r)) + "," + std::to_string(toByte(c.g)) + "," +
         std::to_string(toByte(c.b)) + ")";
}

static std::string num(double v) {
  std::ostringstream oss;
  oss.precision(10);
  oss << v;
  return oss.str();
}

SvgSurface::SvgSurface(int width, int height) : width_(width), height_(height) {}

std::string SvgSurface::paint(const Fill& fill) {
  if (const Rgba* solid = std::get_if<Rgba>(&fill)) {
    return "fill=\"" + rgbText(*solid) + "\" fill-opacity=\"" + num(solid->a) + "\"";
  }

  const LinearGradient& g = std::get<LinearGradient>(fill);
  const std::string id = "g" + std::to_string(gradients_++);

  body_ << "<defs><linearGradient id=\"" << id << "\" gradientUnits=\"userSpaceOnUse\""
        << " x1=\"" << num(g.p0.x) << "\" y1=\"" << num(g.p0.y) << "\""
        << " x2=\"" << num(g.p1.x) << "\" y2=\"" << num(g.p1.y) << "\">";
  for (const GradientStop& s : g.stops) {
    body_ << "<stop offset=\"" << num(s.offset) << "\" stop-color=\"" << rgbText(s.color)
          << "\" stop-opacity=\"" << num(s.color.a) << "\"/>";
  }
  body_ << "</linearGradient></defs>\n";

  return "fill=\"url(#" + id + ")\"";
}

void SvgSurface::fillRect(double x, double y, double w, double h, const Fill& fill) {
  const std::string attrs = paint(fill);
  body_ << "<rect x=\"" << num(x) << "\" y=\"" << num(y) << "\" width=\"" << num(w) << "\" height=\"" << num(h)
        << "\" " << attrs << "/>\n";
  ++shapes_;
}

void SvgSurface::fillPolygon(const std::vector<math::Vec2d>& points, const Fill& fill) {
  if (points.size() < 3) return;

  const std::string attrs = paint(fill);
  body_ << "<polygon points=\"";
  for (std::size_t i = 0; i < points.size(); ++i) {
    if (i) body_ << ' ';
    body_ << num(points[i].x) << ',' << num(points[i].y);
  }
  body_ << "\" fill-rule=\"nonzero\" " << attrs << "/>\n";
  ++shapes_;
}

void SvgSurface::fillCircle(const math::Vec2d& center, double radius, const Fill& fill) {
  const std::string attrs = paint(fill);
  body_ << "<circle cx=\"" << num(center.x) << "\" cy=\"" << num(center.y) << "\" r=\"" << num(radius) << "\" "
        << attrs << "/>\n";
  ++shapes_;
}

std::string SvgSurface::str() const {
  std::ostringstream oss;
  oss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << width_ << "\" height=\"" << height_
      << "\" viewBox=\"0 0 " << width_ << " " << height_ << "\">\n"
      << body_.str()
      << "</svg>\n";
  return oss.str();
}

bool SvgSurface::writeToFile(const std::string& path, std::string* outError) const {
  if (path.empty()) {
    if (outError) *outError = "Empty output path.";
    return false;
  }

  std::ofstream f(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!f) {
    if (outError) *outError = "Failed to open for writing: " + path;
    return false;
  }
  f << str();
  if (!f) {
    if (outError) *outError = "Failed to write SVG: " + path;
    return false;
  }
  return true;
}

} // namespace ridgeline::render
