#include "ridgeline/render/RasterSurface.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace ridgeline::render {

namespace {

struct Crossing {
  double x{0.0};
  int winding{0};
};

static inline double clamp01(double v) { return std::clamp(v, 0.0, 1.0); }

static inline std::uint8_t toByte(double v) {
  return (std::uint8_t)std::lround(clamp01(v) * 255.0);
}

static inline Rgba lerp(const Rgba& a, const Rgba& b, double t) {
  return {a.r + (b.r - a.r) * t,
          a.g + (b.g - a.g) * t,
          a.b + (b.b - a.b) * t,
          a.a + (b.a - a.a) * t};
}

// First pixel whose centre lies at or right of x. Saturates far outside any
// image so huge coordinates never overflow the int conversion; NaN maps to 0.
static inline int firstPixelAtOrAfter(double x) {
  constexpr double kLimit = 1.0e9;
  if (std::isnan(x)) return 0;
  return (int)std::ceil(std::clamp(x, -kLimit, kLimit) - 0.5);
}

} // namespace

Rgba sampleLinearGradient(const LinearGradient& g, const math::Vec2d& p) {
  if (g.stops.empty()) return Rgba{0.0, 0.0, 0.0, 0.0};

  const math::Vec2d d = g.p1 - g.p0;
  const double len2 = math::dot(d, d);
  if (len2 <= 0.0) return g.stops.back().color;

  const double t = math::dot(p - g.p0, d) / len2;

  if (t <= g.stops.front().offset) return g.stops.front().color;
  if (t >= g.stops.back().offset) return g.stops.back().color;

  for (std::size_t i = 1; i < g.stops.size(); ++i) {
    const GradientStop& a = g.stops[i - 1];
    const GradientStop& b = g.stops[i];
    if (t > b.offset) continue;
    const double span = b.offset - a.offset;
    if (span <= 0.0) return b.color;
    return lerp(a.color, b.color, (t - a.offset) / span);
  }
  return g.stops.back().color;
}

RasterSurface::RasterSurface(int width, int height, Rgba clearColor) {
  image_.w = std::max(0, width);
  image_.h = std::max(0, height);
  image_.rgba.resize((std::size_t)image_.w * (std::size_t)image_.h * 4u);
  clear(clearColor);
}

void RasterSurface::clear(const Rgba& c) {
  const std::uint8_t px[4] = {toByte(c.r), toByte(c.g), toByte(c.b), toByte(c.a)};
  for (std::size_t i = 0; i < image_.rgba.size(); i += 4) {
    std::copy(px, px + 4, image_.rgba.begin() + (std::ptrdiff_t)i);
  }
}

Rgba RasterSurface::pixel(int x, int y) const {
  if (x < 0 || y < 0 || x >= image_.w || y >= image_.h) return Rgba{0.0, 0.0, 0.0, 0.0};
  const std::size_t idx = ((std::size_t)y * (std::size_t)image_.w + (std::size_t)x) * 4u;
  return {image_.rgba[idx + 0] / 255.0,
          image_.rgba[idx + 1] / 255.0,
          image_.rgba[idx + 2] / 255.0,
          image_.rgba[idx + 3] / 255.0};
}

void RasterSurface::blend(std::size_t idx, const Rgba& src) {
  const double sa = clamp01(src.a);
  if (sa <= 0.0) return;

  std::uint8_t* dst = image_.rgba.data() + idx;
  const double da = dst[3] / 255.0;
  const double outA = sa + da * (1.0 - sa);
  if (outA <= 0.0) return;

  const double k = da * (1.0 - sa);
  const double sc[3] = {src.r, src.g, src.b};
  for (int c = 0; c < 3; ++c) {
    const double dc = dst[c] / 255.0;
    dst[c] = toByte((clamp01(sc[c]) * sa + dc * k) / outA);
  }
  dst[3] = toByte(outA);
}

void RasterSurface::fillSpan(int y, int x0, int x1, const Fill& fill) {
  if (y < 0 || y >= image_.h) return;
  x0 = std::max(x0, 0);
  x1 = std::min(x1, image_.w);
  if (x0 >= x1) return;

  const Rgba* solid = std::get_if<Rgba>(&fill);
  const LinearGradient* grad = std::get_if<LinearGradient>(&fill);
  const double cy = y + 0.5;

  std::size_t idx = ((std::size_t)y * (std::size_t)image_.w + (std::size_t)x0) * 4u;
  for (int x = x0; x < x1; ++x, idx += 4) {
    if (solid) {
      blend(idx, *solid);
    } else if (grad) {
      blend(idx, sampleLinearGradient(*grad, {x + 0.5, cy}));
    }
  }
}

void RasterSurface::fillRect(double x, double y, double w, double h, const Fill& fill) {
  if (w <= 0.0 || h <= 0.0) return;

  const int px0 = firstPixelAtOrAfter(x);
  const int px1 = firstPixelAtOrAfter(x + w);
  const int py0 = std::max(firstPixelAtOrAfter(y), 0);
  const int py1 = std::min(firstPixelAtOrAfter(y + h), image_.h);
  for (int py = py0; py < py1; ++py) fillSpan(py, px0, px1, fill);
}

void RasterSurface::fillPolygon(const std::vector<math::Vec2d>& points, const Fill& fill) {
  if (points.size() < 3) return;

  double minY = points.front().y;
  double maxY = points.front().y;
  for (const math::Vec2d& p : points) {
    minY = std::min(minY, p.y);
    maxY = std::max(maxY, p.y);
  }

  const int py0 = std::max(firstPixelAtOrAfter(minY), 0);
  const int py1 = std::min(firstPixelAtOrAfter(maxY), image_.h);

  std::vector<Crossing> xs;
  xs.reserve(points.size());

  for (int py = py0; py < py1; ++py) {
    const double cy = py + 0.5;
    xs.clear();

    for (std::size_t i = 0; i < points.size(); ++i) {
      const math::Vec2d& a = points[i];
      const math::Vec2d& b = points[(i + 1) % points.size()];
      if (a.y == b.y) continue;

      // Half-open in y so shared vertices are counted once.
      const bool down = a.y < b.y;
      const double y0 = down ? a.y : b.y;
      const double y1 = down ? b.y : a.y;
      if (cy < y0 || cy >= y1) continue;

      const double x = a.x + (cy - a.y) * (b.x - a.x) / (b.y - a.y);
      xs.push_back({x, down ? 1 : -1});
    }

    std::sort(xs.begin(), xs.end(), [](const Crossing& l, const Crossing& r) { return l.x < r.x; });

    // Nonzero winding: fill wherever the running sum is not zero.
    int winding = 0;
    for (std::size_t i = 0; i + 1 < xs.size(); ++i) {
      winding += xs[i].winding;
      if (winding == 0) continue;
      fillSpan(py, firstPixelAtOrAfter(xs[i].x), firstPixelAtOrAfter(xs[i + 1].x), fill);
    }
  }
}

void RasterSurface::fillCircle(const math::Vec2d& center, double radius, const Fill& fill) {
  if (radius <= 0.0) return;

  const int py0 = std::max(firstPixelAtOrAfter(center.y - radius), 0);
  const int py1 = std::min(firstPixelAtOrAfter(center.y + radius), image_.h);
  const double r2 = radius * radius;

  for (int py = py0; py < py1; ++py) {
    const double dy = py + 0.5 - center.y;
    const double rem = r2 - dy * dy;
    if (rem <= 0.0) continue;
    const double half = std::sqrt(rem);
    fillSpan(py, firstPixelAtOrAfter(center.x - half), firstPixelAtOrAfter(center.x + half), fill);
  }
}

} // namespace ridgeline::render
