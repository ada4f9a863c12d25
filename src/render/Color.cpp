#include "ridgeline/render/Color.h"

#include <stdexcept>

namespace ridgeline::render {

Hsv Hsv::darken(double amount) const {
  return Hsv(hue, saturation, value * (1.0 - amount), alpha);
}

Hsv Hsv::desaturate(double amount) const {
  return Hsv(hue, saturation * (1.0 - amount), value, alpha);
}

Hsv Hsv::withOverrides(std::optional<int> h,
                       std::optional<double> s,
                       std::optional<double> v,
                       std::optional<double> a) const {
  return Hsv(h.value_or(hue), s.value_or(saturation), v.value_or(value), a.value_or(alpha));
}

// h in [0,1] covers the full circle; sector 6 wraps to sector 0.
static Rgb hsvToRgb(double h, double s, double v) {
  if (s == 0.0) return {v, v, v};

  int sector = static_cast<int>(h * 6.0);
  const double f = h * 6.0 - sector;
  const double p = v * (1.0 - s);
  const double q = v * (1.0 - s * f);
  const double t = v * (1.0 - s * (1.0 - f));
  sector = ((sector % 6) + 6) % 6;

  switch (sector) {
    case 0: return {v, t, p};
    case 1: return {q, v, p};
    case 2: return {p, v, t};
    case 3: return {p, q, v};
    case 4: return {t, p, v};
    default: return {v, p, q};
  }
}

Rgb Hsv::toRgb() const {
  return hsvToRgb(static_cast<double>(hue) / 359.0, saturation, value);
}

Rgba Hsv::toRgba() const {
  const Rgb c = toRgb();
  return {c.r, c.g, c.b, alpha};
}

Gradient::Gradient(std::initializer_list<Hsv> stops) : Gradient(std::vector<Hsv>(stops)) {}

Gradient::Gradient(std::vector<Hsv> stops) : stops_(std::move(stops)) {
  if (stops_.empty()) {
    throw std::invalid_argument("Gradient needs at least one stop");
  }
}

LinearGradient Gradient::toLinearGradient(double x0, double y0, double x1, double y1) const {
  LinearGradient g;
  g.p0 = {x0, y0};
  g.p1 = {x1, y1};
  g.stops.reserve(stops_.size());

  const double n = static_cast<double>(stops_.size());
  for (std::size_t i = 0; i < stops_.size(); ++i) {
    g.stops.push_back({static_cast<double>(i) / n, stops_[i].toRgba()});
  }
  return g;
}

} // namespace ridgeline::render
