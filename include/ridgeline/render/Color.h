#pragma once

#include "ridgeline/math/Vec2.h"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <utility>
#include <vector>

namespace ridgeline::render {

struct Rgb {
  double r{0}, g{0}, b{0};
};

// Straight (non-premultiplied) RGBA, all channels in [0,1].
struct Rgba {
  double r{0}, g{0}, b{0}, a{1};

  bool operator==(const Rgba& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
  bool operator!=(const Rgba& o) const { return !(*this == o); }
};

// HSV colour value.
//
//  - hue is in integer degrees (0..359 by convention, never range checked)
//  - saturation/value/alpha are expected in [0,1] (caller responsibility)
//
// All transforms return a new value; an Hsv is never modified after construction.
struct Hsv {
  int hue{0};
  double saturation{0.0};
  double value{0.0};
  double alpha{1.0};

  constexpr Hsv() = default;
  constexpr Hsv(int h, double s, double v, double a = 1.0)
      : hue(h), saturation(s), value(v), alpha(a) {}

  // value *= (1 - amount)
  Hsv darken(double amount) const;
  // saturation *= (1 - amount)
  Hsv desaturate(double amount) const;

  // Copy with selected fields replaced. No arguments yields an equal copy.
  Hsv withOverrides(std::optional<int> h = std::nullopt,
                    std::optional<double> s = std::nullopt,
                    std::optional<double> v = std::nullopt,
                    std::optional<double> a = std::nullopt) const;

  // Hue is normalized by 359 (not 360) before conversion, so hue 359 lands on
  // exactly 1.0 and converts like hue 0.
  Rgb toRgb() const;
  Rgba toRgba() const;

  bool operator==(const Hsv& o) const {
    return hue == o.hue && saturation == o.saturation && value == o.value && alpha == o.alpha;
  }
  bool operator!=(const Hsv& o) const { return !(*this == o); }
};

struct GradientStop {
  double offset{0.0}; // [0,1] along p0 -> p1
  Rgba color{};
};

// Renderer-facing linear gradient: two endpoints in pixel space and ordered stops.
struct LinearGradient {
  math::Vec2d p0{};
  math::Vec2d p1{};
  std::vector<GradientStop> stops;
};

// An ordered, non-empty list of HSV stops. Stop order defines the
// interpolation axis.
class Gradient {
public:
  // Throws std::invalid_argument when given no stops.
  Gradient(std::initializer_list<Hsv> stops);
  explicit Gradient(std::vector<Hsv> stops);

  const Hsv& start() const { return stops_.front(); }
  const Hsv& end() const { return stops_.back(); }
  const Hsv& operator[](std::size_t i) const { return stops_[i]; }
  std::size_t size() const { return stops_.size(); }
  const std::vector<Hsv>& stops() const { return stops_; }

  // New gradient with mapper(index, stop) applied to every stop, in order.
  template <class Mapper>
  Gradient map(Mapper&& mapper) const {
    std::vector<Hsv> out;
    out.reserve(stops_.size());
    for (std::size_t i = 0; i < stops_.size(); ++i) {
      out.push_back(mapper(i, stops_[i]));
    }
    return Gradient(std::move(out));
  }

  // Stops are placed at i/size() for i in [0,size()), so the last colour
  // never sits at offset 1.0.
  LinearGradient toLinearGradient(double x0, double y0, double x1, double y1) const;

  bool operator==(const Gradient& o) const { return stops_ == o.stops_; }
  bool operator!=(const Gradient& o) const { return !(*this == o); }

private:
  std::vector<Hsv> stops_;
};

} // namespace ridgeline::render
