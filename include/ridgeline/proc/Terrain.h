#pragma once

#include "ridgeline/core/Random.h"
#include "ridgeline/math/Vec2.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ridgeline::proc {

struct IntRange {
  int min{0};
  int max{0};
};

struct Bounds {
  double min{0.0};
  double max{0.0};
};

struct Dimensions {
  int width{0};
  int height{0};
};

// Closed ridge outline in pixel space: generated peaks (two of them off-screen
// anchors) followed by the bottom-left and bottom-right image corners.
using Silhouette = std::vector<math::Vec2d>;

// Above this the rejection loop gets slow; a warning is logged.
inline constexpr double kMinDiffWarnAbove = 0.45;
// Hard ceiling for the minimum difference. Past 0.5 some draws have no valid successor.
inline constexpr double kMinDiffCeiling = 0.49;

// Largest visible peak count generatePeaks accepts.
inline constexpr int kMaxPeakCount = 4096;

// Lazily draws `count` values in [min,max).
//
// Every raw [0,1) draw after the first differs from the previous raw draw by at
// least minDiffFraction; draws that don't are rejected and redrawn. The check
// runs on the raw draw, not on the scaled value, so minDiffFraction is a fraction
// of the unit interval whatever min and max are.
//
// There is no retry cap. Clamping minDiffFraction to kMinDiffCeiling is what
// keeps the loop finite.
class ConstrainedRandoms {
public:
  ConstrainedRandoms(core::RandomSource& rng,
                     std::size_t count,
                     double min,
                     double max,
                     double minDiffFraction = 0.2);

  // Produces the next value. Returns false once `count` values were produced.
  bool next(double& out);

  std::size_t remaining() const { return count_ - produced_; }

  // Raw [0,1) draw behind the most recent value (0 before the first).
  double lastRaw() const { return prevRaw_; }

  // Effective minimum difference after clamping.
  double minDiffFraction() const { return minDiff_; }

private:
  core::RandomSource& rng_;
  std::size_t count_{0};
  std::size_t produced_{0};
  double min_{0.0};
  double size_{0.0};
  double minDiff_{0.0};
  double prevRaw_{0.0};
};

// Eager form of ConstrainedRandoms.
std::vector<double> generateConstrainedRandoms(core::RandomSource& rng,
                                               std::size_t count,
                                               double min,
                                               double max,
                                               double minDiffFraction = 0.2);

// Generate one mountain ridge.
//
// peakCountRange: visible peaks, drawn inclusively; two off-screen anchors are added.
// yBounds:        peak heights as fractions of the image height.
// peakiness:      minimum height difference between neighbours is 0.3 * peakiness.
// roughness:      reserved; accepted and currently ignored.
//
// The result has (drawn peaks + 2) + 2 points. Returns nullopt, before any
// draw, when peakCountRange.min < 1, min > max or max > kMaxPeakCount.
std::optional<Silhouette> generatePeaks(core::RandomSource& rng,
                                        IntRange peakCountRange,
                                        Bounds yBounds,
                                        Dimensions dims,
                                        double peakiness,
                                        double roughness = 0.0,
                                        std::string* outError = nullptr);

} // namespace ridgeline::proc
