#include "ridgeline/proc/Terrain.h"

#include "ridgeline/core/Log.h"

#include <cmath>
#include <sstream>

namespace ridgeline::proc {

ConstrainedRandoms::ConstrainedRandoms(core::RandomSource& rng,
                                       std::size_t count,
                                       double min,
                                       double max,
                                       double minDiffFraction)
    : rng_(rng), count_(count), min_(min), size_(max - min), minDiff_(minDiffFraction) {
  if (count_ == 0) return;

  if (minDiff_ > kMinDiffWarnAbove) {
    std::ostringstream oss;
    oss << "Terrain: minimum peak difference " << minDiff_
        << " is over-tuned, random generation is very restricted and may take a long time";
    RIDGELINE_LOG_WARN(oss.str());
  }
  if (minDiff_ > kMinDiffCeiling) {
    std::ostringstream oss;
    oss << "Terrain: minimum peak difference clamped from " << minDiff_ << " to " << kMinDiffCeiling
        << " to keep generation finite";
    RIDGELINE_LOG_WARN(oss.str());
    minDiff_ = kMinDiffCeiling;
  }
}

bool ConstrainedRandoms::next(double& out) {
  if (produced_ >= count_) return false;

  double raw = rng_.unit();
  if (produced_ > 0) {
    while (std::fabs(raw - prevRaw_) < minDiff_) raw = rng_.unit();
  }

  prevRaw_ = raw;
  ++produced_;
  out = raw * size_ + min_;
  return true;
}

std::vector<double> generateConstrainedRandoms(core::RandomSource& rng,
                                               std::size_t count,
                                               double min,
                                               double max,
                                               double minDiffFraction) {
  std::vector<double> out;
  out.reserve(count);

  ConstrainedRandoms seq(rng, count, min, max, minDiffFraction);
  double v = 0.0;
  while (seq.next(v)) out.push_back(v);
  return out;
}

std::optional<Silhouette> generatePeaks(core::RandomSource& rng,
                                        IntRange peakCountRange,
                                        Bounds yBounds,
                                        Dimensions dims,
                                        double peakiness,
                                        double roughness,
                                        std::string* outError) {
  if (peakCountRange.min < 1) {
    if (outError) *outError = "Peak count range must start at 1 or more (got " + std::to_string(peakCountRange.min) + ")";
    return std::nullopt;
  }
  if (peakCountRange.min > peakCountRange.max) {
    if (outError) {
      *outError = "Peak count range is inverted (" + std::to_string(peakCountRange.min) + " > " +
                  std::to_string(peakCountRange.max) + ")";
    }
    return std::nullopt;
  }
  if (peakCountRange.max > kMaxPeakCount) {
    if (outError) {
      *outError = "Peak count " + std::to_string(peakCountRange.max) + " exceeds the limit of " +
                  std::to_string(kMaxPeakCount);
    }
    return std::nullopt;
  }

  // TODO: perturb the cliff edges between peaks by roughness.
  (void)roughness;

  // Two extra peaks sit just off-screen on the left and right.
  const int peakCount = rng.rangeInt(peakCountRange.min, peakCountRange.max) + 2;
  const double slots = static_cast<double>(peakCount - 2);

  const std::vector<double> ys =
    generateConstrainedRandoms(rng, static_cast<std::size_t>(peakCount), yBounds.min, yBounds.max, 0.3 * peakiness);

  // Even spacing, each peak centred in its slot, then up to +-10% of a slot of jitter.
  const double jitter = 0.2 / slots;
  std::vector<double> xs;
  xs.reserve(static_cast<std::size_t>(peakCount));
  for (int i = 0; i < peakCount; ++i) {
    const double x = (static_cast<double>(i) - 0.5) / slots;
    xs.push_back(x + (rng.unit() - 0.5) * jitter);
  }

  const double w = static_cast<double>(dims.width);
  const double h = static_cast<double>(dims.height);

  Silhouette out;
  out.reserve(static_cast<std::size_t>(peakCount) + 2);
  for (int i = 0; i < peakCount; ++i) {
    // Fraction space runs right to left.
    out.push_back({(1.0 - xs[(std::size_t)i]) * w, ys[(std::size_t)i] * h});
  }

  out.push_back({0.0, h});
  out.push_back({w, h});
  return out;
}

} // namespace ridgeline::proc
