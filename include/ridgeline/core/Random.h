#pragma once

#include "ridgeline/core/Hash.h"
#include "ridgeline/core/Types.h"

#include <string_view>
#include <type_traits>
#include <utility>

namespace ridgeline::core {

// SplitMix64: fast, simple PRNG with 64-bit state.
// Good enough for procedural generation. Not suitable for crypto.
class SplitMix64 {
public:
  explicit SplitMix64(u64 seed = 0) : state_(seed) {}

  void reseed(u64 seed) { state_ = seed; }

  u64 nextU64() {
    u64 z = (state_ += 0x9E3779B97F4A7C15ull);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    return z ^ (z >> 31);
  }

  // [0,1)
  double nextDouble() {
    // 53 random bits -> double in [0,1).
    constexpr double inv = 1.0 / static_cast<double>(1ull << 53);
    return static_cast<double>(nextU64() >> 11) * inv;
  }

  // Inclusive range for integers
  template <class Int, std::enable_if_t<std::is_integral_v<Int>, int> = 0>
  Int range(Int minInclusive, Int maxInclusive) {
    if (maxInclusive < minInclusive) std::swap(minInclusive, maxInclusive);
    const u64 span = static_cast<u64>(maxInclusive) - static_cast<u64>(minInclusive) + 1ull;
    return static_cast<Int>(minInclusive + static_cast<Int>(nextU64() % span));
  }

private:
  u64 state_{0};
};

// The randomness the generators consume. Everything that draws random numbers
// takes one of these by reference so tests can script the exact draws.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Uniform in [0,1).
  virtual double unit() = 0;

  // Uniform integer in [lo,hi] (inclusive).
  virtual int rangeInt(int lo, int hi) = 0;
};

class SplitMixRandom final : public RandomSource {
public:
  explicit SplitMixRandom(u64 seed = 0) : rng_(seed) {}

  void reseed(u64 seed) { rng_.reseed(seed); }

  double unit() override { return rng_.nextDouble(); }
  int rangeInt(int lo, int hi) override { return rng_.range<int>(lo, hi); }

private:
  SplitMix64 rng_;
};

inline u64 seedFromText(std::string_view text) { return fnv1a64(text); }

// Seed given on the command line: all-digit text that fits in 64 bits is
// used as is, anything else non-empty is hashed with seedFromText.
// Returns false only for empty text.
bool parseSeed(std::string_view text, u64& out);

// Seed of image `index` in a batch. Index 0 keeps the base seed.
u64 batchSeed(u64 base, u64 index);

} // namespace ridgeline::core
