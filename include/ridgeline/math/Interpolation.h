#pragma once

#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

namespace ridgeline::math {

// Sample the line through f(0) = start and f(maxI) = end at point i.
//
// maxI must be non-zero; callers validate their sweep lengths up front.
double sampleLinear(double start, double end, double i, double maxI);

// A polynomial sum(terms[n] * x^n), lowest order first.
class Polynomial {
public:
  Polynomial() = default;
  Polynomial(std::initializer_list<double> terms) : terms_(terms) {}
  explicit Polynomial(std::vector<double> terms) : terms_(std::move(terms)) {}

  double sample(double x) const;

  const std::vector<double>& terms() const { return terms_; }
  std::size_t degree() const { return terms_.empty() ? 0 : terms_.size() - 1; }

private:
  std::vector<double> terms_;
};

} // namespace ridgeline::math
