#include "ridgeline/math/Interpolation.h"

namespace ridgeline::math {

double sampleLinear(double start, double end, double i, double maxI) {
  const double t = i / maxI;
  return start * (1.0 - t) + end * t;
}

double Polynomial::sample(double x) const {
  double sum = 0.0;
  double xn = 1.0;
  for (double a : terms_) {
    sum += a * xn;
    xn *= x;
  }
  return sum;
}

} // namespace ridgeline::math
