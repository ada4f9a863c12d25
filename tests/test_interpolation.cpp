#include "test_harness.h"

#include "ridgeline/math/Interpolation.h"

using ridgeline::math::Polynomial;
using ridgeline::math::sampleLinear;

int test_interpolation() {
  int failures = 0;

  // Endpoints are hit exactly for any non-zero sweep length.
  {
    const double starts[] = {0.0, -3.5, 0.15, 100.0};
    const double ends[] = {1.0, 0.85, 0.7, -42.0};
    const int maxes[] = {1, 2, 7, 31};
    for (double s : starts) {
      for (double e : ends) {
        for (int m : maxes) {
          CHECK(sampleLinear(s, e, 0, m) == s);
          CHECK(sampleLinear(s, e, m, m) == e);
        }
      }
    }
  }

  // Midpoints and extrapolation past maxI.
  {
    CHECK_NEAR(sampleLinear(0.0, 1.0, 1, 2), 0.5, 1e-12);
    CHECK_NEAR(sampleLinear(0.4, 0.1, 3, 7), 0.4 + (0.1 - 0.4) * 3.0 / 7.0, 1e-12);
    CHECK_NEAR(sampleLinear(0.15, 0.7, 9, 8), 0.15 * (1.0 - 9.0 / 8.0) + 0.7 * 9.0 / 8.0, 1e-12);
  }

  // Polynomial: terms are coefficients of ascending powers.
  {
    const Polynomial p{1.0, 2.0, 3.0};
    CHECK_NEAR(p.sample(0.0), 1.0, 1e-12);
    CHECK_NEAR(p.sample(2.0), 1.0 + 4.0 + 12.0, 1e-12);
    CHECK_NEAR(p.sample(-1.0), 1.0 - 2.0 + 3.0, 1e-12);
    CHECK(p.degree() == 2);

    const Polynomial constant{4.25};
    CHECK_NEAR(constant.sample(123.0), 4.25, 1e-12);

    const Polynomial empty;
    CHECK(empty.sample(5.0) == 0.0);

    const Polynomial cubic(std::vector<double>{0.0, 0.0, 0.0, 0.5});
    CHECK_NEAR(cubic.sample(2.0), 4.0, 1e-12);
  }

  return failures;
}
