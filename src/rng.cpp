#include <cmath>
#include <metrochain/math/rng.hpp>
#include <numbers>

namespace metrochain::math {

double RandomSource::normal(const double mean, const double stddev) {
  // 1 - u keeps the log argument in (0, 1]
  const double u1 = 1.0 - uniform();
  const double u2 = uniform();
  const double z0 = std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * std::numbers::pi * u2);
  return z0 * stddev + mean;
}

double Rng::uniform() {
  return uni(gen);
}

} // namespace metrochain::math
