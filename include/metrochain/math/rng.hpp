#pragma once
#include <cstdint>
#include <random>

namespace metrochain::math {

// Source of uniform variates consumed by the sampler. Everything else is
// derived from uniform() so a substituted source controls the whole stream.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Uniform in [0, 1).
  virtual double uniform() = 0;

  // Box-Muller, two uniform draws per call.
  double normal(const double mean, const double stddev);
};

struct Rng : public RandomSource {
  std::mt19937_64 gen;
  std::uniform_real_distribution<double> uni{0.0, 1.0};

  explicit Rng(std::uint64_t seed = std::random_device{}()) : gen(seed) {}

  double uniform() override;
};

} // namespace metrochain::math
