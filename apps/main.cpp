#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <metrochain/metrochain.hpp>
#include <string>
#include <vector>

using namespace metrochain::core;
using namespace metrochain::log;

// Posterior of a Gaussian mean with known unit variance, prior N(5, 2^2).
//
// usage: metrochain_demo [samples] [burn_in] [seed] [log_level]
int main(int argc, char **argv) {
  SamplerConfig config;
  try {
    if (argc > 1)
      config.samples = std::stoll(argv[1]);
    if (argc > 2)
      config.burn_in = std::stod(argv[2]);
    if (argc > 3)
      config.seed = std::stoull(argv[3]);
  } catch (const std::exception &) {
    std::fprintf(stderr, "usage: %s [samples] [burn_in] [seed] [log_level]\n", argv[0]);
    return EXIT_FAILURE;
  }

  if (argc > 4) {
    auto level = parse_level(argv[4]);
    if (!level) {
      MCLOG_ERROR("Unknown log level '{}'", argv[4]);
      return EXIT_FAILURE;
    }
    Logger::instance().set_level(*level);
  }

  const std::vector<double> data{4.2, 5.6, 4.9, 5.3, 5.0};

  auto log_likelihood = [](const State &s, const std::vector<double> &obs) {
    double total = 0.0;
    for (double y : obs)
      for (double x : s.values())
        total += -0.5 * (y - x) * (y - x);
    return total;
  };
  auto log_prior = [](const State &s) {
    double total = 0.0;
    for (double x : s.values())
      total += -0.5 * (x - 5.0) * (x - 5.0) / 4.0;
    return total;
  };
  ProposalFn proposal = [](const State &current, RandomSource &rng) {
    if (current.is_scalar())
      return State(current.scalar() + rng.normal(0.0, 1.0));
    State next = current;
    for (std::size_t k = 0; k < next.size(); ++k)
      next[k] += rng.normal(0.0, 1.0);
    return next;
  };

  LogPosteriorRatio rule(bind_data(log_likelihood, data), log_prior);

  try {
    Partition scalar = sample_partition(State(0.0), config, proposal, rule);
    double mean = 0.0;
    for (const State &s : scalar.accepted)
      mean += s.scalar();
    if (!scalar.accepted.empty())
      mean /= static_cast<double>(scalar.accepted.size());

    MCLOG_INFO("Scalar chain: {} accepted, {} rejected, acceptance rate {:.3f}", scalar.accepted.size(),
               scalar.rejected.size(), scalar.stats.acceptance_rate());
    std::printf("scalar posterior mean: %.4f\n", mean);

    Chain chain = sample_chain(State(std::vector<double>{0.0, 0.0}), config, proposal, rule);
    std::vector<double> means(2, 0.0);
    for (const State &s : chain.states)
      for (std::size_t k = 0; k < 2; ++k)
        means[k] += s[k] / static_cast<double>(chain.states.size());

    MCLOG_INFO("Vector chain: {} states, acceptance rate {:.3f}", chain.states.size(),
               chain.stats.acceptance_rate());
    std::printf("vector posterior mean: (%.4f, %.4f)\n", means[0], means[1]);
  } catch (const InvalidArgument &e) {
    std::fprintf(stderr, "invalid argument: %s\n", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
