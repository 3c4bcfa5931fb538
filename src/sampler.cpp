#include <cmath>
#include <metrochain/core/errors.hpp>
#include <metrochain/core/sampler.hpp>
#include <metrochain/log/logger.hpp>
#include <string>

namespace metrochain::core {

std::size_t SamplerConfig::burn_in_index() const {
  return static_cast<std::size_t>(std::floor(static_cast<double>(samples) * burn_in));
}

void validate(const SamplerConfig &config) {
  if (config.samples < 1) {
    MCLOG_ERROR("samples must be greater than 0, got {}", config.samples);
    throw InvalidArgument("samples must be greater than 0, got " + std::to_string(config.samples));
  }

  // written so that NaN fails too
  if (!(config.burn_in >= 0.0 && config.burn_in <= 1.0)) {
    MCLOG_ERROR("burn_in must be between 0 and 1, got {}", config.burn_in);
    throw InvalidArgument("burn_in must be between 0 and 1, got " + std::to_string(config.burn_in));
  }
}

Rng make_rng(const SamplerConfig &config) {
  return Rng(config.seed);
}

RunStats run_chain(const State &initial, const SamplerConfig &config, const ProposalFn &proposal,
                   AcceptanceRule &rule, ChainSink &sink, RandomSource &rng) {
  validate(config);

  const std::size_t samples = static_cast<std::size_t>(config.samples);
  const std::size_t burn_in_idx = config.burn_in_index();

  MCLOG_DEBUG("Sampling {} states of dimension {} with {}, burn-in index {}", samples,
              initial.dimension(), rule.name(), burn_in_idx);

  RunStats stats;
  State current = initial;

  rule.start(initial);
  sink.begin(initial, samples, burn_in_idx);

  for (std::size_t i = 1; i < samples; ++i) {
    State candidate = proposal(current, rng);

    const Decision decision = rule.evaluate(current, candidate);
    const bool accepted = decision.certain || rng.uniform() < decision.probability;

    ++stats.steps;
    if (accepted) {
      rule.accepted();
      current = candidate;
      ++stats.accepted;
    }

    sink.record(i, candidate, current, accepted);
  }

  MCLOG_DEBUG("Chain finished. Acceptance rate: {:.4f} ({} of {})", stats.acceptance_rate(),
              stats.accepted, stats.steps);
  return stats;
}

Chain sample_chain(const State &initial, const SamplerConfig &config, const ProposalFn &proposal,
                   AcceptanceRule &rule, RandomSource &rng) {
  FullChainSink sink;
  const RunStats stats = run_chain(initial, config, proposal, rule, sink, rng);
  return sink.take(stats);
}

Chain sample_chain(const State &initial, const SamplerConfig &config, const ProposalFn &proposal,
                   AcceptanceRule &rule) {
  Rng rng = make_rng(config);
  return sample_chain(initial, config, proposal, rule, rng);
}

Partition sample_partition(const State &initial, const SamplerConfig &config, const ProposalFn &proposal,
                           AcceptanceRule &rule, RandomSource &rng) {
  PartitionSink sink;
  const RunStats stats = run_chain(initial, config, proposal, rule, sink, rng);
  return sink.take(stats);
}

Partition sample_partition(const State &initial, const SamplerConfig &config, const ProposalFn &proposal,
                           AcceptanceRule &rule) {
  Rng rng = make_rng(config);
  return sample_partition(initial, config, proposal, rule, rng);
}

} // namespace metrochain::core
