#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <metrochain/core/acceptance.hpp>
#include <metrochain/core/output.hpp>
#include <metrochain/core/state.hpp>
#include <metrochain/math/rng.hpp>
#include <random>

using metrochain::math::RandomSource;
using metrochain::math::Rng;

namespace metrochain::core {

struct SamplerConfig {
  std::int64_t samples = 10000;
  double burn_in = 0.0; // fraction of leading steps left out of a Partition
  std::uint64_t seed = std::random_device{}();

  // floor(samples * burn_in)
  std::size_t burn_in_index() const;
};

// Throws InvalidArgument for samples < 1 or burn_in outside [0, 1].
void validate(const SamplerConfig &config);

Rng make_rng(const SamplerConfig &config);

// Draws a candidate from the current position. Must return a state of the
// same shape as its argument.
using ProposalFn = std::function<State(const State &, RandomSource &)>;

/// @brief Run samples - 1 Metropolis-Hastings transitions from `initial`
/// @param initial Position at index 0, never itself accepted or rejected
/// @param config Sample count and burn-in fraction, validated before the loop
/// @param proposal Candidate generator
/// @param rule Scoring strategy deciding each transition
/// @param sink Receives every transition outcome
/// @param rng Uniform stream, drawn at most once per step
/// @return Transition and acceptance counts
RunStats run_chain(const State &initial, const SamplerConfig &config, const ProposalFn &proposal,
                   AcceptanceRule &rule, ChainSink &sink, RandomSource &rng);

/// @brief Full chain of `samples` states, rejections repeating the previous one
Chain sample_chain(const State &initial, const SamplerConfig &config, const ProposalFn &proposal,
                   AcceptanceRule &rule, RandomSource &rng);
Chain sample_chain(const State &initial, const SamplerConfig &config, const ProposalFn &proposal,
                   AcceptanceRule &rule);

/// @brief Accepted and rejected candidates past the burn-in index
Partition sample_partition(const State &initial, const SamplerConfig &config, const ProposalFn &proposal,
                           AcceptanceRule &rule, RandomSource &rng);
Partition sample_partition(const State &initial, const SamplerConfig &config, const ProposalFn &proposal,
                           AcceptanceRule &rule);

} // namespace metrochain::core
