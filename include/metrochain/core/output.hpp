#pragma once
#include <cstddef>
#include <metrochain/core/state.hpp>
#include <vector>

namespace metrochain::core {

struct RunStats {
  std::size_t steps{0};
  std::size_t accepted{0};

  double acceptance_rate() const {
    return steps == 0 ? 0.0 : static_cast<double>(accepted) / static_cast<double>(steps);
  }
};

// Every visited state, index 0 being the initial state.
struct Chain {
  StateShape shape;
  std::vector<State> states;
  RunStats stats;
};

// Proposed candidates at or past the burn-in index, split by decision.
struct Partition {
  StateShape shape;
  std::vector<State> accepted;
  std::vector<State> rejected;
  RunStats stats;
};

// Row-major (n x dimension) copy of the states' values; a scalar chain
// flattens to n values.
std::vector<double> flatten(const std::vector<State> &states);

// Receives the outcome of every transition, in step order.
class ChainSink {
public:
  virtual ~ChainSink() = default;

  virtual void begin(const State &initial, std::size_t samples, std::size_t burn_in_idx) = 0;

  // `current` is the chain position after the decision at `step`.
  virtual void record(std::size_t step, const State &candidate, const State &current, bool accepted) = 0;
};

// Fixed-size buffer, slot i written at step i. Burn-in does not apply.
class FullChainSink : public ChainSink {
public:
  void begin(const State &initial, std::size_t samples, std::size_t burn_in_idx) override;
  void record(std::size_t step, const State &candidate, const State &current, bool accepted) override;

  Chain take(const RunStats &stats);

private:
  StateShape shape_;
  std::vector<State> states_;
};

// Append-only accepted/rejected sequences of candidates.
class PartitionSink : public ChainSink {
public:
  void begin(const State &initial, std::size_t samples, std::size_t burn_in_idx) override;
  void record(std::size_t step, const State &candidate, const State &current, bool accepted) override;

  Partition take(const RunStats &stats);

private:
  StateShape shape_;
  std::size_t burn_in_idx_{0};
  std::vector<State> accepted_;
  std::vector<State> rejected_;
};

} // namespace metrochain::core
