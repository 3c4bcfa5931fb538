#include <metrochain/core/output.hpp>
#include <utility>

namespace metrochain::core {

std::vector<double> flatten(const std::vector<State> &states) {
  std::vector<double> out;
  if (states.empty())
    return out;

  out.reserve(states.size() * states.front().size());
  for (const State &s : states)
    out.insert(out.end(), s.values().begin(), s.values().end());
  return out;
}

void FullChainSink::begin(const State &initial, std::size_t samples, std::size_t burn_in_idx) {
  shape_ = initial.shape();
  states_.assign(samples, initial);
}

void FullChainSink::record(std::size_t step, const State &candidate, const State &current, bool accepted) {
  states_[step] = current;
}

Chain FullChainSink::take(const RunStats &stats) {
  return Chain{shape_, std::move(states_), stats};
}

void PartitionSink::begin(const State &initial, std::size_t samples, std::size_t burn_in_idx) {
  shape_ = initial.shape();
  burn_in_idx_ = burn_in_idx;
  accepted_.clear();
  rejected_.clear();
}

void PartitionSink::record(std::size_t step, const State &candidate, const State &current, bool accepted) {
  if (step < burn_in_idx_)
    return;

  if (accepted)
    accepted_.push_back(candidate);
  else
    rejected_.push_back(candidate);
}

Partition PartitionSink::take(const RunStats &stats) {
  return Partition{shape_, std::move(accepted_), std::move(rejected_), stats};
}

} // namespace metrochain::core
