#include <metrochain/core/errors.hpp>
#include <metrochain/core/state.hpp>
#include <metrochain/log/logger.hpp>
#include <string>
#include <utility>

namespace metrochain::core {

StateShape StateShape::from_extents(const std::vector<std::size_t> &extents) {
  if (extents.empty())
    return StateShape{};

  if (extents.size() > 1) {
    MCLOG_ERROR("Initial state must be one dimensional, got {} dimensions", extents.size());
    throw InvalidArgument("initial state must be a one dimensional array, got " +
                          std::to_string(extents.size()) + " dimensions");
  }

  if (extents[0] == 0) {
    MCLOG_ERROR("Initial state must have at least one element");
    throw InvalidArgument("initial state must have at least one element");
  }

  return StateShape(extents[0]);
}

State::State(std::vector<double> values) : shape_(values.size()), values_(std::move(values)) {
  if (values_.empty()) {
    MCLOG_ERROR("Vector state must have at least one element");
    throw InvalidArgument("vector state must have at least one element");
  }
}

State State::from_array(const std::vector<std::size_t> &extents, std::vector<double> values) {
  const StateShape shape = StateShape::from_extents(extents);

  if (values.size() != shape.size()) {
    MCLOG_ERROR("State buffer holds {} values, shape expects {}", values.size(), shape.size());
    throw InvalidArgument("state buffer holds " + std::to_string(values.size()) +
                          " values but its shape expects " + std::to_string(shape.size()));
  }

  if (shape.is_scalar())
    return State(values[0]);
  return State(std::move(values));
}

void require_shape(const StateShape &expected, const State &s) {
  if (s.shape() == expected)
    return;

  MCLOG_ERROR("State has dimension {}, expected {}", s.dimension(), expected.dimension);
  throw InvalidArgument("state has dimension " + std::to_string(s.dimension()) + " but the chain has dimension " +
                        std::to_string(expected.dimension));
}

} // namespace metrochain::core
