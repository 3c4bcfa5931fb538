#pragma once
#include <stdexcept>
#include <string>

namespace metrochain::core {

// Bad sampler input, raised before the first transition.
class InvalidArgument : public std::invalid_argument {
public:
  explicit InvalidArgument(const std::string &what) : std::invalid_argument(what) {}
};

// A score could not be computed for a state, e.g. a linear prior <= 0.
class ScoringError : public std::domain_error {
public:
  explicit ScoringError(const std::string &what) : std::domain_error(what) {}
};

} // namespace metrochain::core
