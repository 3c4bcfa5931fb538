#include <cmath>
#include <metrochain/core/acceptance.hpp>
#include <metrochain/core/errors.hpp>
#include <string>

namespace metrochain::core {

void PosteriorRatioRule::start(const State &initial) {
  current_score_.reset();
}

Decision PosteriorRatioRule::evaluate(const State &current, const State &candidate) {
  candidate_score_ = score(candidate);
  if (!current_score_)
    current_score_ = score(current);

  const double delta = candidate_score_ - *current_score_;

  // exp() of a large positive delta overflows, and it would be accepted anyway
  if (delta >= 0.0)
    return Decision::always();

  // NaN falls through here and is rejected by every draw
  return Decision::with_probability(std::exp(delta));
}

void PosteriorRatioRule::accepted() {
  current_score_ = candidate_score_;
}

LogPosteriorRatio::LogPosteriorRatio(LogLikelihoodFn log_likelihood, LogPriorFn log_prior)
    : log_likelihood(std::move(log_likelihood)), log_prior(std::move(log_prior)) {}

double LogPosteriorRatio::score(const State &s) {
  return log_likelihood(s) + log_prior(s);
}

RawPriorRatio::RawPriorRatio(LogLikelihoodFn log_likelihood, PriorFn prior)
    : log_likelihood(std::move(log_likelihood)), prior(std::move(prior)) {}

double RawPriorRatio::score(const State &s) {
  const double p = prior(s);
  if (!(p > 0.0))
    throw ScoringError("prior must be strictly positive to take its log, got " + std::to_string(p));
  return log_likelihood(s) + std::log(p);
}

ExternalAcceptance::ExternalAcceptance(AcceptanceFn acceptance) : acceptance(std::move(acceptance)) {}

Decision ExternalAcceptance::evaluate(const State &current, const State &candidate) {
  const double ratio = acceptance(current, candidate);
  if (ratio >= 1.0)
    return Decision::always();
  return Decision::with_probability(ratio);
}

} // namespace metrochain::core
