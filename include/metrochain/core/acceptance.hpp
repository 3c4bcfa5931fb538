#pragma once
#include <functional>
#include <metrochain/core/state.hpp>
#include <optional>
#include <string_view>
#include <utility>

namespace metrochain::core {

// Outcome of scoring one transition. When `certain` is set the candidate is
// accepted without consuming a uniform draw, otherwise it is accepted iff
// u < probability.
struct Decision {
  bool certain{false};
  double probability{0.0};

  static Decision always() { return {true, 1.0}; }
  static Decision with_probability(double p) { return {false, p}; }
};

using LogLikelihoodFn = std::function<double(const State &)>;
using LogPriorFn = std::function<double(const State &)>;
using PriorFn = std::function<double(const State &)>;
using AcceptanceFn = std::function<double(const State &current, const State &candidate)>;

// Closes a likelihood of the form f(state, data) over its data.
template <class F, class Data>
LogLikelihoodFn bind_data(F log_likelihood, Data data) {
  return [fn = std::move(log_likelihood), data = std::move(data)](const State &s) {
    return fn(s, data);
  };
}

class AcceptanceRule {
public:
  virtual ~AcceptanceRule() = default;

  // Called once per run before the first transition.
  virtual void start(const State &initial) {}

  virtual Decision evaluate(const State &current, const State &candidate) = 0;

  // The candidate passed to the last evaluate() became the current state.
  virtual void accepted() {}

  virtual std::string_view name() const = 0;
};

// Shared log-space logic: delta = score(candidate) - score(current).
// The current state's score is kept until a candidate is accepted.
class PosteriorRatioRule : public AcceptanceRule {
public:
  void start(const State &initial) override;
  Decision evaluate(const State &current, const State &candidate) override;
  void accepted() override;

protected:
  virtual double score(const State &s) = 0;

private:
  std::optional<double> current_score_;
  double candidate_score_{0.0};
};

// log L(x, data) + log P(x)
class LogPosteriorRatio : public PosteriorRatioRule {
public:
  LogPosteriorRatio(LogLikelihoodFn log_likelihood, LogPriorFn log_prior);
  std::string_view name() const override { return "log-posterior-ratio"; }

protected:
  double score(const State &s) override;

private:
  LogLikelihoodFn log_likelihood;
  LogPriorFn log_prior;
};

// log L(x, data) + ln(prior(x)), prior given in linear space.
// Throws ScoringError when prior(x) is not strictly positive.
class RawPriorRatio : public PosteriorRatioRule {
public:
  RawPriorRatio(LogLikelihoodFn log_likelihood, PriorFn prior);
  std::string_view name() const override { return "raw-probability-ratio"; }

protected:
  double score(const State &s) override;

private:
  LogLikelihoodFn log_likelihood;
  PriorFn prior;
};

// Caller supplies the acceptance ratio directly, in linear space.
class ExternalAcceptance : public AcceptanceRule {
public:
  explicit ExternalAcceptance(AcceptanceFn acceptance);
  Decision evaluate(const State &current, const State &candidate) override;
  std::string_view name() const override { return "external-acceptance"; }

private:
  AcceptanceFn acceptance;
};

} // namespace metrochain::core
