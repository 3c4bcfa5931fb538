#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <metrochain/core/acceptance.hpp>
#include <metrochain/core/errors.hpp>
#include "test_utils.h"

using namespace ::testing;
using namespace metrochain::core;
using namespace metrochain::test_utils;

namespace {

double zero_prior(const State&) {
  return 0.0;
}

} // namespace

TEST(acceptance_test, uphill_move_is_certain) {
  LogPosteriorRatio rule([](const State& s) { return s.scalar(); }, zero_prior);
  rule.start(State(0.0));
  Decision d = rule.evaluate(State(0.0), State(1.0));
  EXPECT_TRUE(d.certain);
}

TEST(acceptance_test, equal_score_is_certain) {
  LogPosteriorRatio rule([](const State&) { return -3.0; }, zero_prior);
  rule.start(State(0.0));
  EXPECT_TRUE(rule.evaluate(State(0.0), State(10.0)).certain);
}

TEST(acceptance_test, downhill_move_has_probability_exp_delta) {
  LogPosteriorRatio rule([](const State& s) { return s.scalar(); }, zero_prior);
  rule.start(State(0.0));
  Decision d = rule.evaluate(State(0.0), State(-2.0));
  EXPECT_FALSE(d.certain);
  EXPECT_DOUBLE_EQ(d.probability, std::exp(-2.0));
}

TEST(acceptance_test, huge_uphill_delta_does_not_overflow) {
  LogPosteriorRatio rule([](const State& s) { return 1e6 * s.scalar(); }, zero_prior);
  rule.start(State(0.0));
  Decision d = rule.evaluate(State(0.0), State(1.0));
  EXPECT_TRUE(d.certain);
  EXPECT_TRUE(std::isfinite(d.probability));
}

TEST(acceptance_test, log_prior_is_added_to_log_likelihood) {
  LogPosteriorRatio rule(
      [](const State& s) { return s.scalar(); },
      [](const State& s) { return -2.0 * s.scalar(); });
  rule.start(State(0.0));
  // net score is -x, so moving up by 1 costs exp(-1)
  Decision d = rule.evaluate(State(0.0), State(1.0));
  EXPECT_FALSE(d.certain);
  EXPECT_DOUBLE_EQ(d.probability, std::exp(-1.0));
}

TEST(acceptance_test, current_score_is_reused_until_accepted) {
  int calls = 0;
  LogPosteriorRatio rule(
      [&calls](const State& s) {
        ++calls;
        return -s.scalar();
      },
      zero_prior);
  rule.start(State(0.0));

  rule.evaluate(State(0.0), State(1.0));
  EXPECT_EQ(calls, 2);

  // rejected: only the new candidate is scored
  rule.evaluate(State(0.0), State(2.0));
  EXPECT_EQ(calls, 3);

  // accepted: the candidate's score becomes the current one
  rule.accepted();
  Decision d = rule.evaluate(State(2.0), State(1.0));
  EXPECT_EQ(calls, 4);
  EXPECT_TRUE(d.certain);
}

TEST(acceptance_test, start_drops_cached_score) {
  int calls = 0;
  LogPosteriorRatio rule(
      [&calls](const State&) {
        ++calls;
        return 0.0;
      },
      zero_prior);
  rule.start(State(0.0));
  rule.evaluate(State(0.0), State(1.0));
  rule.start(State(5.0));
  rule.evaluate(State(5.0), State(6.0));
  EXPECT_EQ(calls, 4);
}

TEST(acceptance_test, raw_prior_matches_log_prior) {
  auto log_likelihood = [](const State& s) { return gaussian_log_density(s, 1.0, 2.0); };
  auto prior = [](const State& s) { return std::exp(-std::abs(s.scalar())); };
  auto log_prior = [prior](const State& s) { return std::log(prior(s)); };

  LogPosteriorRatio log_rule(log_likelihood, log_prior);
  RawPriorRatio raw_rule(log_likelihood, prior);
  log_rule.start(State(0.0));
  raw_rule.start(State(0.0));

  for (double x : {-3.0, -0.5, 0.25, 1.0, 4.0}) {
    Decision a = log_rule.evaluate(State(0.0), State(x));
    Decision b = raw_rule.evaluate(State(0.0), State(x));
    EXPECT_EQ(a.certain, b.certain) << "x = " << x;
    EXPECT_EQ(a.probability, b.probability) << "x = " << x;
  }
}

TEST(acceptance_test, non_positive_prior_is_a_scoring_error) {
  RawPriorRatio zero([](const State&) { return 0.0; }, [](const State&) { return 0.0; });
  zero.start(State(0.0));
  EXPECT_THROW(zero.evaluate(State(0.0), State(1.0)), ScoringError);

  RawPriorRatio negative(
      [](const State&) { return 0.0; },
      [](const State& s) { return s.scalar() > 0.5 ? -1.0 : 1.0; });
  negative.start(State(0.0));
  EXPECT_THROW(negative.evaluate(State(0.0), State(1.0)), ScoringError);

  RawPriorRatio nan(
      [](const State&) { return 0.0; },
      [](const State&) { return std::numeric_limits<double>::quiet_NaN(); });
  nan.start(State(0.0));
  EXPECT_THROW(nan.evaluate(State(0.0), State(1.0)), ScoringError);
}

TEST(acceptance_test, external_ratio_is_used_directly) {
  ExternalAcceptance rule([](const State& current, const State& candidate) {
    return candidate.scalar() / current.scalar();
  });
  rule.start(State(4.0));

  EXPECT_TRUE(rule.evaluate(State(4.0), State(4.0)).certain);
  EXPECT_TRUE(rule.evaluate(State(4.0), State(8.0)).certain);

  Decision d = rule.evaluate(State(4.0), State(1.0));
  EXPECT_FALSE(d.certain);
  EXPECT_DOUBLE_EQ(d.probability, 0.25);
}

TEST(acceptance_test, external_receives_current_then_candidate) {
  State seen_current, seen_candidate;
  ExternalAcceptance rule([&](const State& current, const State& candidate) {
    seen_current = current;
    seen_candidate = candidate;
    return 0.5;
  });
  rule.evaluate(State(1.0), State(2.0));
  EXPECT_EQ(seen_current, State(1.0));
  EXPECT_EQ(seen_candidate, State(2.0));
}

TEST(acceptance_test, nan_score_is_never_certain) {
  LogPosteriorRatio rule(
      [](const State& s) {
        return s.scalar() > 0.0 ? std::numeric_limits<double>::quiet_NaN() : 0.0;
      },
      zero_prior);
  rule.start(State(0.0));
  Decision d = rule.evaluate(State(0.0), State(1.0));
  EXPECT_FALSE(d.certain);
  EXPECT_FALSE(0.0 < d.probability);
}

TEST(acceptance_test, bind_data_passes_data_through) {
  std::vector<double> data{1.0, 2.0, 3.0};
  LogLikelihoodFn fn = bind_data(
      [](const State& s, const std::vector<double>& d) {
        double total = 0.0;
        for (double x : d) {
          total += x * s.scalar();
        }
        return total;
      },
      data);
  EXPECT_DOUBLE_EQ(fn(State(2.0)), 12.0);
}
