#include <gtest/gtest.h>
#include <metrochain/core/errors.hpp>
#include <metrochain/core/output.hpp>
#include <metrochain/core/state.hpp>

using namespace ::testing;
using namespace metrochain::core;

TEST(state_test, scalar_has_dimension_zero) {
  State s = 2.5;
  EXPECT_TRUE(s.is_scalar());
  EXPECT_EQ(s.dimension(), 0);
  EXPECT_EQ(s.size(), 1);
  EXPECT_EQ(s.scalar(), 2.5);
}

TEST(state_test, default_state_is_scalar_zero) {
  State s;
  EXPECT_TRUE(s.is_scalar());
  EXPECT_EQ(s.scalar(), 0.0);
}

TEST(state_test, vector_keeps_length) {
  State s(std::vector<double>{1.0, 2.0, 3.0});
  EXPECT_FALSE(s.is_scalar());
  EXPECT_EQ(s.dimension(), 3);
  EXPECT_EQ(s[1], 2.0);
}

TEST(state_test, vector_of_one_is_not_a_scalar) {
  State v(std::vector<double>{4.0});
  State s = 4.0;
  EXPECT_EQ(v.dimension(), 1);
  EXPECT_NE(v, s);
}

TEST(state_test, empty_vector_is_rejected) {
  EXPECT_THROW(State(std::vector<double>{}), InvalidArgument);
}

TEST(state_test, shape_from_extents) {
  EXPECT_TRUE(StateShape::from_extents({}).is_scalar());
  EXPECT_EQ(StateShape::from_extents({4}).dimension, 4);
  EXPECT_EQ(StateShape::from_extents({4}).size(), 4);
}

TEST(state_test, more_than_one_extent_is_rejected) {
  EXPECT_THROW(StateShape::from_extents({2, 2}), InvalidArgument);
  EXPECT_THROW(State::from_array({1, 3}, {1.0, 2.0, 3.0}), InvalidArgument);
}

TEST(state_test, from_array_checks_value_count) {
  EXPECT_THROW(State::from_array({3}, {1.0, 2.0}), InvalidArgument);
  EXPECT_THROW(State::from_array({}, {}), InvalidArgument);

  State scalar = State::from_array({}, {7.0});
  EXPECT_TRUE(scalar.is_scalar());
  EXPECT_EQ(scalar.scalar(), 7.0);

  State vec = State::from_array({2}, {1.0, -1.0});
  EXPECT_EQ(vec.dimension(), 2);
  EXPECT_EQ(vec.values(), (std::vector<double>{1.0, -1.0}));
}

TEST(state_test, flatten_is_row_major) {
  std::vector<State> states{
      State(std::vector<double>{1.0, 2.0}), State(std::vector<double>{3.0, 4.0})};
  EXPECT_EQ(flatten(states), (std::vector<double>{1.0, 2.0, 3.0, 4.0}));

  std::vector<State> scalars{1.0, 2.0, 3.0};
  EXPECT_EQ(flatten(scalars), (std::vector<double>{1.0, 2.0, 3.0}));
  EXPECT_TRUE(flatten({}).empty());
}

TEST(state_test, require_shape_rejects_other_dimensions) {
  const StateShape pair = StateShape::from_extents({2});
  EXPECT_NO_THROW(require_shape(pair, State(std::vector<double>{1.0, 2.0})));
  EXPECT_THROW(require_shape(pair, State(std::vector<double>{1.0, 2.0, 3.0})), InvalidArgument);
  EXPECT_THROW(require_shape(pair, State(1.0)), InvalidArgument);
  EXPECT_THROW(require_shape(StateShape{}, State(std::vector<double>{1.0})), InvalidArgument);
  EXPECT_NO_THROW(require_shape(StateShape{}, State(4.0)));
}
