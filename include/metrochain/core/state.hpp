#pragma once
#include <cstddef>
#include <vector>

namespace metrochain::core {

// Shape of a chain position, fixed once from the initial state.
// dimension == 0 is a scalar, dimension == k a vector of k reals.
struct StateShape {
  std::size_t dimension{0};

  StateShape() = default;
  explicit StateShape(std::size_t dimension) : dimension(dimension) {}

  bool is_scalar() const { return dimension == 0; }
  // Number of stored reals.
  std::size_t size() const { return is_scalar() ? 1 : dimension; }

  // extents as an array library reports them: {} scalar, {k} vector.
  // More than one extent throws InvalidArgument.
  static StateShape from_extents(const std::vector<std::size_t> &extents);

  bool operator==(const StateShape &) const = default;
};

class State {
public:
  State() = default;
  State(double x) : values_{x} {}
  explicit State(std::vector<double> values);

  // Validates a raw numeric buffer against its extents.
  static State from_array(const std::vector<std::size_t> &extents, std::vector<double> values);

  const StateShape &shape() const { return shape_; }
  std::size_t dimension() const { return shape_.dimension; }
  bool is_scalar() const { return shape_.is_scalar(); }
  std::size_t size() const { return values_.size(); }

  double scalar() const { return values_[0]; }
  double operator[](std::size_t i) const { return values_[i]; }
  double &operator[](std::size_t i) { return values_[i]; }

  const std::vector<double> &values() const { return values_; }

  bool operator==(const State &) const = default;

private:
  StateShape shape_{};
  std::vector<double> values_{0.0};
};

// Throws InvalidArgument when `s` does not have the `expected` shape. The
// sampler itself never calls this; wrappers that build states from untyped
// input do.
void require_shape(const StateShape &expected, const State &s);

} // namespace metrochain::core
