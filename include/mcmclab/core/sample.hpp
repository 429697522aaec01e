#pragma once
#include <mcmclab/math/vec.hpp>

namespace mcmclab::core {

using Point = mcmclab::math::Vec2;

// One emitted chain position. Slice-family kernels report accepted=true
// whenever they found a point under the density.
struct Sample {
  double x{0.0};
  double y{0.0};
  bool accepted{false};

  Sample() = default;
  Sample(double x, double y, bool accepted) : x(x), y(y), accepted(accepted) {}
  Sample(const Point &p, bool accepted) : x(p.x), y(p.y), accepted(accepted) {}

  Point point() const { return {x, y}; }
};

} // namespace mcmclab::core
