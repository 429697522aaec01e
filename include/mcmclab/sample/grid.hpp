#pragma once
#include <cstddef>
#include <vector>
#include <mcmclab/core/sample.hpp>
#include <mcmclab/math/vec.hpp>
#include <mcmclab/sample/density.hpp>

namespace mcmclab::sample {

using mcmclab::math::Matrix;

struct GridSpec {
  std::size_t nx{60};
  std::size_t ny{60};
  double x_min{-5.0};
  double x_max{5.0};
  double y_min{-5.0};
  double y_max{5.0};
  std::size_t oversample{1}; // sub-lattice points per cell and axis

  double dx() const { return (x_max - x_min) / static_cast<double>(nx); }
  double dy() const { return (y_max - y_min) / static_cast<double>(ny); }
};

// Cell (i, j) covers row i along y and column j along x. Cells sum to 1.
Matrix density_grid(const TargetDensity &target, const GridSpec &spec);

// Normalized over the samples that fall inside the grid; all zero if none do.
Matrix sample_histogram(const std::vector<core::Sample> &samples, const GridSpec &spec);

double total_variation(const Matrix &a, const Matrix &b);

} // namespace mcmclab::sample
