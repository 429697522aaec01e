#include <cmath>
#include <stdexcept>
#include <mcmclab/log/logger.hpp>
#include <mcmclab/sample/grid.hpp>

namespace mcmclab::sample {

namespace {

void validate(const GridSpec &spec) {
  if (spec.nx == 0 || spec.ny == 0 || spec.oversample == 0) {
    MLOG_ERROR("GridSpec needs positive nx, ny and oversample, got {}, {}, {}", spec.nx, spec.ny, spec.oversample);
    throw std::invalid_argument("GridSpec dimensions must be greater than 0");
  }
  if (spec.x_min >= spec.x_max || spec.y_min >= spec.y_max) {
    MLOG_ERROR("GridSpec bounds are empty: x [{}, {}], y [{}, {}]", spec.x_min, spec.x_max, spec.y_min, spec.y_max);
    throw std::invalid_argument("GridSpec min must be less than max");
  }
}

} // namespace

Matrix density_grid(const TargetDensity &target, const GridSpec &spec) {
  validate(spec);
  MLOG_DEBUG("Evaluating {} on {}x{} grid (oversample {})", target.name(), spec.nx, spec.ny, spec.oversample);

  Matrix grid(spec.ny, spec.nx);
  const double dx = spec.dx();
  const double dy = spec.dy();
  const double sub = static_cast<double>(spec.oversample);

  for (std::size_t i = 0; i < spec.ny; ++i) {
    for (std::size_t j = 0; j < spec.nx; ++j) {
      double acc = 0.0;
      // midpoints of the sub-lattice inside the cell
      for (std::size_t a = 0; a < spec.oversample; ++a) {
        const double y = spec.y_min + (i + (a + 0.5) / sub) * dy;
        for (std::size_t b = 0; b < spec.oversample; ++b) {
          const double x = spec.x_min + (j + (b + 0.5) / sub) * dx;
          acc += std::exp(target.log_density({x, y}));
        }
      }
      grid(i, j) = acc;
    }
  }

  const double total = grid.sum();
  if (total > 0.0) {
    for (auto &v : grid.data)
      v /= total;
  }
  return grid;
}

Matrix sample_histogram(const std::vector<core::Sample> &samples, const GridSpec &spec) {
  validate(spec);

  Matrix hist(spec.ny, spec.nx);
  const double dx = spec.dx();
  const double dy = spec.dy();
  std::size_t inside = 0;

  for (const auto &s : samples) {
    if (s.x < spec.x_min || s.x >= spec.x_max || s.y < spec.y_min || s.y >= spec.y_max)
      continue;
    auto j = static_cast<std::size_t>((s.x - spec.x_min) / dx);
    auto i = static_cast<std::size_t>((s.y - spec.y_min) / dy);
    if (j >= spec.nx)
      j = spec.nx - 1;
    if (i >= spec.ny)
      i = spec.ny - 1;
    hist(i, j) += 1.0;
    ++inside;
  }

  if (inside > 0) {
    const double inv = 1.0 / static_cast<double>(inside);
    for (auto &v : hist.data)
      v *= inv;
  }
  return hist;
}

double total_variation(const Matrix &a, const Matrix &b) {
  if (a.rows != b.rows || a.cols != b.cols) {
    MLOG_ERROR("total_variation: shape mismatch {}x{} vs {}x{}", a.rows, a.cols, b.rows, b.cols);
    throw std::invalid_argument("total_variation requires grids of equal shape");
  }
  double acc = 0.0;
  for (std::size_t k = 0; k < a.data.size(); ++k)
    acc += std::abs(a.data[k] - b.data[k]);
  return 0.5 * acc;
}

} // namespace mcmclab::sample
