#include <mcmclab/log/logger.hpp>
#include <mcmclab/math/vec.hpp>
#include <numeric>
#include <stdexcept>

namespace mcmclab::math {

double &Matrix::operator()(std::size_t i, std::size_t j) {
  if (i >= rows || j >= cols) {
    MLOG_ERROR("Matrix index ({}, {}) out of range for {}x{}", i, j, rows, cols);
    throw std::out_of_range("Matrix index out of range");
  }
  return data[i * cols + j];
}

const double &Matrix::operator()(std::size_t i, std::size_t j) const {
  if (i >= rows || j >= cols) {
    MLOG_ERROR("Matrix index ({}, {}) out of range for {}x{}", i, j, rows, cols);
    throw std::out_of_range("Matrix index out of range");
  }
  return data[i * cols + j];
}

double Matrix::sum() const {
  return std::accumulate(data.begin(), data.end(), 0.0);
}

double dot(const Vec2 &a, const Vec2 &b) {
  return a.x * b.x + a.y * b.y;
}

double norm(const Vec2 &v) {
  return std::sqrt(dot(v, v));
}

Vec2 direction(double theta) {
  return {std::cos(theta), std::sin(theta)};
}

}
