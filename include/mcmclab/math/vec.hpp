#pragma once
#include <cmath>
#include <cstddef>
#include <vector>

namespace mcmclab::math {

struct Vec2 {
  double x{0.0};
  double y{0.0};

  Vec2() = default;
  constexpr Vec2(double x, double y) : x(x), y(y) {}

  Vec2 operator+(const Vec2 &o) const { return {x + o.x, y + o.y}; }
  Vec2 operator-(const Vec2 &o) const { return {x - o.x, y - o.y}; }
  Vec2 operator*(double s) const { return {x * s, y * s}; }
  Vec2 &operator+=(const Vec2 &o) {
    x += o.x;
    y += o.y;
    return *this;
  }
  bool operator==(const Vec2 &o) const { return x == o.x && y == o.y; }
};

// Row-major dense grid of doubles.
struct Matrix {
  std::size_t rows;
  std::size_t cols;
  std::vector<double> data;

  Matrix(std::size_t rows, std::size_t cols) : rows(rows), cols(cols) {
    data.resize(rows * cols, 0.0);
  }

  double &operator()(std::size_t i, std::size_t j);
  const double &operator()(std::size_t i, std::size_t j) const;

  double sum() const;
};

double dot(const Vec2 &a, const Vec2 &b);
double norm(const Vec2 &v);

// Unit vector at angle theta from the x axis.
Vec2 direction(double theta);

} // namespace mcmclab::math
