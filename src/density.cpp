#include <cmath>
#include <stdexcept>
#include <utility>
#include <mcmclab/log/logger.hpp>
#include <mcmclab/sample/density.hpp>

namespace mcmclab::sample {

//========================================
// Catalog targets
//========================================

double GaussianDensity::log_density(const Vec2 &p) const {
  return -0.5 * (p.x * p.x + p.y * p.y);
}

Vec2 GaussianDensity::gradient(const Vec2 &p) const {
  return {-p.x, -p.y};
}

double BimodalDensity::log_density(const Vec2 &p) const {
  const double d1 = std::pow(p.x + offset, 2) + std::pow(p.y + offset, 2);
  const double d2 = std::pow(p.x - offset, 2) + std::pow(p.y - offset, 2);
  const double e1 = std::exp(-precision * d1);
  const double e2 = std::exp(-precision * d2);
  return std::log(e1 + e2 + eps);
}

Vec2 BimodalDensity::gradient(const Vec2 &p) const {
  const double d1 = std::pow(p.x + offset, 2) + std::pow(p.y + offset, 2);
  const double d2 = std::pow(p.x - offset, 2) + std::pow(p.y - offset, 2);
  const double e1 = std::exp(-precision * d1);
  const double e2 = std::exp(-precision * d2);
  const double sum = e1 + e2 + eps;
  const double k = -2.0 * precision;

  const double dx = (e1 * k * (p.x + offset) + e2 * k * (p.x - offset)) / sum;
  const double dy = (e1 * k * (p.y + offset) + e2 * k * (p.y - offset)) / sum;
  return {dx, dy};
}

double DonutDensity::log_density(const Vec2 &p) const {
  const double r = std::sqrt(p.x * p.x + p.y * p.y);
  return -2.0 * std::pow(r - radius, 2);
}

Vec2 DonutDensity::gradient(const Vec2 &p) const {
  // r is offset so the origin does not divide by zero
  const double r = std::sqrt(p.x * p.x + p.y * p.y) + eps;
  const double term = -4.0 * (r - radius);
  return {term * (p.x / r), term * (p.y / r)};
}

double BananaDensity::log_density(const Vec2 &p) const {
  const double valley = p.y - p.x * p.x;
  return -(std::pow(a - p.x, 2) + b * valley * valley) / scale;
}

Vec2 BananaDensity::gradient(const Vec2 &p) const {
  const double valley = p.y - p.x * p.x;
  const double dx = -(2.0 * (p.x - a) + 2.0 * b * valley * (-2.0 * p.x)) / scale;
  const double dy = -(2.0 * b * valley) / scale;
  return {dx, dy};
}

//========================================
// User supplied target
//========================================

FunctionDensity::FunctionDensity(std::string name, LogDensityFunction logp, GradientFunction grad)
    : name_(std::move(name)), logp_(std::move(logp)), grad_(std::move(grad)) {
  if (!logp_) {
    MLOG_ERROR("FunctionDensity '{}' created without a log-density", name_);
    throw std::invalid_argument("FunctionDensity requires a log-density function");
  }
}

double FunctionDensity::log_density(const Vec2 &p) const {
  return logp_(p);
}

bool FunctionDensity::has_gradient() const {
  return static_cast<bool>(grad_);
}

Vec2 FunctionDensity::gradient(const Vec2 &p) const {
  if (!grad_) {
    MLOG_ERROR("FunctionDensity '{}' has no gradient", name_);
    throw std::logic_error("gradient requested from a target without one");
  }
  return grad_(p);
}

//========================================
// Catalog lookup
//========================================

std::unique_ptr<TargetDensity> make_density(std::string_view name) {
  if (name == "gaussian")
    return std::make_unique<GaussianDensity>();
  if (name == "bimodal")
    return std::make_unique<BimodalDensity>();
  if (name == "donut")
    return std::make_unique<DonutDensity>();
  if (name == "banana")
    return std::make_unique<BananaDensity>();

  MLOG_ERROR("Unknown target '{}'", name);
  throw std::invalid_argument("unknown target: " + std::string(name));
}

const std::vector<std::string> &target_names() {
  static const std::vector<std::string> names{"gaussian", "bimodal", "donut", "banana"};
  return names;
}

} // namespace mcmclab::sample
