#pragma once
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <mcmclab/math/vec.hpp>

namespace mcmclab::sample {

using mcmclab::math::Vec2;

// Unnormalized 2D target. Implementations are pure and must tolerate any
// finite input.
class TargetDensity {
public:
  virtual ~TargetDensity() = default;
  virtual double log_density(const Vec2 &p) const = 0;
  virtual bool has_gradient() const { return true; }
  // Analytic gradient of log_density. Only valid when has_gradient().
  virtual Vec2 gradient(const Vec2 &p) const = 0;
  virtual std::string name() const = 0;
};

class GaussianDensity : public TargetDensity {
public:
  double log_density(const Vec2 &p) const override;
  Vec2 gradient(const Vec2 &p) const override;
  std::string name() const override { return "gaussian"; }
};

class BimodalDensity : public TargetDensity {
public:
  double log_density(const Vec2 &p) const override;
  Vec2 gradient(const Vec2 &p) const override;
  std::string name() const override { return "bimodal"; }

private:
  static constexpr double offset = 1.5;
  static constexpr double precision = 2.0; // exp(-precision * |p - mu|^2)
  static constexpr double eps = 1e-9;
};

class DonutDensity : public TargetDensity {
public:
  double log_density(const Vec2 &p) const override;
  Vec2 gradient(const Vec2 &p) const override;
  std::string name() const override { return "donut"; }

private:
  static constexpr double radius = 2.5;
  static constexpr double eps = 1e-9;
};

// Rosenbrock shaped target, -((a - x)^2 + b (y - x^2)^2) / 10.
class BananaDensity : public TargetDensity {
public:
  double log_density(const Vec2 &p) const override;
  Vec2 gradient(const Vec2 &p) const override;
  std::string name() const override { return "banana"; }

private:
  static constexpr double a = 1.0;
  static constexpr double b = 5.0;
  static constexpr double scale = 10.0;
};

using LogDensityFunction = std::function<double(const Vec2 &)>;
using GradientFunction = std::function<Vec2(const Vec2 &)>;

// Caller supplied target. The gradient may be left empty.
class FunctionDensity : public TargetDensity {
public:
  FunctionDensity(std::string name, LogDensityFunction logp, GradientFunction grad = nullptr);
  double log_density(const Vec2 &p) const override;
  bool has_gradient() const override;
  Vec2 gradient(const Vec2 &p) const override;
  std::string name() const override { return name_; }

private:
  std::string name_;
  LogDensityFunction logp_;
  GradientFunction grad_;
};

std::unique_ptr<TargetDensity> make_density(std::string_view name);

const std::vector<std::string> &target_names();

} // namespace mcmclab::sample
