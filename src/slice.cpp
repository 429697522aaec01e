#include <cmath>
#include <mcmclab/kernel/slice.hpp>

namespace mcmclab::kernel {

using mcmclab::math::direction;

namespace {

constexpr double two_pi = 2.0 * M_PI;

std::vector<Vec2> bracket_ends(const Vec2 &origin, const Vec2 &dir, double L, double R) {
  return {origin + dir * L, origin + dir * R};
}

} // namespace

Proposal step_slice(const Vec2 &current, const TargetDensity &target,
                    const KernelParams &params, Rng &rng) {
  const double w = params.step_size;
  const double threshold = target.log_density(current) + std::log(rng.uniform());
  const Vec2 dir = direction(rng.uniform(0.0, two_pi));

  auto above = [&](double t) {
    return target.log_density(current + dir * t) > threshold;
  };

  double L = -rng.uniform() * w;
  double R = L + w;

  for (int i = 0; i < slice_step_out_cap && above(L); ++i)
    L -= w;
  for (int i = 0; i < slice_step_out_cap && above(R); ++i)
    R += w;

  for (int i = 0; i < slice_shrink_cap; ++i) {
    const double t = rng.uniform(L, R);
    const Vec2 candidate = current + dir * t;
    if (target.log_density(candidate) > threshold)
      return {candidate, true, bracket_ends(current, dir, L, R)};

    if (t < 0.0)
      L = t;
    else
      R = t;
  }

  return {current, false, bracket_ends(current, dir, L, R)};
}

double elliptical_log_likelihood(const TargetDensity &target, const Vec2 &p) {
  return target.log_density(p) + 0.5 * (p.x * p.x + p.y * p.y);
}

Proposal step_elliptical(const Vec2 &current, const TargetDensity &target,
                         const KernelParams & /*params*/, Rng &rng) {
  const Vec2 nu{rng.normal(0.0, 1.0), rng.normal(0.0, 1.0)};
  const double threshold = elliptical_log_likelihood(target, current) + std::log(rng.uniform());

  double theta = rng.uniform(0.0, two_pi);
  double theta_min = theta - two_pi;
  double theta_max = theta;

  for (int i = 0; i < elliptical_shrink_cap; ++i) {
    const Vec2 candidate = current * std::cos(theta) + nu * std::sin(theta);
    if (elliptical_log_likelihood(target, candidate) > threshold)
      return {candidate, true, std::nullopt};

    // shrink toward theta = 0, which maps back to the current state
    if (theta < 0.0)
      theta_min = theta;
    else
      theta_max = theta;
    theta = rng.uniform(theta_min, theta_max);
  }

  return {current, false, std::nullopt};
}

Proposal step_hit_and_run(const Vec2 &current, const TargetDensity &target,
                          const KernelParams & /*params*/, Rng &rng) {
  const Vec2 dir = direction(rng.uniform(0.0, two_pi));
  const double threshold = target.log_density(current) + std::log(rng.uniform());

  auto above = [&](double t) {
    return target.log_density(current + dir * t) > threshold;
  };

  double L = -1.0;
  double R = 1.0;

  for (int i = 0; i < hit_and_run_step_out_cap && above(L); ++i)
    L *= 2.0;
  for (int i = 0; i < hit_and_run_step_out_cap && above(R); ++i)
    R *= 2.0;

  for (int i = 0; i < hit_and_run_shrink_cap; ++i) {
    const double t = rng.uniform(L, R);
    const Vec2 candidate = current + dir * t;
    if (target.log_density(candidate) > threshold)
      return {candidate, true, std::nullopt};

    if (t < 0.0)
      L = t;
    else
      R = t;
  }

  return {current, false, std::nullopt};
}

} // namespace mcmclab::kernel
