#include <cmath>
#include <mcmclab/kernel/metropolis.hpp>

namespace mcmclab::kernel {

bool metropolis_accept(double log_ratio, Rng &rng) {
  return std::log(rng.uniform()) < log_ratio;
}

double independent_proposal_log_density(const Vec2 &p) {
  const double s2 = independent_proposal_sigma * independent_proposal_sigma;
  return -0.5 * (p.x * p.x + p.y * p.y) / s2;
}

Proposal step_rwm(const Vec2 &current, const TargetDensity &target,
                  const KernelParams &params, Rng &rng) {
  Vec2 proposed;
  proposed.x = current.x + rng.normal(0.0, params.step_size);
  proposed.y = current.y + rng.normal(0.0, params.step_size);

  const double log_ratio = target.log_density(proposed) - target.log_density(current);

  if (metropolis_accept(log_ratio, rng))
    return {proposed, true, std::nullopt};
  return {current, false, std::nullopt};
}

Proposal step_mh(const Vec2 &current, const TargetDensity &target,
                 const KernelParams & /*params*/, Rng &rng) {
  Vec2 proposed;
  proposed.x = rng.normal(0.0, independent_proposal_sigma);
  proposed.y = rng.normal(0.0, independent_proposal_sigma);

  // q does not depend on the current state, so the ratio needs both q terms
  const double log_ratio =
      (target.log_density(proposed) + independent_proposal_log_density(current)) -
      (target.log_density(current) + independent_proposal_log_density(proposed));

  if (metropolis_accept(log_ratio, rng))
    return {proposed, true, std::nullopt};
  return {current, false, std::nullopt};
}

} // namespace mcmclab::kernel
