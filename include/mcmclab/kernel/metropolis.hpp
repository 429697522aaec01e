#pragma once
#include <mcmclab/kernel/kernel.hpp>

namespace mcmclab::kernel {

// Standard deviation of the fixed proposal used by step_mh.
inline constexpr double independent_proposal_sigma = 1.5;

// Draws u ~ U(0,1) and returns log(u) < log_ratio. Always consumes one draw.
bool metropolis_accept(double log_ratio, Rng &rng);

// Log-density of the independent proposal N(0, sigma^2 I), constants dropped.
double independent_proposal_log_density(const Vec2 &p);

/**
 * Random walk Metropolis.
 *
 * Proposes current + N(0, step_size^2 I). Draws: normal x, normal y, u.
 */
Proposal step_rwm(const Vec2 &current, const TargetDensity &target,
                  const KernelParams &params, Rng &rng);

/**
 * Independent Metropolis-Hastings with a fixed N(0, 1.5^2 I) proposal.
 *
 * Ignores params. Draws: normal x, normal y, u.
 */
Proposal step_mh(const Vec2 &current, const TargetDensity &target,
                 const KernelParams &params, Rng &rng);

} // namespace mcmclab::kernel
