#pragma once
#include <vector>
#include <mcmclab/kernel/kernel.hpp>

namespace mcmclab::kernel {

struct PhasePoint {
  Vec2 position;
  Vec2 momentum;
};

/**
 * Leapfrog integration of Hamiltonian dynamics with potential -log p.
 *
 * Inputs:
 *  - start: initial position and momentum.
 *  - n_steps: number of position updates, at least 1.
 *  - epsilon: integrator step size.
 *  - trajectory: when not null, receives the start position followed by the
 *    position after every step.
 *
 * Returns the final position and momentum.
 */
PhasePoint leapfrog(const TargetDensity &target, const PhasePoint &start, int n_steps,
                    double epsilon, std::vector<Vec2> *trajectory = nullptr);

// H = -log p(q) + |p|^2 / 2
double hamiltonian(const TargetDensity &target, const PhasePoint &state);

/**
 * Hamiltonian Monte Carlo with unit mass.
 *
 * The integrator trajectory is always returned as the path, including for
 * rejected proposals. Draws: momentum x, momentum y, u.
 */
Proposal step_hmc(const Vec2 &current, const TargetDensity &target,
                  const KernelParams &params, Rng &rng);

} // namespace mcmclab::kernel
