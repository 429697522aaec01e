#include <stdexcept>
#include <utility>
#include <mcmclab/kernel/hmc.hpp>
#include <mcmclab/kernel/metropolis.hpp>
#include <mcmclab/log/logger.hpp>

namespace mcmclab::kernel {

PhasePoint leapfrog(const TargetDensity &target, const PhasePoint &start, int n_steps,
                    double epsilon, std::vector<Vec2> *trajectory) {
  Vec2 q = start.position;
  Vec2 p = start.momentum;

  if (trajectory) {
    trajectory->clear();
    trajectory->reserve(static_cast<std::size_t>(n_steps) + 1);
    trajectory->push_back(q);
  }

  // Half-step momentum
  Vec2 grad = target.gradient(q);
  p += grad * (0.5 * epsilon);

  for (int step = 0; step < n_steps; ++step) {
    // Full step position
    q += p * epsilon;
    if (trajectory)
      trajectory->push_back(q);

    grad = target.gradient(q);
    if (step != n_steps - 1)
      p += grad * epsilon;
  }

  // Final half-step momentum
  p += grad * (0.5 * epsilon);

  return {q, p};
}

double hamiltonian(const TargetDensity &target, const PhasePoint &state) {
  const double potential = -target.log_density(state.position);
  const double kinetic = 0.5 * (state.momentum.x * state.momentum.x +
                                state.momentum.y * state.momentum.y);
  return potential + kinetic;
}

Proposal step_hmc(const Vec2 &current, const TargetDensity &target,
                  const KernelParams &params, Rng &rng) {
  if (!target.has_gradient()) {
    MLOG_ERROR("HMC step requested on target '{}' without a gradient", target.name());
    throw std::invalid_argument("HMC requires a target with a gradient");
  }

  PhasePoint start;
  start.position = current;
  start.momentum = Vec2{rng.normal(0.0, 1.0), rng.normal(0.0, 1.0)};

  std::vector<Vec2> trajectory;
  const PhasePoint end =
      leapfrog(target, start, params.leapfrog_steps, params.leapfrog_epsilon, &trajectory);

  const double h_start = hamiltonian(target, start);
  const double h_end = hamiltonian(target, end);

  if (metropolis_accept(h_start - h_end, rng))
    return {end.position, true, std::move(trajectory)};
  return {current, false, std::move(trajectory)};
}

} // namespace mcmclab::kernel
