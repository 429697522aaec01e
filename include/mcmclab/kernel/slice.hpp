#pragma once
#include <mcmclab/kernel/kernel.hpp>

namespace mcmclab::kernel {

// Iteration caps. Exhausting one leaves the chain where it was.
inline constexpr int slice_step_out_cap = 100;
inline constexpr int slice_shrink_cap = 100;
inline constexpr int elliptical_shrink_cap = 50;
inline constexpr int hit_and_run_step_out_cap = 20;
inline constexpr int hit_and_run_shrink_cap = 50;

/**
 * Slice sampling along a random direction.
 *
 * The bracket has width step_size and is placed uniformly around the current
 * state, stepped out in step_size increments and shrunk on every rejected
 * candidate. The bracket ends at return time are reported as the path, also
 * when the shrink cap runs out.
 *
 * Draws: u, theta, bracket offset, then one uniform per candidate.
 */
Proposal step_slice(const Vec2 &current, const TargetDensity &target,
                    const KernelParams &params, Rng &rng);

// log L(p) = log p(p) - log N(p; 0, I), up to a constant.
double elliptical_log_likelihood(const TargetDensity &target, const Vec2 &p);

/**
 * Elliptical slice sampling with the target split as likelihood x N(0, I).
 *
 * Draws: nu x, nu y, u, theta, then one uniform per rejected angle.
 */
Proposal step_elliptical(const Vec2 &current, const TargetDensity &target,
                         const KernelParams &params, Rng &rng);

/**
 * Hit-and-run. Like step_slice but the bracket starts at [-1, 1] and doubles
 * while its ends lie above the slice. No path is reported.
 *
 * Draws: theta, u, then one uniform per candidate.
 */
Proposal step_hit_and_run(const Vec2 &current, const TargetDensity &target,
                          const KernelParams &params, Rng &rng);

} // namespace mcmclab::kernel
