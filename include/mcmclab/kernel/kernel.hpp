#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <mcmclab/math/rng.hpp>
#include <mcmclab/math/vec.hpp>
#include <mcmclab/sample/density.hpp>

namespace mcmclab::kernel {

using mcmclab::math::Rng;
using mcmclab::math::Vec2;
using mcmclab::sample::TargetDensity;

// Tunable knobs shared by all kernels. Each kernel reads only its subset.
struct KernelParams {
  double step_size{0.5};       // RWM sigma, slice bracket width
  int leapfrog_steps{10};      // HMC
  double leapfrog_epsilon{0.1}; // HMC
};

// Outcome of a single kernel invocation. `point` equals the input state when
// accepted is false. `path` holds the slice bracket ends or the HMC
// trajectory, and is empty for kernels that do not traverse one.
struct Proposal {
  Vec2 point;
  bool accepted{false};
  std::optional<std::vector<Vec2>> path;
};

enum class KernelKind { rwm, mh, slice, elliptical, hitnrun, hmc };

using KernelFunction = Proposal (*)(const Vec2 &current, const TargetDensity &target,
                                    const KernelParams &params, Rng &rng);

KernelFunction kernel_function(KernelKind kind);

// Whether the kernel calls TargetDensity::gradient.
bool requires_gradient(KernelKind kind);

KernelKind parse_kernel(std::string_view name);
std::string_view to_string(KernelKind kind);
const std::vector<std::string> &kernel_names();

} // namespace mcmclab::kernel
