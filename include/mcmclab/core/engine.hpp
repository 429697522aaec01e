#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>
#include <mcmclab/core/chain.hpp>
#include <mcmclab/core/sample.hpp>
#include <mcmclab/kernel/kernel.hpp>
#include <mcmclab/math/rng.hpp>
#include <mcmclab/sample/density.hpp>

namespace mcmclab::core {

using mcmclab::kernel::KernelKind;
using mcmclab::kernel::KernelParams;
using mcmclab::math::Rng;
using mcmclab::sample::TargetDensity;

// Inclusive bounds accepted by SamplerEngine::set_params.
struct ParamLimits {
  double step_size_min{0.1};
  double step_size_max{3.0};
  int leapfrog_steps_min{1};
  int leapfrog_steps_max{50};
  double leapfrog_epsilon_min{0.01};
  double leapfrog_epsilon_max{0.5};
};

// Partial parameter update; unset fields keep their current value.
struct ParamsUpdate {
  std::optional<double> step_size;
  std::optional<int> leapfrog_steps;
  std::optional<double> leapfrog_epsilon;
};

struct EngineConfig {
  std::uint64_t seed = std::random_device{}();
  std::string target{"gaussian"};
  std::string kernel{"rwm"};
  KernelParams params{};
  ParamLimits limits{};
  std::size_t history_capacity{default_history_capacity};
  Point origin{default_origin};
};

struct BatchResult {
  int accepted_count{0};
  std::vector<Sample> samples;

  double acceptance_rate() const;
};

/**
 * Drives one chain with the selected kernel.
 *
 * Changing the target or the kernel starts a fresh chain at the origin.
 * Parameter changes apply to the next step without resetting. Invalid
 * input throws std::invalid_argument and leaves the engine unchanged.
 */
class SamplerEngine {
public:
  explicit SamplerEngine(const EngineConfig &config = EngineConfig{});

  void select_target(std::string_view name);
  void set_target(std::shared_ptr<const TargetDensity> target);
  void select_kernel(std::string_view name);
  void select_kernel(KernelKind kind);
  void set_params(const ParamsUpdate &update);
  void reset();

  // Runs `steps` kernel invocations, steps >= 1.
  BatchResult advance(int steps);

  const Point &position() const { return chain_.position(); }
  const std::deque<Sample> &history() const { return chain_.history(); }
  const std::optional<std::vector<Point>> &last_trajectory() const { return chain_.last_trajectory(); }

  const KernelParams &params() const { return params_; }
  const ParamLimits &limits() const { return limits_; }
  const TargetDensity &target() const { return *target_; }
  KernelKind kernel() const { return kind_; }

  std::size_t total_steps() const { return total_steps_; }
  std::size_t total_accepted() const { return total_accepted_; }
  double acceptance_rate() const;

private:
  void check_compatible(const TargetDensity &target, KernelKind kind) const;
  KernelParams validated(const KernelParams &base, const ParamsUpdate &update) const;

  ParamLimits limits_;
  KernelParams params_;
  std::shared_ptr<const TargetDensity> target_;
  KernelKind kind_;
  kernel::KernelFunction step_;
  ChainState chain_;
  Rng rng_;

  std::size_t total_steps_{0};
  std::size_t total_accepted_{0};
};

// Advances `steps` in batches of at most `steps_per_frame`, the way a render
// loop drives the engine. Both counts must be at least 1. Returns the number
// of accepted steps.
int run_frames(SamplerEngine &engine, int steps, int steps_per_frame);

} // namespace mcmclab::core
