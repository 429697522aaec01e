#include <stdexcept>
#include <utility>
#include <mcmclab/core/engine.hpp>
#include <mcmclab/log/logger.hpp>

namespace mcmclab::core {

double BatchResult::acceptance_rate() const {
  if (samples.empty())
    return 0.0;
  return static_cast<double>(accepted_count) / static_cast<double>(samples.size());
}

SamplerEngine::SamplerEngine(const EngineConfig &config)
    : limits_(config.limits),
      params_(validated(config.params, ParamsUpdate{})),
      target_(sample::make_density(config.target)),
      kind_(kernel::parse_kernel(config.kernel)),
      step_(kernel::kernel_function(kind_)),
      chain_(config.history_capacity, config.origin),
      rng_(config.seed) {
  check_compatible(*target_, kind_);
  MLOG_INFO("Engine ready: target {}, kernel {}, seed {}, history capacity {}",
            target_->name(), kernel::to_string(kind_), config.seed, chain_.capacity());
}

void SamplerEngine::select_target(std::string_view name) {
  set_target(sample::make_density(name));
}

void SamplerEngine::set_target(std::shared_ptr<const TargetDensity> target) {
  if (!target) {
    MLOG_ERROR("SamplerEngine::set_target: target is null");
    throw std::invalid_argument("target must not be null");
  }
  check_compatible(*target, kind_);

  target_ = std::move(target);
  MLOG_INFO("Target set to {}", target_->name());
  reset();
}

void SamplerEngine::select_kernel(std::string_view name) {
  select_kernel(kernel::parse_kernel(name));
}

void SamplerEngine::select_kernel(KernelKind kind) {
  check_compatible(*target_, kind);

  kind_ = kind;
  step_ = kernel::kernel_function(kind);
  MLOG_INFO("Kernel set to {}", kernel::to_string(kind_));
  reset();
}

void SamplerEngine::set_params(const ParamsUpdate &update) {
  params_ = validated(params_, update);
  MLOG_DEBUG("Params: step_size {}, leapfrog_steps {}, leapfrog_epsilon {}",
             params_.step_size, params_.leapfrog_steps, params_.leapfrog_epsilon);
}

void SamplerEngine::reset() {
  chain_.reset();
  total_steps_ = 0;
  total_accepted_ = 0;
  MLOG_DEBUG("Chain reset to ({}, {})", chain_.origin().x, chain_.origin().y);
}

BatchResult SamplerEngine::advance(int steps) {
  if (steps < 1) {
    MLOG_ERROR("SamplerEngine::advance: steps must be at least 1, got {}", steps);
    throw std::invalid_argument("advance requires steps >= 1");
  }

  BatchResult batch;
  batch.samples.reserve(static_cast<std::size_t>(steps));

  for (int i = 0; i < steps; ++i) {
    kernel::Proposal proposal = step_(chain_.position(), *target_, params_, rng_);
    const Sample s = chain_.record(std::move(proposal));
    if (s.accepted)
      batch.accepted_count++;
    batch.samples.push_back(s);
  }

  total_steps_ += static_cast<std::size_t>(steps);
  total_accepted_ += static_cast<std::size_t>(batch.accepted_count);

  MLOG_DEBUG("Advanced {} steps with {}: {} accepted, position ({}, {})", steps,
             kernel::to_string(kind_), batch.accepted_count, chain_.position().x,
             chain_.position().y);
  return batch;
}

double SamplerEngine::acceptance_rate() const {
  if (total_steps_ == 0)
    return 0.0;
  return static_cast<double>(total_accepted_) / static_cast<double>(total_steps_);
}

void SamplerEngine::check_compatible(const TargetDensity &target, KernelKind kind) const {
  if (kernel::requires_gradient(kind) && !target.has_gradient()) {
    MLOG_ERROR("Kernel {} needs a gradient but target {} has none", kernel::to_string(kind), target.name());
    throw std::invalid_argument("kernel requires a target with a gradient");
  }
}

KernelParams SamplerEngine::validated(const KernelParams &base, const ParamsUpdate &update) const {
  KernelParams next = base;
  if (update.step_size)
    next.step_size = *update.step_size;
  if (update.leapfrog_steps)
    next.leapfrog_steps = *update.leapfrog_steps;
  if (update.leapfrog_epsilon)
    next.leapfrog_epsilon = *update.leapfrog_epsilon;

  // written so that NaN fails every check
  if (!(next.step_size > 0.0) || !(next.step_size >= limits_.step_size_min && next.step_size <= limits_.step_size_max)) {
    MLOG_ERROR("step_size must lie in [{}, {}], got {}", limits_.step_size_min, limits_.step_size_max, next.step_size);
    throw std::invalid_argument("step_size out of range");
  }
  if (next.leapfrog_steps < 1 || next.leapfrog_steps < limits_.leapfrog_steps_min || next.leapfrog_steps > limits_.leapfrog_steps_max) {
    MLOG_ERROR("leapfrog_steps must lie in [{}, {}], got {}", limits_.leapfrog_steps_min, limits_.leapfrog_steps_max, next.leapfrog_steps);
    throw std::invalid_argument("leapfrog_steps out of range");
  }
  if (!(next.leapfrog_epsilon > 0.0) || !(next.leapfrog_epsilon >= limits_.leapfrog_epsilon_min && next.leapfrog_epsilon <= limits_.leapfrog_epsilon_max)) {
    MLOG_ERROR("leapfrog_epsilon must lie in [{}, {}], got {}", limits_.leapfrog_epsilon_min, limits_.leapfrog_epsilon_max, next.leapfrog_epsilon);
    throw std::invalid_argument("leapfrog_epsilon out of range");
  }
  return next;
}

int run_frames(SamplerEngine &engine, int steps, int steps_per_frame) {
  if (steps < 1 || steps_per_frame < 1) {
    MLOG_ERROR("run_frames: steps and steps_per_frame must be at least 1, got {} and {}", steps, steps_per_frame);
    throw std::invalid_argument("run_frames requires steps >= 1 and steps_per_frame >= 1");
  }

  int accepted = 0;
  int remaining = steps;
  while (remaining > 0) {
    const int n = remaining < steps_per_frame ? remaining : steps_per_frame;
    accepted += engine.advance(n).accepted_count;
    remaining -= n;
  }
  return accepted;
}

} // namespace mcmclab::core
