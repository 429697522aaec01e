#include <atomic>
#include <exception>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>
#include <mcmclab/core/ensemble.hpp>
#include <mcmclab/log/logger.hpp>

namespace mcmclab::core {

using mcmclab::math::mix_seed;

namespace {

void validate(const EnsembleConfig &config) {
  if (config.n_chains == 0) {
    MLOG_ERROR("EnsembleConfig: n_chains must be greater than 0");
    throw std::invalid_argument("n_chains must be greater than 0");
  }
  if (config.steps_per_chain < 1) {
    MLOG_ERROR("EnsembleConfig: steps_per_chain must be at least 1, got {}", config.steps_per_chain);
    throw std::invalid_argument("steps_per_chain must be at least 1");
  }
}

} // namespace

ChainRun run_chain(const EngineConfig &engine, std::uint64_t seed, int steps) {
  EngineConfig cfg = engine;
  cfg.seed = seed;
  SamplerEngine sampler(cfg);

  BatchResult batch = sampler.advance(steps);

  ChainRun run;
  run.seed = seed;
  run.accepted = static_cast<std::size_t>(batch.accepted_count);
  run.samples = std::move(batch.samples);
  return run;
}

std::vector<ChainRun> run_chains(const EnsembleConfig &config) {
  validate(config);

  std::vector<ChainRun> runs;
  runs.reserve(config.n_chains);
  for (std::size_t c = 0; c < config.n_chains; ++c) {
    const std::uint64_t seed = mix_seed(config.engine.seed, static_cast<std::uint64_t>(c));
    runs.push_back(run_chain(config.engine, seed, config.steps_per_chain));
  }
  return runs;
}

std::vector<ChainRun> run_chains_parallel(const EnsembleConfig &config) {
  validate(config);

  // Determine number of threads to use
  std::size_t n_threads = config.n_threads;
  if (n_threads == 0)
    n_threads = std::thread::hardware_concurrency();
  if (n_threads == 0)
    n_threads = 1;
  if (n_threads > config.n_chains)
    n_threads = config.n_chains;

  MLOG_INFO("Running {} chains of {} steps on {} threads", config.n_chains, config.steps_per_chain, n_threads);

  // Each slot is written by exactly one worker
  std::vector<ChainRun> runs(config.n_chains);

  std::vector<std::thread> workers;
  workers.reserve(n_threads);

  std::atomic<bool> any_error{false};
  std::exception_ptr thread_exception = nullptr;
  std::mutex error_mu;

  try {
    for (std::size_t t = 0; t < n_threads; ++t) {
      workers.emplace_back([&, t]() {
        try {
          std::ostringstream oss;
          oss << std::this_thread::get_id();
          MLOG_DEBUG("Worker {} (id {}) started", t, oss.str());

          // strided assignment of chains to workers
          for (std::size_t c = t; c < config.n_chains; c += n_threads) {
            if (any_error)
              return;
            const std::uint64_t seed = mix_seed(config.engine.seed, static_cast<std::uint64_t>(c));
            runs[c] = run_chain(config.engine, seed, config.steps_per_chain);
          }
        } catch (...) {
          std::scoped_lock lk(error_mu);
          if (!thread_exception)
            thread_exception = std::current_exception();
          any_error = true;
        }
      });
    }
  } catch (...) {
    // thread creation failed: stop the workers already running before unwinding
    any_error = true;
    for (auto &th : workers)
      th.join();
    MLOG_ERROR("Failed to start worker {} of {}", workers.size(), n_threads);
    throw;
  }

  // Join threads
  for (auto &th : workers)
    th.join();
  if (any_error && thread_exception) {
    std::rethrow_exception(thread_exception);
  }

  std::size_t accepted = 0;
  for (const auto &run : runs)
    accepted += run.accepted;
  MLOG_INFO("Parallel chains finished. Accepted {} of {} steps", accepted,
            config.n_chains * static_cast<std::size_t>(config.steps_per_chain));
  return runs;
}

} // namespace mcmclab::core
