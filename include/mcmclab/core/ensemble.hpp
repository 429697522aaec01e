#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include <mcmclab/core/engine.hpp>

namespace mcmclab::core
{

  struct EnsembleConfig
  {
    EngineConfig engine;    // engine.seed is the base seed of the ensemble
    std::size_t n_chains{4};
    std::size_t n_threads{1}; // 0 picks hardware concurrency
    int steps_per_chain{1000};
  };

  struct ChainRun
  {
    std::uint64_t seed{0};
    std::vector<Sample> samples;
    std::size_t accepted{0};
  };

  // Independent chains, chain c seeded with mix_seed(engine.seed, c).
  // Results come back in chain order and do not depend on n_threads.
  std::vector<ChainRun> run_chains(const EnsembleConfig &config);

  std::vector<ChainRun> run_chains_parallel(const EnsembleConfig &config);

  ChainRun run_chain(const EngineConfig &engine, std::uint64_t seed, int steps);

} // namespace mcmclab::core
