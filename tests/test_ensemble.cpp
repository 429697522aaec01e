#include <set>
#include <stdexcept>
#include <gtest/gtest.h>
#include <mcmclab/core/ensemble.hpp>

using namespace mcmclab::core;
using mcmclab::math::mix_seed;

namespace {

EnsembleConfig small_ensemble() {
  EnsembleConfig config;
  config.engine.seed = 314;
  config.engine.target = "donut";
  config.engine.kernel = "hitnrun";
  config.n_chains = 5;
  config.steps_per_chain = 200;
  return config;
}

void expect_same_runs(const std::vector<ChainRun> &a, const std::vector<ChainRun> &b) {
  ASSERT_EQ(a.size(), b.size());
  for (std::size_t c = 0; c < a.size(); ++c) {
    EXPECT_EQ(a[c].seed, b[c].seed);
    EXPECT_EQ(a[c].accepted, b[c].accepted);
    ASSERT_EQ(a[c].samples.size(), b[c].samples.size());
    for (std::size_t k = 0; k < a[c].samples.size(); ++k) {
      ASSERT_EQ(a[c].samples[k].x, b[c].samples[k].x);
      ASSERT_EQ(a[c].samples[k].y, b[c].samples[k].y);
      ASSERT_EQ(a[c].samples[k].accepted, b[c].samples[k].accepted);
    }
  }
}

} // namespace

TEST(Ensemble, ChainsUseMixedSeeds) {
  const EnsembleConfig config = small_ensemble();
  const auto runs = run_chains(config);
  ASSERT_EQ(runs.size(), 5u);

  std::set<std::uint64_t> seeds;
  for (std::size_t c = 0; c < runs.size(); ++c) {
    EXPECT_EQ(runs[c].seed, mix_seed(314, c));
    EXPECT_EQ(runs[c].samples.size(), 200u);
    seeds.insert(runs[c].seed);
  }
  EXPECT_EQ(seeds.size(), 5u);
}

TEST(Ensemble, ResultDoesNotDependOnThreadCount) {
  EnsembleConfig config = small_ensemble();
  const auto serial = run_chains(config);

  config.n_threads = 1;
  expect_same_runs(serial, run_chains_parallel(config));

  config.n_threads = 3;
  expect_same_runs(serial, run_chains_parallel(config));

  config.n_threads = 16;
  expect_same_runs(serial, run_chains_parallel(config));
}

TEST(Ensemble, ChainMatchesSingleEngine) {
  const EnsembleConfig config = small_ensemble();
  const auto runs = run_chains(config);

  EngineConfig engine_config = config.engine;
  engine_config.seed = mix_seed(314, 2);
  SamplerEngine engine(engine_config);
  const BatchResult batch = engine.advance(200);

  ASSERT_EQ(batch.samples.size(), runs[2].samples.size());
  for (std::size_t k = 0; k < batch.samples.size(); ++k) {
    EXPECT_EQ(batch.samples[k].x, runs[2].samples[k].x);
    EXPECT_EQ(batch.samples[k].y, runs[2].samples[k].y);
  }
}

TEST(Ensemble, RejectsEmptyConfig) {
  EnsembleConfig config = small_ensemble();
  config.n_chains = 0;
  EXPECT_THROW(run_chains_parallel(config), std::invalid_argument);

  config = small_ensemble();
  config.steps_per_chain = 0;
  EXPECT_THROW(run_chains(config), std::invalid_argument);
}

TEST(Ensemble, WorkerErrorsReachTheCaller) {
  EnsembleConfig config = small_ensemble();
  config.engine.kernel = "gibbs";
  config.n_threads = 2;
  EXPECT_THROW(run_chains_parallel(config), std::invalid_argument);
}

TEST(Ensemble, AllWorkersJoinBeforeErrorIsRethrown) {
  EnsembleConfig config = small_ensemble();
  config.engine.target = "cauchy";
  config.n_chains = 64;
  config.n_threads = 16;
  EXPECT_THROW(run_chains_parallel(config), std::invalid_argument);

  // the runner is reusable afterwards
  config = small_ensemble();
  config.n_threads = 16;
  EXPECT_EQ(run_chains_parallel(config).size(), 5u);
}
