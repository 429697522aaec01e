#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <mcmclab/core/engine.hpp>
#include <mcmclab/log/logger.hpp>

using namespace mcmclab::core;
using namespace mcmclab::log;

namespace {

constexpr int steps_per_frame = 20;

void usage(const char *argv0) {
  std::fprintf(stderr, "usage: %s <target> <kernel> <steps> [seed] [log-level]\n", argv0);
  std::fprintf(stderr, "  targets: gaussian bimodal donut banana\n");
  std::fprintf(stderr, "  kernels: rwm mh slice elliptical hitnrun hmc\n");
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 4) {
    usage(argv[0]);
    return EXIT_FAILURE;
  }

  try {
    EngineConfig config;
    config.target = argv[1];
    config.kernel = argv[2];
    const int steps = std::stoi(argv[3]);
    if (argc > 4)
      config.seed = std::stoull(argv[4]);
    if (argc > 5)
      Logger::instance().set_level(parse_level(argv[5]));

    SamplerEngine engine(config);

    run_frames(engine, steps, steps_per_frame);

    MLOG_INFO("{} steps, acceptance rate {:.3f}, final position ({:.4f}, {:.4f})",
              engine.total_steps(), engine.acceptance_rate(), engine.position().x,
              engine.position().y);

    std::printf("x,y,accepted\n");
    for (const auto &s : engine.history())
      std::printf("%.17g,%.17g,%d\n", s.x, s.y, s.accepted ? 1 : 0);
  } catch (const std::exception &e) {
    MLOG_ERROR("{}", e.what());
    usage(argv[0]);
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
