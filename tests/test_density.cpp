#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <gtest/gtest.h>
#include <mcmclab/sample/density.hpp>
#include <mcmclab/sample/grid.hpp>

using namespace mcmclab::sample;
using mcmclab::math::Vec2;

TEST(Density, GaussianValues) {
  GaussianDensity g;
  EXPECT_DOUBLE_EQ(g.log_density({0.0, 0.0}), 0.0);
  EXPECT_DOUBLE_EQ(g.log_density({1.0, 2.0}), -2.5);
  const Vec2 grad = g.gradient({1.0, -2.0});
  EXPECT_DOUBLE_EQ(grad.x, -1.0);
  EXPECT_DOUBLE_EQ(grad.y, 2.0);
}

TEST(Density, BimodalIsSymmetricAndPeaksAtModes) {
  BimodalDensity b;
  EXPECT_DOUBLE_EQ(b.log_density({1.5, 1.5}), b.log_density({-1.5, -1.5}));
  EXPECT_NEAR(b.log_density({1.5, 1.5}), 0.0, 1e-6);
  EXPECT_LT(b.log_density({0.0, 0.0}), b.log_density({1.5, 1.5}));
  EXPECT_LT(b.log_density({1.5, -1.5}), b.log_density({1.5, 1.5}));

  // far away the additive epsilon bounds the log from below
  EXPECT_NEAR(b.log_density({40.0, -40.0}), std::log(1e-9), 1e-9);
}

TEST(Density, DonutToleratesOrigin) {
  DonutDensity d;
  EXPECT_DOUBLE_EQ(d.log_density({0.0, 0.0}), -12.5);
  const Vec2 grad = d.gradient({0.0, 0.0});
  EXPECT_TRUE(std::isfinite(grad.x));
  EXPECT_TRUE(std::isfinite(grad.y));
  EXPECT_DOUBLE_EQ(d.log_density({2.5, 0.0}), 0.0);
  EXPECT_DOUBLE_EQ(d.log_density({0.0, -2.5}), 0.0);
}

TEST(Density, BananaPeaksOnValley) {
  BananaDensity b;
  EXPECT_DOUBLE_EQ(b.log_density({1.0, 1.0}), 0.0);
  EXPECT_DOUBLE_EQ(b.log_density({0.0, 0.0}), -0.1);
  EXPECT_GT(b.log_density({2.0, 4.0}), b.log_density({2.0, 0.0}));
}

class GradientCheck : public ::testing::TestWithParam<std::string> {};

TEST_P(GradientCheck, MatchesCentralDifferences) {
  auto target = make_density(GetParam());
  ASSERT_TRUE(target->has_gradient());

  const double h = 1e-5;
  const Vec2 points[] = {{0.3, -0.7}, {1.2, 0.4}, {-2.0, 1.5}, {2.6, 0.1}, {-0.9, -1.1}};
  for (const auto &p : points) {
    const double fdx = (target->log_density({p.x + h, p.y}) - target->log_density({p.x - h, p.y})) / (2 * h);
    const double fdy = (target->log_density({p.x, p.y + h}) - target->log_density({p.x, p.y - h})) / (2 * h);
    const Vec2 g = target->gradient(p);

    EXPECT_NEAR(g.x, fdx, 1e-4 * std::max(1.0, std::abs(fdx))) << GetParam() << " at (" << p.x << ", " << p.y << ")";
    EXPECT_NEAR(g.y, fdy, 1e-4 * std::max(1.0, std::abs(fdy))) << GetParam() << " at (" << p.x << ", " << p.y << ")";
  }
}

INSTANTIATE_TEST_SUITE_P(Catalog, GradientCheck,
                         ::testing::Values("gaussian", "bimodal", "donut", "banana"));

TEST(Density, CatalogLookup) {
  for (const auto &name : target_names()) {
    auto target = make_density(name);
    ASSERT_NE(target, nullptr);
    EXPECT_EQ(target->name(), name);
  }
  EXPECT_THROW(make_density("cauchy"), std::invalid_argument);
  EXPECT_THROW(make_density(""), std::invalid_argument);
}

TEST(FunctionDensity, WrapsCallables) {
  FunctionDensity f(
      "shifted", [](const Vec2 &p) { return -0.5 * ((p.x - 1.0) * (p.x - 1.0) + p.y * p.y); },
      [](const Vec2 &p) { return Vec2{-(p.x - 1.0), -p.y}; });
  EXPECT_EQ(f.name(), "shifted");
  EXPECT_TRUE(f.has_gradient());
  EXPECT_DOUBLE_EQ(f.log_density({1.0, 0.0}), 0.0);
  EXPECT_DOUBLE_EQ(f.gradient({2.0, 0.0}).x, -1.0);
}

TEST(FunctionDensity, GradientIsOptional) {
  FunctionDensity f("flat", [](const Vec2 &) { return 0.0; });
  EXPECT_FALSE(f.has_gradient());
  EXPECT_THROW(f.gradient({0.0, 0.0}), std::logic_error);
  EXPECT_THROW(FunctionDensity("empty", nullptr), std::invalid_argument);
}

TEST(DensityGrid, IsNormalizedAndSymmetric) {
  GaussianDensity g;
  GridSpec spec;
  spec.nx = 10;
  spec.ny = 10;
  spec.x_min = -4.0;
  spec.x_max = 4.0;
  spec.y_min = -4.0;
  spec.y_max = 4.0;
  spec.oversample = 4;

  const auto grid = density_grid(g, spec);
  EXPECT_NEAR(grid.sum(), 1.0, 1e-12);
  EXPECT_NEAR(grid(4, 4), grid(5, 5), 1e-12);
  EXPECT_NEAR(grid(0, 9), grid(9, 0), 1e-12);
  EXPECT_GT(grid(4, 4), grid(0, 0));
}

TEST(DensityGrid, HistogramCountsInRangeSamplesOnly) {
  GridSpec spec;
  spec.nx = 2;
  spec.ny = 2;
  spec.x_min = 0.0;
  spec.x_max = 2.0;
  spec.y_min = 0.0;
  spec.y_max = 2.0;

  std::vector<mcmclab::core::Sample> samples{
      {0.5, 0.5, true}, {1.5, 0.5, true}, {1.5, 0.5, false}, {1.5, 1.5, true}, {9.0, 9.0, true}};
  const auto hist = sample_histogram(samples, spec);
  EXPECT_DOUBLE_EQ(hist(0, 0), 0.25);
  EXPECT_DOUBLE_EQ(hist(0, 1), 0.5);
  EXPECT_DOUBLE_EQ(hist(1, 0), 0.0);
  EXPECT_DOUBLE_EQ(hist(1, 1), 0.25);
  EXPECT_DOUBLE_EQ(total_variation(hist, hist), 0.0);
}

TEST(DensityGrid, RejectsBadSpecs) {
  GaussianDensity g;
  GridSpec spec;
  spec.nx = 0;
  EXPECT_THROW(density_grid(g, spec), std::invalid_argument);

  GridSpec flipped;
  flipped.x_min = 1.0;
  flipped.x_max = -1.0;
  EXPECT_THROW(density_grid(g, flipped), std::invalid_argument);

  mcmclab::math::Matrix a(2, 2);
  mcmclab::math::Matrix b(3, 2);
  EXPECT_THROW(total_variation(a, b), std::invalid_argument);
}
