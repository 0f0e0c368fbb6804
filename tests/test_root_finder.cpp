#include "orckit/numerics/quadrature.hpp"
#include "orckit/numerics/root_finder.hpp"
#include <cmath>
#include <vector>
#include <gtest/gtest.h>

namespace orckit::numerics {
namespace {

TEST(BrentRootFinder, FindsSquareRootOfTwo) {
  RootFinderConfig config;
  config.relative_tolerance = 1e-12;
  config.absolute_tolerance = 1e-12;
  const BrentRootFinder solver(config);

  auto result = solver.solve([](double x) { return x * x - 2.0; }, 0.0, 2.0);
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_TRUE(result->converged);
  EXPECT_NEAR(result->root, std::sqrt(2.0), 1e-10);
  EXPECT_LT(result->iterations, 50);
}

TEST(BrentRootFinder, AcceptsRootOnInterval) {
  const BrentRootFinder solver;
  auto result = solver.solve([](double x) { return x - 1.0; }, 1.0, 3.0);
  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->root, 1.0);
  EXPECT_EQ(result->iterations, 0);
}

TEST(BrentRootFinder, ReportsMissingBracket) {
  const BrentRootFinder solver;
  auto result = solver.solve([](double x) { return x * x + 1.0; }, -1.0, 1.0);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), RootFinderError::Kind::NoBracket);
}

TEST(BrentRootFinder, RejectsDegenerateInterval) {
  const BrentRootFinder solver;
  auto result = solver.solve([](double x) { return x; }, 2.0, 2.0);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), RootFinderError::Kind::InvalidInterval);
}

TEST(BrentRootFinder, PropagatesResidualFailure) {
  struct Failure : core::OrckitException {
    Failure() : OrckitException("outside domain") {}
  };

  const BrentRootFinder solver;
  auto residual = [](double x) -> std::expected<double, Failure> {
    if (x > 0.5) {
      return std::unexpected(Failure());
    }
    return x - 0.25;
  };

  auto result = solver.solve(residual, 0.0, 1.0);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), RootFinderError::Kind::ResidualFailure);
  EXPECT_DOUBLE_EQ(result.error().last_iterate(), 1.0);
}

TEST(BrentRootFinder, StopsAtIterationLimit) {
  RootFinderConfig config;
  config.relative_tolerance = 1e-15;
  config.absolute_tolerance = 0.0;
  config.max_iterations = 2;
  const BrentRootFinder solver(config);

  auto result = solver.solve([](double x) { return std::exp(x) - 5.0; }, 0.0, 10.0);
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->converged);
  EXPECT_LE(result->iterations, 2);
}

TEST(Quadrature, GaussLegendreIsExactForCubics) {
  auto cubic = [](double x) { return 4.0 * x * x * x - 3.0 * x * x + 1.0; };
  // ∫_0^2 = 16 - 8 + 2
  EXPECT_NEAR(integrate(cubic, 0.0, 2.0), 10.0, 1e-10);
}

TEST(Quadrature, TrapezoidOfTabulatedLine) {
  const std::vector<double> x{0.0, 0.5, 2.0, 3.0};
  const std::vector<double> y{1.0, 2.0, 5.0, 7.0};
  // Piecewise-linear data is integrated exactly
  EXPECT_NEAR(trapezoid(x, y), 0.75 + 5.25 + 6.0, 1e-12);
}

} // namespace
} // namespace orckit::numerics
