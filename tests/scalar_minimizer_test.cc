// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "oneup/math/scalar_minimizer.hpp"
#include "oneup/support/pricing_trace.h"
#include <cmath>
#include <limits>

namespace oneup {
namespace {

auto parabola = [](double x) { return (x - 1.3) * (x - 1.3) + 0.25; };

TEST(BrentBoundedMinimizerTest, FindsInteriorMinimum) {
    BrentBoundedMinimizer brent;
    auto result = brent.minimize(parabola, -2.0, 2.0);

    EXPECT_TRUE(result.converged);
    EXPECT_NEAR(result.x, 1.3, 1e-4);
    EXPECT_NEAR(result.fx, 0.25, 1e-8);
    EXPECT_FALSE(result.used_fallback);
    EXPECT_LT(result.evaluations, 100u);
}

TEST(BrentBoundedMinimizerTest, MinimumAtBoundary) {
    BrentBoundedMinimizer brent;
    auto result = brent.minimize([](double x) { return x; }, 0.5, 3.0);

    EXPECT_TRUE(result.converged);
    EXPECT_NEAR(result.x, 0.5, 1e-4);
}

TEST(BrentBoundedMinimizerTest, RejectsInvalidBounds) {
    BrentBoundedMinimizer brent;
    auto result = brent.minimize(parabola, 2.0, -2.0);

    EXPECT_FALSE(result.converged);
    ASSERT_TRUE(result.failure_reason.has_value());
}

TEST(BrentBoundedMinimizerTest, EvaluationBudgetExhausted) {
    BrentBoundedMinimizer brent(MinimizerConfig{.max_evaluations = 3});
    auto result = brent.minimize(parabola, -2.0, 2.0);

    EXPECT_FALSE(result.converged);
    EXPECT_EQ(result.evaluations, 3u);
}

TEST(GridSearchMinimizerTest, FindsNearestNode) {
    GridSearchMinimizer grid(401);  // step 0.01 on [-2, 2]
    auto result = grid.minimize(parabola, -2.0, 2.0);

    EXPECT_TRUE(result.converged);
    EXPECT_NEAR(result.x, 1.3, 0.01);
    EXPECT_EQ(result.evaluations, 401u);
}

TEST(GridSearchMinimizerTest, IncludesBothBounds) {
    GridSearchMinimizer grid(5);
    EXPECT_DOUBLE_EQ(grid.minimize([](double x) { return -x; }, 0.0, 1.0).x, 1.0);
    EXPECT_DOUBLE_EQ(grid.minimize([](double x) { return x; }, 0.0, 1.0).x, 0.0);
}

TEST(GridSearchMinimizerTest, AllNonFinite) {
    GridSearchMinimizer grid(10);
    auto result = grid.minimize([](double) { return std::numeric_limits<double>::quiet_NaN(); }, 0.0, 1.0);
    EXPECT_FALSE(result.converged);
}

TEST(AnyScalarMinimizerTest, FactorySelectsStrategy) {
    EXPECT_EQ(make_scalar_minimizer(MinimizerKind::BrentBounded).kind(), MinimizerKind::BrentBounded);
    EXPECT_EQ(make_scalar_minimizer(MinimizerKind::GridSearch).kind(), MinimizerKind::GridSearch);
}

TEST(AnyScalarMinimizerTest, BothStrategiesAgree) {
    auto brent = make_scalar_minimizer(MinimizerKind::BrentBounded);
    auto grid = make_scalar_minimizer(MinimizerKind::GridSearch, MinimizerConfig{.grid_points = 801});

    EXPECT_NEAR(brent.minimize(parabola, -2.0, 2.0).x, grid.minimize(parabola, -2.0, 2.0).x, 0.01);
}

TEST(MinimizeWithFallbackTest, ConvergedResultKept) {
    auto brent = make_scalar_minimizer(MinimizerKind::BrentBounded);
    auto result = minimize_with_fallback(brent, parabola, -2.0, 2.0, 201, MODULE_SUPREMACY);

    EXPECT_TRUE(result.converged);
    EXPECT_FALSE(result.used_fallback);
    EXPECT_NEAR(result.x, 1.3, 1e-4);
}

TEST(MinimizeWithFallbackTest, GridTakesOverOnFailure) {
    auto brent = make_scalar_minimizer(MinimizerKind::BrentBounded, MinimizerConfig{.max_evaluations = 3});
    auto result = minimize_with_fallback(brent, parabola, -2.0, 2.0, 201, MODULE_SUPREMACY);

    EXPECT_TRUE(result.converged);
    EXPECT_TRUE(result.used_fallback);
    EXPECT_NEAR(result.x, 1.3, 0.02);
    EXPECT_EQ(result.evaluations, 3u + 201u);
}

}  // namespace
}  // namespace oneup
