// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "oneup/math/root_finding.hpp"
#include <cmath>
#include <limits>

namespace oneup {
namespace {

TEST(RootFindingConfigTest, DefaultValues) {
    RootFindingConfig config;

    EXPECT_EQ(config.max_iter, 50u);
    EXPECT_EQ(config.max_expansions, 20u);
    EXPECT_DOUBLE_EQ(config.lower, 0.01);
    EXPECT_DOUBLE_EQ(config.upper, 6.0);
}

TEST(BisectIncreasingTest, FindsRootInsideInitialBracket) {
    auto f = [](double x) { return x * x; };

    auto result = bisect_increasing(f, 2.0, RootFindingConfig{});

    ASSERT_TRUE(result.root.has_value());
    EXPECT_TRUE(result.converged);
    EXPECT_NEAR(*result.root, std::sqrt(2.0), 1e-10);
    EXPECT_EQ(result.iterations, 50u);
    EXPECT_LT(result.final_error, 1e-10);
}

TEST(BisectIncreasingTest, ExpandsUpperBound) {
    auto f = [](double x) { return x; };

    auto result = bisect_increasing(f, 10.0, RootFindingConfig{});

    ASSERT_TRUE(result.root.has_value());
    EXPECT_TRUE(result.converged);
    EXPECT_NEAR(*result.root, 10.0, 1e-9);
}

TEST(BisectIncreasingTest, UnreachableTargetStillReturnsMidpoint) {
    auto f = [](double) { return 0.5; };

    auto result = bisect_increasing(f, 0.9, RootFindingConfig{.max_iter = 10, .max_expansions = 3});

    EXPECT_FALSE(result.converged);
    ASSERT_TRUE(result.root.has_value());
    ASSERT_TRUE(result.failure_reason.has_value());
    EXPECT_GT(*result.root, 0.0);
}

TEST(BisectIncreasingTest, NonFiniteObjective) {
    auto f = [](double) { return std::numeric_limits<double>::quiet_NaN(); };

    auto result = bisect_increasing(f, 0.5, RootFindingConfig{});

    EXPECT_FALSE(result.converged);
    EXPECT_FALSE(result.root.has_value());
    ASSERT_TRUE(result.failure_reason.has_value());
}

}  // namespace
}  // namespace oneup
