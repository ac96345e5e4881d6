// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "oneup/model/rate_inference.hpp"
#include "oneup/market/devig.hpp"
#include "oneup/math/poisson.hpp"
#include "market_fixtures.hpp"
#include <vector>

namespace oneup {
namespace {

using fixtures::over_under;

TEST(RateInferenceTest, SingleLineReproducesFairProbability) {
    const double rate = infer_rate_single_line(2.5, 1.9, 1.9);
    EXPECT_NEAR(effective_over_probability(rate, 2.5), 0.5, 1e-9);
    EXPECT_GT(rate, 2.0);
    EXPECT_LT(rate, 3.5);
}

TEST(RateInferenceTest, SingleLineRecoversKnownRate) {
    const MarketQuote q = over_under(2.7, 2.5);
    EXPECT_NEAR(infer_rate_single_line(2.5, q.odds[0], q.odds[1]), 2.7, 1e-8);
}

TEST(RateInferenceTest, HigherOverProbabilityGivesHigherRate) {
    // Over odds shortening: p_over rising
    const double r_low = infer_rate_single_line(2.5, 2.5, 1.55);
    const double r_mid = infer_rate_single_line(2.5, 1.9, 1.9);
    const double r_high = infer_rate_single_line(2.5, 1.5, 2.6);
    EXPECT_LT(r_low, r_mid);
    EXPECT_LT(r_mid, r_high);
}

TEST(RateInferenceTest, MonotoneAcrossManyProbabilities) {
    double prev = 0.0;
    for (double p = 0.05; p < 0.96; p += 0.05) {
        const double rate = infer_rate_single_line(1.5, 1.0 / p, 1.0 / (1.0 - p));
        EXPECT_GT(rate, prev) << "p=" << p;
        prev = rate;
    }
}

TEST(RateInferenceTest, HighRateNeedsBracketExpansion) {
    // Rate above the initial upper bound of 6.0
    const MarketQuote q = over_under(9.0, 8.5);
    EXPECT_NEAR(infer_rate_single_line(8.5, q.odds[0], q.odds[1]), 9.0, 1e-7);
}

TEST(RateInferenceTest, MultiLineFitRecoversRate) {
    const std::vector<MarketQuote> quotes = {
        over_under(2.7, 1.5), over_under(2.7, 2.5), over_under(2.7, 3.5)};
    auto brent = make_scalar_minimizer(MinimizerKind::BrentBounded);

    const RateFit fit = fit_rate(quotes, brent);

    EXPECT_NEAR(fit.rate, 2.7, 1e-3);
    EXPECT_EQ(fit.lines_used, 3u);
    EXPECT_FALSE(fit.used_fallback_rate);
    EXPECT_FALSE(fit.used_grid_fallback);
}

TEST(RateInferenceTest, MultiLineGridStrategy) {
    const std::vector<MarketQuote> quotes = {over_under(1.4, 0.5), over_under(1.4, 1.5)};
    auto grid = make_scalar_minimizer(MinimizerKind::GridSearch);

    const RateFit fit = fit_rate(quotes, grid);

    // 400 points on [0.01, 8]
    EXPECT_NEAR(fit.rate, 1.4, 0.021);
    EXPECT_EQ(fit.lines_used, 2u);
}

TEST(RateInferenceTest, InvalidLinesDroppedIndividually) {
    const std::vector<MarketQuote> quotes = {
        MarketQuote{.line = std::nullopt, .odds = {1.9, 1.9}},
        MarketQuote{.line = 2.5, .odds = {1.0, 1.9}},
        over_under(3.1, 2.5),
        MarketQuote{.line = 3.5, .odds = {2.0}},
    };
    auto brent = make_scalar_minimizer(MinimizerKind::BrentBounded);

    const RateFit fit = fit_rate(quotes, brent);

    EXPECT_EQ(fit.lines_used, 1u);
    EXPECT_NEAR(fit.rate, 3.1, 1e-7);
}

TEST(RateInferenceTest, NoValidLineUsesFallbackRate) {
    auto brent = make_scalar_minimizer(MinimizerKind::BrentBounded);

    const RateFit empty = fit_rate(std::vector<MarketQuote>{}, brent);
    EXPECT_DOUBLE_EQ(empty.rate, 1.8);
    EXPECT_TRUE(empty.used_fallback_rate);
    EXPECT_EQ(empty.lines_used, 0u);

    const std::vector<MarketQuote> invalid = {MarketQuote{.line = 2.5, .odds = {1.01, 1.01}}};
    const RateFit fit = fit_rate(invalid, brent);
    EXPECT_DOUBLE_EQ(fit.rate, 1.8);
    EXPECT_TRUE(fit.used_fallback_rate);
}

TEST(RateInferenceTest, MinimizerFailureFallsBackToGrid) {
    const std::vector<MarketQuote> quotes = {over_under(2.2, 1.5), over_under(2.2, 2.5)};
    auto starved = make_scalar_minimizer(MinimizerKind::BrentBounded, MinimizerConfig{.max_evaluations = 2});

    const RateFit fit = fit_rate(quotes, starved);

    EXPECT_TRUE(fit.used_grid_fallback);
    EXPECT_FALSE(fit.used_fallback_rate);
    EXPECT_NEAR(fit.rate, 2.2, 0.021);
}

TEST(RateInferenceTest, BttsImpliedTotal) {
    const double p_btts = both_teams_score_probability(1.5, 1.0);
    // 100 points on [0.5, 5.5]
    EXPECT_NEAR(infer_total_rate_from_btts(p_btts, 0.6), 2.5, 0.051);
}

}  // namespace
}  // namespace oneup
