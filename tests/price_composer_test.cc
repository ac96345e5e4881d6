// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "oneup/pricing/price_composer.hpp"
#include <limits>
#include <sstream>

namespace oneup {
namespace {

TEST(PriceComposerTest, FairAndMarginOdds) {
    const auto quote = compose_price(0.5, 0.05);
    ASSERT_TRUE(quote.has_value());
    EXPECT_DOUBLE_EQ(quote->fair_odds, 2.0);
    EXPECT_DOUBLE_EQ(quote->margin_odds, 1.9);
}

TEST(PriceComposerTest, ZeroMarginKeepsFairOdds) {
    const auto quote = compose_price(0.25, 0.0);
    ASSERT_TRUE(quote.has_value());
    EXPECT_DOUBLE_EQ(quote->margin_odds, quote->fair_odds);
}

TEST(PriceComposerTest, MarginNeverAboveFair) {
    for (double p : {0.01, 0.2, 0.7, 0.99}) {
        const auto quote = compose_price(p, 0.08);
        ASSERT_TRUE(quote.has_value());
        EXPECT_LT(quote->margin_odds, quote->fair_odds);
    }
}

TEST(PriceComposerTest, RejectsInvalidProbability) {
    for (double p : {0.0, -0.1, std::numeric_limits<double>::quiet_NaN(),
                     std::numeric_limits<double>::infinity()}) {
        const auto quote = compose_price(p, 0.05);
        ASSERT_FALSE(quote.has_value());
        EXPECT_EQ(quote.error().code, PricingErrorCode::InvalidProbability);
    }
}

TEST(PriceComposerTest, RejectsInvalidMargin) {
    for (double m : {-0.01, 1.0, 1.5}) {
        const auto quote = compose_price(0.5, m);
        ASSERT_FALSE(quote.has_value());
        EXPECT_EQ(quote.error().code, PricingErrorCode::InvalidMargin);
        EXPECT_DOUBLE_EQ(quote.error().value, m);
    }
}

TEST(PricingErrorTest, EveryCodeHasAName) {
    EXPECT_STREQ(to_string(PricingErrorCode::InsufficientData), "InsufficientData");
    EXPECT_STREQ(to_string(PricingErrorCode::InvalidProbability), "InvalidProbability");
    EXPECT_STREQ(to_string(PricingErrorCode::InvalidMargin), "InvalidMargin");
}

TEST(PricingErrorTest, StreamsFamilyOrValue) {
    std::ostringstream missing;
    missing << PricingError{.code = PricingErrorCode::InsufficientData,
                            .family = MarketFamily::HomeGoals};
    EXPECT_EQ(missing.str(), "PricingError{code=InsufficientData, family=home_goals}");

    std::ostringstream margin;
    margin << compose_price(0.5, 1.5).error();
    EXPECT_EQ(margin.str(), "PricingError{code=InvalidMargin, value=1.5}");
}

}  // namespace
}  // namespace oneup
