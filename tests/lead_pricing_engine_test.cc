// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "oneup/pricing/lead_pricing_engine.hpp"
#include "oneup/math/poisson.hpp"
#include "market_fixtures.hpp"
#include <algorithm>
#include <cmath>
#include <string_view>

namespace oneup {
namespace {

using fixtures::first_scorer;
using fixtures::request_from_rates;

EngineConfig exact_config() {
    EngineConfig config;
    config.lead_strategy = LeadStrategy::ExactBarrier;
    config.calibration.version = CalibrationVersion::Identity;
    config.margin_fraction = 0.0;
    return config;
}

LeadPricingEngine make_engine(EngineConfig config) {
    auto engine = LeadPricingEngine::create(std::move(config));
    EXPECT_TRUE(engine.has_value());
    return std::move(*engine);
}

bool has_note(const PricingDiagnostics& diag, std::string_view prefix) {
    return std::any_of(diag.degeneracies.begin(), diag.degeneracies.end(),
                       [&](const std::string& note) { return note.starts_with(prefix); });
}

TEST(LeadPricingEngineTest, CreateRejectsInvalidConfig) {
    EngineConfig config;
    config.margin_fraction = 2.0;
    const auto engine = LeadPricingEngine::create(config);
    ASSERT_FALSE(engine.has_value());
    EXPECT_EQ(engine.error().code, ValidationErrorCode::InvalidMargin);
}

TEST(LeadPricingEngineTest, PricesStrongerHomeSide) {
    const auto engine = make_engine(exact_config());

    const auto record = engine.price(request_from_rates("ev-1", 1.8, 1.2));
    ASSERT_TRUE(record.has_value());

    EXPECT_NEAR(record->rate_total, 3.0, 1e-3);
    EXPECT_NEAR(record->rate_home, 1.8, 1e-2);
    EXPECT_NEAR(record->rate_away, 1.2, 1e-2);
    EXPECT_GT(record->p_home_lead, record->p_away_lead);
    EXPECT_LT(record->home.fair_odds, record->away.fair_odds);
    EXPECT_DOUBLE_EQ(record->home.fair_odds, 1.0 / record->p_home_lead);
    EXPECT_DOUBLE_EQ(record->home.margin_odds, record->home.fair_odds);
    EXPECT_GE(record->p_home_lead + record->p_away_lead, 1.0 - std::exp(-record->rate_total) - 1e-6);
}

TEST(LeadPricingEngineTest, RecordKeyAndVersions) {
    EngineConfig config = exact_config();
    config.engine_version = "oneup-test";
    const auto engine = make_engine(config);

    const auto record = engine.price(request_from_rates("ev-42", 1.4, 1.1, "bet9ja"));
    ASSERT_TRUE(record.has_value());

    EXPECT_EQ(record->key.event_id, "ev-42");
    EXPECT_EQ(record->key.snapshot_id, "snap-1");
    EXPECT_EQ(record->key.engine_version, "oneup-test");
    EXPECT_EQ(record->key.source, "bet9ja");
    EXPECT_EQ(record->diagnostics.calibrator_version, "identity");
    EXPECT_EQ(record->diagnostics.lead_strategy, "exact_barrier_dp");
    EXPECT_EQ(record->diagnostics.lines_total, 1u);
    EXPECT_EQ(record->diagnostics.lines_home, 1u);
    EXPECT_EQ(record->diagnostics.lines_away, 1u);
}

TEST(LeadPricingEngineTest, BalancedMatchPricedEvenly) {
    const auto engine = make_engine(exact_config());

    const auto record = engine.price(request_from_rates("ev-1", 1.3, 1.3));
    ASSERT_TRUE(record.has_value());

    EXPECT_NEAR(record->diagnostics.supremacy, 0.0, 1e-3);
    EXPECT_NEAR(record->p_home_lead, record->p_away_lead, 1e-3);
}

TEST(LeadPricingEngineTest, MissingFamiliesReportedInOrder) {
    const auto engine = make_engine(exact_config());

    auto no_result = request_from_rates("ev-1", 1.5, 1.0);
    no_result.markets.match_result.reset();
    no_result.markets.home_goals.clear();
    const auto r1 = engine.price(no_result);
    ASSERT_FALSE(r1.has_value());
    EXPECT_EQ(r1.error().code, PricingErrorCode::InsufficientData);
    EXPECT_EQ(r1.error().family, MarketFamily::MatchResult);

    auto no_home = request_from_rates("ev-1", 1.5, 1.0);
    no_home.markets.home_goals.clear();
    const auto r2 = engine.price(no_home);
    ASSERT_FALSE(r2.has_value());
    EXPECT_EQ(r2.error().family, MarketFamily::HomeGoals);

    auto bad_away = request_from_rates("ev-1", 1.5, 1.0);
    bad_away.markets.away_goals = {MarketQuote{.line = 1.5, .odds = {1.0, 1.9}}};
    const auto r3 = engine.price(bad_away);
    ASSERT_FALSE(r3.has_value());
    EXPECT_EQ(r3.error().family, MarketFamily::AwayGoals);

    auto bad_total = request_from_rates("ev-1", 1.5, 1.0);
    bad_total.markets.total_goals = {MarketQuote{.line = std::nullopt, .odds = {1.9, 1.9}}};
    const auto r4 = engine.price(bad_total);
    ASSERT_FALSE(r4.has_value());
    EXPECT_EQ(r4.error().family, MarketFamily::TotalGoals);
}

TEST(LeadPricingEngineTest, InvalidLineDroppedNotFatal) {
    const auto engine = make_engine(exact_config());

    auto request = request_from_rates("ev-1", 1.5, 1.0);
    request.markets.total_goals.push_back(MarketQuote{.line = 3.5, .odds = {1.005, 1.9}});
    const auto record = engine.price(request);
    ASSERT_TRUE(record.has_value());

    EXPECT_EQ(record->diagnostics.lines_total, 1u);
    EXPECT_NEAR(record->rate_total, 2.5, 1e-3);
}

TEST(LeadPricingEngineTest, FirstScorerShareFromRoutedProvider) {
    const auto engine = make_engine(exact_config());

    auto request = request_from_rates("ev-1", 1.5, 1.5, "pawa");
    request.markets.first_scorer = {first_scorer(3.0, 0.6, "sporty")};
    const auto record = engine.price(request);
    ASSERT_TRUE(record.has_value());

    const auto& diag = record->diagnostics;
    EXPECT_EQ(diag.share_source, "sporty_for_pawa");
    EXPECT_TRUE(diag.share_override_applied);
    EXPECT_NEAR(diag.conditional_share, 0.6, 1e-9);
    EXPECT_NEAR(record->rate_home, 0.6 * record->rate_total, 1e-9);
    EXPECT_GT(record->p_home_lead, record->p_away_lead);
}

TEST(LeadPricingEngineTest, RoutedProviderMissingUsesSupremacy) {
    const auto engine = make_engine(exact_config());

    auto request = request_from_rates("ev-1", 1.8, 1.2, "pawa");
    request.markets.first_scorer = {first_scorer(3.0, 0.3, "pawa")};
    const auto record = engine.price(request);
    ASSERT_TRUE(record.has_value());

    EXPECT_EQ(record->diagnostics.share_source, "no_sporty_quote");
    EXPECT_FALSE(record->diagnostics.share_override_applied);
    EXPECT_NEAR(record->diagnostics.supremacy, 0.6, 1e-2);
}

TEST(LeadPricingEngineTest, OverrideDisabled) {
    EngineConfig config = exact_config();
    config.split.first_scorer_override = false;
    const auto engine = make_engine(config);

    auto request = request_from_rates("ev-1", 1.8, 1.2);
    request.markets.first_scorer = {first_scorer(3.0, 0.3, "sporty")};
    const auto record = engine.price(request);
    ASSERT_TRUE(record.has_value());

    EXPECT_EQ(record->diagnostics.share_source, "disabled");
    EXPECT_FALSE(record->diagnostics.share_override_applied);
    EXPECT_GT(record->rate_home, record->rate_away);
}

TEST(LeadPricingEngineTest, BttsCrossCheck) {
    const auto engine = make_engine(exact_config());

    auto request = request_from_rates("ev-1", 1.8, 1.2);
    const double p = both_teams_score_probability(1.8, 1.2);
    request.markets.both_teams_score = MarketQuote{
        .line = std::nullopt,
        .odds = {1.0 / (p * fixtures::kBookMargin), 1.0 / ((1.0 - p) * fixtures::kBookMargin)},
    };
    const auto record = engine.price(request);
    ASSERT_TRUE(record.has_value());

    ASSERT_TRUE(record->diagnostics.btts.has_value());
    const BttsCheck& btts = *record->diagnostics.btts;
    EXPECT_NEAR(btts.p_market, p, 1e-12);
    EXPECT_NEAR(btts.p_model, p, 1e-2);
    EXPECT_NEAR(btts.implied_total, 3.0, 0.06);
}

TEST(LeadPricingEngineTest, BttsAbsentLeavesCheckEmpty) {
    const auto engine = make_engine(exact_config());
    const auto record = engine.price(request_from_rates("ev-1", 1.8, 1.2));
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->diagnostics.btts.has_value());
}

TEST(LeadPricingEngineTest, CalibrationAppliedAfterRawEstimate) {
    EngineConfig config = exact_config();
    config.calibration.version = CalibrationVersion::RatioCorrectionV2;
    const auto engine = make_engine(config);

    const auto record = engine.price(request_from_rates("ev-1", 2.2, 0.8));
    ASSERT_TRUE(record.has_value());

    const auto& raw = record->diagnostics.raw;
    EXPECT_EQ(record->diagnostics.calibrator_version, "ratio_correction_v2");
    EXPECT_LT(record->p_away_lead, raw.p_away_lead);
    EXPECT_LT(record->p_home_lead, raw.p_home_lead);
    EXPECT_DOUBLE_EQ(record->p_level_full_time, raw.p_level_full_time);
}

TEST(LeadPricingEngineTest, MarginAppliedToBothSides) {
    EngineConfig config = exact_config();
    config.margin_fraction = 0.05;
    const auto engine = make_engine(config);

    const auto record = engine.price(request_from_rates("ev-1", 1.5, 1.0));
    ASSERT_TRUE(record.has_value());
    EXPECT_NEAR(record->home.margin_odds, 0.95 * record->home.fair_odds, 1e-12);
    EXPECT_NEAR(record->away.margin_odds, 0.95 * record->away.fair_odds, 1e-12);
}

TEST(LeadPricingEngineTest, StochasticStrategyCloseToExact) {
    EngineConfig stochastic = exact_config();
    stochastic.lead_strategy = LeadStrategy::Stochastic;
    stochastic.stochastic.n_sims = 100000;
    const auto mc = make_engine(stochastic);
    const auto dp = make_engine(exact_config());

    const auto request = request_from_rates("ev-1", 1.6, 1.1);
    const auto a = mc.price(request);
    const auto b = dp.price(request);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());

    EXPECT_EQ(a->diagnostics.lead_strategy, "stochastic");
    EXPECT_NEAR(a->p_home_lead, b->p_home_lead, 0.01);
    EXPECT_NEAR(a->p_away_lead, b->p_away_lead, 0.01);
}

TEST(LeadPricingEngineTest, ExtremeShareFlooredAndNoted) {
    const auto engine = make_engine(exact_config());

    auto request = request_from_rates("ev-1", 1.5, 1.5);
    request.markets.first_scorer = {first_scorer(3.0, 0.9999, "sporty")};
    const auto record = engine.price(request);
    ASSERT_TRUE(record.has_value());

    EXPECT_DOUBLE_EQ(record->rate_away, 0.01);
    EXPECT_NEAR(record->rate_total, record->rate_home + 0.01, 1e-12);
    EXPECT_TRUE(has_note(record->diagnostics, "rate_away"));
    EXPECT_FALSE(has_note(record->diagnostics, "rate_home"));
}

TEST(LeadPricingEngineTest, FloorFollowsSupremacyMinRate) {
    EngineConfig config = exact_config();
    config.supremacy.min_rate = 0.05;
    const auto engine = make_engine(config);

    auto request = request_from_rates("ev-1", 1.5, 1.5);
    request.markets.first_scorer = {first_scorer(3.0, 0.9999, "sporty")};
    const auto record = engine.price(request);
    ASSERT_TRUE(record.has_value());

    EXPECT_DOUBLE_EQ(record->rate_away, 0.05);
    EXPECT_NEAR(record->diagnostics.conditional_share, record->rate_home / record->rate_total, 1e-12);
}

TEST(LeadPricingEngineTest, ProportionalRatesKeptInDiagnostics) {
    const auto engine = make_engine(exact_config());

    auto request = request_from_rates("ev-1", 1.8, 1.2);
    request.markets.first_scorer = {first_scorer(3.0, 0.3, "sporty")};
    const auto record = engine.price(request);
    ASSERT_TRUE(record.has_value());

    const RateEstimate& proportional = record->diagnostics.proportional_rates;
    EXPECT_NEAR(proportional.rate_home, 1.8, 1e-2);
    EXPECT_NEAR(proportional.rate_away, 1.2, 1e-2);
    EXPECT_NEAR(proportional.rate_total, record->rate_total, 1e-9);
    // The first-scorer share replaced the proportional split
    EXPECT_NEAR(record->rate_home, 0.3 * record->rate_total, 1e-9);
}

TEST(LeadPricingEngineTest, DegenerateSupremacyKeepsProportionalSplit) {
    EngineConfig config = exact_config();
    config.split.first_scorer_override = false;
    config.supremacy.min_rate = 1.85;
    const auto engine = make_engine(config);

    const auto record = engine.price(request_from_rates("ev-1", 2.0, 1.6));
    ASSERT_TRUE(record.has_value());

    const PricingDiagnostics& diag = record->diagnostics;
    EXPECT_TRUE(has_note(diag, "supremacy: total rate too small, proportional split used"));
    EXPECT_NEAR(diag.supremacy, diag.proportional_rates.rate_home - diag.proportional_rates.rate_away, 1e-12);
    EXPECT_NEAR(diag.supremacy, 0.4, 2e-2);
    EXPECT_NEAR(record->rate_home, diag.proportional_rates.rate_home, 1e-12);
    EXPECT_DOUBLE_EQ(record->rate_away, 1.85);
}

MarketQuote btts_quote(double p) {
    return MarketQuote{
        .line = std::nullopt,
        .odds = {1.0 / (p * fixtures::kBookMargin), 1.0 / ((1.0 - p) * fixtures::kBookMargin)},
    };
}

TEST(LeadPricingEngineTest, BttsAdjustmentOffByDefault) {
    const auto engine = make_engine(exact_config());

    auto request = request_from_rates("ev-1", 1.8, 1.2);
    request.markets.both_teams_score = btts_quote(0.75);
    const auto record = engine.price(request);
    ASSERT_TRUE(record.has_value());

    ASSERT_TRUE(record->diagnostics.btts.has_value());
    EXPECT_FALSE(record->diagnostics.btts->rates_adjusted);
    EXPECT_DOUBLE_EQ(record->diagnostics.btts->adjustment_factor, 1.0);
    EXPECT_NEAR(record->rate_total, 3.0, 1e-3);
}

TEST(LeadPricingEngineTest, BttsAdjustmentMovesRatesTowardsMarket) {
    EngineConfig adjusted_config = exact_config();
    adjusted_config.split.btts_adjustment.enabled = true;
    const auto adjusted = make_engine(adjusted_config);
    const auto plain = make_engine(exact_config());

    auto request = request_from_rates("ev-1", 1.8, 1.2);
    request.markets.both_teams_score = btts_quote(0.75);
    const auto a = adjusted.price(request);
    const auto b = plain.price(request);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());

    const BttsCheck& check = *a->diagnostics.btts;
    EXPECT_TRUE(check.rates_adjusted);
    EXPECT_GT(check.adjustment_factor, 1.0);
    EXPECT_LE(check.adjustment_factor, 1.15);
    EXPECT_GT(a->rate_total, b->rate_total);
    EXPECT_GT(check.p_model, b->diagnostics.btts->p_model);
    EXPECT_NEAR(a->diagnostics.conditional_share, a->rate_home / a->rate_total, 1e-12);
    EXPECT_GT(a->p_home_lead, b->p_home_lead);
}

TEST(LeadPricingEngineTest, BttsAdjustmentNeedsQuote) {
    EngineConfig config = exact_config();
    config.split.btts_adjustment.enabled = true;
    const auto engine = make_engine(config);

    const auto record = engine.price(request_from_rates("ev-1", 1.8, 1.2));
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->diagnostics.btts.has_value());
    EXPECT_NEAR(record->rate_total, 3.0, 1e-3);
}

}  // namespace
}  // namespace oneup
