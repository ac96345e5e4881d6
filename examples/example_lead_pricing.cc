// SPDX-License-Identifier: MIT
/**
 * @file example_lead_pricing.cc
 * @brief Price the lead-by-one market of a single match
 *
 * Demonstrates:
 * - Building a market book from quoted decimal odds
 * - Creating an engine with a validated configuration
 * - Comparing the stochastic and exact lead strategies
 * - Reading the diagnostics of a price record
 */

#include "oneup/pricing/lead_pricing_engine.hpp"
#include <iomanip>
#include <iostream>

namespace {

oneup::PricingRequest sample_request() {
    oneup::PricingRequest request{
        .event_id = "arsenal-v-fulham",
        .snapshot_id = "2026-10-19T12:00:00Z",
        .source = "pawa",
    };

    auto& m = request.markets;
    m.match_result = oneup::MarketQuote{.line = std::nullopt, .odds = {1.62, 4.10, 5.40}};
    m.total_goals = {
        {.line = 1.5, .odds = {1.25, 3.90}},
        {.line = 2.5, .odds = {1.80, 2.02}},
        {.line = 3.5, .odds = {2.95, 1.40}},
    };
    m.home_goals = {
        {.line = 0.5, .odds = {1.13, 5.80}},
        {.line = 1.5, .odds = {1.72, 2.10}},
    };
    m.away_goals = {
        {.line = 0.5, .odds = {1.62, 2.25}},
        {.line = 1.5, .odds = {4.20, 1.22}},
    };
    // Only the shared provider publishes first-scorer odds
    m.first_scorer = {{.line = std::nullopt, .odds = {1.55, 11.0, 3.10}, .provider = "sporty"}};
    m.both_teams_score = oneup::MarketQuote{.line = std::nullopt, .odds = {1.95, 1.85}};
    return request;
}

void print_record(const oneup::PriceRecord& r) {
    const auto& d = r.diagnostics;
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "  strategy:        " << d.lead_strategy << " / " << d.calibrator_version << "\n";
    std::cout << "  rates (h/a/t):   " << r.rate_home << " / " << r.rate_away << " / " << r.rate_total << "\n";
    std::cout << "  share source:    " << d.share_source
              << (d.share_override_applied ? " (applied)" : "") << "\n";
    std::cout << "  raw lead (h/a):  " << d.raw.p_home_lead << " / " << d.raw.p_away_lead << "\n";
    std::cout << "  lead (h/a):      " << r.p_home_lead << " / " << r.p_away_lead << "\n";
    std::cout << "  level at FT:     " << r.p_level_full_time << "\n";
    std::cout << "  home odds:       " << r.home.fair_odds << " fair, " << r.home.margin_odds << " offered\n";
    std::cout << "  away odds:       " << r.away.fair_odds << " fair, " << r.away.margin_odds << " offered\n";
    if (d.btts.has_value()) {
        std::cout << "  BTTS market/model: " << d.btts->p_market << " / " << d.btts->p_model
                  << " (implied total " << d.btts->implied_total << ")\n";
    }
    for (const auto& note : d.degeneracies) {
        std::cout << "  note: " << note << "\n";
    }
}

}  // namespace

int main() {
    std::cout << "=== Lead-by-One Pricing Example ===\n\n";

    const oneup::PricingRequest request = sample_request();

    for (auto strategy : {oneup::LeadStrategy::Stochastic, oneup::LeadStrategy::ExactBarrier}) {
        oneup::EngineConfig config{.lead_strategy = strategy};

        auto engine = oneup::LeadPricingEngine::create(config);
        if (!engine.has_value()) {
            std::cerr << "Invalid configuration: " << engine.error() << "\n";
            return 1;
        }

        auto record = engine->price(request);
        if (!record.has_value()) {
            std::cerr << "Pricing failed: " << record.error() << "\n";
            return 1;
        }

        std::cout << oneup::to_string(strategy) << ":\n";
        print_record(*record);
        std::cout << "\n";
    }

    // A book without the match result cannot be priced
    oneup::PricingRequest incomplete = request;
    incomplete.markets.match_result.reset();
    auto engine = oneup::LeadPricingEngine::create(oneup::EngineConfig{});
    if (engine.has_value()) {
        auto rejected = engine->price(incomplete);
        if (!rejected.has_value()) {
            std::cout << "Incomplete book rejected: " << rejected.error() << "\n";
        }
    }

    return 0;
}
