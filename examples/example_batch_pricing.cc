// SPDX-License-Identifier: MIT
/**
 * @file example_batch_pricing.cc
 * @brief Batch lead-by-one pricing across events and sources
 *
 * Demonstrates:
 * - Pricing many (event, source) requests in parallel
 * - Writing records through a single sink into a keyed store
 * - Handling rejected requests without aborting the batch
 * - Performance measurement
 */

#include "oneup/math/poisson.hpp"
#include "oneup/pricing/batch_pricer.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

/// Over/under quote with a 5% book margin around Poisson(rate)
oneup::MarketQuote over_under(double rate, double line) {
    const double p = oneup::effective_over_probability(rate, line);
    return oneup::MarketQuote{.line = line, .odds = {1.0 / (1.05 * p), 1.0 / (1.05 * (1.0 - p))}};
}

oneup::PricingRequest make_request(const std::string& event, const std::string& source,
                                   double home, double away) {
    const oneup::MatchOutcome o = oneup::poisson_match_outcome(home, away);
    oneup::PricingRequest request{.event_id = event, .snapshot_id = "snap-0001", .source = source};
    request.markets.match_result = oneup::MarketQuote{
        .line = std::nullopt,
        .odds = {1.0 / (1.05 * o.home_win), 1.0 / (1.05 * o.draw), 1.0 / (1.05 * o.away_win)},
    };
    request.markets.total_goals = {over_under(home + away, 1.5), over_under(home + away, 2.5)};
    request.markets.home_goals = {over_under(home, 0.5), over_under(home, 1.5)};
    request.markets.away_goals = {over_under(away, 0.5), over_under(away, 1.5)};
    return request;
}

}  // namespace

int main() {
    std::cout << "=== Batch Lead-by-One Pricing Example ===\n\n";

    struct Fixture {
        const char* event;
        double home;
        double away;
    };
    const std::vector<Fixture> fixtures = {
        {"ev-001", 1.9, 0.9}, {"ev-002", 1.4, 1.3}, {"ev-003", 0.8, 1.7},
        {"ev-004", 2.4, 0.6}, {"ev-005", 1.1, 1.1}, {"ev-006", 1.6, 1.2},
    };

    std::vector<oneup::PricingRequest> requests;
    for (const auto& f : fixtures) {
        for (const char* source : {"sporty", "pawa", "bet9ja"}) {
            requests.push_back(make_request(f.event, source, f.home, f.away));
        }
    }
    // One source is missing its away-goals market
    requests[4].markets.away_goals.clear();

    oneup::EngineConfig config{.lead_strategy = oneup::LeadStrategy::Stochastic};
    config.stochastic.n_sims = 20000;
    auto engine = oneup::LeadPricingEngine::create(config);
    if (!engine.has_value()) {
        std::cerr << "Invalid configuration: " << engine.error() << "\n";
        return 1;
    }

    oneup::BatchPricer pricer(*engine);
    oneup::PriceRecordStore store;

    auto start = std::chrono::high_resolution_clock::now();
    const auto batch = pricer.price_batch(requests, store.sink());
    auto end = std::chrono::high_resolution_clock::now();
    const double ms = std::chrono::duration<double, std::milli>(end - start).count();

    std::cout << "Requests: " << requests.size() << ", priced: " << store.size()
              << ", rejected: " << batch.failed_count << " (" << std::fixed << std::setprecision(1)
              << ms << " ms)\n\n";

    std::cout << std::setw(8) << "Event" << std::setw(8) << "Source"
              << std::setw(10) << "P(home)" << std::setw(10) << "P(away)"
              << std::setw(10) << "Home" << std::setw(10) << "Away" << "\n";
    std::cout << std::string(56, '-') << "\n";
    std::cout << std::setprecision(3);
    for (const auto& key : store.write_order()) {
        const auto record = store.find(key);
        if (!record.has_value()) continue;
        std::cout << std::setw(8) << key.event_id << std::setw(8) << key.source
                  << std::setw(10) << record->p_home_lead << std::setw(10) << record->p_away_lead
                  << std::setw(10) << record->home.margin_odds << std::setw(10) << record->away.margin_odds
                  << "\n";
    }

    for (size_t i = 0; i < batch.results.size(); ++i) {
        if (!batch.results[i].has_value()) {
            std::cout << "\nRejected " << requests[i].event_id << "/" << requests[i].source
                      << ": " << batch.results[i].error() << "\n";
        }
    }

    return 0;
}
