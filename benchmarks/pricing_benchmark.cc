// SPDX-License-Identifier: MIT
#include <benchmark/benchmark.h>
#include "oneup/math/poisson.hpp"
#include "oneup/pricing/batch_pricer.hpp"
#include <string>
#include <vector>

using namespace oneup;

namespace {

MarketQuote over_under(double rate, double line) {
    const double p = effective_over_probability(rate, line);
    return MarketQuote{.line = line, .odds = {0.95 / p, 0.95 / (1.0 - p)}};
}

PricingRequest make_request(size_t i) {
    const double home = 0.8 + 0.05 * static_cast<double>(i % 25);
    const double away = 1.2;
    const MatchOutcome o = poisson_match_outcome(home, away);

    PricingRequest request{
        .event_id = "ev-" + std::to_string(i),
        .snapshot_id = "bench",
        .source = "sporty",
    };
    request.markets.match_result = MarketQuote{
        .line = std::nullopt,
        .odds = {0.95 / o.home_win, 0.95 / o.draw, 0.95 / o.away_win},
    };
    for (double line : {1.5, 2.5, 3.5}) {
        request.markets.total_goals.push_back(over_under(home + away, line));
    }
    request.markets.home_goals = {over_under(home, 0.5), over_under(home, 1.5)};
    request.markets.away_goals = {over_under(away, 0.5), over_under(away, 1.5)};
    return request;
}

std::vector<PricingRequest> make_requests(size_t n) {
    std::vector<PricingRequest> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(make_request(i));
    }
    return out;
}

}  // namespace

// Single request through the full pipeline
static void BM_PriceSingle(benchmark::State& state) {
    EngineConfig config;
    config.lead_strategy = state.range(0) == 0 ? LeadStrategy::ExactBarrier : LeadStrategy::Stochastic;
    auto engine = LeadPricingEngine::create(config);
    if (!engine.has_value()) {
        state.SkipWithError("invalid engine config");
        return;
    }
    const PricingRequest request = make_request(3);

    for (auto _ : state) {
        auto record = engine->price(request);
        benchmark::DoNotOptimize(record);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel(to_string(config.lead_strategy));
}
BENCHMARK(BM_PriceSingle)->Arg(0)->Arg(1)->Unit(benchmark::kMicrosecond);

// Batch of range(0) requests, parallel across events
static void BM_PriceBatch(benchmark::State& state) {
    EngineConfig config;
    config.lead_strategy = LeadStrategy::ExactBarrier;
    auto engine = LeadPricingEngine::create(config);
    if (!engine.has_value()) {
        state.SkipWithError("invalid engine config");
        return;
    }
    BatchPricer pricer(*engine);
    const auto requests = make_requests(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        auto batch = pricer.price_batch(requests);
        benchmark::DoNotOptimize(batch);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_PriceBatch)->Arg(10)->Arg(100)->Arg(1000)->Unit(benchmark::kMillisecond);

// Rate fit alone, Brent versus grid search
static void BM_FitRate(benchmark::State& state) {
    const auto kind = state.range(0) == 0 ? MinimizerKind::BrentBounded : MinimizerKind::GridSearch;
    const AnyScalarMinimizer minimizer = make_scalar_minimizer(kind);
    const PricingRequest request = make_request(0);

    for (auto _ : state) {
        auto fit = fit_rate(request.markets.total_goals, minimizer);
        benchmark::DoNotOptimize(fit);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel(kind == MinimizerKind::BrentBounded ? "brent" : "grid");
}
BENCHMARK(BM_FitRate)->Arg(0)->Arg(1);
