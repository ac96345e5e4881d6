// SPDX-License-Identifier: MIT
#include <benchmark/benchmark.h>
#include "oneup/model/exact_barrier_dp.hpp"
#include "oneup/model/stochastic_estimator.hpp"
#include "oneup/support/parallel.hpp"
#include <string>

using namespace oneup;

namespace {

const RateEstimate kRates{.rate_home = 1.6, .rate_away = 1.1, .rate_total = 2.7};

}  // namespace

// Exact recursion, truncated at range(0) goals
static void BM_ExactBarrierDP(benchmark::State& state) {
    ExactBarrierDP dp(ExactBarrierConfig{.max_goals = static_cast<int>(state.range(0))});

    for (auto _ : state) {
        auto r = dp.estimate(kRates);
        benchmark::DoNotOptimize(r);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel("max_goals=" + std::to_string(state.range(0)));
}
BENCHMARK(BM_ExactBarrierDP)->Arg(10)->Arg(15)->Arg(25);

// Batched chunk-parallel simulation
static void BM_Stochastic_Batched(benchmark::State& state) {
    const size_t n_sims = static_cast<size_t>(state.range(0));
    StochasticEstimator mc(StochasticConfig{.n_sims = n_sims});

    for (auto _ : state) {
        auto r = mc.estimate(kRates);
        benchmark::DoNotOptimize(r);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.SetLabel("threads=" + std::to_string(available_workers()));
}
BENCHMARK(BM_Stochastic_Batched)->Arg(10000)->Arg(30000)->Arg(100000)->Unit(benchmark::kMillisecond);

// One timeline at a time, single generator
static void BM_Stochastic_Scalar(benchmark::State& state) {
    const size_t n_sims = static_cast<size_t>(state.range(0));
    StochasticEstimator mc(StochasticConfig{.n_sims = n_sims});

    for (auto _ : state) {
        auto r = mc.simulate_scalar(kRates);
        benchmark::DoNotOptimize(r);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.SetLabel("scalar");
}
BENCHMARK(BM_Stochastic_Scalar)->Arg(10000)->Arg(30000)->Unit(benchmark::kMillisecond);

// Chunk size sweep at a fixed simulation count
static void BM_Stochastic_ChunkSize(benchmark::State& state) {
    StochasticEstimator mc(StochasticConfig{
        .n_sims = 30000,
        .chunk_size = static_cast<size_t>(state.range(0)),
    });

    for (auto _ : state) {
        auto r = mc.estimate(kRates);
        benchmark::DoNotOptimize(r);
    }

    state.SetItemsProcessed(state.iterations() * 30000);
}
BENCHMARK(BM_Stochastic_ChunkSize)->Arg(512)->Arg(4096)->Arg(16384)->Unit(benchmark::kMillisecond);
