// SPDX-License-Identifier: MIT
#include "oneup/model/stochastic_estimator.hpp"
#include "oneup/support/parallel.hpp"
#include "oneup/support/pricing_trace.h"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

namespace oneup {

namespace {

using TimeArray = Eigen::Array<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using IndexArray = Eigen::Array<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using SignArray = Eigen::Array<signed char, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

std::mt19937_64 chunk_generator(uint64_t seed, size_t chunk_index) {
    const uint64_t chunk = static_cast<uint64_t>(chunk_index);
    std::seed_seq seq{
        static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
        static_cast<uint32_t>(chunk), static_cast<uint32_t>(chunk >> 32),
    };
    return std::mt19937_64(seq);
}

/// Poisson draw capped at `cap`; zero for a non-positive rate
int draw_goals(std::mt19937_64& rng, double rate, int cap) {
    if (!(rate > 0.0)) return 0;
    std::poisson_distribution<int> dist(rate);
    return std::min(dist(rng), cap);
}

}  // anonymous namespace

LeadProbabilityResult SimulationTally::to_result() const {
    if (simulations == 0) return {};
    const double n = static_cast<double>(simulations);
    return LeadProbabilityResult{
        .p_home_lead = static_cast<double>(home_led) / n,
        .p_away_lead = static_cast<double>(away_led) / n,
        .p_level_full_time = static_cast<double>(level) / n,
    };
}

StochasticEstimator::StochasticEstimator(const StochasticConfig& config)
    : config_(config)
{
    if (config_.n_sims == 0) {
        throw std::invalid_argument("StochasticEstimator: n_sims must be positive");
    }
    if (!(config_.match_minutes > 0.0) || !std::isfinite(config_.match_minutes)) {
        throw std::invalid_argument("StochasticEstimator: match_minutes must be positive");
    }
    if (config_.chunk_size == 0) {
        throw std::invalid_argument("StochasticEstimator: chunk_size must be positive");
    }
    if (config_.max_goals_per_side < 1) {
        throw std::invalid_argument("StochasticEstimator: max_goals_per_side must be >= 1");
    }
}

SimulationTally StochasticEstimator::simulate_chunk(double rate_home, double rate_away,
                                                    size_t chunk_index, size_t count) const {
    const int cap = config_.max_goals_per_side;
    const Eigen::Index rows = static_cast<Eigen::Index>(count);
    const Eigen::Index width = 2 * static_cast<Eigen::Index>(cap);

    std::mt19937_64 rng = chunk_generator(config_.seed, chunk_index);
    std::uniform_real_distribution<double> clock(0.0, config_.match_minutes);

    // Goal counts
    Eigen::ArrayXi home_goals(rows);
    Eigen::ArrayXi away_goals(rows);
    for (Eigen::Index i = 0; i < rows; ++i) {
        home_goals(i) = draw_goals(rng, rate_home, cap);
        away_goals(i) = draw_goals(rng, rate_away, cap);
    }

    // Goal times, packed left: home goals first, then away goals
    TimeArray times = TimeArray::Constant(rows, width, std::numeric_limits<double>::infinity());
    SignArray side = SignArray::Zero(rows, width);
    for (Eigen::Index i = 0; i < rows; ++i) {
        const int h = home_goals(i);
        const int a = away_goals(i);
        for (int g = 0; g < h; ++g) {
            times(i, g) = clock(rng);
            side(i, g) = 1;
        }
        for (int g = 0; g < a; ++g) {
            times(i, h + g) = clock(rng);
            side(i, h + g) = -1;
        }
    }

    // Time-sorted order of each row
    IndexArray order(rows, width);
    for (Eigen::Index i = 0; i < rows; ++i) {
        int* first = order.data() + i * width;
        const int k = home_goals(i) + away_goals(i);
        std::iota(first, first + width, 0);
        const double* row_times = times.data() + i * width;
        std::sort(first, first + k, [row_times](int x, int y) { return row_times[x] < row_times[y]; });
    }

    SimulationTally tally;
    tally.simulations = count;
    for (Eigen::Index i = 0; i < rows; ++i) {
        const int k = home_goals(i) + away_goals(i);
        if (home_goals(i) == away_goals(i)) ++tally.level;
        if (k == 0) {
            ++tally.scoreless;
            continue;
        }
        int running = 0;
        bool home_led = false;
        bool away_led = false;
        for (int j = 0; j < k; ++j) {
            running += side(i, order(i, j));
            home_led = home_led || running > 0;
            away_led = away_led || running < 0;
        }
        tally.home_led += home_led ? 1 : 0;
        tally.away_led += away_led ? 1 : 0;
    }
    return tally;
}

SimulationTally StochasticEstimator::tally(const RateEstimate& rates,
                                           std::optional<double> share_override) const {
    const RateEstimate r = effective_rates(rates, share_override);
    const size_t n_sims = config_.n_sims;
    const size_t chunk_size = config_.chunk_size;
    const size_t n_chunks = (n_sims + chunk_size - 1) / chunk_size;

    ONEUP_TRACE_ALGO_START(MODULE_STOCHASTIC, n_sims, r.rate_home, r.rate_away);

    std::vector<SimulationTally> partial(n_chunks);

    ONEUP_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (size_t c = 0; c < n_chunks; ++c) {
        const size_t begin = c * chunk_size;
        const size_t count = std::min(chunk_size, n_sims - begin);
        partial[c] = simulate_chunk(r.rate_home, r.rate_away, c, count);
    }

    // Sequential reduction keeps the sum independent of scheduling
    SimulationTally total;
    for (const auto& t : partial) {
        total += t;
    }

    ONEUP_TRACE_ALGO_COMPLETE(MODULE_STOCHASTIC, total.simulations, total.home_led);
    return total;
}

LeadProbabilityResult StochasticEstimator::estimate(const RateEstimate& rates,
                                                    std::optional<double> share_override) const {
    return tally(rates, share_override).to_result();
}

LeadProbabilityResult StochasticEstimator::simulate_scalar(const RateEstimate& rates,
                                                           std::optional<double> share_override) const {
    const RateEstimate r = effective_rates(rates, share_override);
    const int cap = config_.max_goals_per_side;

    std::mt19937_64 rng(config_.seed);
    std::uniform_real_distribution<double> clock(0.0, config_.match_minutes);

    SimulationTally tally;
    tally.simulations = config_.n_sims;
    std::vector<std::pair<double, int>> events;
    events.reserve(static_cast<size_t>(2 * cap));

    for (size_t s = 0; s < config_.n_sims; ++s) {
        const int h = draw_goals(rng, r.rate_home, cap);
        const int a = draw_goals(rng, r.rate_away, cap);
        if (h == a) ++tally.level;
        if (h + a == 0) {
            ++tally.scoreless;
            continue;
        }

        events.clear();
        for (int g = 0; g < h; ++g) events.emplace_back(clock(rng), 1);
        for (int g = 0; g < a; ++g) events.emplace_back(clock(rng), -1);
        std::sort(events.begin(), events.end());

        int running = 0;
        bool home_led = false;
        bool away_led = false;
        for (const auto& [time, sign] : events) {
            running += sign;
            home_led = home_led || running > 0;
            away_led = away_led || running < 0;
        }
        tally.home_led += home_led ? 1 : 0;
        tally.away_led += away_led ? 1 : 0;
    }
    return tally.to_result();
}

}  // namespace oneup
