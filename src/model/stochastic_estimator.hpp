// SPDX-License-Identifier: MIT
/**
 * @file stochastic_estimator.hpp
 * @brief Monte Carlo lead probabilities over simulated goal timelines
 *
 * Each simulation draws home and away goal counts from Poisson, gives every
 * goal a uniform time in [0, match_minutes], orders the goals by time and
 * walks the running score difference. A side has "led" if the difference
 * ever reaches +1 on its side. Scoreless simulations count for neither side
 * but stay in the denominator.
 *
 * Simulations run in fixed-size chunks. A chunk holds its goal counts,
 * goal times and time-sorted order in Eigen arrays; chunks run in parallel
 * under OpenMP. Every chunk owns a std::mt19937_64 seeded from
 * (seed, chunk index), so results do not depend on the thread count.
 *
 * simulate_scalar() is the one-timeline-at-a-time reference used by tests.
 */

#pragma once

#include "oneup/model/lead_probability.hpp"
#include <cstddef>
#include <cstdint>

namespace oneup {

/// Simulation budget and match model
struct StochasticConfig {
    size_t n_sims = 30000;
    double match_minutes = 95.0;
    uint64_t seed = 42;
    size_t chunk_size = 4096;
    int max_goals_per_side = 20;  ///< Larger Poisson draws are truncated
};

/// Raw counts of one simulation run
struct SimulationTally {
    size_t simulations = 0;
    size_t home_led = 0;
    size_t away_led = 0;
    size_t level = 0;      ///< Equal final counts, scoreless included
    size_t scoreless = 0;

    SimulationTally& operator+=(const SimulationTally& other) {
        simulations += other.simulations;
        home_led += other.home_led;
        away_led += other.away_led;
        level += other.level;
        scoreless += other.scoreless;
        return *this;
    }

    [[nodiscard]] LeadProbabilityResult to_result() const;
};

class StochasticEstimator {
public:
    /// @throws std::invalid_argument for zero simulations, zero chunk size,
    ///         a goal cap below one or a non-positive match length
    explicit StochasticEstimator(const StochasticConfig& config = {});

    /// Batched, chunk-parallel estimate
    [[nodiscard]] LeadProbabilityResult estimate(const RateEstimate& rates,
                                   std::optional<double> share_override = std::nullopt) const;

    /// Batched estimate returning the raw counts
    [[nodiscard]] SimulationTally tally(const RateEstimate& rates,
                          std::optional<double> share_override = std::nullopt) const;

    /// Sequential reference implementation (single generator seeded with `seed`)
    [[nodiscard]] LeadProbabilityResult simulate_scalar(const RateEstimate& rates,
                                          std::optional<double> share_override = std::nullopt) const;

    const StochasticConfig& config() const noexcept { return config_; }

private:
    SimulationTally simulate_chunk(double rate_home, double rate_away,
                                   size_t chunk_index, size_t count) const;

    StochasticConfig config_;
};

static_assert(LeadProbabilityEstimator<StochasticEstimator>);

}  // namespace oneup
