// SPDX-License-Identifier: MIT
/**
 * @file lead_probability.hpp
 * @brief Common contract of the lead-probability strategies
 *
 * A lead-probability estimator turns final rates (and an optional
 * first-scorer share) into the probability that each side is ever strictly
 * ahead. The two outcomes overlap: a match can see both sides lead, so the
 * probabilities need not sum to one.
 *
 * Strategies:
 * - StochasticEstimator: batched Monte Carlo over goal timelines
 * - ExactBarrierDP: Poisson-weighted absorbing-barrier recursion
 */

#pragma once

#include "oneup/model/split_estimator.hpp"
#include <algorithm>
#include <concepts>
#include <optional>

namespace oneup {

/// Lead probabilities of one match
struct LeadProbabilityResult {
    double p_home_lead = 0.0;
    double p_away_lead = 0.0;
    double p_level_full_time = 0.0;
};

/// Strategy selector used by EngineConfig
enum class LeadStrategy {
    Stochastic,
    ExactBarrier
};

inline const char* to_string(LeadStrategy strategy) {
    switch (strategy) {
        case LeadStrategy::Stochastic:   return "stochastic";
        case LeadStrategy::ExactBarrier: return "exact_barrier_dp";
    }
    return "unknown";
}

/// Concept for lead-probability strategies
template <typename E>
concept LeadProbabilityEstimator = requires(const E& e, const RateEstimate& rates,
                                            std::optional<double> share) {
    { e.estimate(rates, share) } -> std::same_as<LeadProbabilityResult>;
};

/// Rates the strategies work with: re-split by `share_override` when given
[[nodiscard]] inline RateEstimate effective_rates(const RateEstimate& rates, std::optional<double> share_override) {
    const double total = rates.rate_total > 0.0 ? rates.rate_total : rates.rate_home + rates.rate_away;
    if (share_override.has_value()) {
        return split_by_share(total, *share_override);
    }
    return RateEstimate{.rate_home = rates.rate_home, .rate_away = rates.rate_away, .rate_total = total};
}

/// Clamp every probability into [epsilon, 1 - epsilon]
///
/// @return true if any value moved
inline bool clamp_lead_probabilities(LeadProbabilityResult& r, double epsilon) {
    const LeadProbabilityResult before = r;
    r.p_home_lead = std::clamp(r.p_home_lead, epsilon, 1.0 - epsilon);
    r.p_away_lead = std::clamp(r.p_away_lead, epsilon, 1.0 - epsilon);
    r.p_level_full_time = std::clamp(r.p_level_full_time, epsilon, 1.0 - epsilon);
    return r.p_home_lead != before.p_home_lead ||
           r.p_away_lead != before.p_away_lead ||
           r.p_level_full_time != before.p_level_full_time;
}

}  // namespace oneup
