// SPDX-License-Identifier: MIT
/**
 * @file exact_barrier_dp.hpp
 * @brief Deterministic lead probabilities by absorbing-barrier recursion
 *
 * Conditional on n goals, each goal is independently a home goal with
 * probability p, so the score difference is a simple random walk of n steps.
 * P(ever +1) is computed by pushing probability mass forward over the
 * unabsorbed differences [-n, 0] and absorbing whatever steps onto +1.
 * The match-level probability mixes these over n ~ Poisson(total).
 *
 * Properties:
 * - hit_probability(n, p, +1) == hit_probability(n, 1 - p, -1)
 * - non-decreasing in p for barrier +1
 * - hit_probability(0, p, b) == 0, hit_probability(1, p, +1) == p
 */

#pragma once

#include "oneup/model/lead_probability.hpp"

namespace oneup {

/// Truncation and clamping of the Poisson mixture
struct ExactBarrierConfig {
    int max_goals = 15;
    double weight_cutoff = 1e-15;  ///< Poisson weights below this are skipped
    double epsilon = 1e-9;         ///< Aggregates are clamped to [epsilon, 1 - epsilon]
};

class ExactBarrierDP {
public:
    /// @throws std::invalid_argument if max_goals < 0 or epsilon is outside [0, 0.5)
    explicit ExactBarrierDP(const ExactBarrierConfig& config = {});

    /// P(the walk of n steps ever reaches `barrier`)
    ///
    /// Steps are +1 with probability p and -1 otherwise. Negative barriers
    /// are handled by symmetry (p <-> 1 - p). A zero barrier is reached
    /// immediately.
    [[nodiscard]] static double hit_probability(int n, double p, int barrier);

    /// P(difference is 0 after n steps): C(n, n/2) p^{n/2} (1-p)^{n/2} for even n
    [[nodiscard]] static double level_probability(int n, double p) noexcept;

    /// Poisson(total)-weighted lead probabilities
    ///
    /// p is `share_override` when given, otherwise rate_home / rate_total.
    [[nodiscard]] LeadProbabilityResult estimate(const RateEstimate& rates,
                                   std::optional<double> share_override = std::nullopt) const;

    const ExactBarrierConfig& config() const noexcept { return config_; }

private:
    ExactBarrierConfig config_;
};

static_assert(LeadProbabilityEstimator<ExactBarrierDP>);

}  // namespace oneup
