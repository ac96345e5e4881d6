// SPDX-License-Identifier: MIT
#include "oneup/model/exact_barrier_dp.hpp"
#include "oneup/math/poisson.hpp"
#include "oneup/support/pricing_trace.h"
#include <cmath>
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace oneup {

ExactBarrierDP::ExactBarrierDP(const ExactBarrierConfig& config)
    : config_(config)
{
    if (config_.max_goals < 0) {
        throw std::invalid_argument("ExactBarrierDP: max_goals must be non-negative");
    }
    if (!(config_.epsilon >= 0.0 && config_.epsilon < 0.5)) {
        throw std::invalid_argument("ExactBarrierDP: epsilon must be in [0, 0.5)");
    }
}

double ExactBarrierDP::hit_probability(int n, double p, int barrier) {
    if (barrier == 0) return 1.0;
    if (barrier < 0) return hit_probability(n, 1.0 - p, -barrier);
    if (n < barrier) return 0.0;

    const double q = 1.0 - p;

    // mass[d + n] for unabsorbed differences d in [-n, barrier - 1]
    const size_t width = static_cast<size_t>(n + barrier);
    const size_t origin = static_cast<size_t>(n);
    std::vector<double> mass(width, 0.0);
    std::vector<double> next(width, 0.0);
    mass[origin] = 1.0;

    double absorbed = 0.0;
    for (int step = 0; step < n; ++step) {
        std::fill(next.begin(), next.end(), 0.0);
        for (size_t i = 0; i < width; ++i) {
            const double m = mass[i];
            if (m == 0.0) continue;
            if (i + 1 == width) {
                absorbed += p * m;
            } else {
                next[i + 1] += p * m;
            }
            // Down-moves never leave the range within n steps
            if (i > 0) {
                next[i - 1] += q * m;
            }
        }
        mass.swap(next);
    }
    return absorbed;
}

double ExactBarrierDP::level_probability(int n, double p) noexcept {
    if (n < 0 || n % 2 != 0) return 0.0;
    const int k = n / 2;
    if (k == 0) return 1.0;
    const double log_comb = std::lgamma(n + 1.0) - 2.0 * std::lgamma(k + 1.0);
    return std::exp(log_comb) * std::pow(p, k) * std::pow(1.0 - p, k);
}

LeadProbabilityResult ExactBarrierDP::estimate(const RateEstimate& rates,
                                               std::optional<double> share_override) const {
    const RateEstimate r = effective_rates(rates, share_override);
    const double total = r.rate_total;
    const double p = share_override.has_value() ? *share_override
                   : (total > 0.0 ? r.rate_home / total : 0.5);

    ONEUP_TRACE_ALGO_START(MODULE_EXACT_BARRIER, config_.max_goals, total, p);

    LeadProbabilityResult result;
    size_t terms = 0;
    for (int n = 0; n <= config_.max_goals; ++n) {
        const double weight = poisson_pmf(n, total);
        if (weight < config_.weight_cutoff) continue;
        result.p_home_lead += weight * hit_probability(n, p, +1);
        result.p_away_lead += weight * hit_probability(n, p, -1);
        result.p_level_full_time += weight * level_probability(n, p);
        ++terms;
    }

    const double raw_home = result.p_home_lead;
    if (clamp_lead_probabilities(result, config_.epsilon)) {
        ONEUP_TRACE_DEGENERATE_CLAMP(MODULE_EXACT_BARRIER, raw_home, result.p_home_lead);
    }

    ONEUP_TRACE_ALGO_COMPLETE(MODULE_EXACT_BARRIER, terms, result.p_home_lead);
    return result;
}

}  // namespace oneup
