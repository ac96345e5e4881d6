// SPDX-License-Identifier: MIT
#include "oneup/model/supremacy_calibrator.hpp"
#include "oneup/math/poisson.hpp"
#include "oneup/support/pricing_trace.h"
#include <algorithm>

namespace oneup {

double supremacy_loss(double total, double s, const ThreeWayProbabilities& market,
                      int max_goals) {
    const MatchOutcome model = poisson_match_outcome(0.5 * (total + s), 0.5 * (total - s), max_goals);
    const double dh = model.home_win - market.first;
    const double dd = model.draw - market.middle;
    const double da = model.away_win - market.last;
    return dh * dh + dd * dd + da * da;
}

SupremacyFit calibrate_supremacy(double total, const ThreeWayProbabilities& market,
                                 const AnyScalarMinimizer& minimizer,
                                 const SupremacyConfig& config) {
    const double half_width = std::min(config.max_supremacy, total - 2.0 * config.min_rate);

    ONEUP_TRACE_ALGO_START(MODULE_SUPREMACY, config.max_goals, total, half_width);

    if (!(half_width > 0.0)) {
        return SupremacyFit{
            .supremacy = 0.0,
            .rates = split_by_share(total, 0.5),
            .loss = supremacy_loss(total, 0.0, market, config.max_goals),
            .degenerate_bounds = true,
        };
    }

    auto loss = [&](double s) { return supremacy_loss(total, s, market, config.max_goals); };
    const MinimizationResult best = minimize_with_fallback(
        minimizer, loss, -half_width, half_width,
        config.fallback_grid_points, MODULE_SUPREMACY);

    const double s = std::clamp(best.x, -half_width, half_width);
    ONEUP_TRACE_ALGO_COMPLETE(MODULE_SUPREMACY, best.evaluations, s);

    return SupremacyFit{
        .supremacy = s,
        .rates = RateEstimate{
            .rate_home = 0.5 * (total + s),
            .rate_away = 0.5 * (total - s),
            .rate_total = total,
        },
        .loss = best.fx,
        .used_grid_fallback = best.used_fallback,
    };
}

}  // namespace oneup
