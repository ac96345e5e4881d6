// SPDX-License-Identifier: MIT
#include "oneup/model/rate_inference.hpp"
#include "oneup/market/devig.hpp"
#include "oneup/math/poisson.hpp"
#include "oneup/support/error_types.hpp"
#include "oneup/support/pricing_trace.h"
#include <cmath>
#include <optional>
#include <vector>

namespace oneup {

namespace {

struct LineTarget {
    double line;
    double p_over;
};

std::vector<LineTarget> collect_targets(std::span<const MarketQuote> quotes) {
    std::vector<LineTarget> targets;
    targets.reserve(quotes.size());
    for (const auto& q : quotes) {
        if (!is_valid_over_under(q)) {
            ONEUP_TRACE_VALIDATION_ERROR(MODULE_RATE_INFERENCE,
                static_cast<int>(ValidationErrorCode::InvalidLine),
                q.line.value_or(-1.0), q.odds.empty() ? 0.0 : q.odds.front());
            continue;
        }
        targets.push_back(LineTarget{
            .line = *q.line,
            .p_over = devig_two_way(q.odds[0], q.odds[1]),
        });
    }
    return targets;
}

/// Bisect for the rate whose tail beyond `line` equals `p_over`; nullopt if unusable
std::optional<double> invert_line(double line, double p_over, const RateInferenceConfig& config) {
    auto tail = [line](double rate) { return effective_over_probability(rate, line); };
    const RootFindingResult result = bisect_increasing(tail, p_over, config.inversion);
    if (!result.root.has_value() || !(*result.root > 0.0)) {
        return std::nullopt;
    }
    return result.root;
}

}  // anonymous namespace

double infer_rate_single_line(double line, double over_odds, double under_odds,
                              const RateInferenceConfig& config) {
    const auto rate = invert_line(line, devig_two_way(over_odds, under_odds), config);
    return rate.value_or(config.fallback_rate);
}

RateFit fit_rate(std::span<const MarketQuote> quotes,
                 const AnyScalarMinimizer& minimizer,
                 const RateInferenceConfig& config) {
    const std::vector<LineTarget> targets = collect_targets(quotes);

    ONEUP_TRACE_ALGO_START(MODULE_RATE_INFERENCE, targets.size(), config.fit_lower, config.fit_upper);

    if (targets.empty()) {
        return RateFit{
            .rate = config.fallback_rate,
            .lines_used = 0,
            .used_fallback_rate = true,
        };
    }

    if (targets.size() == 1) {
        const auto rate = invert_line(targets.front().line, targets.front().p_over, config);
        ONEUP_TRACE_ALGO_COMPLETE(MODULE_RATE_INFERENCE, config.inversion.max_iter,
                                  rate.value_or(config.fallback_rate));
        return RateFit{
            .rate = rate.value_or(config.fallback_rate),
            .lines_used = 1,
            .used_fallback_rate = !rate.has_value(),
        };
    }

    auto loss = [&targets](double rate) {
        double sum = 0.0;
        for (const auto& t : targets) {
            const double diff = effective_over_probability(rate, t.line) - t.p_over;
            sum += diff * diff;
        }
        return sum;
    };

    const MinimizationResult best = minimize_with_fallback(
        minimizer, loss, config.fit_lower, config.fit_upper,
        config.fit_grid_points, MODULE_RATE_INFERENCE);

    const bool usable = best.converged && std::isfinite(best.x) && best.x > 0.0;
    const double rate = usable ? best.x : config.fallback_rate;
    ONEUP_TRACE_ALGO_COMPLETE(MODULE_RATE_INFERENCE, best.evaluations, rate);

    return RateFit{
        .rate = rate,
        .lines_used = targets.size(),
        .used_fallback_rate = !usable,
        .used_grid_fallback = best.used_fallback,
    };
}

double infer_total_rate_from_btts(double p_btts, double home_share,
                                  const RateInferenceConfig& config) {
    auto mismatch = [p_btts, home_share](double total) {
        const double model = both_teams_score_probability(total * home_share,
                                                          total * (1.0 - home_share));
        return std::abs(model - p_btts);
    };
    const MinimizationResult best = GridSearchMinimizer(config.btts_grid_points)
        .minimize(mismatch, config.btts_lower, config.btts_upper);
    return best.x;
}

}  // namespace oneup
