// SPDX-License-Identifier: MIT
#include "oneup/model/split_estimator.hpp"
#include "oneup/market/devig.hpp"
#include "oneup/support/pricing_trace.h"
#include <algorithm>
#include <cmath>

namespace oneup {

RateEstimate proportional_split(double raw_home, double raw_away, double total) {
    const double sum = raw_home + raw_away;
    const double factor = sum > 0.0 ? total / sum : 1.0;
    const double home = raw_home * factor;
    const double away = raw_away * factor;
    return RateEstimate{
        .rate_home = home,
        .rate_away = away,
        .rate_total = home + away,
    };
}

RateEstimate split_by_share(double total, double share) noexcept {
    return RateEstimate{
        .rate_home = total * share,
        .rate_away = total * (1.0 - share),
        .rate_total = total,
    };
}

ConditionalShare conditional_share_from_odds(double home_odds, double no_goal_odds,
                                             double away_odds) {
    const ThreeWayProbabilities p = devig_three_way(home_odds, no_goal_odds, away_odds);
    return ConditionalShare{
        .p_home_first = p.first,
        .p_no_goal = p.middle,
        .p_away_first = p.last,
    };
}

double clamped_share(const ConditionalShare& cs, const SplitConfig& config) {
    const double raw = cs.share();
    const double clamped = std::clamp(raw, config.share_epsilon, 1.0 - config.share_epsilon);
    if (clamped != raw) {
        ONEUP_TRACE_DEGENERATE_CLAMP(MODULE_SPLIT_ESTIMATOR, raw, clamped);
    }
    return clamped;
}

std::optional<BttsAdjustment> adjust_for_btts(const RateEstimate& rates,
                                              double p_btts_market,
                                              const BttsAdjustmentConfig& config) {
    if (!std::isfinite(p_btts_market) || p_btts_market <= 0.0 || p_btts_market >= 1.0) {
        return std::nullopt;
    }

    const double total = rates.rate_total > 0.0 ? rates.rate_total : rates.rate_home + rates.rate_away;
    const double p_home_scores = 1.0 - std::exp(-rates.rate_home);
    const double p_away_scores = 1.0 - std::exp(-rates.rate_away);
    const double p_model = p_home_scores * p_away_scores;
    if (!(p_model > 0.01 && p_model < 0.99)) {
        return std::nullopt;
    }

    const double factor = std::clamp(std::sqrt(p_btts_market / p_model),
                                     config.min_factor, config.max_factor);
    const double cap = config.max_score_probability;
    const double home = -std::log1p(-std::min(p_home_scores * factor, cap));
    const double away = -std::log1p(-std::min(p_away_scores * factor, cap));

    const double scale = (1.0 - config.blend) + config.blend * total / (home + away);
    ONEUP_TRACE_ALGO_COMPLETE(MODULE_SPLIT_ESTIMATOR, 1, factor);
    return BttsAdjustment{
        .rates = RateEstimate{
            .rate_home = home * scale,
            .rate_away = away * scale,
            .rate_total = (home + away) * scale,
        },
        .factor = factor,
    };
}

ShareSelection select_first_scorer_share(std::span<const MarketQuote> quotes,
                                         std::string_view source,
                                         const SplitConfig& config) {
    if (quotes.empty()) {
        return ShareSelection{.share = std::nullopt, .label = "absent"};
    }

    const auto route = config.provider_routing.find(source);
    if (route == config.provider_routing.end()) {
        return ShareSelection{.share = std::nullopt, .label = "unconfigured_source"};
    }
    const std::string& provider = route->second;

    for (const auto& q : quotes) {
        const std::string_view quote_provider =
            q.provider.empty() ? source : std::string_view(q.provider);
        if (quote_provider != provider || !is_valid_three_way(q)) continue;

        std::string label = provider;
        if (provider != source) {
            label += "_for_";
            label += source;
        }
        return ShareSelection{
            .share = conditional_share_from_odds(q.odds[0], q.odds[1], q.odds[2]),
            .label = std::move(label),
        };
    }

    return ShareSelection{.share = std::nullopt, .label = "no_" + provider + "_quote"};
}

}  // namespace oneup
