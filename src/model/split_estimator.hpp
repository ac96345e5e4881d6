// SPDX-License-Identifier: MIT
/**
 * @file split_estimator.hpp
 * @brief Home/away split of the total goal rate
 *
 * The proportional split rescales the independently inferred per-side rates
 * so they add up to the inferred total. When a first-scorer market is
 * available (and enabled), its conditional share P(home first | a goal)
 * replaces the proportional split.
 *
 * First-scorer quotes are chosen by provider routing: each source identity
 * is mapped to the odds provider whose first-scorer price it shares. A source
 * absent from the routing table never borrows another provider's quote.
 *
 * An optional both-teams-score adjustment moves each side's probability of
 * scoring towards the market's both-teams-score price, converts back to
 * rates and pulls the result part of the way back to the fitted total.
 */

#pragma once

#include "oneup/market/market_quotes.hpp"
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace oneup {

/// Per-side and total rates of one match
struct RateEstimate {
    double rate_home = 0.0;
    double rate_away = 0.0;
    double rate_total = 0.0;
};

/// De-vigged first-scorer probabilities
struct ConditionalShare {
    double p_home_first = 0.0;
    double p_no_goal = 0.0;
    double p_away_first = 0.0;

    /// P(home scores first | at least one goal), 0.5 when no goal is near-certain
    [[nodiscard]] double share() const noexcept {
        const double scoring = 1.0 - p_no_goal;
        if (scoring <= 1e-9) return 0.5;
        return p_home_first / scoring;
    }
};

/// Both-teams-score rate adjustment
struct BttsAdjustmentConfig {
    bool enabled = false;

    /// Bounds of the per-side factor sqrt(p_market / p_model)
    double min_factor = 0.87;
    double max_factor = 1.15;

    /// Cap of an adjusted P(side scores)
    double max_score_probability = 0.99;

    /// Fraction of the way the adjusted rates are rescaled back to the fitted total
    double blend = 0.5;
};

/// Rates after a both-teams-score adjustment
struct BttsAdjustment {
    RateEstimate rates;
    double factor = 1.0;  ///< Applied per-side scoring-probability factor
};

/// Split configuration
struct SplitConfig {
    /// Replace the proportional split with the first-scorer share when available
    bool first_scorer_override = true;

    /// Source identity -> provider whose first-scorer quote it uses
    std::map<std::string, std::string, std::less<>> provider_routing = {
        {"pawa", "sporty"},
        {"sporty", "sporty"},
        {"bet9ja", "bet9ja"},
    };

    /// Conditional shares are clamped to [share_epsilon, 1 - share_epsilon]
    double share_epsilon = 1e-6;

    BttsAdjustmentConfig btts_adjustment{};
};

/// First-scorer share selected for a request
struct ShareSelection {
    std::optional<ConditionalShare> share;
    std::string label;  ///< e.g. "sporty", "sporty_for_pawa", "no_sporty_quote"
};

/// Rescale raw per-side rates so they sum to `total`
///
/// A non-positive raw sum leaves the rates unscaled.
[[nodiscard]] RateEstimate proportional_split(double raw_home, double raw_away, double total);

/// Split `total` as (total * share, total * (1 - share))
[[nodiscard]] RateEstimate split_by_share(double total, double share) noexcept;

/// De-vig a (home first, no goal, away first) quote
[[nodiscard]] ConditionalShare conditional_share_from_odds(double home_odds, double no_goal_odds,
                                                           double away_odds);

/// Clamped conditional share of `cs`
[[nodiscard]] double clamped_share(const ConditionalShare& cs, const SplitConfig& config);

/// Adjust per-side rates towards a de-vigged both-teams-score probability
///
/// Each side's P(scores) = 1 - exp(-rate) is multiplied by
/// sqrt(p_market / p_model), bounded to [min_factor, max_factor] and capped
/// at max_score_probability, then inverted back to a rate. The adjusted
/// rates are scaled by (1 - blend) + blend * total / (home + away).
///
/// @return Adjusted rates, or nullopt when p_btts_market is not a valid
///         probability or the model probability is outside (0.01, 0.99)
[[nodiscard]] std::optional<BttsAdjustment> adjust_for_btts(const RateEstimate& rates,
                                                            double p_btts_market,
                                                            const BttsAdjustmentConfig& config);

/// Pick the first-scorer quote a source is allowed to use
///
/// Quotes with an empty provider are attributed to `source`. The label
/// records the outcome: "<provider>" when the source uses its own quote,
/// "<provider>_for_<source>" when it uses a shared provider's quote,
/// "no_<provider>_quote" when the routed provider has no valid quote,
/// "unconfigured_source" for sources without a route, and "absent" when
/// the request carries no first-scorer market.
[[nodiscard]] ShareSelection select_first_scorer_share(std::span<const MarketQuote> quotes,
                                         std::string_view source,
                                         const SplitConfig& config);

}  // namespace oneup
