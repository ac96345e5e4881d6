// SPDX-License-Identifier: MIT
/**
 * @file market_quotes.hpp
 * @brief Parsed market odds consumed by the pricing engine
 *
 * Odds acquisition and market-name normalization happen upstream; these
 * types only carry the already-parsed decimal odds.
 */

#pragma once

#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace oneup {

/// One quoted market: optional line plus 2 or 3 decimal odds
///
/// Two-way over/under quotes store (over, under); three-way quotes store
/// (home, draw/no-goal, away). `provider` tags first-scorer quotes with the
/// odds provider that published them; empty means the request's own source.
struct MarketQuote {
    std::optional<double> line;
    std::vector<double> odds;
    std::string provider;
};

/// All market families for one (event, snapshot, source)
struct MarketBook {
    std::optional<MarketQuote> match_result;     ///< Mandatory, 3 odds
    std::vector<MarketQuote> total_goals;        ///< Mandatory, >= 1 line
    std::vector<MarketQuote> home_goals;         ///< Mandatory, >= 1 line
    std::vector<MarketQuote> away_goals;         ///< Mandatory, >= 1 line
    std::vector<MarketQuote> first_scorer;       ///< Optional, one per provider
    std::optional<MarketQuote> both_teams_score; ///< Optional, (yes, no)
};

/// Odds at or below this are treated as unpriced
inline constexpr double kMinValidOdds = 1.01;

/// True when every odd is finite and strictly above kMinValidOdds
inline bool odds_are_valid(const std::vector<double>& odds, size_t expected_count) {
    if (odds.size() != expected_count) return false;
    for (double o : odds) {
        if (!std::isfinite(o) || o <= kMinValidOdds) return false;
    }
    return true;
}

/// Valid two-way over/under quote with a finite line
inline bool is_valid_over_under(const MarketQuote& q) {
    return q.line.has_value() && std::isfinite(*q.line) && *q.line >= 0.0 &&
           odds_are_valid(q.odds, 2);
}

/// Valid three-way quote (match result or first scorer)
inline bool is_valid_three_way(const MarketQuote& q) {
    return odds_are_valid(q.odds, 3);
}

/// Valid two-way quote without a line (both teams to score)
inline bool is_valid_two_way(const MarketQuote& q) {
    return odds_are_valid(q.odds, 2);
}

}  // namespace oneup
