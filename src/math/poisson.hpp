// SPDX-License-Identifier: MIT
/**
 * @file poisson.hpp
 * @brief Poisson distribution primitives for goal-count models
 */

#pragma once

#include <cstddef>

namespace oneup {

/// P(N = k) for N ~ Poisson(rate); 0 for negative k
[[nodiscard]] double poisson_pmf(int k, double rate) noexcept;

/// P(N <= k); 0 for negative k
[[nodiscard]] double poisson_cdf(int k, double rate) noexcept;

/// P(N >= threshold); 1 for threshold <= 0
[[nodiscard]] double poisson_tail(int threshold, double rate) noexcept;

/// Goals needed to win "over" a line: floor(round_to_half(line)) + 1
///
/// Quarter lines (2.25, 2.75) are rounded to the nearest half first.
[[nodiscard]] int over_threshold(double line) noexcept;

/// P(N > line) under Poisson(rate), using over_threshold()
[[nodiscard]] double effective_over_probability(double rate, double line) noexcept;

/// Win/draw/loss probabilities of two independent Poisson scores
struct MatchOutcome {
    double home_win;
    double draw;
    double away_win;
};

/// Bivariate independent Poisson outcome summed over 0..max_goals per side
///
/// The truncated mass is renormalized so the three outcomes sum to one.
[[nodiscard]] MatchOutcome poisson_match_outcome(double rate_home, double rate_away, int max_goals = 10);

/// P(both sides score at least once) under independent Poisson scores
[[nodiscard]] double both_teams_score_probability(double rate_home, double rate_away) noexcept;

}  // namespace oneup
