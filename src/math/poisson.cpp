// SPDX-License-Identifier: MIT
#include "oneup/math/poisson.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace oneup {

double poisson_pmf(int k, double rate) noexcept {
    if (k < 0) return 0.0;
    if (rate <= 0.0) return k == 0 ? 1.0 : 0.0;
    // log-space avoids overflow of rate^k and k! for large k
    return std::exp(k * std::log(rate) - rate - std::lgamma(static_cast<double>(k) + 1.0));
}

double poisson_cdf(int k, double rate) noexcept {
    if (k < 0) return 0.0;
    double term = std::exp(-rate);
    double sum = term;
    for (int i = 1; i <= k; ++i) {
        term *= rate / i;
        sum += term;
    }
    return std::min(sum, 1.0);
}

double poisson_tail(int threshold, double rate) noexcept {
    if (threshold <= 0) return 1.0;
    return 1.0 - poisson_cdf(threshold - 1, rate);
}

int over_threshold(double line) noexcept {
    const double adjusted = std::round(line * 2.0) / 2.0;
    return static_cast<int>(std::floor(adjusted)) + 1;
}

double effective_over_probability(double rate, double line) noexcept {
    return poisson_tail(over_threshold(line), rate);
}

MatchOutcome poisson_match_outcome(double rate_home, double rate_away, int max_goals) {
    std::vector<double> home(static_cast<size_t>(max_goals) + 1);
    std::vector<double> away(static_cast<size_t>(max_goals) + 1);
    for (int g = 0; g <= max_goals; ++g) {
        home[static_cast<size_t>(g)] = poisson_pmf(g, rate_home);
        away[static_cast<size_t>(g)] = poisson_pmf(g, rate_away);
    }

    double home_win = 0.0;
    double draw = 0.0;
    double away_win = 0.0;
    for (int h = 0; h <= max_goals; ++h) {
        for (int a = 0; a <= max_goals; ++a) {
            const double p = home[static_cast<size_t>(h)] * away[static_cast<size_t>(a)];
            if (h > a) {
                home_win += p;
            } else if (h == a) {
                draw += p;
            } else {
                away_win += p;
            }
        }
    }

    const double total = home_win + draw + away_win;
    if (total <= 0.0) {
        return MatchOutcome{.home_win = 1.0 / 3.0, .draw = 1.0 / 3.0, .away_win = 1.0 / 3.0};
    }
    return MatchOutcome{
        .home_win = home_win / total,
        .draw = draw / total,
        .away_win = away_win / total,
    };
}

double both_teams_score_probability(double rate_home, double rate_away) noexcept {
    return 1.0 - std::exp(-rate_home) - std::exp(-rate_away) + std::exp(-(rate_home + rate_away));
}

}  // namespace oneup
