// SPDX-License-Identifier: MIT
/**
 * @file devig.hpp
 * @brief Margin removal for two- and three-way markets
 */

#pragma once

namespace oneup {

/// De-vigged probabilities of a three-way market
struct ThreeWayProbabilities {
    double first;
    double middle;
    double last;
};

/// Fair probability of the first outcome of a two-way market
///
/// p = (1/a) / (1/a + 1/b). devig_two_way(a, b) + devig_two_way(b, a) == 1.
[[nodiscard]] double devig_two_way(double odds_yes, double odds_no) noexcept;

/// Fair probabilities of a three-way market, normalized to sum to 1
[[nodiscard]] ThreeWayProbabilities devig_three_way(double o1, double o2, double o3) noexcept;

/// Bookmaker overround: sum of implied probabilities minus one
[[nodiscard]] double overround(double o1, double o2) noexcept;
[[nodiscard]] double overround(double o1, double o2, double o3) noexcept;

}  // namespace oneup
