// SPDX-License-Identifier: MIT
#include "oneup/market/devig.hpp"

namespace oneup {

double devig_two_way(double odds_yes, double odds_no) noexcept {
    const double q_yes = 1.0 / odds_yes;
    const double q_no = 1.0 / odds_no;
    return q_yes / (q_yes + q_no);
}

ThreeWayProbabilities devig_three_way(double o1, double o2, double o3) noexcept {
    const double q1 = 1.0 / o1;
    const double q2 = 1.0 / o2;
    const double q3 = 1.0 / o3;
    const double total = q1 + q2 + q3;
    return ThreeWayProbabilities{
        .first = q1 / total,
        .middle = q2 / total,
        .last = q3 / total,
    };
}

double overround(double o1, double o2) noexcept {
    return 1.0 / o1 + 1.0 / o2 - 1.0;
}

double overround(double o1, double o2, double o3) noexcept {
    return 1.0 / o1 + 1.0 / o2 + 1.0 / o3 - 1.0;
}

}  // namespace oneup
