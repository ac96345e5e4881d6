// SPDX-License-Identifier: MIT
/**
 * @file supremacy_calibrator.hpp
 * @brief Fit the home/away split to the market's match-result prices
 *
 * With the total rate fixed, a supremacy s gives
 *   rate_home = (total + s) / 2,  rate_away = (total - s) / 2.
 * The loss is the squared distance between the independent-Poisson
 * win/draw/loss distribution (goals 0..max_goals per side, renormalized)
 * and the de-vigged match-result probabilities. s is searched in
 * [-max_supremacy, max_supremacy], narrowed so both rates stay >= min_rate.
 */

#pragma once

#include "oneup/market/devig.hpp"
#include "oneup/math/scalar_minimizer.hpp"
#include "oneup/model/split_estimator.hpp"
#include <cstddef>

namespace oneup {

/// Supremacy search configuration
struct SupremacyConfig {
    double max_supremacy = 2.0;
    /// Smallest per-side rate of the search; the engine also floors its final rates here
    double min_rate = 0.01;
    int max_goals = 10;                 ///< Per-side goal grid of the outcome model
    size_t fallback_grid_points = 201;  ///< Grid used when the minimizer fails
};

/// Calibrated split
struct SupremacyFit {
    double supremacy = 0.0;
    RateEstimate rates;
    double loss = 0.0;
    bool used_grid_fallback = false;
    bool degenerate_bounds = false;  ///< Total too small to move the split
};

/// Squared win/draw/loss distance at supremacy `s`
[[nodiscard]] double supremacy_loss(double total, double s, const ThreeWayProbabilities& market,
                      int max_goals = 10);

/// Minimize supremacy_loss over the admissible interval
[[nodiscard]] SupremacyFit calibrate_supremacy(double total, const ThreeWayProbabilities& market,
                                 const AnyScalarMinimizer& minimizer,
                                 const SupremacyConfig& config = {});

}  // namespace oneup
