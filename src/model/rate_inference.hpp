// SPDX-License-Identifier: MIT
/**
 * @file rate_inference.hpp
 * @brief Goal-rate inference from over/under goal lines
 *
 * A rate r is chosen so that the Poisson(r) tail beyond each quoted line
 * matches the de-vigged "over" probability:
 * - one valid line: monotone inversion by bracket expansion + bisection
 * - several lines: least squares over r in [fit_lower, fit_upper] with the
 *   configured scalar minimizer (grid search if it does not converge)
 *
 * Invalid lines are dropped individually. With no valid line the fixed
 * fallback rate is returned, so the result is always strictly positive.
 */

#pragma once

#include "oneup/market/market_quotes.hpp"
#include "oneup/math/root_finding.hpp"
#include "oneup/math/scalar_minimizer.hpp"
#include <cstddef>
#include <span>

namespace oneup {

/// Configuration for rate inference
struct RateInferenceConfig {
    /// Bracket and budget for single-line inversion
    RootFindingConfig inversion{};

    /// Least-squares search interval for multi-line fits
    double fit_lower = 0.01;
    double fit_upper = 8.0;

    /// Grid resolution used when the minimizer does not converge
    size_t fit_grid_points = 400;

    /// Rate returned when no usable line exists
    double fallback_rate = 1.8;

    /// BTTS cross-check grid
    double btts_lower = 0.5;
    double btts_upper = 5.5;
    size_t btts_grid_points = 100;
};

/// Rate inferred for one market family
struct RateFit {
    double rate = 0.0;
    size_t lines_used = 0;
    bool used_fallback_rate = false;   ///< No valid line, fixed rate returned
    bool used_grid_fallback = false;   ///< Minimizer failed, grid search used
};

/// Invert a single (line, over, under) quote
///
/// De-vigs the pair and bisects for the rate whose tail beyond `line`
/// equals the fair "over" probability.
///
/// @return Inferred rate (midpoint of the final bisection bracket)
[[nodiscard]] double infer_rate_single_line(double line, double over_odds, double under_odds,
                              const RateInferenceConfig& config = {});

/// Fit a rate to every valid over/under quote
///
/// Uses the single-line inversion when exactly one quote is valid.
[[nodiscard]] RateFit fit_rate(std::span<const MarketQuote> quotes,
                 const AnyScalarMinimizer& minimizer,
                 const RateInferenceConfig& config = {});

/// Total rate whose split by `home_share` reproduces a BTTS probability
///
/// Grid search over [btts_lower, btts_upper] of
/// |1 - e^{-r s} - e^{-r (1 - s)} + e^{-r} - p_btts|.
[[nodiscard]] double infer_total_rate_from_btts(double p_btts, double home_share,
                                  const RateInferenceConfig& config = {});

}  // namespace oneup
