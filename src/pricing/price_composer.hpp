// SPDX-License-Identifier: MIT
/**
 * @file price_composer.hpp
 * @brief Probability to decimal odds conversion
 */

#pragma once

#include "oneup/support/error_types.hpp"
#include <expected>

namespace oneup {

/// Fair and margin-adjusted decimal odds of one outcome
struct PriceQuote {
    double fair_odds = 0.0;
    double margin_odds = 0.0;
};

/// fair = 1 / p, margin = fair * (1 - margin_fraction)
///
/// @param p Outcome probability, must be finite and > 0
/// @param margin_fraction Bookmaker margin in [0, 1)
/// @return PriceQuote, or PricingError (InvalidProbability / InvalidMargin)
[[nodiscard]] std::expected<PriceQuote, PricingError> compose_price(double p, double margin_fraction);

}  // namespace oneup
