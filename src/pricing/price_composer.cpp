// SPDX-License-Identifier: MIT
#include "oneup/pricing/price_composer.hpp"
#include "oneup/support/pricing_trace.h"
#include <cmath>

namespace oneup {

std::expected<PriceQuote, PricingError> compose_price(double p, double margin_fraction) {
    if (!std::isfinite(p) || p <= 0.0) {
        ONEUP_TRACE_VALIDATION_ERROR(MODULE_PRICE_COMPOSER,
            static_cast<int>(PricingErrorCode::InvalidProbability), p, 0.0);
        return std::unexpected(PricingError{
            .code = PricingErrorCode::InvalidProbability,
            .value = p,
        });
    }
    if (!std::isfinite(margin_fraction) || margin_fraction < 0.0 || margin_fraction >= 1.0) {
        ONEUP_TRACE_VALIDATION_ERROR(MODULE_PRICE_COMPOSER,
            static_cast<int>(PricingErrorCode::InvalidMargin), margin_fraction, 1.0);
        return std::unexpected(PricingError{
            .code = PricingErrorCode::InvalidMargin,
            .value = margin_fraction,
        });
    }

    const double fair = 1.0 / p;
    return PriceQuote{
        .fair_odds = fair,
        .margin_odds = fair * (1.0 - margin_fraction),
    };
}

}  // namespace oneup
