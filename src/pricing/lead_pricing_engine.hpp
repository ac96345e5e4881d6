// SPDX-License-Identifier: MIT
/**
 * @file lead_pricing_engine.hpp
 * @brief End-to-end lead-by-one pricing of one (event, snapshot, source)
 *
 * Pipeline:
 *   1. reject the request if a mandatory market family has no valid quote
 *   2. fit total, home and away goal rates from their over/under lines
 *   3. rescale the per-side rates to the total (proportional split)
 *   4. replace the split with the first-scorer share when routing allows,
 *      otherwise fit the supremacy to the de-vigged match result; the
 *      proportional split is kept only when that fit has no usable bounds
 *   5. optionally adjust the rates towards the both-teams-score price
 *   6. estimate raw lead probabilities with the configured strategy
 *   7. recalibrate with the configured calibrator version
 *   8. convert both probabilities to fair and margin odds
 *
 * The engine is immutable after creation and safe to share across threads.
 */

#pragma once

#include "oneup/market/devig.hpp"
#include "oneup/market/market_quotes.hpp"
#include "oneup/model/lead_estimator_factory.hpp"
#include "oneup/pricing/engine_config.hpp"
#include "oneup/pricing/price_composer.hpp"
#include "oneup/support/error_types.hpp"
#include <compare>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace oneup {

/// One pricing call
struct PricingRequest {
    std::string event_id;
    std::string snapshot_id;
    std::string source;  ///< Source identity, drives first-scorer routing
    MarketBook markets;
};

/// Key under which a record is stored downstream
struct PriceRecordKey {
    std::string event_id;
    std::string snapshot_id;
    std::string engine_version;
    std::string source;

    auto operator<=>(const PriceRecordKey&) const = default;
};

/// Both-teams-score cross-check
struct BttsCheck {
    double p_market = 0.0;       ///< De-vigged market probability
    double p_model = 0.0;        ///< Model probability at the final rates
    double implied_total = 0.0;  ///< Total rate reproducing p_market at the final share
    bool rates_adjusted = false;  ///< The final rates include the both-teams-score adjustment
    double adjustment_factor = 1.0;
};

/// Everything needed to audit a record without recomputation
struct PricingDiagnostics {
    LeadProbabilityResult raw;            ///< Before calibration
    RateEstimate proportional_rates;      ///< Per-side fits rescaled to the total
    double conditional_share = 0.5;       ///< Home share of the final rates
    std::string share_source;             ///< First-scorer routing label
    bool share_override_applied = false;
    double supremacy = 0.0;
    bool optimizer_fallback = false;      ///< Some minimization fell back to grid search
    ThreeWayProbabilities match_result{};
    double match_result_overround = 0.0;
    size_t lines_total = 0;
    size_t lines_home = 0;
    size_t lines_away = 0;
    std::string calibrator_version;
    std::string lead_strategy;
    std::optional<BttsCheck> btts;
    std::vector<std::string> degeneracies;
};

/// Priced lead-by-one market
struct PriceRecord {
    PriceRecordKey key;
    double rate_home = 0.0;
    double rate_away = 0.0;
    double rate_total = 0.0;
    double p_home_lead = 0.0;
    double p_away_lead = 0.0;
    double p_level_full_time = 0.0;
    PriceQuote home;
    PriceQuote away;
    PricingDiagnostics diagnostics;
};

class LeadPricingEngine {
public:
    /// Validate `config` and build the configured strategies
    [[nodiscard]] static std::expected<LeadPricingEngine, ValidationError> create(EngineConfig config);

    /// Price one request
    ///
    /// @return PriceRecord, or PricingError{InsufficientData, family} when a
    ///         mandatory market family is missing or has no valid quote
    [[nodiscard]] std::expected<PriceRecord, PricingError> price(const PricingRequest& request) const;

    const EngineConfig& config() const noexcept { return config_; }

private:
    LeadPricingEngine(EngineConfig config,
                      AnyScalarMinimizer minimizer,
                      AnyLeadEstimator estimator,
                      AnyProbabilityCalibrator calibrator);

    EngineConfig config_;
    AnyScalarMinimizer minimizer_;
    AnyLeadEstimator estimator_;
    AnyProbabilityCalibrator calibrator_;
};

}  // namespace oneup
