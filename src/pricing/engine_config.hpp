// SPDX-License-Identifier: MIT
/**
 * @file engine_config.hpp
 * @brief Configuration of the lead pricing engine
 *
 * One EngineConfig is built up front and passed by const reference to every
 * component; nothing in the engine reads global state.
 *
 * Example:
 * @code
 * oneup::EngineConfig config{
 *     .lead_strategy = oneup::LeadStrategy::ExactBarrier,
 *     .margin_fraction = 0.05,
 * };
 * if (auto ok = oneup::validate_engine_config(config); !ok) { ... }
 * @endcode
 */

#pragma once

#include "oneup/math/scalar_minimizer.hpp"
#include "oneup/model/empirical_calibrator.hpp"
#include "oneup/model/exact_barrier_dp.hpp"
#include "oneup/model/lead_probability.hpp"
#include "oneup/model/rate_inference.hpp"
#include "oneup/model/split_estimator.hpp"
#include "oneup/model/stochastic_estimator.hpp"
#include "oneup/model/supremacy_calibrator.hpp"
#include "oneup/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <string>

namespace oneup {

/// Engine configuration
struct EngineConfig {
    LeadStrategy lead_strategy = LeadStrategy::Stochastic;
    MinimizerKind minimizer = MinimizerKind::BrentBounded;
    MinimizerConfig minimizer_config{};

    RateInferenceConfig rate_inference{};
    SplitConfig split{};
    SupremacyConfig supremacy{};
    StochasticConfig stochastic{};
    ExactBarrierConfig exact{};
    CalibrationConfig calibration{};

    double margin_fraction = 0.05;

    /// Probability clamp of the final lead probabilities
    double probability_epsilon = 1e-9;

    /// Worker threads of BatchPricer (0 = all available)
    size_t max_workers = 0;

    /// Stored in every PriceRecord key
    std::string engine_version = "oneup-1.0";
};

/// Validate every sub-configuration
///
/// @return void on success, or the first ValidationError found
[[nodiscard]] std::expected<void, ValidationError> validate_engine_config(const EngineConfig& config);

}  // namespace oneup
