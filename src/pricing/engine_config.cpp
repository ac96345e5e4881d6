// SPDX-License-Identifier: MIT
#include "oneup/pricing/engine_config.hpp"
#include "oneup/support/pricing_trace.h"
#include <cmath>
#include <limits>

namespace oneup {

namespace {

std::unexpected<ValidationError> fail(ValidationErrorCode code, double value, size_t index = 0) {
    ONEUP_TRACE_VALIDATION_ERROR(MODULE_PRICING_ENGINE, static_cast<int>(code), value, index);
    return std::unexpected(ValidationError(code, value, index));
}

bool valid_interval(double lower, double upper) {
    return std::isfinite(lower) && std::isfinite(upper) && lower > 0.0 && lower < upper;
}

bool valid_epsilon(double epsilon) {
    return std::isfinite(epsilon) && epsilon > 0.0 && epsilon < 0.5;
}

}  // anonymous namespace

std::expected<void, ValidationError> validate_engine_config(const EngineConfig& config) {
    // Rate inference
    const auto& ri = config.rate_inference;
    if (!valid_interval(ri.inversion.lower, ri.inversion.upper)) {
        return fail(ValidationErrorCode::InvalidBounds, ri.inversion.lower);
    }
    if (!valid_interval(ri.fit_lower, ri.fit_upper)) {
        return fail(ValidationErrorCode::InvalidBounds, ri.fit_lower);
    }
    if (ri.fit_grid_points < 400) {
        return fail(ValidationErrorCode::InvalidGridSize, static_cast<double>(ri.fit_grid_points));
    }
    if (!std::isfinite(ri.fallback_rate) || ri.fallback_rate <= 0.0) {
        return fail(ValidationErrorCode::InvalidRate, ri.fallback_rate);
    }
    if (!valid_interval(ri.btts_lower, ri.btts_upper)) {
        return fail(ValidationErrorCode::InvalidBounds, ri.btts_lower);
    }
    if (ri.btts_grid_points < 2) {
        return fail(ValidationErrorCode::InvalidGridSize, static_cast<double>(ri.btts_grid_points));
    }

    // Minimizer
    if (config.minimizer_config.max_evaluations == 0 ||
        !(config.minimizer_config.x_tolerance > 0.0)) {
        return fail(ValidationErrorCode::InvalidBounds, config.minimizer_config.x_tolerance);
    }
    if (config.minimizer_config.grid_points < 2) {
        return fail(ValidationErrorCode::InvalidGridSize,
                    static_cast<double>(config.minimizer_config.grid_points));
    }

    // Split
    if (!valid_epsilon(config.split.share_epsilon)) {
        return fail(ValidationErrorCode::InvalidProbability, config.split.share_epsilon);
    }
    size_t route_index = 0;
    for (const auto& [source, provider] : config.split.provider_routing) {
        if (source.empty() || provider.empty()) {
            return fail(ValidationErrorCode::UnknownProvider, 0.0, route_index);
        }
        ++route_index;
    }
    const auto& btts = config.split.btts_adjustment;
    if (!(std::isfinite(btts.min_factor) && std::isfinite(btts.max_factor) &&
          btts.min_factor > 0.0 && btts.min_factor <= 1.0 && btts.max_factor >= 1.0)) {
        return fail(ValidationErrorCode::InvalidBounds, btts.min_factor);
    }
    if (!(btts.max_score_probability > 0.0 && btts.max_score_probability < 1.0)) {
        return fail(ValidationErrorCode::InvalidProbability, btts.max_score_probability);
    }
    if (!(btts.blend >= 0.0 && btts.blend <= 1.0)) {
        return fail(ValidationErrorCode::InvalidBounds, btts.blend);
    }

    // Supremacy
    const auto& sup = config.supremacy;
    if (!std::isfinite(sup.max_supremacy) || sup.max_supremacy <= 0.0) {
        return fail(ValidationErrorCode::InvalidBounds, sup.max_supremacy);
    }
    if (!std::isfinite(sup.min_rate) || sup.min_rate <= 0.0) {
        return fail(ValidationErrorCode::InvalidRate, sup.min_rate);
    }
    if (sup.max_goals < 1) {
        return fail(ValidationErrorCode::InvalidGoalBound, static_cast<double>(sup.max_goals));
    }
    if (sup.fallback_grid_points < 200) {
        return fail(ValidationErrorCode::InvalidGridSize, static_cast<double>(sup.fallback_grid_points));
    }

    // Lead strategies
    const auto& mc = config.stochastic;
    if (mc.n_sims == 0) {
        return fail(ValidationErrorCode::InvalidSimulationCount, 0.0);
    }
    if (mc.chunk_size == 0) {
        return fail(ValidationErrorCode::InvalidSimulationCount, 0.0, 1);
    }
    if (!std::isfinite(mc.match_minutes) || mc.match_minutes <= 0.0) {
        return fail(ValidationErrorCode::InvalidMatchLength, mc.match_minutes);
    }
    if (mc.max_goals_per_side < 1) {
        return fail(ValidationErrorCode::InvalidGoalBound, static_cast<double>(mc.max_goals_per_side));
    }
    if (config.exact.max_goals < 0) {
        return fail(ValidationErrorCode::InvalidGoalBound, static_cast<double>(config.exact.max_goals));
    }
    if (!(config.exact.epsilon >= 0.0 && config.exact.epsilon < 0.5)) {
        return fail(ValidationErrorCode::InvalidProbability, config.exact.epsilon);
    }

    // Calibration
    if (!valid_epsilon(config.calibration.epsilon)) {
        return fail(ValidationErrorCode::InvalidProbability, config.calibration.epsilon);
    }
    if (!std::isfinite(config.calibration.logit_intercept) ||
        !std::isfinite(config.calibration.logit_slope)) {
        return fail(ValidationErrorCode::InvalidBounds, config.calibration.logit_slope);
    }

    // Engine
    if (!std::isfinite(config.margin_fraction) ||
        config.margin_fraction < 0.0 || config.margin_fraction >= 1.0) {
        return fail(ValidationErrorCode::InvalidMargin, config.margin_fraction);
    }
    if (!valid_epsilon(config.probability_epsilon)) {
        return fail(ValidationErrorCode::InvalidProbability, config.probability_epsilon);
    }
    if (config.max_workers > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return fail(ValidationErrorCode::InvalidWorkerCount, static_cast<double>(config.max_workers));
    }

    return {};
}

}  // namespace oneup
