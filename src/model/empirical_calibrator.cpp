// SPDX-License-Identifier: MIT
#include "oneup/model/empirical_calibrator.hpp"
#include "oneup/support/pricing_trace.h"
#include <algorithm>
#include <cmath>

namespace oneup {

namespace {

/// Linear interpolation from y0 at x0 to y1 at x1
double ramp(double x, double x0, double x1, double y0, double y1) {
    return y0 + (y1 - y0) * (x - x0) / (x1 - x0);
}

double clamp_probability(double p, double epsilon) {
    const double clamped = std::clamp(p, epsilon, 1.0 - epsilon);
    if (clamped != p) {
        ONEUP_TRACE_DEGENERATE_CLAMP(MODULE_CALIBRATOR, p, clamped);
    }
    return clamped;
}

/// Scale the underdog and favourite probabilities by ratio-dependent multipliers
template <typename Underdog, typename Favourite>
LeadProbabilityResult apply_ratio_correction(const LeadProbabilityResult& raw,
                                             const RateEstimate& rates,
                                             double epsilon,
                                             Underdog&& underdog,
                                             Favourite&& favourite) {
    const RateRatio r = rate_ratio(rates.rate_home, rates.rate_away);

    double home = raw.p_home_lead;
    double away = raw.p_away_lead;
    if (r.home_is_underdog) {
        home *= underdog(r.ratio);
        away *= favourite(r.ratio);
    } else if (r.away_is_underdog) {
        home *= favourite(r.ratio);
        away *= underdog(r.ratio);
    }

    return LeadProbabilityResult{
        .p_home_lead = clamp_probability(home, epsilon),
        .p_away_lead = clamp_probability(away, epsilon),
        .p_level_full_time = raw.p_level_full_time,
    };
}

}  // anonymous namespace

RateRatio rate_ratio(double rate_home, double rate_away) {
    if (rate_home < 0.01 || rate_away < 0.01) {
        return RateRatio{};
    }
    if (rate_home < rate_away) {
        return RateRatio{.ratio = rate_away / rate_home, .home_is_underdog = true};
    }
    if (rate_away < rate_home) {
        return RateRatio{.ratio = rate_home / rate_away, .away_is_underdog = true};
    }
    return RateRatio{};
}

// ---------------------------------------------------------------------------
// RatioCorrectionV2
// ---------------------------------------------------------------------------

double RatioCorrectionV2::underdog_multiplier(double ratio) {
    if (ratio <= 1.15) return 1.0;
    if (ratio <= 1.5) return ramp(ratio, 1.15, 1.5, 1.00, 0.97);
    if (ratio <= 2.0) return ramp(ratio, 1.5, 2.0, 0.97, 0.92);
    if (ratio <= 3.0) return ramp(ratio, 2.0, 3.0, 0.92, 0.82);
    return ramp(std::min(ratio, 5.0), 3.0, 5.0, 0.82, 0.75);
}

double RatioCorrectionV2::favourite_multiplier(double ratio) {
    if (ratio <= 1.15) return 1.0;
    if (ratio <= 2.0) return ramp(ratio, 1.15, 2.0, 1.00, 0.97);
    return ramp(std::min(ratio, 4.0), 2.0, 4.0, 0.97, 0.90);
}

LeadProbabilityResult RatioCorrectionV2::apply(const LeadProbabilityResult& raw,
                                               const RateEstimate& rates) const {
    return apply_ratio_correction(raw, rates, epsilon_, underdog_multiplier, favourite_multiplier);
}

// ---------------------------------------------------------------------------
// RatioCorrectionV1
// ---------------------------------------------------------------------------

double RatioCorrectionV1::underdog_multiplier(double ratio) {
    if (ratio <= 1.0) return 1.0;
    if (ratio <= 1.5) return ramp(ratio, 1.0, 1.5, 1.00, 0.97);
    if (ratio <= 2.0) return ramp(ratio, 1.5, 2.0, 0.97, 0.92);
    return ramp(std::min(ratio, 4.0), 2.0, 4.0, 0.92, 0.90);
}

double RatioCorrectionV1::favourite_multiplier(double ratio) {
    return ratio <= 1.0 ? 1.0 : 0.97;
}

LeadProbabilityResult RatioCorrectionV1::apply(const LeadProbabilityResult& raw,
                                               const RateEstimate& rates) const {
    return apply_ratio_correction(raw, rates, epsilon_, underdog_multiplier, favourite_multiplier);
}

// ---------------------------------------------------------------------------
// LogitLinearCalibration
// ---------------------------------------------------------------------------

double LogitLinearCalibration::calibrate(double p) const {
    if (p <= epsilon_ || p >= 1.0 - epsilon_) {
        return clamp_probability(p, epsilon_);
    }
    const double logit = std::log(p / (1.0 - p));
    // Bounded exponent keeps exp() finite
    const double adjusted = std::clamp(intercept_ + slope_ * logit, -20.0, 20.0);
    return clamp_probability(1.0 / (1.0 + std::exp(-adjusted)), epsilon_);
}

LeadProbabilityResult LogitLinearCalibration::apply(const LeadProbabilityResult& raw,
                                                    const RateEstimate&) const {
    return LeadProbabilityResult{
        .p_home_lead = calibrate(raw.p_home_lead),
        .p_away_lead = calibrate(raw.p_away_lead),
        .p_level_full_time = raw.p_level_full_time,
    };
}

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

AnyProbabilityCalibrator make_probability_calibrator(const CalibrationConfig& config) {
    switch (config.version) {
        case CalibrationVersion::RatioCorrectionV2:
            return AnyProbabilityCalibrator(RatioCorrectionV2(config.epsilon));
        case CalibrationVersion::RatioCorrectionV1:
            return AnyProbabilityCalibrator(RatioCorrectionV1(config.epsilon));
        case CalibrationVersion::LogitLinear:
            return AnyProbabilityCalibrator(LogitLinearCalibration(
                config.logit_intercept, config.logit_slope, config.epsilon));
        case CalibrationVersion::Identity:
            break;
    }
    return AnyProbabilityCalibrator(IdentityCalibration{});
}

}  // namespace oneup
