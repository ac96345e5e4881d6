// SPDX-License-Identifier: MIT
/**
 * @file empirical_calibrator.hpp
 * @brief Versioned recalibration of raw lead probabilities
 *
 * Raw model probabilities are corrected by an empirically fitted strategy.
 * Each strategy carries a version tag that ends up in every price record,
 * so a result can always be traced back to the correction that produced it.
 *
 * Strategies:
 * - RatioCorrectionV2 (default): ratio-dependent multipliers for the weaker
 *   and the stronger side, no correction below ratio 1.15
 * - RatioCorrectionV1: earlier shape, corrects from ratio 1.0 with a 0.90
 *   underdog floor and a flat 0.97 favourite multiplier
 * - LogitLinearCalibration: logit(p') = a + b logit(p)
 * - IdentityCalibration: raw probabilities unchanged
 *
 * The full-time level probability is passed through by every strategy.
 */

#pragma once

#include "oneup/model/lead_probability.hpp"
#include <concepts>
#include <string_view>
#include <variant>

namespace oneup {

/// Calibration strategy selector
enum class CalibrationVersion {
    RatioCorrectionV2,
    RatioCorrectionV1,
    LogitLinear,
    Identity
};

/// Calibration parameters, fixed for the lifetime of an engine
struct CalibrationConfig {
    CalibrationVersion version = CalibrationVersion::RatioCorrectionV2;
    double logit_intercept = 0.17721692133648134;
    double logit_slope = 1.1581541486316087;
    double epsilon = 1e-6;  ///< Calibrated probabilities stay in [epsilon, 1 - epsilon]
};

/// Strength ratio of two rates: stronger / weaker, >= 1
struct RateRatio {
    double ratio = 1.0;
    bool home_is_underdog = false;
    bool away_is_underdog = false;
};

/// Ratio of the two rates; balanced (1.0) when either rate is below 0.01
[[nodiscard]] RateRatio rate_ratio(double rate_home, double rate_away);

/// Current ratio correction
class RatioCorrectionV2 {
public:
    explicit RatioCorrectionV2(double epsilon = 1e-6) : epsilon_(epsilon) {}

    static constexpr std::string_view version() { return "ratio_correction_v2"; }

    static double underdog_multiplier(double ratio);
    static double favourite_multiplier(double ratio);

    [[nodiscard]] LeadProbabilityResult apply(const LeadProbabilityResult& raw, const RateEstimate& rates) const;

private:
    double epsilon_;
};

/// Legacy ratio correction kept for regression comparisons
class RatioCorrectionV1 {
public:
    explicit RatioCorrectionV1(double epsilon = 1e-6) : epsilon_(epsilon) {}

    static constexpr std::string_view version() { return "ratio_correction_v1"; }

    static double underdog_multiplier(double ratio);
    static double favourite_multiplier(double ratio);

    [[nodiscard]] LeadProbabilityResult apply(const LeadProbabilityResult& raw, const RateEstimate& rates) const;

private:
    double epsilon_;
};

/// Linear map in logit space
class LogitLinearCalibration {
public:
    LogitLinearCalibration(double intercept, double slope, double epsilon = 1e-6)
        : intercept_(intercept), slope_(slope), epsilon_(epsilon) {}

    static constexpr std::string_view version() { return "logit_linear"; }

    [[nodiscard]] double calibrate(double p) const;

    [[nodiscard]] LeadProbabilityResult apply(const LeadProbabilityResult& raw, const RateEstimate& rates) const;

private:
    double intercept_;
    double slope_;
    double epsilon_;
};

class IdentityCalibration {
public:
    static constexpr std::string_view version() { return "identity"; }

    [[nodiscard]] LeadProbabilityResult apply(const LeadProbabilityResult& raw, const RateEstimate&) const {
        return raw;
    }
};

/// Concept for calibration strategies
template <typename C>
concept ProbabilityCalibrator = requires(const C& c, const LeadProbabilityResult& raw,
                                         const RateEstimate& rates) {
    { c.apply(raw, rates) } -> std::same_as<LeadProbabilityResult>;
    { C::version() } -> std::convertible_to<std::string_view>;
};

static_assert(ProbabilityCalibrator<RatioCorrectionV2>);
static_assert(ProbabilityCalibrator<RatioCorrectionV1>);
static_assert(ProbabilityCalibrator<LogitLinearCalibration>);
static_assert(ProbabilityCalibrator<IdentityCalibration>);

/// Type-erased calibrator selected at configuration time
class AnyProbabilityCalibrator {
public:
    template <ProbabilityCalibrator C>
    explicit AnyProbabilityCalibrator(C calibrator) : impl_(std::move(calibrator)) {}

    [[nodiscard]] LeadProbabilityResult apply(const LeadProbabilityResult& raw, const RateEstimate& rates) const {
        return std::visit([&](const auto& c) { return c.apply(raw, rates); }, impl_);
    }

    std::string_view version() const {
        return std::visit([](const auto& c) -> std::string_view { return c.version(); }, impl_);
    }

private:
    std::variant<RatioCorrectionV2, RatioCorrectionV1, LogitLinearCalibration, IdentityCalibration> impl_;
};

/// Build the configured calibrator
[[nodiscard]] AnyProbabilityCalibrator make_probability_calibrator(const CalibrationConfig& config);

}  // namespace oneup
