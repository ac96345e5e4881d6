// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <expected>
#include <ostream>
#include <string>

namespace oneup {

/// Error codes for parameter validation failures
enum class ValidationErrorCode {
    InvalidOdds,
    InvalidLine,
    InvalidRate,
    InvalidProbability,
    InvalidSimulationCount,
    InvalidMatchLength,
    InvalidGoalBound,
    InvalidGridSize,
    InvalidBounds,
    InvalidMargin,
    InvalidWorkerCount,
    UnknownProvider
};

/// Detailed validation error for parameter validation failures
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided
    size_t index;  // Optional index for array/grid errors (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                   double value = 0.0,
                   size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Market families a pricing request is built from
enum class MarketFamily {
    MatchResult,
    TotalGoals,
    HomeGoals,
    AwayGoals,
    FirstScorer,
    BothTeamsScore
};

/// High-level pricing error categories surfaced through expected results
enum class PricingErrorCode {
    InsufficientData,      ///< A mandatory market family is missing or invalid
    InvalidProbability,    ///< Probability outside (0, 1] handed to the composer
    InvalidMargin          ///< Margin fraction outside [0, 1)
};

/// Detailed pricing error passed through expected failure path
struct PricingError {
    PricingErrorCode code;
    MarketFamily family = MarketFamily::MatchResult;  ///< Offending family (InsufficientData only)
    double value = 0.0;                               ///< Offending value, when numeric
};

inline const char* to_string(MarketFamily family) {
    switch (family) {
        case MarketFamily::MatchResult:    return "match_result";
        case MarketFamily::TotalGoals:     return "total_goals";
        case MarketFamily::HomeGoals:      return "home_goals";
        case MarketFamily::AwayGoals:      return "away_goals";
        case MarketFamily::FirstScorer:    return "first_scorer";
        case MarketFamily::BothTeamsScore: return "both_teams_score";
    }
    return "unknown";
}

inline const char* to_string(PricingErrorCode code) {
    switch (code) {
        case PricingErrorCode::InsufficientData:     return "InsufficientData";
        case PricingErrorCode::InvalidProbability:   return "InvalidProbability";
        case PricingErrorCode::InvalidMargin:        return "InvalidMargin";
    }
    return "Unknown";
}

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << static_cast<int>(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

/// Output stream operator for PricingError
inline std::ostream& operator<<(std::ostream& os, const PricingError& err) {
    os << "PricingError{code=" << to_string(err.code);
    if (err.code == PricingErrorCode::InsufficientData) {
        os << ", family=" << to_string(err.family);
    } else {
        os << ", value=" << err.value;
    }
    os << "}";
    return os;
}

} // namespace oneup
