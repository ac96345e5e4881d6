// SPDX-License-Identifier: MIT
#pragma once

#include "oneup/support/pricing_trace.h"
#include <cstddef>
#include <optional>
#include <string>
#include <concepts>
#include <cmath>
#include <limits>
#include <algorithm>

namespace oneup {

/// Configuration for bracketed root finding
struct RootFindingConfig {
    /// Bisection iterations once the root is bracketed
    size_t max_iter = 50;

    /// Maximum number of times the upper bound may be doubled
    size_t max_expansions = 20;

    /// Initial bracket
    double lower = 0.01;
    double upper = 6.0;
};

/// Result from a root-finding method
///
/// Provides consistent interface for convergence status,
/// iteration count, and diagnostic information.
struct RootFindingResult {
    /// Convergence status
    bool converged;

    /// Number of iterations performed
    size_t iterations;

    /// Final bracket width
    double final_error;

    /// Optional failure diagnostic message
    std::optional<std::string> failure_reason;

    /// Root estimate (midpoint of the final bracket)
    std::optional<double> root;
};

/// Concept for objective functions (scalar functions f: R -> R)
template<typename F>
concept ObjectiveFunction = requires(F f, double x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Solve f(x) = target for a non-decreasing f by bisection
///
/// The upper bound is doubled (at most config.max_expansions times) until
/// f(upper) >= target, then the bracket is halved config.max_iter times.
/// The midpoint of the final bracket is returned even when the target was
/// never reached by the expanded bound; `converged` reports whether the
/// bracket was feasible.
///
/// **Precondition:** f is non-decreasing on [config.lower, inf)
///
/// @param f Monotone objective
/// @param target Value to match
/// @param config Bracket and iteration budget
/// @return Result with root and convergence status
template<ObjectiveFunction F>
[[nodiscard]] RootFindingResult bisect_increasing(F&& f, double target, const RootFindingConfig& config) {
    double lo = config.lower;
    double hi = config.upper;

    ONEUP_TRACE_ALGO_START(MODULE_ROOT_FINDING, config.max_iter, target, (hi - lo));

    bool bracketed = false;
    for (size_t expansion = 0; expansion < config.max_expansions; ++expansion) {
        const double f_hi = f(hi);
        if (!std::isfinite(f_hi)) {
            return RootFindingResult{
                .converged = false,
                .iterations = 0,
                .final_error = std::numeric_limits<double>::quiet_NaN(),
                .failure_reason = "Function returned non-finite value (NaN or Inf)",
                .root = std::nullopt
            };
        }
        if (f_hi >= target) {
            bracketed = true;
            break;
        }
        hi *= 2.0;
    }

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        const double mid = 0.5 * (lo + hi);
        if (f(mid) < target) {
            lo = mid;
        } else {
            hi = mid;
        }
    }

    const double root = 0.5 * (lo + hi);
    if (bracketed) {
        ONEUP_TRACE_CONVERGENCE_SUCCESS(MODULE_ROOT_FINDING, config.max_iter, (hi - lo));
    } else {
        ONEUP_TRACE_CONVERGENCE_FAILED(MODULE_ROOT_FINDING, config.max_iter, (hi - lo));
    }
    ONEUP_TRACE_ALGO_COMPLETE(MODULE_ROOT_FINDING, config.max_iter, root);

    return RootFindingResult{
        .converged = bracketed,
        .iterations = config.max_iter,
        .final_error = hi - lo,
        .failure_reason = bracketed ? std::nullopt
                                    : std::optional<std::string>("Target not reached by expanded bracket"),
        .root = root
    };
}

}  // namespace oneup
