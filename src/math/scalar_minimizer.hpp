// SPDX-License-Identifier: MIT
/**
 * @file scalar_minimizer.hpp
 * @brief Bounded one-dimensional minimization strategies
 *
 * Two interchangeable strategies share one interface:
 * - BrentBoundedMinimizer: golden-section search with parabolic
 *   interpolation (Brent 1973, as in Forsythe/Malcolm/Moler `fmin`)
 * - GridSearchMinimizer: deterministic evaluation on a uniform grid
 *
 * The strategy is chosen once from configuration and wrapped in
 * AnyScalarMinimizer. minimize_with_fallback() runs the configured strategy
 * and switches to grid search when it does not converge, so callers always
 * get a finite answer within a fixed evaluation budget.
 */

#pragma once

#include "oneup/math/root_finding.hpp"
#include "oneup/support/pricing_trace.h"
#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <variant>

namespace oneup {

/// Result of a bounded scalar minimization
struct MinimizationResult {
    bool converged = false;
    size_t evaluations = 0;
    double x = std::numeric_limits<double>::quiet_NaN();
    double fx = std::numeric_limits<double>::quiet_NaN();
    bool used_fallback = false;  ///< Grid search replaced a failed minimizer
    std::optional<std::string> failure_reason;
};

/// Which strategy EngineConfig selects
enum class MinimizerKind {
    BrentBounded,
    GridSearch
};

/// Configuration shared by the minimizer strategies
struct MinimizerConfig {
    size_t max_evaluations = 500;   ///< Brent evaluation budget
    double x_tolerance = 1e-5;      ///< Brent absolute tolerance on x
    size_t grid_points = 400;       ///< Grid search resolution
};

/// Golden-section search with parabolic interpolation on [lower, upper]
class BrentBoundedMinimizer {
public:
    explicit BrentBoundedMinimizer(const MinimizerConfig& config = {})
        : max_evaluations_(config.max_evaluations)
        , x_tolerance_(config.x_tolerance) {}

    template <ObjectiveFunction F>
    [[nodiscard]] MinimizationResult minimize(F&& f, double lower, double upper) const;

private:
    size_t max_evaluations_;
    double x_tolerance_;
};

/// Exhaustive evaluation on `points` evenly spaced nodes including both bounds
class GridSearchMinimizer {
public:
    explicit GridSearchMinimizer(size_t points = 400) : points_(std::max<size_t>(points, 2)) {}

    size_t points() const noexcept { return points_; }

    template <ObjectiveFunction F>
    [[nodiscard]] MinimizationResult minimize(F&& f, double lower, double upper) const;

private:
    size_t points_;
};

/// Concept for scalar minimization strategies
template <typename M>
concept ScalarMinimizer = requires(const M& m, double (*f)(double), double a, double b) {
    { m.minimize(f, a, b) } -> std::same_as<MinimizationResult>;
};

static_assert(ScalarMinimizer<BrentBoundedMinimizer>);
static_assert(ScalarMinimizer<GridSearchMinimizer>);

/// Type-erased minimizer selected at configuration time
class AnyScalarMinimizer {
public:
    explicit AnyScalarMinimizer(BrentBoundedMinimizer m) : impl_(std::move(m)) {}
    explicit AnyScalarMinimizer(GridSearchMinimizer m) : impl_(std::move(m)) {}

    template <ObjectiveFunction F>
    [[nodiscard]] MinimizationResult minimize(F&& f, double lower, double upper) const {
        return std::visit([&](const auto& m) {
            return m.minimize(f, lower, upper);
        }, impl_);
    }

    [[nodiscard]] MinimizerKind kind() const {
        return std::holds_alternative<BrentBoundedMinimizer>(impl_)
            ? MinimizerKind::BrentBounded : MinimizerKind::GridSearch;
    }

private:
    std::variant<BrentBoundedMinimizer, GridSearchMinimizer> impl_;
};

/// Build the configured strategy
[[nodiscard]] inline AnyScalarMinimizer make_scalar_minimizer(MinimizerKind kind, const MinimizerConfig& config = {}) {
    if (kind == MinimizerKind::GridSearch) {
        return AnyScalarMinimizer(GridSearchMinimizer(config.grid_points));
    }
    return AnyScalarMinimizer(BrentBoundedMinimizer(config));
}

/// Run `minimizer`; on non-convergence fall back to a grid of `fallback_points`
///
/// @param module_id MODULE_* constant of the caller, for tracing
template <ObjectiveFunction F>
[[nodiscard]] MinimizationResult minimize_with_fallback(const AnyScalarMinimizer& minimizer, F&& f,
                                          double lower, double upper,
                                          size_t fallback_points, int module_id) {
    MinimizationResult result = minimizer.minimize(f, lower, upper);
    if (result.converged && std::isfinite(result.x) && std::isfinite(result.fx)) {
        return result;
    }

    ONEUP_TRACE_OPTIMIZER_FALLBACK(module_id, lower, upper);
    MinimizationResult fallback = GridSearchMinimizer(fallback_points).minimize(f, lower, upper);
    fallback.used_fallback = true;
    fallback.evaluations += result.evaluations;
    return fallback;
}

// ===========================================================================
// Implementation
// ===========================================================================

template <ObjectiveFunction F>
MinimizationResult BrentBoundedMinimizer::minimize(F&& f, double lower, double upper) const {
    if (!(lower < upper) || !std::isfinite(lower) || !std::isfinite(upper)) {
        return MinimizationResult{
            .converged = false,
            .evaluations = 0,
            .failure_reason = "Invalid bounds: lower must be < upper"
        };
    }

    ONEUP_TRACE_ALGO_START(MODULE_MINIMIZER, max_evaluations_, x_tolerance_, (upper - lower));

    static constexpr double kGolden = 0.3819660112501051;  // (3 - sqrt(5)) / 2
    const double sqrt_eps = std::sqrt(std::numeric_limits<double>::epsilon());

    double a = lower;
    double b = upper;

    // xf: best point, nfc: second best, fulc: previous second best
    double fulc = a + kGolden * (b - a);
    double nfc = fulc;
    double xf = fulc;
    double rat = 0.0;
    double e = 0.0;
    double fx = f(xf);
    size_t evaluations = 1;
    double ffulc = fx;
    double fnfc = fx;

    if (!std::isfinite(fx)) {
        return MinimizationResult{
            .converged = false,
            .evaluations = evaluations,
            .failure_reason = "Function returned non-finite value (NaN or Inf)"
        };
    }

    double xm = 0.5 * (a + b);
    double tol1 = sqrt_eps * std::abs(xf) + x_tolerance_ / 3.0;
    double tol2 = 2.0 * tol1;

    while (std::abs(xf - xm) > (tol2 - 0.5 * (b - a))) {
        bool golden_step = true;

        if (std::abs(e) > tol1) {
            golden_step = false;
            double r = (xf - nfc) * (fx - ffulc);
            double q = (xf - fulc) * (fx - fnfc);
            double p = (xf - fulc) * q - (xf - nfc) * r;
            q = 2.0 * (q - r);
            if (q > 0.0) p = -p;
            q = std::abs(q);
            r = e;
            e = rat;

            if (std::abs(p) < std::abs(0.5 * q * r) && p > q * (a - xf) && p < q * (b - xf)) {
                // Parabolic step
                rat = p / q;
                const double x = xf + rat;
                if ((x - a) < tol2 || (b - x) < tol2) {
                    const double si = (xm - xf) >= 0.0 ? 1.0 : -1.0;
                    rat = tol1 * si;
                }
            } else {
                golden_step = true;
            }
        }

        if (golden_step) {
            e = (xf >= xm) ? (a - xf) : (b - xf);
            rat = kGolden * e;
        }

        const double si = rat >= 0.0 ? 1.0 : -1.0;
        const double x = xf + si * std::max(std::abs(rat), tol1);
        const double fu = f(x);
        ++evaluations;

        if (!std::isfinite(fu)) {
            ONEUP_TRACE_CONVERGENCE_FAILED(MODULE_MINIMIZER, evaluations, fx);
            return MinimizationResult{
                .converged = false,
                .evaluations = evaluations,
                .x = xf,
                .fx = fx,
                .failure_reason = "Function returned non-finite value (NaN or Inf)"
            };
        }

        if (fu <= fx) {
            if (x >= xf) {
                a = xf;
            } else {
                b = xf;
            }
            fulc = nfc;
            ffulc = fnfc;
            nfc = xf;
            fnfc = fx;
            xf = x;
            fx = fu;
        } else {
            if (x < xf) {
                a = x;
            } else {
                b = x;
            }
            if (fu <= fnfc || nfc == xf) {
                fulc = nfc;
                ffulc = fnfc;
                nfc = x;
                fnfc = fu;
            } else if (fu <= ffulc || fulc == xf || fulc == nfc) {
                fulc = x;
                ffulc = fu;
            }
        }

        xm = 0.5 * (a + b);
        tol1 = sqrt_eps * std::abs(xf) + x_tolerance_ / 3.0;
        tol2 = 2.0 * tol1;

        if (evaluations >= max_evaluations_) {
            ONEUP_TRACE_CONVERGENCE_FAILED(MODULE_MINIMIZER, evaluations, fx);
            return MinimizationResult{
                .converged = false,
                .evaluations = evaluations,
                .x = xf,
                .fx = fx,
                .failure_reason = "Maximum function evaluations reached"
            };
        }
    }

    ONEUP_TRACE_CONVERGENCE_SUCCESS(MODULE_MINIMIZER, evaluations, fx);
    ONEUP_TRACE_ALGO_COMPLETE(MODULE_MINIMIZER, evaluations, xf);
    return MinimizationResult{
        .converged = true,
        .evaluations = evaluations,
        .x = xf,
        .fx = fx,
    };
}

template <ObjectiveFunction F>
MinimizationResult GridSearchMinimizer::minimize(F&& f, double lower, double upper) const {
    double best_x = lower;
    double best_f = std::numeric_limits<double>::infinity();

    const double step = (upper - lower) / static_cast<double>(points_ - 1);
    for (size_t i = 0; i < points_; ++i) {
        const double x = (i + 1 == points_) ? upper : lower + step * static_cast<double>(i);
        const double fx = f(x);
        if (std::isfinite(fx) && fx < best_f) {
            best_f = fx;
            best_x = x;
        }
    }

    const bool found = std::isfinite(best_f);
    return MinimizationResult{
        .converged = found,
        .evaluations = points_,
        .x = best_x,
        .fx = found ? best_f : std::numeric_limits<double>::quiet_NaN(),
        .failure_reason = found ? std::nullopt
                                : std::optional<std::string>("No finite value on grid")
    };
}

}  // namespace oneup
