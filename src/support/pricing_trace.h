// SPDX-License-Identifier: MIT
/**
 * @file pricing_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the oneup library
 *
 * Zero-overhead tracing points that can be enabled at runtime with
 * bpftrace, systemtap or perf. When tracing is disabled (default), probes
 * compile to single NOP instructions; without <sys/sdt.h> they compile away.
 *
 * Example usage with bpftrace:
 *   # Trace every rejected pricing request
 *   sudo bpftrace -e 'usdt:./liboneup*:oneup:insufficient_data { printf("%d\n", arg0); }'
 *
 *   # Watch minimizer fallbacks to grid search
 *   sudo bpftrace -e 'usdt:./liboneup*:oneup:optimizer_fallback { ... }'
 */

#ifndef ONEUP_PRICING_TRACE_H
#define ONEUP_PRICING_TRACE_H

#include <stddef.h>

#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all oneup probes
 */
#define ONEUP_PROVIDER oneup

/**
 * Module identifiers, passed as the first parameter to generic probes
 */
#define MODULE_RATE_INFERENCE       1
#define MODULE_SPLIT_ESTIMATOR      2
#define MODULE_SUPREMACY            3
#define MODULE_STOCHASTIC           4
#define MODULE_EXACT_BARRIER        5
#define MODULE_CALIBRATOR           6
#define MODULE_PRICE_COMPOSER       7
#define MODULE_PRICING_ENGINE       8
#define MODULE_BATCH_PRICER         9
#define MODULE_ROOT_FINDING         10
#define MODULE_MINIMIZER            11

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., n_sims, max_iter)
 * @param param2: Module-specific parameter (e.g., rate, tolerance)
 * @param param3: Module-specific parameter
 */
#define ONEUP_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(ONEUP_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when an algorithm completes
 * @param module_id: Module identifier
 * @param iterations: Number of iterations/steps/simulations completed
 * @param final_metric: Final metric value (e.g., root, probability)
 */
#define ONEUP_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(ONEUP_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * ============================================================================
 * Convergence Tracking Probes
 * ============================================================================
 */

/**
 * Fired when convergence is achieved
 * @param module_id: Module identifier
 * @param final_iter: Number of iterations required
 * @param final_error: Final error achieved
 */
#define ONEUP_TRACE_CONVERGENCE_SUCCESS(module_id, final_iter, final_error) \
    DTRACE_PROBE3(ONEUP_PROVIDER, convergence_success, module_id, final_iter, final_error)

/**
 * Fired when convergence fails
 * @param module_id: Module identifier
 * @param max_iter: Maximum iterations attempted
 * @param final_error: Final error at failure
 */
#define ONEUP_TRACE_CONVERGENCE_FAILED(module_id, max_iter, final_error) \
    DTRACE_PROBE3(ONEUP_PROVIDER, convergence_failed, module_id, max_iter, final_error)

/**
 * Fired when a bounded minimizer gives up and grid search takes over
 * @param module_id: Module requesting the minimization
 * @param lower: Lower bound of the search interval
 * @param upper: Upper bound of the search interval
 */
#define ONEUP_TRACE_OPTIMIZER_FALLBACK(module_id, lower, upper) \
    DTRACE_PROBE3(ONEUP_PROVIDER, optimizer_fallback, module_id, lower, upper)

/**
 * ============================================================================
 * Validation and Degeneracy Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: Error code (ValidationErrorCode / PricingErrorCode)
 * @param param1: Relevant parameter value
 * @param param2: Relevant parameter value or threshold
 */
#define ONEUP_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(ONEUP_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * Fired when a request is rejected for a missing mandatory market family
 * @param family: MarketFamily as integer
 */
#define ONEUP_TRACE_INSUFFICIENT_DATA(family) \
    DTRACE_PROBE1(ONEUP_PROVIDER, insufficient_data, family)

/**
 * Fired when a rate or probability is clamped to an epsilon boundary
 * @param module_id: Module identifier
 * @param original: Value before clamping
 * @param clamped: Value after clamping
 */
#define ONEUP_TRACE_DEGENERATE_CLAMP(module_id, original, clamped) \
    DTRACE_PROBE3(ONEUP_PROVIDER, degenerate_clamp, module_id, original, clamped)

/**
 * ============================================================================
 * Module-Specific Probes: Pricing Engine
 * ============================================================================
 */

/**
 * Fired when a single request has been priced
 * @param rate_home: Final home rate
 * @param rate_away: Final away rate
 * @param p_home_lead: Calibrated home lead probability
 * @param p_away_lead: Calibrated away lead probability
 */
#define ONEUP_TRACE_PRICE_COMPLETE(rate_home, rate_away, p_home_lead, p_away_lead) \
    DTRACE_PROBE4(ONEUP_PROVIDER, price_complete, rate_home, rate_away, p_home_lead, p_away_lead)

/**
 * Fired when a batch finishes
 * @param n_requests: Requests submitted
 * @param n_priced: Requests priced successfully
 * @param n_rejected: Requests rejected
 */
#define ONEUP_TRACE_BATCH_COMPLETE(n_requests, n_priced, n_rejected) \
    DTRACE_PROBE3(ONEUP_PROVIDER, batch_complete, n_requests, n_priced, n_rejected)

#endif // ONEUP_PRICING_TRACE_H
