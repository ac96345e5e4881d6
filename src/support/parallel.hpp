// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP and sequential execution
 *
 * Usage:
 *   ONEUP_PRAGMA_SIMD
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 *   ONEUP_PRAGMA_PARALLEL_FOR_DYNAMIC
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 *   const int workers = worker_count(max_workers);
 *   ONEUP_PRAGMA_PARALLEL_FOR_DYNAMIC_N(workers)
 *   for (size_t i = 0; i < n; ++i) { ... }
 */

#include <cstddef>

#if defined(_OPENMP)
    #include <omp.h>

    #define ONEUP_PRAGMA_SIMD                   _Pragma("omp simd")
    #define ONEUP_PRAGMA_PARALLEL_FOR           _Pragma("omp parallel for")
    #define ONEUP_PRAGMA_PARALLEL_FOR_DYNAMIC   _Pragma("omp parallel for schedule(dynamic, 1)")
    #define ONEUP_PRAGMA_CRITICAL               _Pragma("omp critical")

    #define ONEUP_PRAGMA_IMPL(x)                _Pragma(#x)
    // Thread count of this region only; the global OpenMP setting is untouched
    #define ONEUP_PRAGMA_PARALLEL_FOR_DYNAMIC_N(n) \
        ONEUP_PRAGMA_IMPL(omp parallel for schedule(dynamic, 1) num_threads(n))
#else
    #define ONEUP_PRAGMA_SIMD
    #define ONEUP_PRAGMA_PARALLEL_FOR
    #define ONEUP_PRAGMA_PARALLEL_FOR_DYNAMIC
    #define ONEUP_PRAGMA_CRITICAL
    #define ONEUP_PRAGMA_PARALLEL_FOR_DYNAMIC_N(n)
#endif

namespace oneup {

/// Number of worker threads available to parallel regions
[[nodiscard]] inline size_t available_workers() noexcept {
#if defined(_OPENMP)
    return static_cast<size_t>(omp_get_max_threads());
#else
    return 1;
#endif
}

/// Worker count for a region capped at `max_workers` (0 = all available)
[[nodiscard]] inline int worker_count(size_t max_workers) noexcept {
    const size_t available = available_workers();
    const size_t workers = (max_workers == 0 || max_workers > available) ? available : max_workers;
    return static_cast<int>(workers);
}

/// Restricts the default OpenMP thread count for the lifetime of the guard
class ScopedWorkerLimit {
public:
    explicit ScopedWorkerLimit(size_t max_workers) noexcept
        : previous_(available_workers())
    {
#if defined(_OPENMP)
        if (max_workers > 0) {
            omp_set_num_threads(static_cast<int>(max_workers));
        }
#else
        (void)max_workers;
#endif
    }

    ~ScopedWorkerLimit() {
#if defined(_OPENMP)
        omp_set_num_threads(static_cast<int>(previous_));
#endif
    }

    ScopedWorkerLimit(const ScopedWorkerLimit&) = delete;
    ScopedWorkerLimit& operator=(const ScopedWorkerLimit&) = delete;

private:
    size_t previous_;
};

}  // namespace oneup

/**
 * Design notes:
 *
 * 1. OpenMP: `omp simd` for vectorization and `omp parallel for` for
 *    multi-threading. Dynamic scheduling is used where per-item cost varies
 *    (event pricing, simulation chunks with variable goal counts).
 *
 * 2. Sequential: No-op for debugging or builds without OpenMP.
 *
 * 3. _Pragma instead of #pragma: required to emit pragmas from macros.
 */
