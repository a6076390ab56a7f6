// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP and sequential execution
 *
 * Inside one batch every source is solved independently, so batch loops
 * run in parallel across sources.
 *
 * Usage:
 *   LENSOLVE_PRAGMA_PARALLEL_FOR_DYNAMIC
 *   for (size_t i = 0; i < n; ++i) { ... }
 */

#if defined(_OPENMP)
    #define LENSOLVE_PRAGMA_PARALLEL_FOR_DYNAMIC   _Pragma("omp parallel for schedule(dynamic, 1)")
#else
    #define LENSOLVE_PRAGMA_PARALLEL_FOR_DYNAMIC
#endif

/**
 * Notes:
 *
 * 1. _Pragma is used instead of #pragma so the constructs can live in macros.
 *
 * 2. Per-source solve cost varies a lot (sources near caustics need more
 *    Newton steps), so batch loops use dynamic scheduling.
 *
 * 3. Sequential mode is a no-op expansion, useful under debuggers and for
 *    builds without OpenMP.
 */
