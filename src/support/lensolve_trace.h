// SPDX-License-Identifier: MIT
/**
 * @file lensolve_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the lensolve library
 *
 * Zero-overhead tracing points that can be enabled at runtime with bpftrace,
 * systemtap or perf. When tracing is disabled (default) probes compile to a
 * single NOP; when sys/sdt.h is unavailable they compile to nothing.
 *
 * Example usage with bpftrace:
 *   # Per-source solve summary
 *   sudo bpftrace -e 'usdt:./liblensolve.so:lensolve:solve_complete { ... }'
 *
 *   # Refiner progress (running candidates per iteration)
 *   sudo bpftrace -e 'usdt:./liblensolve.so:lensolve:algo_progress /arg0 == 3/ { ... }'
 */

#ifndef LENSOLVE_TRACE_H
#define LENSOLVE_TRACE_H

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
#define DTRACE_PROBE6(provider, probe, arg1, arg2, arg3, arg4, arg5, arg6) do {} while(0)
#endif

/**
 * Provider name for all lensolve probes
 */
#define LENSOLVE_PROVIDER lensolve

/**
 * Module identifiers, passed as the first argument of the generic probes
 */
#define MODULE_SOLVER_CONFIG       1
#define MODULE_CANDIDATE_GENERATOR 2
#define MODULE_ROOT_REFINER        3
#define MODULE_IMAGE_CLASSIFIER    4
#define MODULE_BATCH_SOLVER        5
#define MODULE_TRIANGLE_SEARCH     6

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (MODULE_* constant)
 * @param param1: Module-specific parameter (e.g. candidate count)
 * @param param2: Module-specific parameter (e.g. tolerance)
 * @param param3: Module-specific parameter
 */
#define LENSOLVE_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(LENSOLVE_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired periodically during algorithm execution
 * @param module_id: Module identifier
 * @param current: Current progress (e.g. iteration)
 * @param total: Total work (e.g. max iterations)
 * @param metric: Progress metric (e.g. running candidates)
 */
#define LENSOLVE_TRACE_ALGO_PROGRESS(module_id, current, total, metric) \
    DTRACE_PROBE4(LENSOLVE_PROVIDER, algo_progress, module_id, current, total, metric)

/**
 * Fired when an algorithm completes
 * @param module_id: Module identifier
 * @param iterations: Iterations completed
 * @param final_metric: Final metric value
 */
#define LENSOLVE_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(LENSOLVE_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * ============================================================================
 * Convergence Tracking Probes
 * ============================================================================
 */

/**
 * Fired when the lockstep loop ends with every candidate terminal
 * @param module_id: Module identifier
 * @param iterations: Lockstep iterations performed
 * @param converged: Number of converged candidates
 */
#define LENSOLVE_TRACE_CONVERGENCE_SUCCESS(module_id, iterations, converged) \
    DTRACE_PROBE3(LENSOLVE_PROVIDER, convergence_success, module_id, iterations, converged)

/**
 * Fired when the iteration cap is hit with candidates still running
 * @param module_id: Module identifier
 * @param max_iter: Iteration cap
 * @param still_running: Candidates that did not reach a terminal state
 */
#define LENSOLVE_TRACE_CONVERGENCE_FAILED(module_id, max_iter, still_running) \
    DTRACE_PROBE3(LENSOLVE_PROVIDER, convergence_failed, module_id, max_iter, still_running)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: ValidationErrorCode as int
 * @param value: Offending value
 * @param index: Offending index (0 if not applicable)
 */
#define LENSOLVE_TRACE_VALIDATION_ERROR(module_id, error_code, value, index) \
    DTRACE_PROBE4(LENSOLVE_PROVIDER, validation_error, module_id, error_code, value, index)

/**
 * ============================================================================
 * Module-Specific Probes: Candidate generation
 * ============================================================================
 */

/**
 * @param strategy: SeedStrategy as int
 * @param n_seeds: Seeds produced
 * @param half_width: Bounding box half width
 */
#define LENSOLVE_TRACE_SEEDS_GENERATED(strategy, n_seeds, half_width) \
    DTRACE_PROBE4(LENSOLVE_PROVIDER, seeds_generated, MODULE_CANDIDATE_GENERATOR, \
                  strategy, n_seeds, half_width)

/**
 * ============================================================================
 * Module-Specific Probes: Root refiner
 * ============================================================================
 */

#define LENSOLVE_TRACE_REFINER_START(n_candidates, max_iter, tolerance) \
    LENSOLVE_TRACE_ALGO_START(MODULE_ROOT_REFINER, n_candidates, max_iter, tolerance)

#define LENSOLVE_TRACE_REFINER_ITER(iter, max_iter, n_running) \
    LENSOLVE_TRACE_ALGO_PROGRESS(MODULE_ROOT_REFINER, iter, max_iter, n_running)

/**
 * Terminal-status summary of one refinement
 * @param converged, diverged, max_iter_exceeded, out_of_domain: candidate counts
 */
#define LENSOLVE_TRACE_REFINER_SUMMARY(converged, diverged, max_iter_exceeded, out_of_domain) \
    DTRACE_PROBE5(LENSOLVE_PROVIDER, refiner_summary, MODULE_ROOT_REFINER, \
                  converged, diverged, max_iter_exceeded, out_of_domain)

/**
 * Fired once per refinement with the number of damped (Levenberg-Marquardt) steps
 */
#define LENSOLVE_TRACE_DAMPED_STEPS(n_damped) \
    DTRACE_PROBE2(LENSOLVE_PROVIDER, damped_steps, MODULE_ROOT_REFINER, n_damped)

/**
 * Continuation of out-of-domain candidates in the enlarged box
 * @param n_continued: OutOfDomain candidates continued
 * @param n_escaped: Of those, candidates converged outside the search box
 */
#define LENSOLVE_TRACE_ESCAPED_ROOTS(n_continued, n_escaped) \
    DTRACE_PROBE3(LENSOLVE_PROVIDER, escaped_roots, MODULE_ROOT_REFINER, n_continued, n_escaped)

/**
 * ============================================================================
 * Module-Specific Probes: Solve / batch
 * ============================================================================
 */

/**
 * @param source_x, source_y: Source-plane position
 * @param n_seeds: Candidates entering refinement
 */
#define LENSOLVE_TRACE_SOLVE_START(source_x, source_y, n_seeds) \
    DTRACE_PROBE4(LENSOLVE_PROVIDER, solve_start, MODULE_BATCH_SOLVER, source_x, source_y, n_seeds)

/**
 * @param n_images: Images retained
 * @param diagnostic: SolveDiagnostic as int
 * @param n_merged: Converged candidates merged into existing images
 */
#define LENSOLVE_TRACE_SOLVE_COMPLETE(n_images, diagnostic, n_merged) \
    DTRACE_PROBE4(LENSOLVE_PROVIDER, solve_complete, MODULE_IMAGE_CLASSIFIER, \
                  n_images, diagnostic, n_merged)

#define LENSOLVE_TRACE_BATCH_START(n_sources, shared_params) \
    LENSOLVE_TRACE_ALGO_START(MODULE_BATCH_SOLVER, n_sources, shared_params, 0)

#define LENSOLVE_TRACE_BATCH_COMPLETE(n_sources, incomplete_count) \
    LENSOLVE_TRACE_ALGO_COMPLETE(MODULE_BATCH_SOLVER, n_sources, incomplete_count)

/**
 * ============================================================================
 * Module-Specific Probes: Triangle search
 * ============================================================================
 */

#define LENSOLVE_TRACE_TRIANGLE_START(n_triangles, iterations, max_solutions) \
    LENSOLVE_TRACE_ALGO_START(MODULE_TRIANGLE_SEARCH, n_triangles, iterations, max_solutions)

/**
 * @param iteration: Refinement pass (0 = initial grid)
 * @param n_selected: Triangles containing the source after this pass
 */
#define LENSOLVE_TRACE_TRIANGLE_ITER(iteration, n_selected) \
    LENSOLVE_TRACE_ALGO_PROGRESS(MODULE_TRIANGLE_SEARCH, iteration, 0, n_selected)

#define LENSOLVE_TRACE_TRIANGLE_COMPLETE(iterations, n_solutions) \
    LENSOLVE_TRACE_ALGO_COMPLETE(MODULE_TRIANGLE_SEARCH, iterations, n_solutions)

#endif // LENSOLVE_TRACE_H
