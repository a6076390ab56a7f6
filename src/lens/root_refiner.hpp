// SPDX-License-Identifier: MIT
/**
 * @file root_refiner.hpp
 * @brief Lockstep damped Newton refinement of lens-equation candidates
 *
 * Solves F(theta) = beta - (theta - alpha(theta)) = 0 for every candidate of
 * a CandidateBatch. Iteration k:
 *
 *   1. evaluate alpha and d(alpha)/d(theta) for the whole batch
 *   2. for each running candidate (masked update):
 *        undefined alpha or non-finite |F|  -> Diverged
 *        |F| < convergence_tol              -> Converged
 *        k == max_iterations                -> MaxIterationsExceeded
 *        otherwise take a damped Newton step (damped_newton_step());
 *          non-finite step                  -> Diverged
 *          step leaves the search box       -> OutOfDomain
 *
 * Terminal candidates keep their last in-box, finite position and are never
 * touched again. The loop stops early once no candidate is running, and
 * otherwise performs max_iterations steps plus one final convergence check.
 *
 * A box too small for the lens loses images silently unless the escapes are
 * followed: count_escaped_roots() continues the OutOfDomain candidates in a
 * box ESCAPE_BOX_FACTOR times wider and counts those that converge outside
 * the search box.
 */

#pragma once

#include "src/lens/candidate_batch.hpp"
#include "src/lens/deflection_field.hpp"
#include "src/lens/search_grid.hpp"
#include "src/lens/solver_config.hpp"
#include <span>

namespace lensolve {

struct RefinerConfig {
    size_t max_iterations = 50;
    double convergence_tol = 1e-8;
    double damping_threshold = 1e-8;

    /// Candidates stepping outside this box become OutOfDomain
    SearchGrid domain{};

    static RefinerConfig from(const SolverConfig& config) noexcept {
        return RefinerConfig{
            .max_iterations = config.max_iterations,
            .convergence_tol = config.convergence_tol,
            .damping_threshold = config.damping_threshold,
            .domain = config.search_grid()
        };
    }
};

struct RefinerStats {
    /// Lockstep passes performed (including the final check)
    size_t passes = 0;

    /// Newton steps that used the Levenberg-Marquardt form
    size_t damped_steps = 0;
};

/// Half-width multiplier of the box OutOfDomain candidates are continued in
inline constexpr double ESCAPE_BOX_FACTOR = 2.0;

/// Advance every running candidate to a terminal state
///
/// @param field Deflection field
/// @param source Source-plane position beta
/// @param params Parameters passed through to the field
/// @param config Iteration settings
/// @param batch Candidates, mutated in place
RefinerStats refine_candidates(const DeflectionField& field,
                               Coordinate source,
                               std::span<const double> params,
                               const RefinerConfig& config,
                               CandidateBatch& batch);

/// Continue the OutOfDomain candidates of a refined batch in the wider box
///
/// The batch itself is not modified; continuation runs on a copy of the
/// escaped candidates' last in-box positions.
///
/// @return Continued candidates that converged outside config.domain
size_t count_escaped_roots(const DeflectionField& field,
                           Coordinate source,
                           std::span<const double> params,
                           const RefinerConfig& config,
                           const CandidateBatch& batch);

}  // namespace lensolve
