// SPDX-License-Identifier: MIT
/**
 * @file lens_equation_solver.hpp
 * @brief Find all images of point sources through a deflection field
 *
 * Solves the lens equation beta = theta - alpha(theta) for theta. Each solve:
 *
 *   1. seeds candidates over the search box (CandidateGenerator)
 *   2. refines them in lockstep with damped Newton (refine_candidates()) and
 *      follows the candidates that left the box (count_escaped_roots())
 *   3. merges, classifies and orders the converged roots (classify_images());
 *      a root found beyond the box marks the result ImagesOutsideDomain
 *
 * Batches run one solve per source, parallel across sources with OpenMP.
 * Sources are independent, so a batch entry is identical to the result of
 * solve() on that source alone.
 *
 * Example:
 * @code
 * auto field = std::make_shared<PointMassLens>();
 * auto solver = LensEquationSolver::create(field, SolverConfig{
 *     .convergence_tol = 1e-10,
 *     .expected_images = 2
 * });
 * if (!solver) {
 *     std::cerr << solver.error() << "\n";
 *     return;
 * }
 *
 * LensParameters params{1.0, 0.0, 0.0};   // theta_E, center
 * auto result = solver->solve(Coordinate{0.1, 0.0}, params);
 * for (const auto& image : result->images) {
 *     std::cout << image.position << " mu=" << image.magnification << "\n";
 * }
 * @endcode
 *
 * **Thread Safety:** immutable after create(); all solve methods are const
 * and may be called concurrently. The deflection field must be thread-safe.
 *
 * **USDT Tracing:** MODULE_BATCH_SOLVER (solve/batch start and complete),
 * MODULE_ROOT_REFINER (iterations, terminal-status summary),
 * MODULE_SOLVER_CONFIG (validation_error).
 */

#pragma once

#include "src/lens/candidate_generator.hpp"
#include "src/lens/deflection_field.hpp"
#include "src/lens/solve_result.hpp"
#include "src/lens/solver_config.hpp"
#include "src/support/error_types.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <span>

namespace lensolve {

class LensEquationSolver {
public:
    /// Validate the configuration and prepare source-independent seeds
    ///
    /// An unset random_seed is drawn here, once; every later solve reuses it.
    ///
    /// @return MissingDeflectionField for a null field, or the first failing
    ///         check of validate_solver_config()
    static std::expected<LensEquationSolver, ValidationError> create(
        std::shared_ptr<const DeflectionField> field,
        const SolverConfig& config = {});

    /// All images of one source
    ///
    /// @return NonFiniteSource or ParameterCountMismatch on invalid input.
    ///         Finding no image is not an error (see SolveResult::diagnostic).
    std::expected<SolveResult, ValidationError> solve(
        Coordinate source, const LensParameters& params) const;

    /// Many sources behind one lens
    ///
    /// @return NonFiniteSource (index = source) or ParameterCountMismatch
    std::expected<BatchResult, ValidationError> solve_batch(
        std::span<const Coordinate> sources, const LensParameters& params) const;

    /// One parameter set per source
    ///
    /// @return BatchSizeMismatch when the spans differ in length, otherwise
    ///         as the single-parameter overload (index = offending entry)
    std::expected<BatchResult, ValidationError> solve_batch(
        std::span<const Coordinate> sources, std::span<const LensParameters> params) const;

    const SolverConfig& config() const noexcept { return config_; }
    const DeflectionField& field() const noexcept { return *field_; }

    /// Random seed in effect (configured or drawn at creation)
    uint64_t random_seed() const noexcept { return seed_; }

    /// Seeds used by every solve; empty for SeedStrategy::SourceTriangles
    std::span<const Coordinate> fixed_seeds() const noexcept { return generator_.fixed_seeds(); }

private:
    LensEquationSolver(std::shared_ptr<const DeflectionField> field,
                       const SolverConfig& config,
                       uint64_t seed);

    std::expected<void, ValidationError> validate_input(
        Coordinate source, const LensParameters& params, size_t index) const;

    /// Solve with inputs already validated
    SolveResult solve_validated(Coordinate source, std::span<const double> params) const;

    std::shared_ptr<const DeflectionField> field_;
    SolverConfig config_;
    uint64_t seed_;
    CandidateGenerator generator_;
};

/// One-shot solve (creates a solver for the call)
std::expected<SolveResult, ValidationError> solve_lens_equation(
    std::shared_ptr<const DeflectionField> field,
    Coordinate source,
    const LensParameters& params,
    const SolverConfig& config = {});

/// One-shot batch solve with shared parameters
std::expected<BatchResult, ValidationError> solve_lens_equation_batch(
    std::shared_ptr<const DeflectionField> field,
    std::span<const Coordinate> sources,
    const LensParameters& params,
    const SolverConfig& config = {});

/// One-shot batch solve with one parameter set per source
std::expected<BatchResult, ValidationError> solve_lens_equation_batch(
    std::shared_ptr<const DeflectionField> field,
    std::span<const Coordinate> sources,
    std::span<const LensParameters> params,
    const SolverConfig& config = {});

}  // namespace lensolve
