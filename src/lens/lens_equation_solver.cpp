// SPDX-License-Identifier: MIT
#include "src/lens/lens_equation_solver.hpp"
#include "src/lens/candidate_batch.hpp"
#include "src/lens/image_classifier.hpp"
#include "src/lens/root_refiner.hpp"
#include "src/support/lensolve_trace.h"
#include "src/support/parallel.hpp"
#include <cmath>
#include <random>
#include <vector>

namespace lensolve {

namespace {

uint64_t draw_seed() {
    std::random_device rd;
    const uint64_t hi = rd();
    const uint64_t lo = rd();
    return (hi << 32) ^ lo;
}

size_t count_incomplete(const std::vector<SolveResult>& results) {
    size_t n = 0;
    for (const auto& r : results) {
        if (!r.is_complete()) {
            ++n;
        }
    }
    return n;
}

}  // namespace

std::expected<LensEquationSolver, ValidationError> LensEquationSolver::create(
    std::shared_ptr<const DeflectionField> field,
    const SolverConfig& config)
{
    if (!field) {
        LENSOLVE_TRACE_VALIDATION_ERROR(MODULE_SOLVER_CONFIG,
            static_cast<int>(ValidationErrorCode::MissingDeflectionField), 0.0, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::MissingDeflectionField));
    }
    if (auto ok = validate_solver_config(config); !ok) {
        return std::unexpected(ok.error());
    }

    const uint64_t seed = config.random_seed.has_value() ? *config.random_seed : draw_seed();
    return LensEquationSolver(std::move(field), config, seed);
}

LensEquationSolver::LensEquationSolver(std::shared_ptr<const DeflectionField> field,
                                       const SolverConfig& config,
                                       uint64_t seed)
    : field_(std::move(field))
    , config_(config)
    , seed_(seed)
    , generator_(config, seed)
{}

std::expected<void, ValidationError> LensEquationSolver::validate_input(
    Coordinate source, const LensParameters& params, size_t index) const
{
    if (!source.is_finite()) {
        const double value = std::isfinite(source.x) ? source.y : source.x;
        LENSOLVE_TRACE_VALIDATION_ERROR(MODULE_BATCH_SOLVER,
            static_cast<int>(ValidationErrorCode::NonFiniteSource), value, index);
        return std::unexpected(ValidationError(ValidationErrorCode::NonFiniteSource, value, index));
    }
    if (params.size() != field_->parameter_count()) {
        const double value = static_cast<double>(params.size());
        LENSOLVE_TRACE_VALIDATION_ERROR(MODULE_BATCH_SOLVER,
            static_cast<int>(ValidationErrorCode::ParameterCountMismatch), value, index);
        return std::unexpected(ValidationError(ValidationErrorCode::ParameterCountMismatch, value, index));
    }
    return {};
}

SolveResult LensEquationSolver::solve_validated(Coordinate source,
                                                std::span<const double> params) const
{
    std::vector<Coordinate> generated;
    std::span<const Coordinate> seeds = generator_.fixed_seeds();
    if (!generator_.is_source_independent()) {
        generated = generator_.generate(*field_, source, params);
        seeds = generated;
    }

    LENSOLVE_TRACE_SOLVE_START(source.x, source.y, seeds.size());

    CandidateBatch batch(seeds);
    const RefinerConfig refiner = RefinerConfig::from(config_);
    const RefinerStats refined = refine_candidates(*field_, source, params, refiner, batch);
    const size_t escaped = count_escaped_roots(*field_, source, params, refiner, batch);

    SolveResult result = classify_images(
        *field_, source, params, batch, ClassifierConfig::from(config_), escaped);
    result.candidates.passes = refined.passes;
    return result;
}

std::expected<SolveResult, ValidationError> LensEquationSolver::solve(
    Coordinate source, const LensParameters& params) const
{
    if (auto ok = validate_input(source, params, 0); !ok) {
        return std::unexpected(ok.error());
    }
    return solve_validated(source, params.values());
}

std::expected<BatchResult, ValidationError> LensEquationSolver::solve_batch(
    std::span<const Coordinate> sources, const LensParameters& params) const
{
    for (size_t i = 0; i < sources.size(); ++i) {
        if (auto ok = validate_input(sources[i], params, i); !ok) {
            return std::unexpected(ok.error());
        }
    }

    LENSOLVE_TRACE_BATCH_START(sources.size(), 1);

    std::vector<SolveResult> results(sources.size());
    const auto values = params.values();

    LENSOLVE_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (size_t i = 0; i < sources.size(); ++i) {
        results[i] = solve_validated(sources[i], values);
    }

    const size_t incomplete = count_incomplete(results);
    LENSOLVE_TRACE_BATCH_COMPLETE(sources.size(), incomplete);

    return BatchResult{
        .results = std::move(results),
        .incomplete_count = incomplete
    };
}

std::expected<BatchResult, ValidationError> LensEquationSolver::solve_batch(
    std::span<const Coordinate> sources, std::span<const LensParameters> params) const
{
    if (sources.size() != params.size()) {
        LENSOLVE_TRACE_VALIDATION_ERROR(MODULE_BATCH_SOLVER,
            static_cast<int>(ValidationErrorCode::BatchSizeMismatch),
            static_cast<double>(params.size()), sources.size());
        return std::unexpected(ValidationError(ValidationErrorCode::BatchSizeMismatch,
                                               static_cast<double>(params.size()),
                                               sources.size()));
    }
    for (size_t i = 0; i < sources.size(); ++i) {
        if (auto ok = validate_input(sources[i], params[i], i); !ok) {
            return std::unexpected(ok.error());
        }
    }

    LENSOLVE_TRACE_BATCH_START(sources.size(), 0);

    std::vector<SolveResult> results(sources.size());

    LENSOLVE_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (size_t i = 0; i < sources.size(); ++i) {
        results[i] = solve_validated(sources[i], params[i].values());
    }

    const size_t incomplete = count_incomplete(results);
    LENSOLVE_TRACE_BATCH_COMPLETE(sources.size(), incomplete);

    return BatchResult{
        .results = std::move(results),
        .incomplete_count = incomplete
    };
}

// ============================================================================
// Free functions
// ============================================================================

std::expected<SolveResult, ValidationError> solve_lens_equation(
    std::shared_ptr<const DeflectionField> field,
    Coordinate source,
    const LensParameters& params,
    const SolverConfig& config)
{
    auto solver = LensEquationSolver::create(std::move(field), config);
    if (!solver) {
        return std::unexpected(solver.error());
    }
    return solver->solve(source, params);
}

std::expected<BatchResult, ValidationError> solve_lens_equation_batch(
    std::shared_ptr<const DeflectionField> field,
    std::span<const Coordinate> sources,
    const LensParameters& params,
    const SolverConfig& config)
{
    auto solver = LensEquationSolver::create(std::move(field), config);
    if (!solver) {
        return std::unexpected(solver.error());
    }
    return solver->solve_batch(sources, params);
}

std::expected<BatchResult, ValidationError> solve_lens_equation_batch(
    std::shared_ptr<const DeflectionField> field,
    std::span<const Coordinate> sources,
    std::span<const LensParameters> params,
    const SolverConfig& config)
{
    auto solver = LensEquationSolver::create(std::move(field), config);
    if (!solver) {
        return std::unexpected(solver.error());
    }
    return solver->solve_batch(sources, params);
}

}  // namespace lensolve
