// SPDX-License-Identifier: MIT
#include "src/lens/root_refiner.hpp"
#include "src/math/root_finding.hpp"
#include "src/support/lensolve_trace.h"
#include <cmath>
#include <optional>
#include <vector>

namespace lensolve {

RefinerStats refine_candidates(const DeflectionField& field,
                               Coordinate source,
                               std::span<const double> params,
                               const RefinerConfig& config,
                               CandidateBatch& batch)
{
    RefinerStats stats;
    const size_t n = batch.size();

    auto positions = batch.positions();
    auto residuals = batch.residual_norms();
    auto iterations = batch.iterations();
    auto status = batch.statuses();

    std::vector<std::optional<DeflectionSample>> samples(n);
    size_t running = batch.count(CandidateStatus::Running);

    LENSOLVE_TRACE_REFINER_START(n, config.max_iterations, config.convergence_tol);

    for (size_t k = 0; k <= config.max_iterations && running > 0; ++k) {
        field.evaluate_batch(positions, params, samples);
        ++stats.passes;

        for (size_t i = 0; i < n; ++i) {
            if (status[i] != CandidateStatus::Running) {
                continue;
            }

            if (!samples[i].has_value()) {
                status[i] = CandidateStatus::Diverged;
                continue;
            }

            const Coordinate theta = positions[i];
            const Coordinate mapped = theta - samples[i]->deflection;
            const Coordinate f = source - mapped;
            const double fnorm = f.norm();

            if (!std::isfinite(fnorm)) {
                status[i] = CandidateStatus::Diverged;
                continue;
            }
            residuals[i] = fnorm;

            if (fnorm < config.convergence_tol) {
                status[i] = CandidateStatus::Converged;
                continue;
            }

            if (k == config.max_iterations) {
                status[i] = CandidateStatus::MaxIterationsExceeded;
                continue;
            }

            const Jacobian2 jf = lens_equation_jacobian(samples[i]->jacobian);
            const NewtonStep2D step = damped_newton_step(jf, f.vec(), config.damping_threshold);
            if (step.damped) {
                ++stats.damped_steps;
            }

            const Coordinate next = theta + Coordinate::from_vec(step.delta);
            if (!next.is_finite()) {
                status[i] = CandidateStatus::Diverged;
                continue;
            }
            if (!config.domain.contains(next)) {
                status[i] = CandidateStatus::OutOfDomain;
                continue;
            }

            positions[i] = next;
            ++iterations[i];
        }

        running = batch.count(CandidateStatus::Running);
        LENSOLVE_TRACE_REFINER_ITER(k, config.max_iterations, running);
    }

    const size_t converged = batch.count(CandidateStatus::Converged);
    if (converged > 0) {
        LENSOLVE_TRACE_CONVERGENCE_SUCCESS(MODULE_ROOT_REFINER, stats.passes, converged);
    }
    const size_t exhausted = batch.count(CandidateStatus::MaxIterationsExceeded);
    if (exhausted > 0) {
        LENSOLVE_TRACE_CONVERGENCE_FAILED(MODULE_ROOT_REFINER, config.max_iterations, exhausted);
    }
    LENSOLVE_TRACE_REFINER_SUMMARY(converged,
                                   batch.count(CandidateStatus::Diverged),
                                   exhausted,
                                   batch.count(CandidateStatus::OutOfDomain));
    LENSOLVE_TRACE_DAMPED_STEPS(stats.damped_steps);

    return stats;
}

size_t count_escaped_roots(const DeflectionField& field,
                           Coordinate source,
                           std::span<const double> params,
                           const RefinerConfig& config,
                           const CandidateBatch& batch)
{
    const auto status = batch.statuses();
    const auto positions = batch.positions();

    std::vector<Coordinate> starts;
    for (size_t i = 0; i < batch.size(); ++i) {
        if (status[i] == CandidateStatus::OutOfDomain) {
            starts.push_back(positions[i]);
        }
    }
    if (starts.empty()) {
        return 0;
    }

    RefinerConfig wide = config;
    wide.domain.half_width *= ESCAPE_BOX_FACTOR;

    CandidateBatch continued(starts);
    refine_candidates(field, source, params, wide, continued);

    size_t escaped = 0;
    const auto final_status = continued.statuses();
    const auto final_positions = continued.positions();
    for (size_t k = 0; k < continued.size(); ++k) {
        if (final_status[k] == CandidateStatus::Converged
            && !config.domain.contains(final_positions[k])) {
            ++escaped;
        }
    }

    LENSOLVE_TRACE_ESCAPED_ROOTS(starts.size(), escaped);
    return escaped;
}

}  // namespace lensolve
