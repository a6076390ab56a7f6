// SPDX-License-Identifier: MIT
#include "src/lens/solver_config.hpp"
#include "src/support/lensolve_trace.h"
#include <cmath>

namespace lensolve {

namespace {

std::unexpected<ValidationError> reject(ValidationErrorCode code, double value) {
    LENSOLVE_TRACE_VALIDATION_ERROR(MODULE_SOLVER_CONFIG, static_cast<int>(code), value, 0);
    return std::unexpected(ValidationError(code, value));
}

}  // namespace

std::expected<void, ValidationError> validate_solver_config(const SolverConfig& config) {
    if (auto grid = validate_search_grid(config.search_grid()); !grid) {
        return std::unexpected(grid.error());
    }

    if (!(config.jitter >= 0.0 && config.jitter <= 1.0)) {
        return reject(ValidationErrorCode::InvalidJitter, config.jitter);
    }

    if (config.max_iterations == 0) {
        return reject(ValidationErrorCode::InvalidMaxIterations, 0.0);
    }

    if (!std::isfinite(config.convergence_tol) || config.convergence_tol <= 0.0) {
        return reject(ValidationErrorCode::InvalidConvergenceTolerance, config.convergence_tol);
    }

    if (!std::isfinite(config.merge_distance) || config.merge_distance <= config.convergence_tol) {
        return reject(ValidationErrorCode::InvalidMergeDistance, config.merge_distance);
    }

    if (!(config.damping_threshold > 0.0 && config.damping_threshold < 1.0)) {
        return reject(ValidationErrorCode::InvalidDampingThreshold, config.damping_threshold);
    }

    if (config.expected_images.has_value() && *config.expected_images == 0) {
        return reject(ValidationErrorCode::InvalidExpectedImages, 0.0);
    }

    if (config.seed_strategy == SeedStrategy::SourceTriangles) {
        if (auto tri = validate_triangle_search_config(config.triangle); !tri) {
            return std::unexpected(tri.error());
        }
    }

    return {};
}

}  // namespace lensolve
