// SPDX-License-Identifier: MIT
/**
 * @file solver_config.hpp
 * @brief Lens equation solver configuration and validation
 *
 * Defaults are calibrated for lens models whose characteristic angular
 * scale (Einstein radius) is of order 1 in the caller's units:
 *
 *   convergence_tol  1e-8   |F| at which a candidate counts as a root
 *   merge_distance   1e-4   converged roots closer than this are one image
 *
 * merge_distance must exceed convergence_tol. Newton roots of the same image
 * scatter by about ||J_F^{-1}|| * convergence_tol, so the gap between the two
 * is what keeps one image from being reported twice.
 *
 * All three widths are absolute, in the lens's angular units. The solver
 * never rescales them from the parameters (those are opaque to it, and
 * regular and Latin hypercube seeds are laid out once at construction), so
 * for a model with Einstein radius R multiply bounding_half_width,
 * convergence_tol and merge_distance by R.
 */

#pragma once

#include "src/lens/search_grid.hpp"
#include "src/lens/triangle_search.hpp"
#include "src/math/coordinate.hpp"
#include "src/support/error_types.hpp"
#include <cstdint>
#include <expected>
#include <optional>
#include <ostream>
#include <string_view>

namespace lensolve {

/// Initial candidate placement policy
enum class SeedStrategy {
    RegularGrid,      ///< Cell-centred grid, optional jitter
    LatinHypercube,   ///< Stratified quasi-random samples over the box
    SourceTriangles   ///< Centroids of grid triangles whose source image contains the source
};

constexpr std::string_view to_string(SeedStrategy strategy) noexcept {
    switch (strategy) {
        case SeedStrategy::RegularGrid:     return "RegularGrid";
        case SeedStrategy::LatinHypercube:  return "LatinHypercube";
        case SeedStrategy::SourceTriangles: return "SourceTriangles";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, SeedStrategy strategy) {
    return os << to_string(strategy);
}

/// Lens equation solver configuration
///
/// Aggregate with defaults; override fields with designated initializers:
/// @code
/// SolverConfig config{
///     .grid_resolution = 60,
///     .bounding_half_width = 2.0,
///     .convergence_tol = 1e-10
/// };
/// @endcode
struct SolverConfig {
    /// Seeds per axis (RegularGrid, SourceTriangles); LatinHypercube uses
    /// grid_resolution^2 samples
    size_t grid_resolution = 40;

    /// Search box is grid_center +- bounding_half_width on both axes.
    /// Absolute angular units: scale it with the lens's Einstein radius
    double bounding_half_width = 3.0;

    Coordinate grid_center{};

    /// Seed displacement in units of the cell width, in [0, 1]. Each seed
    /// moves by up to +-jitter/2 cells per axis (RegularGrid only).
    double jitter = 0.0;

    /// Newton iteration cap per candidate
    size_t max_iterations = 50;

    /// Convergence tolerance on |F(theta)| (epsilon)
    double convergence_tol = 1e-8;

    /// Distinct-image separation (delta), must exceed convergence_tol
    double merge_distance = 1e-4;

    /// Relative determinant threshold for the damped step and the
    /// near_critical flag, in (0, 1)
    double damping_threshold = 1e-8;

    /// Seed of the random strategies; drawn once at solver creation if unset
    std::optional<uint64_t> random_seed;

    SeedStrategy seed_strategy = SeedStrategy::RegularGrid;

    /// Image count below which a result is flagged FewerThanExpected
    std::optional<size_t> expected_images;

    /// Settings of the SourceTriangles strategy (only max_solutions is
    /// unused there: every containing triangle becomes a seed)
    TriangleSearchConfig triangle{};

    SearchGrid search_grid() const noexcept {
        return SearchGrid{
            .resolution = grid_resolution,
            .half_width = bounding_half_width,
            .center = grid_center
        };
    }
};

/// Validate all solver settings
///
/// Checks run in field order and the first failure is returned.
std::expected<void, ValidationError> validate_solver_config(const SolverConfig& config);

}  // namespace lensolve
