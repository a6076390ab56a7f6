// SPDX-License-Identifier: MIT
/**
 * @file candidate_generator.hpp
 * @brief Initial image-plane seeds for the root refiner
 *
 * The Newton refiner only finds roots that some seed falls into the basin
 * of, so the seeds must cover the search box densely enough to land in every
 * image's basin. Three policies are provided (see SeedStrategy):
 *
 * - RegularGrid: cell centers of the search grid. With zero jitter the seed
 *   set is exactly point-symmetric about the box center. Jitter moves each
 *   seed uniformly within +-jitter/2 cells per axis, clamped to the box.
 * - LatinHypercube: grid_resolution^2 stratified samples over the box.
 * - SourceTriangles: centroids of the grid triangles whose source-plane image
 *   strictly contains the source, each shrunk around the image by
 *   triangle.iterations rounds of scale/subdivide/select. The seeds depend on
 *   the source and parameters and are produced per solve.
 *
 * Random policies use std::mt19937_64 and are deterministic for a fixed seed.
 */

#pragma once

#include "src/lens/deflection_field.hpp"
#include "src/lens/solver_config.hpp"
#include "src/lens/triangle_search.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace lensolve {

/// Cell-centred grid seeds, row-major (x fastest)
std::vector<Coordinate> grid_seeds(const SearchGrid& grid, double jitter, uint64_t seed);

/// resolution^2 Latin hypercube seeds over the search box
std::vector<Coordinate> latin_hypercube_seeds(const SearchGrid& grid, uint64_t seed);

/// Source-adapted seeds from source-plane triangle containment
///
/// @param triangles Triangulation of the search grid (triangulate_grid())
/// @param refine Scale/subdivide settings; max_solutions is not applied
std::vector<Coordinate> source_triangle_seeds(const DeflectionField& field,
                                              std::span<const Triangle> triangles,
                                              Coordinate source,
                                              std::span<const double> params,
                                              const TriangleSearchConfig& refine);

/// Seed provider bound to one validated configuration
///
/// Source-independent seed sets are generated once at construction and
/// shared read-only by every solve.
class CandidateGenerator {
public:
    /// @pre validate_solver_config(config) succeeded
    /// @param seed Resolved random seed
    CandidateGenerator(const SolverConfig& config, uint64_t seed);

    /// Seeds for one solve
    std::vector<Coordinate> generate(const DeflectionField& field,
                                     Coordinate source,
                                     std::span<const double> params) const;

    /// True when generate() ignores the source and parameters
    bool is_source_independent() const noexcept {
        return strategy_ != SeedStrategy::SourceTriangles;
    }

    SeedStrategy strategy() const noexcept { return strategy_; }

    /// Precomputed seeds (empty for SourceTriangles)
    std::span<const Coordinate> fixed_seeds() const noexcept { return fixed_seeds_; }

private:
    SeedStrategy strategy_;
    TriangleSearchConfig refine_;
    std::vector<Coordinate> fixed_seeds_;
    std::vector<Triangle> triangles_;
};

}  // namespace lensolve
