// SPDX-License-Identifier: MIT
#include "src/lens/candidate_generator.hpp"
#include "src/support/lensolve_trace.h"
#include <algorithm>
#include <numeric>
#include <random>

namespace lensolve {

std::vector<Coordinate> grid_seeds(const SearchGrid& grid, double jitter, uint64_t seed) {
    const size_t n = grid.resolution;
    std::vector<Coordinate> seeds;
    seeds.reserve(n * n);

    for (size_t j = 0; j < n; ++j) {
        for (size_t i = 0; i < n; ++i) {
            seeds.push_back(grid.cell_center(i, j));
        }
    }

    if (jitter > 0.0) {
        std::mt19937_64 rng(seed);
        const double amplitude = 0.5 * jitter * grid.cell_width();
        std::uniform_real_distribution<double> offset(-amplitude, amplitude);

        const double lo_x = grid.center.x - grid.half_width;
        const double hi_x = grid.center.x + grid.half_width;
        const double lo_y = grid.center.y - grid.half_width;
        const double hi_y = grid.center.y + grid.half_width;

        for (auto& s : seeds) {
            s.x = std::clamp(s.x + offset(rng), lo_x, hi_x);
            s.y = std::clamp(s.y + offset(rng), lo_y, hi_y);
        }
    }

    LENSOLVE_TRACE_SEEDS_GENERATED(static_cast<int>(SeedStrategy::RegularGrid),
                                   seeds.size(), grid.half_width);
    return seeds;
}

std::vector<Coordinate> latin_hypercube_seeds(const SearchGrid& grid, uint64_t seed) {
    const size_t n = grid.cell_count();
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> within(0.0, 1.0);

    // One column and one row stratum per seed, paired by independent shuffles
    std::vector<size_t> column(n);
    std::vector<size_t> row(n);
    std::iota(column.begin(), column.end(), size_t{0});
    std::iota(row.begin(), row.end(), size_t{0});
    std::shuffle(column.begin(), column.end(), rng);
    std::shuffle(row.begin(), row.end(), rng);

    const double lo_x = grid.center.x - grid.half_width;
    const double lo_y = grid.center.y - grid.half_width;
    const double stratum = 2.0 * grid.half_width / static_cast<double>(n);

    std::vector<Coordinate> seeds;
    seeds.reserve(n);
    for (size_t k = 0; k < n; ++k) {
        const double u = static_cast<double>(column[k]) + within(rng);
        const double v = static_cast<double>(row[k]) + within(rng);
        seeds.push_back(Coordinate{lo_x + u * stratum, lo_y + v * stratum});
    }

    LENSOLVE_TRACE_SEEDS_GENERATED(static_cast<int>(SeedStrategy::LatinHypercube),
                                   seeds.size(), grid.half_width);
    return seeds;
}

std::vector<Coordinate> source_triangle_seeds(const DeflectionField& field,
                                              std::span<const Triangle> triangles,
                                              Coordinate source,
                                              std::span<const double> params,
                                              const TriangleSearchConfig& refine)
{
    const auto mapped = source_plane_triangles(field, triangles, params);
    const auto hits = containing_indices(mapped, source, triangles.size());

    std::vector<Coordinate> seeds;
    seeds.reserve(hits.size());

    for (size_t k : hits) {
        Triangle current = triangles[k];

        // Keep the last bracketing triangle if a round loses the source
        for (size_t round = 0; round < refine.iterations; ++round) {
            const Triangle scaled = scale_triangle(current, refine.scale_factor);
            const auto children = subdivide_triangles(std::span(&scaled, 1), refine.subdivisions);
            const auto child_src = source_plane_triangles(field, children, params);
            const auto inside = containing_indices(child_src, source, 1);
            if (inside.empty()) {
                break;
            }
            current = children[inside.front()];
        }
        seeds.push_back(centroid(current));
    }

    LENSOLVE_TRACE_SEEDS_GENERATED(static_cast<int>(SeedStrategy::SourceTriangles),
                                   seeds.size(), 0.0);
    return seeds;
}

CandidateGenerator::CandidateGenerator(const SolverConfig& config, uint64_t seed)
    : strategy_(config.seed_strategy)
    , refine_(config.triangle)
{
    const SearchGrid grid = config.search_grid();
    switch (strategy_) {
        case SeedStrategy::RegularGrid:
            fixed_seeds_ = grid_seeds(grid, config.jitter, seed);
            break;
        case SeedStrategy::LatinHypercube:
            fixed_seeds_ = latin_hypercube_seeds(grid, seed);
            break;
        case SeedStrategy::SourceTriangles:
            triangles_ = triangulate_grid(grid);
            break;
    }
}

std::vector<Coordinate> CandidateGenerator::generate(const DeflectionField& field,
                                                     Coordinate source,
                                                     std::span<const double> params) const
{
    if (strategy_ == SeedStrategy::SourceTriangles) {
        return source_triangle_seeds(field, triangles_, source, params, refine_);
    }
    return fixed_seeds_;
}

}  // namespace lensolve
