// SPDX-License-Identifier: MIT
/**
 * @file triangle_search.hpp
 * @brief Image finder by source-plane triangle containment
 *
 * The search box is triangulated (each cell split along its diagonal into two
 * triangles) and every vertex is ray-shot to the source plane. A triangle
 * whose source-plane image strictly contains the source point brackets an
 * image. Selected triangles are then refined iteratively:
 *
 *   1. scale about the centroid by sqrt(scale_factor) (area x scale_factor)
 *   2. subdivide into 4 congruent triangles, `subdivisions` times
 *   3. ray-shoot and keep the sub-triangles that still contain the source
 *
 * Each iteration shrinks the bracketing triangles by a linear factor of
 * sqrt(scale_factor / 4^subdivisions), so the image-plane centroids converge
 * geometrically (see estimate_accuracy()).
 *
 * Points lying exactly on a triangle edge are not contained; a source that
 * falls on an edge of the initial triangulation can therefore be missed.
 *
 * The search is used standalone and as the SourceTriangles seed strategy of
 * the candidate generator.
 */

#pragma once

#include "src/lens/deflection_field.hpp"
#include "src/lens/search_grid.hpp"
#include "src/support/error_types.hpp"
#include <array>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace lensolve {

/// Refinement settings of the triangle search
struct TriangleSearchConfig {
    /// Maximum number of triangles kept per iteration (e.g. 5 for a quad
    /// including the central image)
    size_t max_solutions = 5;

    /// Number of scale/subdivide/select iterations
    size_t iterations = 5;

    /// Area factor applied about the centroid before subdividing (>= 1)
    double scale_factor = 2.0;

    /// Number of 4-way subdivisions per iteration (>= 1)
    size_t subdivisions = 1;
};

/// Validate triangle search settings
///
/// @return InvalidTriangleSearch with the offending value on failure
std::expected<void, ValidationError> validate_triangle_search_config(const TriangleSearchConfig& config);

/// Triangle given by its three vertices
using Triangle = std::array<Coordinate, 3>;

/// Two triangles per grid cell, cells in row-major order (x fastest)
///
/// For a cell with corners LL, LR, UL, UR the triangles are (LL, LR, UL) and
/// (LR, UR, UL); both are counter-clockwise.
std::vector<Triangle> triangulate_grid(const SearchGrid& grid);

/// Ray-shoot every vertex of every triangle to the source plane
///
/// Uses one batched field evaluation for all 3 * n vertices. A triangle with
/// any undefined vertex maps to nullopt.
std::vector<std::optional<Triangle>> source_plane_triangles(
    const DeflectionField& field,
    std::span<const Triangle> image_triangles,
    std::span<const double> params);

/// Strict containment: true only if the point is inside, not on an edge
bool triangle_contains(const Triangle& triangle, Coordinate point) noexcept;

/// Indices of the triangles that strictly contain the point
///
/// @param limit Stop after this many matches
std::vector<size_t> containing_indices(std::span<const std::optional<Triangle>> triangles,
                                       Coordinate point,
                                       size_t limit);

Coordinate centroid(const Triangle& triangle) noexcept;

/// Signed area; positive for counter-clockwise vertex order
///
/// In the source plane a negative sign marks a parity flip of the mapping.
double signed_area(const Triangle& triangle) noexcept;

/// Scale a triangle about its centroid so that its area grows by area_factor
Triangle scale_triangle(const Triangle& triangle, double area_factor) noexcept;

/// Split each triangle into 4 congruent triangles, repeated `times` times
///
/// The 4^times children of each input triangle are stored contiguously.
std::vector<Triangle> subdivide_triangles(std::span<const Triangle> triangles, size_t times);

/// Result of a triangle search
struct TriangleSearchResult {
    /// Image-plane centroids of the final bracketing triangles
    std::vector<Coordinate> images;

    /// Source-plane centroids of the same triangles
    std::vector<Coordinate> sources;

    /// Number of refinement iterations performed
    size_t iterations = 0;
};

/// Standalone triangle image finder bound to one deflection field and grid
///
/// Immutable after create(); search() is const and thread-safe.
class TriangleImageSearch {
public:
    /// Validate grid and settings and build the initial triangulation
    ///
    /// @return ValidationError for a null field, invalid grid or settings
    static std::expected<TriangleImageSearch, ValidationError> create(
        std::shared_ptr<const DeflectionField> field,
        const SearchGrid& grid,
        const TriangleSearchConfig& config = {});

    /// Locate the images of one source position
    ///
    /// At most max_solutions images are returned. Fewer are returned when
    /// fewer triangles bracket the source.
    ///
    /// @return NonFiniteSource or ParameterCountMismatch on invalid input
    std::expected<TriangleSearchResult, ValidationError> search(
        Coordinate source, const LensParameters& params) const;

    /// Expected image-plane accuracy of search() with the bound settings
    double estimate_accuracy() const noexcept;

    /// pixel_scale * (scale_factor / 4^subdivisions)^(iterations / 2)
    static double estimate_accuracy(double pixel_scale,
                                    size_t iterations,
                                    double scale_factor,
                                    size_t subdivisions) noexcept;

    const SearchGrid& grid() const noexcept { return grid_; }
    const TriangleSearchConfig& config() const noexcept { return config_; }
    std::span<const Triangle> initial_triangles() const noexcept { return triangles_; }

private:
    TriangleImageSearch(std::shared_ptr<const DeflectionField> field,
                        const SearchGrid& grid,
                        const TriangleSearchConfig& config);

    std::shared_ptr<const DeflectionField> field_;
    SearchGrid grid_;
    TriangleSearchConfig config_;
    std::vector<Triangle> triangles_;
};

}  // namespace lensolve
