// SPDX-License-Identifier: MIT
#include "src/lens/triangle_search.hpp"
#include "src/support/lensolve_trace.h"
#include <cmath>

namespace lensolve {

namespace {

/// z-component of a x b
double cross(Coordinate a, Coordinate b) noexcept {
    return a.x * b.y - a.y * b.x;
}

int sign(double v) noexcept {
    return (v > 0.0) - (v < 0.0);
}

Coordinate midpoint(Coordinate a, Coordinate b) noexcept {
    return 0.5 * (a + b);
}

}  // namespace

std::expected<void, ValidationError> validate_triangle_search_config(const TriangleSearchConfig& config) {
    if (config.max_solutions == 0) {
        LENSOLVE_TRACE_VALIDATION_ERROR(MODULE_TRIANGLE_SEARCH,
            static_cast<int>(ValidationErrorCode::InvalidTriangleSearch), 0.0, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTriangleSearch, 0.0, 0));
    }
    if (!std::isfinite(config.scale_factor) || config.scale_factor < 1.0) {
        LENSOLVE_TRACE_VALIDATION_ERROR(MODULE_TRIANGLE_SEARCH,
            static_cast<int>(ValidationErrorCode::InvalidTriangleSearch), config.scale_factor, 2);
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidTriangleSearch, config.scale_factor, 2));
    }
    if (config.subdivisions == 0) {
        LENSOLVE_TRACE_VALIDATION_ERROR(MODULE_TRIANGLE_SEARCH,
            static_cast<int>(ValidationErrorCode::InvalidTriangleSearch), 0.0, 3);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTriangleSearch, 0.0, 3));
    }
    return {};
}

std::vector<Triangle> triangulate_grid(const SearchGrid& grid) {
    const size_t n = grid.resolution;
    const double delta = 0.5 * grid.cell_width();

    std::vector<Triangle> triangles;
    triangles.reserve(2 * n * n);

    for (size_t j = 0; j < n; ++j) {
        for (size_t i = 0; i < n; ++i) {
            const Coordinate c = grid.cell_center(i, j);
            const Coordinate ll{c.x - delta, c.y - delta};
            const Coordinate lr{c.x + delta, c.y - delta};
            const Coordinate ul{c.x - delta, c.y + delta};
            const Coordinate ur{c.x + delta, c.y + delta};
            triangles.push_back({ll, lr, ul});
            triangles.push_back({lr, ur, ul});
        }
    }
    return triangles;
}

std::vector<std::optional<Triangle>> source_plane_triangles(
    const DeflectionField& field,
    std::span<const Triangle> image_triangles,
    std::span<const double> params)
{
    const size_t n = image_triangles.size();

    std::vector<Coordinate> vertices;
    vertices.reserve(3 * n);
    for (const auto& t : image_triangles) {
        vertices.insert(vertices.end(), t.begin(), t.end());
    }

    std::vector<std::optional<DeflectionSample>> samples(vertices.size());
    field.evaluate_batch(vertices, params, samples);

    std::vector<std::optional<Triangle>> source(n);
    for (size_t k = 0; k < n; ++k) {
        Triangle mapped;
        bool defined = true;
        for (size_t v = 0; v < 3; ++v) {
            const auto& s = samples[3 * k + v];
            if (!s.has_value()) {
                defined = false;
                break;
            }
            mapped[v] = vertices[3 * k + v] - s->deflection;
        }
        if (defined) {
            source[k] = mapped;
        }
    }
    return source;
}

bool triangle_contains(const Triangle& triangle, Coordinate point) noexcept {
    const Coordinate d0 = triangle[0] - point;
    const Coordinate d1 = triangle[1] - point;
    const Coordinate d2 = triangle[2] - point;

    const int s = sign(cross(d0, d1)) + sign(cross(d1, d2)) + sign(cross(d2, d0));
    return std::abs(s) == 3;
}

std::vector<size_t> containing_indices(std::span<const std::optional<Triangle>> triangles,
                                       Coordinate point,
                                       size_t limit)
{
    std::vector<size_t> indices;
    for (size_t k = 0; k < triangles.size() && indices.size() < limit; ++k) {
        if (triangles[k].has_value() && triangle_contains(*triangles[k], point)) {
            indices.push_back(k);
        }
    }
    return indices;
}

Coordinate centroid(const Triangle& triangle) noexcept {
    return (1.0 / 3.0) * (triangle[0] + triangle[1] + triangle[2]);
}

double signed_area(const Triangle& triangle) noexcept {
    return 0.5 * cross(triangle[1] - triangle[0], triangle[2] - triangle[1]);
}

Triangle scale_triangle(const Triangle& triangle, double area_factor) noexcept {
    const Coordinate c = centroid(triangle);
    const double s = std::sqrt(area_factor);
    return {c + s * (triangle[0] - c),
            c + s * (triangle[1] - c),
            c + s * (triangle[2] - c)};
}

std::vector<Triangle> subdivide_triangles(std::span<const Triangle> triangles, size_t times) {
    std::vector<Triangle> current(triangles.begin(), triangles.end());

    for (size_t pass = 0; pass < times; ++pass) {
        std::vector<Triangle> next;
        next.reserve(4 * current.size());
        for (const auto& t : current) {
            const Coordinate m01 = midpoint(t[0], t[1]);
            const Coordinate m12 = midpoint(t[1], t[2]);
            const Coordinate m20 = midpoint(t[2], t[0]);
            next.push_back({t[0], m01, m20});
            next.push_back({m01, t[1], m12});
            next.push_back({m20, m01, m12});
            next.push_back({m20, m12, t[2]});
        }
        current = std::move(next);
    }
    return current;
}

// ============================================================================
// TriangleImageSearch
// ============================================================================

std::expected<TriangleImageSearch, ValidationError> TriangleImageSearch::create(
    std::shared_ptr<const DeflectionField> field,
    const SearchGrid& grid,
    const TriangleSearchConfig& config)
{
    if (!field) {
        LENSOLVE_TRACE_VALIDATION_ERROR(MODULE_TRIANGLE_SEARCH,
            static_cast<int>(ValidationErrorCode::MissingDeflectionField), 0.0, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::MissingDeflectionField));
    }
    if (auto ok = validate_search_grid(grid); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = validate_triangle_search_config(config); !ok) {
        return std::unexpected(ok.error());
    }
    return TriangleImageSearch(std::move(field), grid, config);
}

TriangleImageSearch::TriangleImageSearch(std::shared_ptr<const DeflectionField> field,
                                         const SearchGrid& grid,
                                         const TriangleSearchConfig& config)
    : field_(std::move(field))
    , grid_(grid)
    , config_(config)
    , triangles_(triangulate_grid(grid))
{}

std::expected<TriangleSearchResult, ValidationError> TriangleImageSearch::search(
    Coordinate source, const LensParameters& params) const
{
    if (!source.is_finite()) {
        const double value = std::isfinite(source.x) ? source.y : source.x;
        LENSOLVE_TRACE_VALIDATION_ERROR(MODULE_TRIANGLE_SEARCH,
            static_cast<int>(ValidationErrorCode::NonFiniteSource), value, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::NonFiniteSource, value));
    }
    if (params.size() != field_->parameter_count()) {
        LENSOLVE_TRACE_VALIDATION_ERROR(MODULE_TRIANGLE_SEARCH,
            static_cast<int>(ValidationErrorCode::ParameterCountMismatch),
            static_cast<double>(params.size()), 0);
        return std::unexpected(ValidationError(
            ValidationErrorCode::ParameterCountMismatch, static_cast<double>(params.size())));
    }

    LENSOLVE_TRACE_TRIANGLE_START(triangles_.size(), config_.iterations, config_.max_solutions);

    auto src = source_plane_triangles(*field_, triangles_, params.values());
    std::vector<Triangle> selection;
    for (size_t k : containing_indices(src, source, config_.max_solutions)) {
        selection.push_back(triangles_[k]);
    }

    size_t iter = 0;
    for (; iter < config_.iterations && !selection.empty(); ++iter) {
        for (auto& t : selection) {
            t = scale_triangle(t, config_.scale_factor);
        }
        auto refined = subdivide_triangles(selection, config_.subdivisions);
        src = source_plane_triangles(*field_, refined, params.values());

        selection.clear();
        for (size_t k : containing_indices(src, source, config_.max_solutions)) {
            selection.push_back(refined[k]);
        }
        LENSOLVE_TRACE_TRIANGLE_ITER(iter, selection.size());
    }

    TriangleSearchResult result;
    result.iterations = iter;
    src = source_plane_triangles(*field_, selection, params.values());
    for (size_t k = 0; k < selection.size(); ++k) {
        result.images.push_back(centroid(selection[k]));
        // Containment above guarantees every vertex was defined
        result.sources.push_back(src[k].has_value() ? centroid(*src[k]) : source);
    }

    LENSOLVE_TRACE_TRIANGLE_COMPLETE(iter, result.images.size());
    return result;
}

double TriangleImageSearch::estimate_accuracy() const noexcept {
    return estimate_accuracy(grid_.cell_width(), config_.iterations,
                             config_.scale_factor, config_.subdivisions);
}

double TriangleImageSearch::estimate_accuracy(double pixel_scale,
                                              size_t iterations,
                                              double scale_factor,
                                              size_t subdivisions) noexcept {
    const double shrink = scale_factor / std::pow(4.0, static_cast<double>(subdivisions));
    return pixel_scale * std::pow(shrink, 0.5 * static_cast<double>(iterations));
}

}  // namespace lensolve
