// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/coordinate.hpp"
#include "src/support/error_types.hpp"
#include <cmath>
#include <cstddef>
#include <expected>

namespace lensolve {

/// Square image-plane search box divided into resolution x resolution cells
///
/// Cell (i, j) has its center at
///
///   center + ((i + 0.5 - resolution/2) * cell, (j + 0.5 - resolution/2) * cell)
///
/// with cell = 2 * half_width / resolution. The offsets are computed so that
/// cell centers are exactly point-symmetric about the box center.
struct SearchGrid {
    size_t resolution = 40;
    double half_width = 3.0;
    Coordinate center{};

    double cell_width() const noexcept {
        return 2.0 * half_width / static_cast<double>(resolution);
    }

    /// Center of cell (i, j); i runs along x, j along y
    Coordinate cell_center(size_t i, size_t j) const noexcept {
        const double h = cell_width();
        const double half_n = 0.5 * static_cast<double>(resolution);
        const double u = (static_cast<double>(i) + 0.5) - half_n;
        const double v = (static_cast<double>(j) + 0.5) - half_n;
        return Coordinate{center.x + u * h, center.y + v * h};
    }

    size_t cell_count() const noexcept { return resolution * resolution; }

    /// Closed-box membership test
    bool contains(Coordinate p) const noexcept {
        return std::abs(p.x - center.x) <= half_width
            && std::abs(p.y - center.y) <= half_width;
    }
};

/// Check resolution > 0, finite positive half width and finite center
std::expected<void, ValidationError> validate_search_grid(const SearchGrid& grid);

}  // namespace lensolve
