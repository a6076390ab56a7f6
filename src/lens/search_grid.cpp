// SPDX-License-Identifier: MIT
#include "src/lens/search_grid.hpp"
#include "src/support/lensolve_trace.h"

namespace lensolve {

std::expected<void, ValidationError> validate_search_grid(const SearchGrid& grid) {
    if (grid.resolution == 0) {
        LENSOLVE_TRACE_VALIDATION_ERROR(MODULE_SOLVER_CONFIG,
            static_cast<int>(ValidationErrorCode::InvalidGridResolution), 0.0, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidGridResolution, 0.0));
    }
    if (!std::isfinite(grid.half_width) || grid.half_width <= 0.0) {
        LENSOLVE_TRACE_VALIDATION_ERROR(MODULE_SOLVER_CONFIG,
            static_cast<int>(ValidationErrorCode::InvalidHalfWidth), grid.half_width, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidHalfWidth, grid.half_width));
    }
    if (!grid.center.is_finite()) {
        const size_t axis = std::isfinite(grid.center.x) ? 1 : 0;
        const double value = axis == 0 ? grid.center.x : grid.center.y;
        LENSOLVE_TRACE_VALIDATION_ERROR(MODULE_SOLVER_CONFIG,
            static_cast<int>(ValidationErrorCode::InvalidGridCenter), value, axis);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidGridCenter, value, axis));
    }
    return {};
}

}  // namespace lensolve
