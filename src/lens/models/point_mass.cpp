// SPDX-License-Identifier: MIT
#include "src/lens/models/point_mass.hpp"
#include <cmath>

namespace lensolve {

std::optional<DeflectionSample> PointMassLens::evaluate(
    Coordinate position, std::span<const double> params) const
{
    const double theta_e = params[EINSTEIN_RADIUS];
    const double dx = position.x - params[CENTER_X];
    const double dy = position.y - params[CENTER_Y];

    const double r2 = dx * dx + dy * dy;
    if (r2 == 0.0) {
        return std::nullopt;
    }

    const double te2 = theta_e * theta_e;
    const double inv_r2 = 1.0 / r2;
    const double inv_r4 = inv_r2 * inv_r2;

    DeflectionSample sample;
    sample.deflection = Coordinate{te2 * dx * inv_r2, te2 * dy * inv_r2};
    sample.jacobian << te2 * (dy * dy - dx * dx) * inv_r4, -2.0 * te2 * dx * dy * inv_r4,
                       -2.0 * te2 * dx * dy * inv_r4,      te2 * (dx * dx - dy * dy) * inv_r4;
    return sample;
}

}  // namespace lensolve
