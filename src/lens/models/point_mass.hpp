// SPDX-License-Identifier: MIT
#pragma once

#include "src/lens/deflection_field.hpp"

namespace lensolve {

/// Point-mass lens
///
/// Parameters: {theta_E, center_x, center_y}
///
///   alpha(theta) = theta_E^2 * d / |d|^2,   d = theta - center
///
/// Undefined at the lens center. Every source off the center has exactly two
/// images at radii |beta +- sqrt(beta^2 + 4 theta_E^2)| / 2 along the source
/// direction; the outer one has positive parity, the inner one negative.
class PointMassLens final : public DeflectionField {
public:
    static constexpr size_t EINSTEIN_RADIUS = 0;
    static constexpr size_t CENTER_X = 1;
    static constexpr size_t CENTER_Y = 2;
    static constexpr size_t PARAMETER_COUNT = 3;

    std::string_view name() const noexcept override { return "point_mass"; }
    size_t parameter_count() const noexcept override { return PARAMETER_COUNT; }

    std::optional<DeflectionSample> evaluate(
        Coordinate position, std::span<const double> params) const override;
};

}  // namespace lensolve
