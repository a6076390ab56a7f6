// SPDX-License-Identifier: MIT
/**
 * @file isothermal.hpp
 * @brief Singular isothermal lens models (sphere and ellipsoid)
 */

#pragma once

#include "src/lens/deflection_field.hpp"

namespace lensolve {

/// Singular isothermal sphere
///
/// Parameters: {theta_E, center_x, center_y}
///
///   alpha(theta) = theta_E * d / |d|,   d = theta - center
///
/// Constant-magnitude deflection; undefined at the center. A source at
/// |beta| < theta_E has two images at radii theta_E +- |beta|.
class SingularIsothermalSphere final : public DeflectionField {
public:
    static constexpr size_t EINSTEIN_RADIUS = 0;
    static constexpr size_t CENTER_X = 1;
    static constexpr size_t CENTER_Y = 2;
    static constexpr size_t PARAMETER_COUNT = 3;

    std::string_view name() const noexcept override { return "singular_isothermal_sphere"; }
    size_t parameter_count() const noexcept override { return PARAMETER_COUNT; }

    std::optional<DeflectionSample> evaluate(
        Coordinate position, std::span<const double> params) const override;
};

/// Singular isothermal ellipsoid
///
/// Parameters: {b, q, phi, center_x, center_y}
///
/// b is the deflection scale, q in (0, 1] the axis ratio and phi the
/// position angle of the major axis (radians, counter-clockwise from +x).
/// In the frame aligned with the major axis:
///
///   alpha'_x = b q / e * atan (e x / psi)
///   alpha'_y = b q / e * atanh(e y / psi)
///
/// with e = sqrt(1 - q^2) and psi = sqrt(q^2 x^2 + y^2). q == 1 reduces to the
/// singular isothermal sphere with theta_E = b.
///
/// Undefined at the center and for q outside (0, 1].
class SingularIsothermalEllipsoid final : public DeflectionField {
public:
    static constexpr size_t SCALE = 0;
    static constexpr size_t AXIS_RATIO = 1;
    static constexpr size_t POSITION_ANGLE = 2;
    static constexpr size_t CENTER_X = 3;
    static constexpr size_t CENTER_Y = 4;
    static constexpr size_t PARAMETER_COUNT = 5;

    std::string_view name() const noexcept override { return "singular_isothermal_ellipsoid"; }
    size_t parameter_count() const noexcept override { return PARAMETER_COUNT; }

    std::optional<DeflectionSample> evaluate(
        Coordinate position, std::span<const double> params) const override;
};

}  // namespace lensolve
