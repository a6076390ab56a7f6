// SPDX-License-Identifier: MIT
#include "src/lens/models/isothermal.hpp"
#include <cmath>

namespace lensolve {

namespace {

/// Axis ratios closer to 1 than this use the spherical closed form
constexpr double kRoundAxisTolerance = 1e-12;

/// Isothermal deflection about the origin of the lens frame
DeflectionSample isothermal_sphere(double scale, double dx, double dy, double r) {
    const double inv_r = 1.0 / r;
    const double inv_r3 = inv_r * inv_r * inv_r;

    DeflectionSample sample;
    sample.deflection = Coordinate{scale * dx * inv_r, scale * dy * inv_r};
    sample.jacobian << scale * dy * dy * inv_r3, -scale * dx * dy * inv_r3,
                       -scale * dx * dy * inv_r3, scale * dx * dx * inv_r3;
    return sample;
}

}  // namespace

std::optional<DeflectionSample> SingularIsothermalSphere::evaluate(
    Coordinate position, std::span<const double> params) const
{
    const double dx = position.x - params[CENTER_X];
    const double dy = position.y - params[CENTER_Y];
    const double r = std::hypot(dx, dy);
    if (r == 0.0) {
        return std::nullopt;
    }
    return isothermal_sphere(params[EINSTEIN_RADIUS], dx, dy, r);
}

std::optional<DeflectionSample> SingularIsothermalEllipsoid::evaluate(
    Coordinate position, std::span<const double> params) const
{
    const double b = params[SCALE];
    const double q = params[AXIS_RATIO];
    if (!(q > 0.0 && q <= 1.0)) {
        return std::nullopt;
    }

    const double c = std::cos(params[POSITION_ANGLE]);
    const double s = std::sin(params[POSITION_ANGLE]);
    const double dx = position.x - params[CENTER_X];
    const double dy = position.y - params[CENTER_Y];

    const double r = std::hypot(dx, dy);
    if (r == 0.0) {
        return std::nullopt;
    }

    if (1.0 - q < kRoundAxisTolerance) {
        return isothermal_sphere(b, dx, dy, r);
    }

    // Lens frame
    const double x = c * dx + s * dy;
    const double y = -s * dx + c * dy;

    const double e = std::sqrt(1.0 - q * q);
    const double psi = std::sqrt(q * q * x * x + y * y);
    const double amp = b * q / e;

    const double ax = amp * std::atan(e * x / psi);
    const double ay = amp * std::atanh(e * y / psi);

    const double denom = b * q / (psi * r * r);
    Jacobian2 local;
    local << denom * y * y, -denom * x * y,
             -denom * x * y, denom * x * x;

    Jacobian2 rot;
    rot << c, -s,
           s,  c;

    DeflectionSample sample;
    sample.deflection = Coordinate{c * ax - s * ay, s * ax + c * ay};
    sample.jacobian = rot * local * rot.transpose();
    return sample;
}

}  // namespace lensolve
