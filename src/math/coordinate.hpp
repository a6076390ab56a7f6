// SPDX-License-Identifier: MIT
#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <ostream>

namespace lensolve {

/// 2x2 real matrix (deflection Jacobian, lens-equation Jacobian)
using Jacobian2 = Eigen::Matrix2d;

/// Point on the image plane or the source plane
///
/// Plain value type. All arithmetic returns new coordinates.
struct Coordinate {
    double x = 0.0;
    double y = 0.0;

    [[nodiscard]] double norm() const noexcept { return std::hypot(x, y); }
    [[nodiscard]] double squared_norm() const noexcept { return x * x + y * y; }

    /// Polar angle in (-pi, pi]
    [[nodiscard]] double angle() const noexcept { return std::atan2(y, x); }

    [[nodiscard]] bool is_finite() const noexcept {
        return std::isfinite(x) && std::isfinite(y);
    }

    [[nodiscard]] Eigen::Vector2d vec() const noexcept { return {x, y}; }

    static Coordinate from_vec(const Eigen::Vector2d& v) noexcept {
        return Coordinate{v(0), v(1)};
    }

    friend constexpr Coordinate operator+(Coordinate a, Coordinate b) noexcept {
        return {a.x + b.x, a.y + b.y};
    }
    friend constexpr Coordinate operator-(Coordinate a, Coordinate b) noexcept {
        return {a.x - b.x, a.y - b.y};
    }
    friend constexpr Coordinate operator-(Coordinate a) noexcept {
        return {-a.x, -a.y};
    }
    friend constexpr Coordinate operator*(double s, Coordinate a) noexcept {
        return {s * a.x, s * a.y};
    }
    friend constexpr Coordinate operator*(Coordinate a, double s) noexcept {
        return {s * a.x, s * a.y};
    }
    friend constexpr bool operator==(Coordinate a, Coordinate b) noexcept {
        return a.x == b.x && a.y == b.y;
    }
};

inline double distance(Coordinate a, Coordinate b) noexcept {
    return (a - b).norm();
}

inline std::ostream& operator<<(std::ostream& os, Coordinate c) {
    return os << "(" << c.x << ", " << c.y << ")";
}

}  // namespace lensolve
