// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/coordinate.hpp"
#include <Eigen/Dense>
#include <cmath>

namespace lensolve {

/// One 2D Newton update for F(x) = 0
struct NewtonStep2D {
    /// Increment to add to the current iterate (x_{k+1} = x_k + delta)
    Eigen::Vector2d delta;

    /// det(J) at the current iterate
    double determinant;

    /// True when the Levenberg-Marquardt form was used
    bool damped;
};

/// Relative singularity test: |det J| < threshold * ||J||_F^2
///
/// For a 2x2 matrix |det J| <= ||J||_F^2 / 2, so the ratio is scale free and
/// only depends on the conditioning of J.
[[nodiscard]] inline bool is_near_singular(const Jacobian2& jacobian,
                                           double threshold) noexcept {
    return std::abs(jacobian.determinant()) < threshold * jacobian.squaredNorm();
}

/// Damped Newton step for a 2D system
///
/// Regular case: delta = -J^{-1} F.
///
/// Near-singular case (see is_near_singular): Levenberg-Marquardt step
///   delta = -(J^T J + lambda I)^{-1} J^T F,   lambda = threshold * ||J||_F^2
/// which stays bounded along the null direction of J while keeping the
/// Newton component along the well-conditioned direction.
///
/// The step may be non-finite (e.g. J == 0); callers must check.
///
/// @param jacobian J(x_k)
/// @param residual F(x_k)
/// @param damping_threshold Relative determinant threshold in (0, 1)
[[nodiscard]] inline NewtonStep2D damped_newton_step(const Jacobian2& jacobian,
                                                     const Eigen::Vector2d& residual,
                                                     double damping_threshold) noexcept {
    const double det = jacobian.determinant();
    const double scale = jacobian.squaredNorm();

    if (std::abs(det) < damping_threshold * scale) {
        const double lambda = damping_threshold * scale;
        const Jacobian2 normal = jacobian.transpose() * jacobian
                               + lambda * Jacobian2::Identity();
        const Eigen::Vector2d rhs = jacobian.transpose() * residual;
        return NewtonStep2D{
            .delta = -(normal.inverse() * rhs),
            .determinant = det,
            .damped = true
        };
    }

    return NewtonStep2D{
        .delta = -(jacobian.inverse() * residual),
        .determinant = det,
        .damped = false
    };
}

}  // namespace lensolve
