// SPDX-License-Identifier: MIT
#include "src/math/root_finding.hpp"
#include <gtest/gtest.h>
#include <cmath>

namespace lensolve {
namespace {

TEST(DampedNewtonStepTest, RegularStepIsNewton) {
    Jacobian2 j;
    j << 2.0, 1.0,
         0.0, 3.0;
    Eigen::Vector2d f(1.0, 2.0);

    auto step = damped_newton_step(j, f, 1e-8);

    EXPECT_FALSE(step.damped);
    EXPECT_DOUBLE_EQ(step.determinant, 6.0);
    EXPECT_NEAR(step.delta(0), -1.0 / 6.0, 1e-15);
    EXPECT_NEAR(step.delta(1), -2.0 / 3.0, 1e-15);

    // Full step solves the linearized system J delta = -F
    const Eigen::Vector2d lin = f + j * step.delta;
    EXPECT_NEAR(lin.norm(), 0.0, 1e-14);
}

TEST(DampedNewtonStepTest, SingularJacobianUsesLevenbergMarquardt) {
    // Rank one, consistent right-hand side
    Jacobian2 j;
    j << 1.0, 1.0,
         1.0, 1.0;
    Eigen::Vector2d f(1.0, 1.0);

    auto step = damped_newton_step(j, f, 1e-8);

    EXPECT_TRUE(step.damped);
    EXPECT_DOUBLE_EQ(step.determinant, 0.0);
    ASSERT_TRUE(step.delta.allFinite());
    // Minimum-norm solution along the range of J
    EXPECT_NEAR(step.delta(0), -0.5, 1e-7);
    EXPECT_NEAR(step.delta(1), -0.5, 1e-7);
}

TEST(DampedNewtonStepTest, DampedStepStaysBoundedNearSingularity) {
    Jacobian2 j;
    j << 1.0, 0.0,
         0.0, 1e-12;
    Eigen::Vector2d f(0.5, 0.5);

    auto damped = damped_newton_step(j, f, 1e-8);
    EXPECT_TRUE(damped.damped);
    // Undamped Newton would move by 5e11 along y
    EXPECT_LT(std::abs(damped.delta(1)), 1e9);
    EXPECT_NEAR(damped.delta(0), -0.5, 1e-7);
}

TEST(DampedNewtonStepTest, ZeroJacobianGivesNonFiniteStep) {
    Jacobian2 j = Jacobian2::Zero();
    Eigen::Vector2d f(1.0, 0.0);

    auto step = damped_newton_step(j, f, 1e-8);
    EXPECT_DOUBLE_EQ(step.determinant, 0.0);
    EXPECT_FALSE(step.delta.allFinite());
}

TEST(NearSingularTest, RelativeThreshold) {
    Jacobian2 identity = Jacobian2::Identity();
    EXPECT_FALSE(is_near_singular(identity, 1e-8));

    Jacobian2 thin;
    thin << 1.0, 0.0,
            0.0, 1e-10;
    EXPECT_TRUE(is_near_singular(thin, 1e-8));
    EXPECT_FALSE(is_near_singular(thin, 1e-12));

    // Scale free: multiplying by a constant does not change the verdict
    EXPECT_TRUE(is_near_singular(1e6 * thin, 1e-8));
    EXPECT_FALSE(is_near_singular(1e-6 * identity, 1e-8));
}

}  // namespace
}  // namespace lensolve
