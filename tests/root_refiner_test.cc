// SPDX-License-Identifier: MIT
#include "src/lens/root_refiner.hpp"
#include "src/lens/models/external_shear.hpp"
#include "src/lens/models/point_mass.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <vector>

namespace lensolve {
namespace {

class RootRefinerTest : public ::testing::Test {
protected:
    PointMassLens point_mass_;
    LensParameters unit_mass_{1.0, 0.0, 0.0};

    // Identity lens mapping (no deflection): F = beta - theta, J_F = -I
    ExternalShear shear_;
    LensParameters no_shear_{0.0, 0.0};

    RefinerConfig config_{
        .max_iterations = 50,
        .convergence_tol = 1e-10,
        .damping_threshold = 1e-8,
        .domain = {.resolution = 40, .half_width = 3.0}
    };
};

TEST_F(RootRefinerTest, ConvergesToPointMassImage) {
    std::vector<Coordinate> seeds{{1.3, 0.1}};
    CandidateBatch batch(seeds);

    auto stats = refine_candidates(point_mass_, {0.1, 0.0}, unit_mass_.values(), config_, batch);

    const Candidate c = batch.candidate(0);
    EXPECT_EQ(c.status, CandidateStatus::Converged);
    EXPECT_LT(c.residual_norm, 1e-10);
    EXPECT_NEAR(c.position.x, 0.5 * (0.1 + std::sqrt(4.01)), 1e-9);
    EXPECT_NEAR(c.position.y, 0.0, 1e-9);
    EXPECT_GT(c.iterations, 0u);
    EXPECT_LT(c.iterations, 20u);
    EXPECT_EQ(stats.passes, c.iterations + 1);
    EXPECT_EQ(stats.damped_steps, 0u);
}

TEST_F(RootRefinerTest, LinearMapConvergesInOneStep) {
    std::vector<Coordinate> seeds{{0.0, 0.0}};
    CandidateBatch batch(seeds);

    auto stats = refine_candidates(shear_, {0.3, 0.2}, no_shear_.values(), config_, batch);

    EXPECT_EQ(batch.statuses()[0], CandidateStatus::Converged);
    EXPECT_EQ(batch.iterations()[0], 1u);
    EXPECT_DOUBLE_EQ(batch.positions()[0].x, 0.3);
    EXPECT_DOUBLE_EQ(batch.positions()[0].y, 0.2);
    EXPECT_EQ(stats.passes, 2u);
}

TEST_F(RootRefinerTest, StepOutsideBoxIsOutOfDomain) {
    std::vector<Coordinate> seeds{{0.5, 0.5}};
    CandidateBatch batch(seeds);

    refine_candidates(shear_, {5.0, 0.0}, no_shear_.values(), config_, batch);

    const Candidate c = batch.candidate(0);
    EXPECT_EQ(c.status, CandidateStatus::OutOfDomain);
    // Last in-box position is kept
    EXPECT_EQ(c.position, (Coordinate{0.5, 0.5}));
    EXPECT_EQ(c.iterations, 0u);
}

TEST_F(RootRefinerTest, UndefinedDeflectionDiverges) {
    std::vector<Coordinate> seeds{{0.0, 0.0}};
    CandidateBatch batch(seeds);

    refine_candidates(point_mass_, {0.1, 0.0}, unit_mass_.values(), config_, batch);

    EXPECT_EQ(batch.statuses()[0], CandidateStatus::Diverged);
    EXPECT_EQ(batch.positions()[0], (Coordinate{0.0, 0.0}));
}

TEST_F(RootRefinerTest, IterationCapGivesMaxIterationsExceeded) {
    // On the x axis: f(x) = 0.1 - x + 1/x, one Newton step from x = 2
    // lands at 2 - 1.4/1.25 = 0.88
    std::vector<Coordinate> seeds{{2.0, 0.0}};
    CandidateBatch batch(seeds);
    RefinerConfig capped = config_;
    capped.max_iterations = 1;

    auto stats = refine_candidates(point_mass_, {0.1, 0.0}, unit_mass_.values(), capped, batch);

    const Candidate c = batch.candidate(0);
    EXPECT_EQ(c.status, CandidateStatus::MaxIterationsExceeded);
    EXPECT_EQ(c.iterations, 1u);
    EXPECT_NEAR(c.position.x, 0.88, 1e-12);
    EXPECT_NEAR(c.residual_norm, std::abs(0.1 - 0.88 + 1.0 / 0.88), 1e-12);
    EXPECT_EQ(stats.passes, 2u);
}

TEST_F(RootRefinerTest, TerminalCandidatesAreFrozen) {
    std::vector<Coordinate> seeds{{1.3, 0.1}, {0.0, 0.0}, {-1.2, 0.2}};
    CandidateBatch batch(seeds);
    refine_candidates(point_mass_, {0.1, 0.0}, unit_mass_.values(), config_, batch);

    std::vector<Candidate> before;
    for (size_t i = 0; i < batch.size(); ++i) {
        before.push_back(batch.candidate(i));
    }

    auto stats = refine_candidates(point_mass_, {0.1, 0.0}, unit_mass_.values(), config_, batch);
    EXPECT_EQ(stats.passes, 0u);
    for (size_t i = 0; i < batch.size(); ++i) {
        const Candidate after = batch.candidate(i);
        EXPECT_EQ(after.status, before[i].status);
        EXPECT_EQ(after.position, before[i].position);
        EXPECT_EQ(after.iterations, before[i].iterations);
    }
}

TEST_F(RootRefinerTest, LockstepMixedOutcomes) {
    std::vector<Coordinate> seeds{{1.3, 0.1}, {0.0, 0.0}, {-1.2, 0.2}};
    CandidateBatch batch(seeds);

    refine_candidates(point_mass_, {0.1, 0.0}, unit_mass_.values(), config_, batch);

    EXPECT_EQ(batch.statuses()[0], CandidateStatus::Converged);
    EXPECT_EQ(batch.statuses()[1], CandidateStatus::Diverged);
    EXPECT_EQ(batch.count(CandidateStatus::Running), 0u);
    EXPECT_EQ(batch.count(CandidateStatus::Converged)
            + batch.count(CandidateStatus::Diverged)
            + batch.count(CandidateStatus::OutOfDomain)
            + batch.count(CandidateStatus::MaxIterationsExceeded), 3u);

    // Seed order and provenance are preserved
    for (size_t i = 0; i < seeds.size(); ++i) {
        EXPECT_EQ(batch.candidate(i).seed_index, i);
        EXPECT_EQ(batch.candidate(i).seed, seeds[i]);
    }
}

TEST_F(RootRefinerTest, FromSolverConfig) {
    SolverConfig config{
        .grid_resolution = 8,
        .bounding_half_width = 2.5,
        .max_iterations = 12,
        .convergence_tol = 1e-9,
        .damping_threshold = 1e-6
    };
    const RefinerConfig r = RefinerConfig::from(config);
    EXPECT_EQ(r.max_iterations, 12u);
    EXPECT_DOUBLE_EQ(r.convergence_tol, 1e-9);
    EXPECT_DOUBLE_EQ(r.damping_threshold, 1e-6);
    EXPECT_DOUBLE_EQ(r.domain.half_width, 2.5);
}

// ============================================================================
// Escaped candidates
// ============================================================================

TEST_F(RootRefinerTest, EscapedCandidateFindsImageBeyondBox) {
    // Outer image at (0.1 + sqrt 4.01) / 2 = 1.0512 lies outside a unit box
    RefinerConfig small = config_;
    small.domain.half_width = 1.0;

    std::vector<Coordinate> seeds{{0.95, 0.0}, {-0.9, 0.0}};
    CandidateBatch batch(seeds);
    refine_candidates(point_mass_, {0.1, 0.0}, unit_mass_.values(), small, batch);

    ASSERT_EQ(batch.statuses()[0], CandidateStatus::OutOfDomain);
    ASSERT_EQ(batch.statuses()[1], CandidateStatus::Converged);

    const size_t escaped = count_escaped_roots(point_mass_, {0.1, 0.0}, unit_mass_.values(),
                                               small, batch);
    EXPECT_EQ(escaped, 1u);

    // The refined batch is left as it was
    EXPECT_EQ(batch.statuses()[0], CandidateStatus::OutOfDomain);
    EXPECT_EQ(batch.positions()[0], (Coordinate{0.95, 0.0}));
}

TEST_F(RootRefinerTest, EscapeCountOnlyRootsBetweenBoxes) {
    RefinerConfig small = config_;
    small.domain.half_width = 1.0;
    std::vector<Coordinate> seeds{{0.5, 0.5}};

    // Root at (1.5, 0): inside the doubled box
    CandidateBatch near(seeds);
    refine_candidates(shear_, {1.5, 0.0}, no_shear_.values(), small, near);
    ASSERT_EQ(near.statuses()[0], CandidateStatus::OutOfDomain);
    EXPECT_EQ(count_escaped_roots(shear_, {1.5, 0.0}, no_shear_.values(), small, near), 1u);

    // Root at (5, 0): beyond the doubled box as well
    CandidateBatch far(seeds);
    refine_candidates(shear_, {5.0, 0.0}, no_shear_.values(), small, far);
    ASSERT_EQ(far.statuses()[0], CandidateStatus::OutOfDomain);
    EXPECT_EQ(count_escaped_roots(shear_, {5.0, 0.0}, no_shear_.values(), small, far), 0u);
}

TEST_F(RootRefinerTest, NoEscapesWithoutOutOfDomainCandidates) {
    std::vector<Coordinate> seeds{{1.3, 0.1}, {-0.8, 0.2}};
    CandidateBatch batch(seeds);
    refine_candidates(point_mass_, {0.1, 0.0}, unit_mass_.values(), config_, batch);

    ASSERT_EQ(batch.count(CandidateStatus::OutOfDomain), 0u);
    EXPECT_EQ(count_escaped_roots(point_mass_, {0.1, 0.0}, unit_mass_.values(), config_, batch), 0u);
}

}  // namespace
}  // namespace lensolve
