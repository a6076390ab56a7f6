// SPDX-License-Identifier: MIT
#include "src/lens/image_classifier.hpp"
#include "src/lens/models/external_shear.hpp"
#include "src/lens/models/point_mass.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <vector>

namespace lensolve {
namespace {

/// Mark every candidate converged with the given residuals
CandidateBatch converged_batch(const std::vector<Coordinate>& positions,
                               const std::vector<double>& residuals) {
    CandidateBatch batch(positions);
    for (size_t i = 0; i < positions.size(); ++i) {
        batch.statuses()[i] = CandidateStatus::Converged;
        batch.residual_norms()[i] = residuals[i];
    }
    return batch;
}

class ImageClassifierTest : public ::testing::Test {
protected:
    ExternalShear identity_;             // alpha = 0 with zero shear
    LensParameters no_shear_{0.0, 0.0};

    PointMassLens point_mass_;
    LensParameters unit_mass_{1.0, 0.0, 0.0};

    ClassifierConfig config_{.merge_distance = 1e-4, .damping_threshold = 1e-8};
};

TEST_F(ImageClassifierTest, MergesWithinDistanceKeepingBestResidual) {
    auto batch = converged_batch({{1.0, 0.0}, {1.0 + 5e-5, 0.0}, {-1.0, 0.0}},
                                 {1e-9, 1e-10, 1e-9});

    auto kept = select_representatives(batch, 1e-4);
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0], 1u);  // smallest residual first
    EXPECT_EQ(kept[1], 2u);
}

TEST_F(ImageClassifierTest, EqualResidualsKeepSeedOrder) {
    auto batch = converged_batch({{0.0, 1.0}, {0.0, 1.0 + 1e-5}, {0.0, 1.0 - 1e-5}},
                                 {1e-9, 1e-9, 1e-9});

    auto kept = select_representatives(batch, 1e-4);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0], 0u);
}

TEST_F(ImageClassifierTest, IgnoresNonConverged) {
    auto batch = converged_batch({{1.0, 0.0}, {2.0, 0.0}, {3.0, 0.0}}, {1e-9, 1e-9, 1e-9});
    batch.statuses()[1] = CandidateStatus::OutOfDomain;
    batch.statuses()[2] = CandidateStatus::MaxIterationsExceeded;

    auto result = classify_images(identity_, {1.0, 0.0}, no_shear_.values(), batch, config_);
    ASSERT_EQ(result.images.size(), 1u);
    EXPECT_EQ(result.images[0].position, (Coordinate{1.0, 0.0}));
    EXPECT_EQ(result.candidates.total, 3u);
    EXPECT_EQ(result.candidates.converged, 1u);
    EXPECT_EQ(result.candidates.out_of_domain, 1u);
    EXPECT_EQ(result.candidates.max_iterations_exceeded, 1u);
}

TEST_F(ImageClassifierTest, KeptImagesPairwiseSeparated) {
    std::vector<Coordinate> positions;
    std::vector<double> residuals;
    for (int k = 0; k < 50; ++k) {
        positions.push_back({0.3 + 3e-5 * k, 0.0});
        residuals.push_back(1e-9 * ((k * 7) % 11));
    }
    auto batch = converged_batch(positions, residuals);

    auto result = classify_images(identity_, {0.3, 0.0}, no_shear_.values(), batch, config_);
    EXPECT_EQ(result.candidates.merged + result.images.size(), 50u);
    for (size_t a = 0; a < result.images.size(); ++a) {
        for (size_t b = a + 1; b < result.images.size(); ++b) {
            EXPECT_GT(distance(result.images[a].position, result.images[b].position), 1e-4);
        }
    }
}

TEST_F(ImageClassifierTest, PointMassMagnificationAndParity) {
    // On the axis det J_F = 1 - 1/r^4
    auto batch = converged_batch({{0.5, 0.0}, {2.0, 0.0}}, {1e-12, 1e-12});

    auto result = classify_images(point_mass_, {0.0, 0.0}, unit_mass_.values(), batch, config_);
    ASSERT_EQ(result.images.size(), 2u);

    const Image& bright = result.images[0];
    EXPECT_EQ(bright.position, (Coordinate{2.0, 0.0}));
    EXPECT_NEAR(bright.magnification, 16.0 / 15.0, 1e-12);
    EXPECT_EQ(bright.parity(), 1);
    EXPECT_EQ(bright.index, 0u);
    EXPECT_FALSE(bright.near_critical);
    EXPECT_DOUBLE_EQ(bright.source.x, 1.5);

    const Image& faint = result.images[1];
    EXPECT_NEAR(faint.magnification, -1.0 / 15.0, 1e-12);
    EXPECT_EQ(faint.parity(), -1);
    EXPECT_EQ(faint.index, 1u);
    EXPECT_EQ(faint.seed_index, 0u);
}

TEST_F(ImageClassifierTest, CriticalCurveGivesInfiniteMagnification) {
    auto batch = converged_batch({{1.0, 0.0}}, {1e-12});

    auto result = classify_images(point_mass_, {0.0, 0.0}, unit_mass_.values(), batch, config_);
    ASSERT_EQ(result.images.size(), 1u);
    EXPECT_TRUE(std::isinf(result.images[0].magnification));
    EXPECT_GT(result.images[0].magnification, 0.0);
    EXPECT_TRUE(result.images[0].near_critical);
}

TEST_F(ImageClassifierTest, UndefinedFieldDiscardsImage) {
    auto batch = converged_batch({{0.0, 0.0}}, {0.0});

    auto result = classify_images(point_mass_, {0.0, 0.0}, unit_mass_.values(), batch, config_);
    EXPECT_TRUE(result.images.empty());
    EXPECT_EQ(result.candidates.discarded, 1u);
    EXPECT_EQ(result.diagnostic, SolveDiagnostic::NoImages);
}

TEST_F(ImageClassifierTest, ResidualMeasuredAgainstSource) {
    auto batch = converged_batch({{0.25, -0.5}}, {0.0});

    auto result = classify_images(identity_, {0.25, -0.5 + 3e-9}, no_shear_.values(), batch, config_);
    ASSERT_EQ(result.images.size(), 1u);
    EXPECT_NEAR(result.images[0].residual_norm, 3e-9, 1e-15);
    EXPECT_EQ(result.images[0].source, (Coordinate{0.25, -0.5}));
}

// ============================================================================
// Ordering and diagnostics
// ============================================================================

TEST(OrderImagesTest, TiesBrokenByAngleThenRadius) {
    std::vector<Image> images(5);
    images[0].position = {-1.0, 0.0};   // angle pi
    images[1].position = {0.0, 1.0};    // pi/2
    images[2].position = {2.0, 0.0};    // 0, outer
    images[3].position = {0.0, -1.0};   // -pi/2
    images[4].position = {1.0, 0.0};    // 0, inner
    for (auto& im : images) {
        im.magnification = -3.0;
    }
    images[1].magnification = 4.0;

    order_images(images);

    EXPECT_EQ(images[0].position, (Coordinate{0.0, 1.0}));
    EXPECT_EQ(images[1].position, (Coordinate{0.0, -1.0}));
    EXPECT_EQ(images[2].position, (Coordinate{1.0, 0.0}));
    EXPECT_EQ(images[3].position, (Coordinate{2.0, 0.0}));
    EXPECT_EQ(images[4].position, (Coordinate{-1.0, 0.0}));
    for (size_t i = 0; i < images.size(); ++i) {
        EXPECT_EQ(images[i].index, i);
    }
}

TEST(DiagnoseTest, Outcomes) {
    EXPECT_EQ(diagnose(0, std::nullopt), SolveDiagnostic::NoImages);
    EXPECT_EQ(diagnose(0, 2), SolveDiagnostic::NoImages);
    EXPECT_EQ(diagnose(1, 2), SolveDiagnostic::FewerThanExpected);
    EXPECT_EQ(diagnose(2, 2), SolveDiagnostic::Complete);
    EXPECT_EQ(diagnose(5, 4), SolveDiagnostic::Complete);
    EXPECT_EQ(diagnose(1, std::nullopt), SolveDiagnostic::Complete);

    // Roots beyond the box outrank a short count, never an empty result
    EXPECT_EQ(diagnose(1, std::nullopt, 3), SolveDiagnostic::ImagesOutsideDomain);
    EXPECT_EQ(diagnose(1, 2, 3), SolveDiagnostic::ImagesOutsideDomain);
    EXPECT_EQ(diagnose(2, 2, 1), SolveDiagnostic::ImagesOutsideDomain);
    EXPECT_EQ(diagnose(0, std::nullopt, 5), SolveDiagnostic::NoImages);
}

TEST_F(ImageClassifierTest, ExpectedImagesFlagsShortResult) {
    auto batch = converged_batch({{1.0, 0.0}}, {0.0});
    ClassifierConfig expecting = config_;
    expecting.expected_images = 2;

    auto result = classify_images(identity_, {1.0, 0.0}, no_shear_.values(), batch, expecting);
    EXPECT_EQ(result.images.size(), 1u);
    EXPECT_EQ(result.diagnostic, SolveDiagnostic::FewerThanExpected);
    EXPECT_FALSE(result.is_complete());
}

TEST_F(ImageClassifierTest, EscapedRootsMarkResultIncomplete) {
    auto batch = converged_batch({{1.0, 0.0}}, {0.0});

    auto result = classify_images(identity_, {1.0, 0.0}, no_shear_.values(), batch, config_, 4);
    EXPECT_EQ(result.images.size(), 1u);
    EXPECT_EQ(result.candidates.escaped, 4u);
    EXPECT_EQ(result.diagnostic, SolveDiagnostic::ImagesOutsideDomain);
    EXPECT_FALSE(result.is_complete());
}

}  // namespace
}  // namespace lensolve
