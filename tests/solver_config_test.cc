// SPDX-License-Identifier: MIT
#include "src/lens/solver_config.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

namespace lensolve {
namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();

void expect_rejected(const SolverConfig& config, ValidationErrorCode code) {
    auto result = validate_solver_config(config);
    ASSERT_FALSE(result.has_value()) << "expected " << to_string(code);
    EXPECT_EQ(result.error().code, code) << result.error();
}

TEST(SolverConfigTest, DefaultValues) {
    SolverConfig config;

    EXPECT_EQ(config.grid_resolution, 40u);
    EXPECT_DOUBLE_EQ(config.bounding_half_width, 3.0);
    EXPECT_DOUBLE_EQ(config.grid_center.x, 0.0);
    EXPECT_DOUBLE_EQ(config.grid_center.y, 0.0);
    EXPECT_DOUBLE_EQ(config.jitter, 0.0);
    EXPECT_EQ(config.max_iterations, 50u);
    EXPECT_DOUBLE_EQ(config.convergence_tol, 1e-8);
    EXPECT_DOUBLE_EQ(config.merge_distance, 1e-4);
    EXPECT_DOUBLE_EQ(config.damping_threshold, 1e-8);
    EXPECT_FALSE(config.random_seed.has_value());
    EXPECT_EQ(config.seed_strategy, SeedStrategy::RegularGrid);
    EXPECT_FALSE(config.expected_images.has_value());
    EXPECT_EQ(config.triangle.max_solutions, 5u);
    EXPECT_EQ(config.triangle.iterations, 5u);
    EXPECT_DOUBLE_EQ(config.triangle.scale_factor, 2.0);
    EXPECT_EQ(config.triangle.subdivisions, 1u);

    EXPECT_TRUE(validate_solver_config(config).has_value());
}

TEST(SolverConfigTest, SearchGridMirrorsBox) {
    SolverConfig config{
        .grid_resolution = 10,
        .bounding_half_width = 2.0,
        .grid_center = {0.5, -0.25}
    };
    const SearchGrid grid = config.search_grid();
    EXPECT_EQ(grid.resolution, 10u);
    EXPECT_DOUBLE_EQ(grid.half_width, 2.0);
    EXPECT_DOUBLE_EQ(grid.center.x, 0.5);
    EXPECT_DOUBLE_EQ(grid.center.y, -0.25);
    EXPECT_DOUBLE_EQ(grid.cell_width(), 0.4);
}

TEST(SolverConfigTest, RejectsGridSettings) {
    expect_rejected({.grid_resolution = 0}, ValidationErrorCode::InvalidGridResolution);
    expect_rejected({.bounding_half_width = 0.0}, ValidationErrorCode::InvalidHalfWidth);
    expect_rejected({.bounding_half_width = -1.0}, ValidationErrorCode::InvalidHalfWidth);
    expect_rejected({.bounding_half_width = kInf}, ValidationErrorCode::InvalidHalfWidth);
    expect_rejected({.bounding_half_width = kNaN}, ValidationErrorCode::InvalidHalfWidth);
}

TEST(SolverConfigTest, RejectsNonFiniteCenterWithAxis) {
    auto result = validate_solver_config({.grid_center = {0.0, kNaN}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidGridCenter);
    EXPECT_EQ(result.error().index, 1u);
}

TEST(SolverConfigTest, RejectsJitterOutsideUnitInterval) {
    expect_rejected({.jitter = -0.1}, ValidationErrorCode::InvalidJitter);
    expect_rejected({.jitter = 1.5}, ValidationErrorCode::InvalidJitter);
    expect_rejected({.jitter = kNaN}, ValidationErrorCode::InvalidJitter);
    EXPECT_TRUE(validate_solver_config({.jitter = 1.0}).has_value());
}

TEST(SolverConfigTest, RejectsIterationAndTolerances) {
    expect_rejected({.max_iterations = 0}, ValidationErrorCode::InvalidMaxIterations);
    expect_rejected({.convergence_tol = 0.0}, ValidationErrorCode::InvalidConvergenceTolerance);
    expect_rejected({.convergence_tol = kNaN}, ValidationErrorCode::InvalidConvergenceTolerance);
    expect_rejected({.damping_threshold = 0.0}, ValidationErrorCode::InvalidDampingThreshold);
    expect_rejected({.damping_threshold = 1.0}, ValidationErrorCode::InvalidDampingThreshold);
}

TEST(SolverConfigTest, MergeDistanceMustExceedTolerance) {
    expect_rejected({.convergence_tol = 1e-6, .merge_distance = 1e-7},
                    ValidationErrorCode::InvalidMergeDistance);
    expect_rejected({.convergence_tol = 1e-6, .merge_distance = 1e-6},
                    ValidationErrorCode::InvalidMergeDistance);
    EXPECT_TRUE(validate_solver_config({.convergence_tol = 1e-6, .merge_distance = 1e-3}).has_value());
}

TEST(SolverConfigTest, RejectsZeroExpectedImages) {
    expect_rejected({.expected_images = 0}, ValidationErrorCode::InvalidExpectedImages);
    EXPECT_TRUE(validate_solver_config({.expected_images = 4}).has_value());
}

TEST(SolverConfigTest, TriangleSettingsCheckedForSourceTriangles) {
    SolverConfig config{
        .seed_strategy = SeedStrategy::SourceTriangles,
        .triangle = {.scale_factor = 0.5}
    };
    expect_rejected(config, ValidationErrorCode::InvalidTriangleSearch);

    // Unused by the grid strategy
    config.seed_strategy = SeedStrategy::RegularGrid;
    EXPECT_TRUE(validate_solver_config(config).has_value());
}

TEST(SolverConfigTest, FirstFailureWins) {
    SolverConfig config{.grid_resolution = 0, .jitter = 2.0, .max_iterations = 0};
    expect_rejected(config, ValidationErrorCode::InvalidGridResolution);
}

TEST(TriangleSearchConfigTest, Validation) {
    EXPECT_TRUE(validate_triangle_search_config({}).has_value());

    auto no_solutions = validate_triangle_search_config({.max_solutions = 0});
    ASSERT_FALSE(no_solutions.has_value());
    EXPECT_EQ(no_solutions.error().code, ValidationErrorCode::InvalidTriangleSearch);

    auto shrink = validate_triangle_search_config({.scale_factor = 0.9});
    ASSERT_FALSE(shrink.has_value());
    EXPECT_DOUBLE_EQ(shrink.error().value, 0.9);

    EXPECT_FALSE(validate_triangle_search_config({.subdivisions = 0}).has_value());
    EXPECT_TRUE(validate_triangle_search_config({.iterations = 0}).has_value());
}

}  // namespace
}  // namespace lensolve
