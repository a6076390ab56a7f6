// SPDX-License-Identifier: MIT
/**
 * @file image_classifier.hpp
 * @brief Deduplicate converged candidates into images and classify them
 *
 * Converged candidates are visited in ascending residual order (stable, so
 * ties keep seed order). A candidate becomes a new image unless it lies
 * within merge_distance of an image already kept; the kept representative of
 * each cluster is therefore its best-converged member, and kept images are
 * pairwise more than merge_distance apart.
 *
 * Each representative is re-evaluated to obtain mu = 1/det(J_F). Images at
 * which the field is undefined or det(J_F) is non-finite are discarded.
 * Relatively singular determinants are kept and flagged near_critical; an
 * exactly zero determinant gives mu = +infinity.
 */

#pragma once

#include "src/lens/candidate_batch.hpp"
#include "src/lens/deflection_field.hpp"
#include "src/lens/solve_result.hpp"
#include "src/lens/solver_config.hpp"
#include <optional>
#include <span>
#include <vector>

namespace lensolve {

struct ClassifierConfig {
    double merge_distance = 1e-4;
    double damping_threshold = 1e-8;
    std::optional<size_t> expected_images;

    static ClassifierConfig from(const SolverConfig& config) noexcept {
        return ClassifierConfig{
            .merge_distance = config.merge_distance,
            .damping_threshold = config.damping_threshold,
            .expected_images = config.expected_images
        };
    }
};

/// Indices of the cluster representatives among the converged candidates,
/// in selection order (ascending residual)
std::vector<size_t> select_representatives(const CandidateBatch& batch, double merge_distance);

/// Sort images by descending |magnification|, ascending polar angle and
/// ascending radius, and assign Image::index
void order_images(std::vector<Image>& images);

/// Completeness of one solve, first match wins:
/// NoImages, ImagesOutsideDomain, FewerThanExpected, Complete
///
/// @param escaped_roots Candidates that converged beyond the search box
///        (count_escaped_roots())
SolveDiagnostic diagnose(size_t image_count,
                         std::optional<size_t> expected_images,
                         size_t escaped_roots = 0) noexcept;

/// Build the SolveResult of a refined candidate batch
///
/// Never fails: an empty or short image set is reported through
/// SolveResult::diagnostic.
SolveResult classify_images(const DeflectionField& field,
                            Coordinate source,
                            std::span<const double> params,
                            const CandidateBatch& batch,
                            const ClassifierConfig& config,
                            size_t escaped_roots = 0);

}  // namespace lensolve
