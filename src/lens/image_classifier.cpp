// SPDX-License-Identifier: MIT
#include "src/lens/image_classifier.hpp"
#include "src/math/root_finding.hpp"
#include "src/support/lensolve_trace.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace lensolve {

std::vector<size_t> select_representatives(const CandidateBatch& batch, double merge_distance) {
    const auto status = batch.statuses();
    const auto residuals = batch.residual_norms();
    const auto positions = batch.positions();

    std::vector<size_t> order;
    for (size_t i = 0; i < batch.size(); ++i) {
        if (status[i] == CandidateStatus::Converged) {
            order.push_back(i);
        }
    }
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return residuals[a] < residuals[b];
    });

    std::vector<size_t> kept;
    for (size_t i : order) {
        const bool duplicate = std::any_of(kept.begin(), kept.end(), [&](size_t k) {
            return distance(positions[i], positions[k]) <= merge_distance;
        });
        if (!duplicate) {
            kept.push_back(i);
        }
    }
    return kept;
}

void order_images(std::vector<Image>& images) {
    std::sort(images.begin(), images.end(), [](const Image& a, const Image& b) {
        const double ma = std::abs(a.magnification);
        const double mb = std::abs(b.magnification);
        if (ma != mb) {
            return ma > mb;
        }
        const double aa = a.position.angle();
        const double ab = b.position.angle();
        if (aa != ab) {
            return aa < ab;
        }
        return a.position.norm() < b.position.norm();
    });
    for (size_t i = 0; i < images.size(); ++i) {
        images[i].index = i;
    }
}

SolveDiagnostic diagnose(size_t image_count,
                         std::optional<size_t> expected_images,
                         size_t escaped_roots) noexcept {
    if (image_count == 0) {
        return SolveDiagnostic::NoImages;
    }
    if (escaped_roots > 0) {
        return SolveDiagnostic::ImagesOutsideDomain;
    }
    if (expected_images.has_value() && image_count < *expected_images) {
        return SolveDiagnostic::FewerThanExpected;
    }
    return SolveDiagnostic::Complete;
}

SolveResult classify_images(const DeflectionField& field,
                            Coordinate source,
                            std::span<const double> params,
                            const CandidateBatch& batch,
                            const ClassifierConfig& config,
                            size_t escaped_roots)
{
    SolveResult result;
    auto& stats = result.candidates;
    stats.total = batch.size();
    stats.converged = batch.count(CandidateStatus::Converged);
    stats.diverged = batch.count(CandidateStatus::Diverged);
    stats.max_iterations_exceeded = batch.count(CandidateStatus::MaxIterationsExceeded);
    stats.out_of_domain = batch.count(CandidateStatus::OutOfDomain);
    stats.escaped = escaped_roots;

    const auto kept = select_representatives(batch, config.merge_distance);
    stats.merged = stats.converged - kept.size();

    const auto positions = batch.positions();

    std::vector<Coordinate> at;
    at.reserve(kept.size());
    for (size_t i : kept) {
        at.push_back(positions[i]);
    }
    std::vector<std::optional<DeflectionSample>> samples(at.size());
    field.evaluate_batch(at, params, samples);

    result.images.reserve(kept.size());
    for (size_t k = 0; k < kept.size(); ++k) {
        if (!samples[k].has_value()) {
            ++stats.discarded;
            continue;
        }
        const Jacobian2 jf = lens_equation_jacobian(samples[k]->jacobian);
        const double det = jf.determinant();
        if (!std::isfinite(det)) {
            ++stats.discarded;
            continue;
        }

        Image image;
        image.position = at[k];
        image.source = at[k] - samples[k]->deflection;
        image.magnification = det == 0.0 ? std::numeric_limits<double>::infinity() : 1.0 / det;
        image.residual_norm = distance(source, image.source);
        image.near_critical = is_near_singular(jf, config.damping_threshold);
        image.seed_index = kept[k];
        result.images.push_back(image);
    }

    order_images(result.images);
    result.diagnostic = diagnose(result.images.size(), config.expected_images, escaped_roots);

    LENSOLVE_TRACE_SOLVE_COMPLETE(result.images.size(),
                                  static_cast<int>(result.diagnostic),
                                  stats.merged);
    return result;
}

}  // namespace lensolve
