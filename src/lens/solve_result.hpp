// SPDX-License-Identifier: MIT
/**
 * @file solve_result.hpp
 * @brief Lens equation solve results (per source and per batch)
 */

#pragma once

#include "src/math/coordinate.hpp"
#include "src/support/error_types.hpp"
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace lensolve {

/// One lensed image of a source
struct Image {
    /// Image-plane position
    Coordinate position{};

    /// Source-plane position the image maps to (position - alpha(position))
    Coordinate source{};

    /// Signed magnification 1/det(J_F); the sign is the parity.
    /// +infinity when det(J_F) is exactly zero. Never zero.
    double magnification = 0.0;

    /// |beta - (theta - alpha(theta))| at the image
    double residual_norm = 0.0;

    /// |det J_F| below damping_threshold * ||J_F||_F^2
    bool near_critical = false;

    /// Position in the result ordering (descending |magnification|)
    size_t index = 0;

    /// Seed that converged to this image (for diagnostics)
    size_t seed_index = 0;

    /// +1 for positive parity (minima, maxima), -1 for saddle points
    int parity() const noexcept { return std::signbit(magnification) ? -1 : 1; }
};

/// Candidate outcome counts of one solve
struct CandidateStats {
    size_t total = 0;
    size_t converged = 0;
    size_t diverged = 0;
    size_t max_iterations_exceeded = 0;
    size_t out_of_domain = 0;

    /// OutOfDomain candidates that converged beyond the search box when
    /// continued in the wider box
    size_t escaped = 0;

    /// Converged candidates folded into an already kept image
    size_t merged = 0;

    /// Representatives dropped at classification (undefined field or
    /// non-finite determinant at the root)
    size_t discarded = 0;

    /// Lockstep passes of the refiner
    size_t passes = 0;
};

/// All images of one source
struct SolveResult {
    /// Images ordered by descending |magnification|, then ascending polar
    /// angle, then ascending radius
    std::vector<Image> images;

    SolveDiagnostic diagnostic = SolveDiagnostic::NoImages;

    CandidateStats candidates;

    size_t size() const noexcept { return images.size(); }
    bool empty() const noexcept { return images.empty(); }
    bool is_complete() const noexcept { return diagnostic == SolveDiagnostic::Complete; }
};

/// Fixed-capacity tabular view of a batch
///
/// Row r holds the first counts[r] images of source r in result order; cells
/// past that are padding with x = y = magnification = NaN and valid = 0.
/// Arrays are row-major with stride `capacity`.
struct PaddedImageTable {
    size_t rows = 0;
    size_t capacity = 0;

    std::vector<double> x;
    std::vector<double> y;
    std::vector<double> magnification;
    std::vector<uint8_t> valid;

    /// Images stored per row (<= capacity)
    std::vector<size_t> counts;

    /// Rows whose image count exceeded the capacity (faintest dropped)
    size_t truncated_count = 0;

    size_t offset(size_t row, size_t col) const noexcept { return row * capacity + col; }
    bool is_valid(size_t row, size_t col) const noexcept { return valid[offset(row, col)] != 0; }
};

/// Results of a batch solve, in input order
struct BatchResult {
    std::vector<SolveResult> results;

    /// Results whose diagnostic is not Complete
    size_t incomplete_count = 0;

    /// Padded/masked table of the batch
    ///
    /// @param capacity Images per row; defaults to the largest image count
    PaddedImageTable padded(std::optional<size_t> capacity = std::nullopt) const;
};

}  // namespace lensolve
