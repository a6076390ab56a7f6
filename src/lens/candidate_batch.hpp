// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/coordinate.hpp"
#include "src/support/error_types.hpp"
#include <algorithm>
#include <cstddef>
#include <limits>
#include <span>
#include <vector>

namespace lensolve {

/// Value snapshot of one candidate
struct Candidate {
    size_t seed_index = 0;
    Coordinate seed{};
    Coordinate position{};
    double residual_norm = 0.0;
    size_t iterations = 0;
    CandidateStatus status = CandidateStatus::Running;
};

/// Structure-of-arrays workspace for lockstep refinement
///
/// One entry per seed, in seed order. Positions are contiguous so that the
/// whole batch can be handed to DeflectionField::evaluate_batch() at once.
/// Entries are never removed; terminal candidates are masked by status.
class CandidateBatch {
public:
    explicit CandidateBatch(std::span<const Coordinate> seeds)
        : seeds_(seeds.begin(), seeds.end())
        , positions_(seeds.begin(), seeds.end())
        , residual_norms_(seeds.size(), std::numeric_limits<double>::infinity())
        , iterations_(seeds.size(), 0)
        , status_(seeds.size(), CandidateStatus::Running)
    {}

    size_t size() const noexcept { return seeds_.size(); }
    bool empty() const noexcept { return seeds_.empty(); }

    std::span<const Coordinate> seeds() const noexcept { return seeds_; }

    std::span<Coordinate> positions() noexcept { return positions_; }
    std::span<const Coordinate> positions() const noexcept { return positions_; }

    std::span<double> residual_norms() noexcept { return residual_norms_; }
    std::span<const double> residual_norms() const noexcept { return residual_norms_; }

    std::span<size_t> iterations() noexcept { return iterations_; }
    std::span<const size_t> iterations() const noexcept { return iterations_; }

    std::span<CandidateStatus> statuses() noexcept { return status_; }
    std::span<const CandidateStatus> statuses() const noexcept { return status_; }

    bool is_running(size_t i) const noexcept { return status_[i] == CandidateStatus::Running; }

    Candidate candidate(size_t i) const {
        return Candidate{
            .seed_index = i,
            .seed = seeds_[i],
            .position = positions_[i],
            .residual_norm = residual_norms_[i],
            .iterations = iterations_[i],
            .status = status_[i]
        };
    }

    size_t count(CandidateStatus status) const {
        return static_cast<size_t>(std::count(status_.begin(), status_.end(), status));
    }

private:
    std::vector<Coordinate> seeds_;
    std::vector<Coordinate> positions_;
    std::vector<double> residual_norms_;
    std::vector<size_t> iterations_;
    std::vector<CandidateStatus> status_;
};

}  // namespace lensolve
