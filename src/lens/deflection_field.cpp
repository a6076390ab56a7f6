// SPDX-License-Identifier: MIT
#include "src/lens/deflection_field.hpp"
#include <algorithm>

namespace lensolve {

void DeflectionField::evaluate_batch(std::span<const Coordinate> positions,
                                     std::span<const double> params,
                                     std::span<std::optional<DeflectionSample>> out) const {
    const size_t n = std::min(positions.size(), out.size());
    for (size_t i = 0; i < n; ++i) {
        out[i] = evaluate(positions[i], params);
    }
}

std::optional<Coordinate> ray_shoot(const DeflectionField& field,
                                    Coordinate theta,
                                    std::span<const double> params) {
    auto sample = field.evaluate(theta, params);
    if (!sample.has_value()) {
        return std::nullopt;
    }
    return theta - sample->deflection;
}

}  // namespace lensolve
