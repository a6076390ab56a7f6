// SPDX-License-Identifier: MIT
#pragma once

#include "src/lens/deflection_field.hpp"

namespace lensolve {

/// External shear about the origin
///
/// Parameters: {gamma_1, gamma_2}
///
///   alpha(theta) = (gamma_1 x + gamma_2 y, gamma_2 x - gamma_1 y)
///
/// Defined everywhere; the Jacobian is constant. Usually combined with a
/// mass model through CompositeLens.
class ExternalShear final : public DeflectionField {
public:
    static constexpr size_t GAMMA_1 = 0;
    static constexpr size_t GAMMA_2 = 1;
    static constexpr size_t PARAMETER_COUNT = 2;

    std::string_view name() const noexcept override { return "external_shear"; }
    size_t parameter_count() const noexcept override { return PARAMETER_COUNT; }

    std::optional<DeflectionSample> evaluate(
        Coordinate position, std::span<const double> params) const override;
};

}  // namespace lensolve
