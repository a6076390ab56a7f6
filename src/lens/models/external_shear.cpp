// SPDX-License-Identifier: MIT
#include "src/lens/models/external_shear.hpp"

namespace lensolve {

std::optional<DeflectionSample> ExternalShear::evaluate(
    Coordinate position, std::span<const double> params) const
{
    const double g1 = params[GAMMA_1];
    const double g2 = params[GAMMA_2];

    DeflectionSample sample;
    sample.deflection = Coordinate{g1 * position.x + g2 * position.y,
                                   g2 * position.x - g1 * position.y};
    sample.jacobian << g1,  g2,
                       g2, -g1;
    return sample;
}

}  // namespace lensolve
