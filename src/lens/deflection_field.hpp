// SPDX-License-Identifier: MIT
/**
 * @file deflection_field.hpp
 * @brief Pluggable deflection field contract consumed by the lens solver
 *
 * A deflection field maps an image-plane position theta and an opaque
 * parameter set to the deflection alpha(theta) and its spatial Jacobian
 * d(alpha)/d(theta). The solver never computes either itself and never looks
 * inside the parameters; it only checks their length against
 * parameter_count().
 *
 * Implementations must be pure (no hidden mutable state) so that a single
 * instance can be shared across threads by the batch solver.
 */

#pragma once

#include "src/math/coordinate.hpp"
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace lensolve {

/// Deflection and its Jacobian at one image-plane position
struct DeflectionSample {
    Coordinate deflection;
    Jacobian2 jacobian;
};

/// Opaque, model-specific parameter set
///
/// Owns its values; the solver passes values() through to the deflection
/// field unchanged.
class LensParameters {
public:
    LensParameters() = default;
    explicit LensParameters(std::vector<double> values) : values_(std::move(values)) {}
    LensParameters(std::initializer_list<double> values) : values_(values) {}

    std::span<const double> values() const noexcept { return values_; }
    size_t size() const noexcept { return values_.size(); }

private:
    std::vector<double> values_;
};

/// Deflection field provider interface
class DeflectionField {
public:
    virtual ~DeflectionField() = default;

    /// Short model name for diagnostics
    virtual std::string_view name() const noexcept = 0;

    /// Number of values expected in the parameter set
    virtual size_t parameter_count() const noexcept = 0;

    /// Evaluate deflection and Jacobian at one position
    ///
    /// @return nullopt where the field is undefined (singular points)
    virtual std::optional<DeflectionSample> evaluate(
        Coordinate position, std::span<const double> params) const = 0;

    /// Evaluate a sequence of positions
    ///
    /// Default implementation loops over evaluate(); providers with a
    /// vectorized kernel should override it.
    ///
    /// @pre out.size() == positions.size()
    virtual void evaluate_batch(std::span<const Coordinate> positions,
                                std::span<const double> params,
                                std::span<std::optional<DeflectionSample>> out) const;
};

/// Map an image-plane position to the source plane: beta = theta - alpha(theta)
///
/// @return nullopt where the deflection is undefined
std::optional<Coordinate> ray_shoot(const DeflectionField& field,
                                    Coordinate theta,
                                    std::span<const double> params);

/// Lens-equation Jacobian J_F = -I + d(alpha)/d(theta)
///
/// Jacobian of F(theta) = beta - (theta - alpha(theta)).
inline Jacobian2 lens_equation_jacobian(const Jacobian2& deflection_jacobian) {
    return deflection_jacobian - Jacobian2::Identity();
}

}  // namespace lensolve
