// SPDX-License-Identifier: MIT
/**
 * @file composite_lens.hpp
 * @brief Superposition of several deflection fields
 *
 * Deflections (and therefore Jacobians) of thin lenses on the same plane add
 * linearly. The composite parameter set is the concatenation of the component
 * parameter sets, in component order:
 *
 *   [ params(component 0) | params(component 1) | ... ]
 *
 * Example: SIE + external shear
 * @code
 * auto lens = CompositeLens::create({
 *     std::make_shared<SingularIsothermalEllipsoid>(),
 *     std::make_shared<ExternalShear>()});
 * LensParameters params{1.0, 0.8, 0.3, 0.0, 0.0,   // SIE
 *                       0.05, -0.02};              // shear
 * @endcode
 */

#pragma once

#include "src/lens/deflection_field.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <memory>
#include <vector>

namespace lensolve {

class CompositeLens final : public DeflectionField {
public:
    using Component = std::shared_ptr<const DeflectionField>;

    /// Build a composite from its components
    ///
    /// @return MissingDeflectionField (index = offending component) for a
    ///         null component
    static std::expected<CompositeLens, ValidationError> create(std::vector<Component> components);

    std::string_view name() const noexcept override { return "composite"; }
    size_t parameter_count() const noexcept override { return total_parameters_; }

    /// Undefined wherever any component is undefined
    std::optional<DeflectionSample> evaluate(
        Coordinate position, std::span<const double> params) const override;

    /// Accumulates each component's own batched evaluation
    void evaluate_batch(std::span<const Coordinate> positions,
                        std::span<const double> params,
                        std::span<std::optional<DeflectionSample>> out) const override;

    size_t component_count() const noexcept { return components_.size(); }
    const DeflectionField& component(size_t i) const { return *components_[i]; }

    /// Slice of the composite parameters belonging to component i
    std::span<const double> component_parameters(std::span<const double> params, size_t i) const {
        return params.subspan(offsets_[i], components_[i]->parameter_count());
    }

private:
    explicit CompositeLens(std::vector<Component> components);

    std::vector<Component> components_;
    std::vector<size_t> offsets_;
    size_t total_parameters_ = 0;
};

}  // namespace lensolve
