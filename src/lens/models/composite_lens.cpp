// SPDX-License-Identifier: MIT
#include "src/lens/models/composite_lens.hpp"
#include <algorithm>

namespace lensolve {

std::expected<CompositeLens, ValidationError> CompositeLens::create(std::vector<Component> components) {
    for (size_t i = 0; i < components.size(); ++i) {
        if (!components[i]) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::MissingDeflectionField, 0.0, i));
        }
    }
    return CompositeLens(std::move(components));
}

CompositeLens::CompositeLens(std::vector<Component> components)
    : components_(std::move(components))
{
    offsets_.reserve(components_.size());
    for (const auto& c : components_) {
        offsets_.push_back(total_parameters_);
        total_parameters_ += c->parameter_count();
    }
}

std::optional<DeflectionSample> CompositeLens::evaluate(
    Coordinate position, std::span<const double> params) const
{
    DeflectionSample total;
    total.deflection = Coordinate{};
    total.jacobian.setZero();

    for (size_t i = 0; i < components_.size(); ++i) {
        auto part = components_[i]->evaluate(position, component_parameters(params, i));
        if (!part.has_value()) {
            return std::nullopt;
        }
        total.deflection = total.deflection + part->deflection;
        total.jacobian += part->jacobian;
    }
    return total;
}

void CompositeLens::evaluate_batch(std::span<const Coordinate> positions,
                                   std::span<const double> params,
                                   std::span<std::optional<DeflectionSample>> out) const
{
    const size_t n = std::min(positions.size(), out.size());

    for (size_t j = 0; j < n; ++j) {
        DeflectionSample zero;
        zero.deflection = Coordinate{};
        zero.jacobian.setZero();
        out[j] = zero;
    }

    std::vector<std::optional<DeflectionSample>> scratch(n);
    for (size_t i = 0; i < components_.size(); ++i) {
        components_[i]->evaluate_batch(positions.first(n), component_parameters(params, i), scratch);

        for (size_t j = 0; j < n; ++j) {
            if (!out[j].has_value()) {
                continue;
            }
            if (!scratch[j].has_value()) {
                out[j].reset();
                continue;
            }
            out[j]->deflection = out[j]->deflection + scratch[j]->deflection;
            out[j]->jacobian += scratch[j]->jacobian;
        }
    }
}

}  // namespace lensolve
