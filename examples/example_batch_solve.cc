// SPDX-License-Identifier: MIT
#include "src/lens/lens_equation_solver.hpp"
#include "src/lens/models/composite_lens.hpp"
#include "src/lens/models/external_shear.hpp"
#include "src/lens/models/isothermal.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <vector>

int main() {
    using namespace lensolve;

    // Elliptical isothermal lens in an external shear
    auto composite = CompositeLens::create({
        std::make_shared<SingularIsothermalEllipsoid>(),
        std::make_shared<ExternalShear>()});
    if (!composite) {
        std::cerr << "Lens creation failed: " << composite.error() << "\n";
        return 1;
    }
    auto field = std::make_shared<CompositeLens>(std::move(*composite));

    // b, q, phi, center_x, center_y, gamma_1, gamma_2
    LensParameters params{1.0, 0.75, 0.4, 0.0, 0.0, 0.04, -0.02};

    // Sources along a line crossing the caustics
    std::vector<Coordinate> sources;
    for (int i = 0; i <= 10; ++i) {
        sources.push_back(Coordinate{0.05 * i, 0.02});
    }

    auto batch = solve_lens_equation_batch(field, sources, params, SolverConfig{
        .random_seed = 1
    });
    if (!batch) {
        std::cerr << "Batch solve failed: " << batch.error() << "\n";
        return 1;
    }

    std::cout << "=== " << field->name() << ": " << sources.size() << " sources ===\n";
    std::cout << std::fixed << std::setprecision(5);
    for (size_t i = 0; i < sources.size(); ++i) {
        const auto& r = batch->results[i];
        std::cout << "source " << sources[i] << ": " << r.images.size() << " images";
        for (const auto& image : r.images) {
            std::cout << "  " << image.position << (image.parity() > 0 ? "+" : "-");
        }
        std::cout << "\n";
    }

    // Fixed-width view for array consumers
    const auto table = batch->padded(4);
    std::cout << "\nPadded table (" << table.rows << " x " << table.capacity << "), "
              << table.truncated_count << " rows truncated\n";
    for (size_t row = 0; row < table.rows; ++row) {
        std::cout << std::setw(3) << row << ":";
        for (size_t col = 0; col < table.capacity; ++col) {
            const size_t at = table.offset(row, col);
            if (table.is_valid(row, col)) {
                std::cout << std::setw(12) << table.magnification[at];
            } else {
                std::cout << std::setw(12) << "--";
            }
        }
        std::cout << "\n";
    }

    return 0;
}
