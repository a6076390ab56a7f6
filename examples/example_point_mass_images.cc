// SPDX-License-Identifier: MIT
#include "src/lens/lens_equation_solver.hpp"
#include "src/lens/models/point_mass.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>

int main() {
    using namespace lensolve;

    // Point mass with Einstein radius 1 at the origin
    auto field = std::make_shared<PointMassLens>();
    LensParameters params{1.0, 0.0, 0.0};

    auto solver = LensEquationSolver::create(field, SolverConfig{
        .convergence_tol = 1e-10,
        .expected_images = 2
    });
    if (!solver) {
        std::cerr << "Solver creation failed: " << solver.error() << "\n";
        return 1;
    }

    std::cout << "=== Point-mass lens, theta_E = 1 ===\n";
    std::cout << std::fixed << std::setprecision(8);

    for (double beta : {0.5, 0.1, 0.01}) {
        auto result = solver->solve(Coordinate{beta, 0.0}, params);
        if (!result) {
            std::cerr << "Solve failed: " << result.error() << "\n";
            return 1;
        }

        std::cout << "\nSource at (" << beta << ", 0): " << result->diagnostic << "\n";
        double total = 0.0;
        for (const auto& image : result->images) {
            std::cout << "  [" << image.index << "] theta=" << image.position
                      << "  mu=" << std::setw(14) << image.magnification
                      << "  parity=" << std::showpos << image.parity() << std::noshowpos
                      << (image.near_critical ? "  (near critical)" : "") << "\n";
            total += std::abs(image.magnification);
        }

        // Analytic total magnification (u^2 + 2) / (u sqrt(u^2 + 4))
        const double analytic = (beta * beta + 2.0) / (beta * std::sqrt(beta * beta + 4.0));
        std::cout << "  total |mu| = " << total << "  (analytic " << analytic << ")\n";

        const auto& c = result->candidates;
        std::cout << "  candidates: " << c.total << " seeded, " << c.converged << " converged, "
                  << c.merged << " merged, " << c.passes << " passes\n";
    }

    return 0;
}
