// SPDX-License-Identifier: MIT
#include "src/lens/lens_equation_solver.hpp"
#include "src/lens/models/composite_lens.hpp"
#include "src/lens/models/external_shear.hpp"
#include "src/lens/models/isothermal.hpp"
#include "src/lens/models/point_mass.hpp"
#include "src/lens/triangle_search.hpp"
#include <benchmark/benchmark.h>
#include <cmath>
#include <memory>
#include <vector>

using namespace lensolve;

namespace {

std::vector<Coordinate> ring_of_sources(size_t n, double radius) {
    std::vector<Coordinate> sources(n);
    for (size_t i = 0; i < n; ++i) {
        const double phi = 2.0 * M_PI * static_cast<double>(i) / static_cast<double>(n);
        sources[i] = Coordinate{radius * std::cos(phi), radius * std::sin(phi)};
    }
    return sources;
}

std::shared_ptr<const DeflectionField> sheared_ellipsoid() {
    auto lens = CompositeLens::create({
        std::make_shared<SingularIsothermalEllipsoid>(),
        std::make_shared<ExternalShear>()});
    if (!lens) {
        return nullptr;
    }
    return std::make_shared<CompositeLens>(std::move(*lens));
}

}  // namespace

// Benchmark: single point-mass solve across grid resolutions
static void BM_PointMass_Solve(benchmark::State& state) {
    const size_t resolution = state.range(0);

    auto solver = LensEquationSolver::create(std::make_shared<PointMassLens>(),
                                             SolverConfig{.grid_resolution = resolution});
    if (!solver) {
        state.SkipWithError("solver creation failed");
        return;
    }
    LensParameters params{1.0, 0.0, 0.0};

    for (auto _ : state) {
        auto result = solver->solve({0.1, 0.05}, params);
        benchmark::DoNotOptimize(result);
    }

    state.SetLabel(std::to_string(resolution) + "x" + std::to_string(resolution));
}
BENCHMARK(BM_PointMass_Solve)->Arg(20)->Arg(40)->Arg(80);

// Benchmark: sheared ellipsoid, one source (quad configuration)
static void BM_ShearedEllipsoid_Solve(benchmark::State& state) {
    auto field = sheared_ellipsoid();
    auto solver = LensEquationSolver::create(field);
    if (!solver) {
        state.SkipWithError("solver creation failed");
        return;
    }
    LensParameters params{1.0, 0.7, 0.3, 0.0, 0.0, 0.05, -0.02};

    for (auto _ : state) {
        auto result = solver->solve({0.03, 0.01}, params);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ShearedEllipsoid_Solve);

// Benchmark: compare seeding strategies on the same lens
static void BM_SeedStrategy(benchmark::State& state) {
    const auto strategy = static_cast<SeedStrategy>(state.range(0));

    auto solver = LensEquationSolver::create(std::make_shared<SingularIsothermalEllipsoid>(),
                                             SolverConfig{.random_seed = 42, .seed_strategy = strategy});
    if (!solver) {
        state.SkipWithError("solver creation failed");
        return;
    }
    LensParameters params{1.0, 0.7, 0.3, 0.0, 0.0};

    size_t images = 0;
    for (auto _ : state) {
        auto result = solver->solve({0.03, 0.01}, params);
        if (result) {
            images = result->images.size();
        }
        benchmark::DoNotOptimize(images);
    }

    state.counters["images"] = static_cast<double>(images);
    state.SetLabel(std::string(to_string(strategy)));
}
BENCHMARK(BM_SeedStrategy)
    ->Arg(static_cast<int>(SeedStrategy::RegularGrid))
    ->Arg(static_cast<int>(SeedStrategy::LatinHypercube))
    ->Arg(static_cast<int>(SeedStrategy::SourceTriangles));

// Benchmark: triangle-mapping search (no Newton refinement)
static void BM_TriangleSearch(benchmark::State& state) {
    auto search = TriangleImageSearch::create(std::make_shared<SingularIsothermalEllipsoid>(),
                                              SearchGrid{});
    if (!search) {
        state.SkipWithError("search creation failed");
        return;
    }
    LensParameters params{1.0, 0.7, 0.3, 0.0, 0.0};

    for (auto _ : state) {
        auto result = search->search({0.03, 0.01}, params);
        benchmark::DoNotOptimize(result);
    }

    state.counters["accuracy"] = search->estimate_accuracy();
}
BENCHMARK(BM_TriangleSearch);

// Benchmark: batch solve (OpenMP parallel across sources)
static void BM_Batch_Solve(benchmark::State& state) {
    const size_t n_sources = state.range(0);

    auto field = sheared_ellipsoid();
    auto solver = LensEquationSolver::create(field);
    if (!solver) {
        state.SkipWithError("solver creation failed");
        return;
    }
    LensParameters params{1.0, 0.7, 0.3, 0.0, 0.0, 0.05, -0.02};
    const auto sources = ring_of_sources(n_sources, 0.2);

    for (auto _ : state) {
        auto batch = solver->solve_batch(sources, params);
        benchmark::DoNotOptimize(batch);
    }

    state.SetItemsProcessed(state.iterations() * n_sources);
    state.SetLabel("batch_parallel");
}
BENCHMARK(BM_Batch_Solve)->Arg(16)->Arg(64)->Arg(256);

BENCHMARK_MAIN();
