#include <benchmark/benchmark.h>

#include <kmedoids_core/kmedoids.hpp>
#include <kmedoids_core/pairwise.hpp>
#include <random>
#include <string>
#include <vector>

using namespace kmedoids;

namespace {

Matrix<float> generate_points(int n_points, int dim, uint32_t seed = 42) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  Matrix<float> points(static_cast<size_t>(n_points), static_cast<size_t>(dim));
  for (size_t i = 0; i < points.size(); ++i) {
    points.data()[i] = dist(rng);
  }
  return points;
}

KMedoids32 make_engine(int n_points, int n_clusters) {
  return KMedoids32(pairwise_distances(generate_points(n_points, 16)),
                    static_cast<size_t>(n_clusters));
}

}  // namespace

static void BM_PairwiseDistances(benchmark::State& state) {
  const int n_points = state.range(0);
  const int dim = state.range(1);
  auto points = generate_points(n_points, dim);

  for (auto _ : state) {
    auto distances = pairwise_distances(points);
    benchmark::DoNotOptimize(distances.data());
  }

  state.SetLabel(std::to_string(n_points) + "p/" + std::to_string(dim) + "d");
}

static void BM_Associate(benchmark::State& state) {
  const int n_points = state.range(0);
  const int n_clusters = state.range(1);
  auto engine = make_engine(n_points, n_clusters);

  RandomEngine rng(42);
  auto medoids = engine.initialize_medoids(rng);

  for (auto _ : state) {
    auto assignment = engine.associate(medoids);
    benchmark::DoNotOptimize(assignment.cost);
  }

  state.SetLabel(std::to_string(n_points) + "p/" + std::to_string(n_clusters) + "k");
}

static void BM_InitializeMedoids(benchmark::State& state) {
  const int n_points = state.range(0);
  const int n_clusters = state.range(1);
  auto engine = make_engine(n_points, n_clusters);

  RandomEngine rng(42);
  for (auto _ : state) {
    auto medoids = engine.initialize_medoids(rng);
    benchmark::DoNotOptimize(medoids.data());
  }

  state.SetLabel(std::to_string(n_points) + "p/" + std::to_string(n_clusters) + "k");
}

static void BM_Run(benchmark::State& state) {
  const int n_points = state.range(0);
  const int n_clusters = state.range(1);
  const int max_iterations = state.range(2);
  auto engine = make_engine(n_points, n_clusters);

  for (auto _ : state) {
    RandomEngine rng(42);
    auto result = engine.run(rng, max_iterations);
    benchmark::DoNotOptimize(result.cost);
  }

  state.SetLabel(std::to_string(n_points) + "p/" + std::to_string(n_clusters) + "k/"
                 + std::to_string(max_iterations) + "it");
}

BENCHMARK(BM_PairwiseDistances)
    ->Args({100, 16})
    ->Args({500, 16})
    ->Args({1000, 128})
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_Associate)->Args({100, 4})->Args({500, 8})->Args({1000, 16});

BENCHMARK(BM_InitializeMedoids)->Args({100, 4})->Args({500, 8})->Args({1000, 16});

BENCHMARK(BM_Run)
    ->Args({50, 3, 1})
    ->Args({100, 4, 2})
    ->Args({200, 5, 2})
    ->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
