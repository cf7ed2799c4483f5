/**
 * Arbor Tree Benchmarks
 */

#include <benchmark/benchmark.h>
#include "arbor/arbor.hpp"
#include <random>

using namespace arbor;

namespace {

// Two continuous and two categorical columns; label depends on both kinds
void make_data(Index n_samples, Matrix& x, Labels& y) {
    std::mt19937 rng(123);
    std::uniform_real_distribution<Float> real(0.0, 100.0);
    std::uniform_int_distribution<int> cat(0, 3);

    x.resize(n_samples, 4);
    y.resize(n_samples);
    for (Index i = 0; i < n_samples; ++i) {
        x(i, 0) = real(rng);
        x(i, 1) = real(rng);
        x(i, 2) = cat(rng);
        x(i, 3) = cat(rng);
        y(i) = (x(i, 0) + 10 * x(i, 2) > 60.0) ? 1 : 0;
    }
}

Config bench_config() {
    Config config = Config::c45(2, {0, 1});
    config.tree.height = 6;
    return config;
}

} // namespace

// Benchmark C4.5 induction (threshold search at every node)
static void BM_C45Train(benchmark::State& state) {
    Index n_samples = static_cast<Index>(state.range(0));
    Matrix x;
    Labels y;
    make_data(n_samples, x, y);

    for (auto _ : state) {
        C45Tree tree(bench_config());
        tree.train(x, y);
        Index leaves = tree.n_leaves();
        benchmark::DoNotOptimize(leaves);
    }

    state.SetItemsProcessed(state.iterations() * n_samples);
}
BENCHMARK(BM_C45Train)->Range(100, 10000);

// Benchmark single tree prediction
static void BM_C45PredictBatch(benchmark::State& state) {
    Index n_samples = static_cast<Index>(state.range(0));
    Matrix x;
    Labels y;
    make_data(n_samples, x, y);

    C45Tree tree(bench_config());
    tree.train(x, y);

    for (auto _ : state) {
        Labels yp = tree.predict_batch(x);
        Label* data = yp.data();
        benchmark::DoNotOptimize(data);
    }

    state.SetItemsProcessed(state.iterations() * n_samples);
}
BENCHMARK(BM_C45PredictBatch)->Range(100, 10000);

// Benchmark random forest construction
static void BM_RandomForestTrain(benchmark::State& state) {
    Index n_samples = static_cast<Index>(state.range(0));
    Matrix x;
    Labels y;
    make_data(n_samples, x, y);

    Config config = bench_config();
    config.ensemble.n_trees = 11;

    for (auto _ : state) {
        RandomForest forest(config);
        forest.train(x, y);
        size_t built = forest.n_built();
        benchmark::DoNotOptimize(built);
    }

    state.SetItemsProcessed(state.iterations() * n_samples);
}
BENCHMARK(BM_RandomForestTrain)->Range(100, 5000);

BENCHMARK_MAIN();
