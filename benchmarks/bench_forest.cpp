/**
 * Arbor Forest Benchmarks
 */

#include <benchmark/benchmark.h>
#include "arbor/forest.hpp"
#include <vector>
#include <random>

using namespace arbor;

static RecordSet make_records(int n_records, uint64_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 99);

    RecordSet records;
    records.reserve(n_records);
    for (int i = 0; i < n_records; ++i) {
        int x = dist(rng);
        int y = dist(rng);
        const char* category = (x > 50) ? (y > 50 ? "a" : "b") : "c";
        records.push_back(Record({{"x", x}, {"y", y}}, category));
    }
    return records;
}

// Benchmark ensemble training
static void BM_ForestCreate(benchmark::State& state) {
    TreeBuilder builder(Config::numeric());
    builder.set_training_set(make_records(128, 42));
    const uint32_t n_trees = static_cast<uint32_t>(state.range(0));

    for (auto _ : state) {
        RandomForest forest = RandomForest::create(builder, n_trees);
        benchmark::DoNotOptimize(forest.n_trees());
    }
}
BENCHMARK(BM_ForestCreate)->RangeMultiplier(2)->Range(2, 16);

// Benchmark batch voting
static void BM_ForestPredictBatch(benchmark::State& state) {
    TreeBuilder builder(Config::numeric());
    builder.set_training_set(make_records(128, 42));
    RandomForest forest = RandomForest::create(builder, 16);

    RecordSet queries = make_records(static_cast<int>(state.range(0)), 7);

    for (auto _ : state) {
        std::vector<Category> output = forest.predict_batch(queries);
        benchmark::DoNotOptimize(output);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ForestPredictBatch)->Range(100, 10000);

BENCHMARK_MAIN();
