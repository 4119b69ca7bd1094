/**
 * Arbor Tree Benchmarks
 */

#include <benchmark/benchmark.h>
#include "arbor/tree.hpp"
#include <vector>
#include <random>

using namespace arbor;

static RecordSet make_records(int n_records, uint64_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    const char* colors[] = {"red", "green", "blue"};

    RecordSet records;
    records.reserve(n_records);
    for (int i = 0; i < n_records; ++i) {
        double a = dist(rng);
        double b = dist(rng);
        const char* color = colors[i % 3];
        const char* category = (a + b > 0.0) ? "pos" : "neg";
        records.push_back(Record({{"a", a}, {"b", b}, {"color", color}}, category));
    }
    return records;
}

static TreeConfig mixed_config() {
    TreeConfig config;
    config.default_predicates = {predicates::less_equal()};
    config.attribute_predicates["color"] = {predicates::equal()};
    return config;
}

// Benchmark induction (exhaustive split search)
static void BM_TreeBuild(benchmark::State& state) {
    RecordSet records = make_records(static_cast<int>(state.range(0)), 42);
    TreeConfig config = mixed_config();

    for (auto _ : state) {
        DecisionTree tree = DecisionTree::build(records, config);
        benchmark::DoNotOptimize(tree.n_nodes());
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_TreeBuild)->Range(16, 256);

// Benchmark single-record classification
static void BM_TreeClassify(benchmark::State& state) {
    RecordSet records = make_records(256, 42);
    DecisionTree tree = DecisionTree::build(records, mixed_config());
    tree.merge_redundant_rules();

    RecordSet queries = make_records(static_cast<int>(state.range(0)), 123);

    for (auto _ : state) {
        for (const Record& query : queries) {
            Category category = tree.classify(query);
            benchmark::DoNotOptimize(category);
        }
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_TreeClassify)->Range(100, 10000);

BENCHMARK_MAIN();
