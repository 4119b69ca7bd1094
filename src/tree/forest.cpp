/**
 * Arbor Random Forest Implementation
 */

#include "arbor/forest.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <exception>
#include <random>
#include <stdexcept>

namespace arbor {

// ============================================================================
// Construction
// ============================================================================

RandomForest RandomForest::create(const TreeBuilder& builder) {
    return create(builder, builder.config().forest.n_trees);
}

RandomForest RandomForest::create(const TreeBuilder& builder, uint32_t n_trees) {
    const Config& config = builder.config();
    config.validate();
    if (n_trees == 0) {
        throw std::invalid_argument("n_trees must be at least 1");
    }
    if (builder.training_set().empty()) {
        throw std::invalid_argument("training set is empty");
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    // Shuffle a private view; the caller's records stay untouched
    RecordRefs shuffled = make_refs(builder.training_set());
    std::mt19937_64 rng(config.seed);
    std::shuffle(shuffled.begin(), shuffled.end(), rng);

    if (config.verbosity > 0) {
        std::printf("Training forest: %u trees over %zu records\n", n_trees, shuffled.size());
        if (shuffled.size() < n_trees) {
            std::printf("  warning: more trees than records, chunks are empty\n");
        }
        std::fflush(stdout);
    }

    RandomForest forest;
    forest.trees_.reserve(n_trees);

    for (uint32_t i = 0; i < n_trees; ++i) {
        RecordRefs subset = member_subset(shuffled, i, n_trees);

        DecisionTree tree = DecisionTree::build(subset, config.tree);
        tree.merge_redundant_rules();

        if (config.verbosity > 1) {
            std::printf("[DEBUG] tree %u: n_records=%zu, n_nodes=%zu, depth=%u\n",
                        i, subset.size(), tree.n_nodes(), tree.depth());
            std::fflush(stdout);
        }

        forest.trees_.push_back(std::move(tree));
    }

    if (config.verbosity > 0) {
        double elapsed = std::chrono::duration<double>(
            std::chrono::high_resolution_clock::now() - start_time).count();
        std::printf("Forest trained in %.2fs with %zu trees\n", elapsed, forest.n_trees());
        std::fflush(stdout);
    }

    return forest;
}

RecordRefs RandomForest::member_subset(const RecordRefs& shuffled, uint32_t member,
                                       uint32_t n_trees) {
    const size_t chunk_size = shuffled.size() / n_trees;
    const size_t chunk_begin = std::min(shuffled.size(), static_cast<size_t>(member) * chunk_size);
    const size_t chunk_end = std::min(shuffled.size(), chunk_begin + chunk_size);
    const size_t stride = static_cast<size_t>(member) + 1;

    RecordRefs subset(shuffled.begin() + chunk_begin, shuffled.begin() + chunk_end);
    for (size_t i = 0; i < shuffled.size(); ++i) {
        if (i % stride != 0) {
            subset.push_back(shuffled[i]);
        }
    }
    return subset;
}

void RandomForest::add_tree(DecisionTree tree) {
    if (tree.empty()) {
        throw std::invalid_argument("cannot add an empty tree to the forest");
    }
    trees_.push_back(std::move(tree));
}

// ============================================================================
// Classification
// ============================================================================

VoteHistogram RandomForest::classify(const Record& record) const {
    VoteHistogram votes;
    for (const DecisionTree& tree : trees_) {
        ++votes[tree.classify(record)];
    }
    return votes;
}

Category RandomForest::top_category(const VoteHistogram& votes) {
    return most_frequent_category(votes);
}

Category RandomForest::predict(const Record& record) const {
    return top_category(classify(record));
}

std::vector<VoteHistogram> RandomForest::classify_batch(const RecordSet& records) const {
    std::vector<VoteHistogram> output(records.size());
    const int64_t n = static_cast<int64_t>(records.size());
    std::exception_ptr error;

    #pragma omp parallel for schedule(dynamic)
    for (int64_t i = 0; i < n; ++i) {
        try {
            output[i] = classify(records[i]);
        } catch (...) {
            #pragma omp critical
            if (!error) error = std::current_exception();
        }
    }

    if (error) {
        std::rethrow_exception(error);
    }
    return output;
}

std::vector<Category> RandomForest::predict_batch(const RecordSet& records) const {
    std::vector<VoteHistogram> votes = classify_batch(records);
    std::vector<Category> output;
    output.reserve(votes.size());
    for (const VoteHistogram& histogram : votes) {
        output.push_back(top_category(histogram));
    }
    return output;
}

} // namespace arbor
