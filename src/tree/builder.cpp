/**
 * Arbor Tree Builder Implementation
 */

#include "arbor/builder.hpp"
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace arbor {

TreeBuilder& TreeBuilder::set_training_set(RecordSet records) {
    training_set_ = std::move(records);
    return *this;
}

TreeBuilder& TreeBuilder::add_record(Record record) {
    training_set_.push_back(std::move(record));
    return *this;
}

TreeBuilder& TreeBuilder::set_min_leaf_size(uint32_t min_leaf_size) {
    config_.tree.min_leaf_size = min_leaf_size;
    return *this;
}

TreeBuilder& TreeBuilder::set_attribute_predicates(const std::string& attribute,
                                                   PredicateList predicates) {
    config_.tree.attribute_predicates[attribute] = std::move(predicates);
    return *this;
}

TreeBuilder& TreeBuilder::set_default_predicates(PredicateList predicates) {
    config_.tree.default_predicates = std::move(predicates);
    return *this;
}

TreeBuilder& TreeBuilder::ignore_attribute(const std::string& attribute) {
    config_.tree.ignored_attributes.insert(attribute);
    return *this;
}

TreeBuilder& TreeBuilder::set_n_trees(uint32_t n_trees) {
    config_.forest.n_trees = n_trees;
    return *this;
}

TreeBuilder& TreeBuilder::set_seed(uint64_t seed) {
    config_.seed = seed;
    return *this;
}

TreeBuilder& TreeBuilder::set_verbosity(int32_t verbosity) {
    config_.verbosity = verbosity;
    return *this;
}

TreeBuilder& TreeBuilder::set_config(const Config& config) {
    config_ = config;
    return *this;
}

DecisionTree TreeBuilder::build() const {
    config_.validate();
    if (training_set_.empty()) {
        throw std::invalid_argument("training set is empty");
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    if (config_.verbosity > 1) {
        std::printf("[DEBUG] build() started, n_records=%zu, min_leaf_size=%u\n",
                    training_set_.size(), config_.tree.min_leaf_size);
        std::fflush(stdout);
    }

    DecisionTree tree = DecisionTree::build(training_set_, config_.tree);

    if (config_.verbosity > 0) {
        double elapsed = std::chrono::duration<double>(
            std::chrono::high_resolution_clock::now() - start_time).count();
        std::printf("Tree built in %.3fs: %zu nodes, %zu leaves, depth %u\n",
                    elapsed, tree.n_nodes(), tree.n_leaves(), tree.depth());
        std::fflush(stdout);
    }

    return tree;
}

} // namespace arbor
