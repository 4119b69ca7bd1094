#pragma once

/**
 * Arbor Tree Builder
 *
 * Fluent façade collecting a training set and induction parameters.
 *
 * ```cpp
 * arbor::DecisionTree tree = arbor::TreeBuilder()
 *     .set_training_set(records)
 *     .set_default_predicates({arbor::predicates::equal()})
 *     .ignore_attribute("id")
 *     .build()
 *     .merge_redundant_rules();
 * ```
 */

#include "config.hpp"
#include "record.hpp"
#include "tree.hpp"

namespace arbor {

class TreeBuilder {
public:
    TreeBuilder() = default;
    explicit TreeBuilder(const Config& config) : config_(config) {}

    TreeBuilder& set_training_set(RecordSet records);
    TreeBuilder& add_record(Record record);

    TreeBuilder& set_min_leaf_size(uint32_t min_leaf_size);
    TreeBuilder& set_attribute_predicates(const std::string& attribute, PredicateList predicates);
    TreeBuilder& set_default_predicates(PredicateList predicates);
    TreeBuilder& ignore_attribute(const std::string& attribute);

    TreeBuilder& set_n_trees(uint32_t n_trees);
    TreeBuilder& set_seed(uint64_t seed);
    TreeBuilder& set_verbosity(int32_t verbosity);
    TreeBuilder& set_config(const Config& config);

    const RecordSet& training_set() const { return training_set_; }
    const Config& config() const { return config_; }

    /**
     * Induce a tree over the whole training set.
     * Throws std::invalid_argument for an invalid config or empty training set.
     */
    DecisionTree build() const;

private:
    Config config_;
    RecordSet training_set_;
};

} // namespace arbor
