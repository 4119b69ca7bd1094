#pragma once

/**
 * Arbor Random Forest
 *
 * Bagged ensemble of decision trees. Each member is trained on one
 * contiguous chunk of the shuffled training set plus an index-modulo
 * subsample of the whole shuffled set, then pruned of redundant rules.
 * Classification returns how many trees voted for each category.
 */

#include "types.hpp"
#include "config.hpp"
#include "record.hpp"
#include "tree.hpp"
#include "builder.hpp"
#include <vector>

namespace arbor {

// Category -> number of trees voting for it
using VoteHistogram = CategoryCounts;

class RandomForest {
public:
    RandomForest() = default;

    /**
     * Train n_trees members on resamples of builder's training set,
     * using builder's tree config, seed and verbosity.
     * Throws std::invalid_argument for an empty training set or n_trees == 0.
     */
    static RandomForest create(const TreeBuilder& builder, uint32_t n_trees);

    // Ensemble size taken from builder.config().forest.n_trees
    static RandomForest create(const TreeBuilder& builder);

    /**
     * Training subset of ensemble member `member` over an already
     * shuffled set: chunk `member` of size total / n_trees, followed by
     * every item whose index is not a multiple of member + 1.
     */
    static RecordRefs member_subset(const RecordRefs& shuffled, uint32_t member, uint32_t n_trees);

    VoteHistogram classify(const Record& record) const;

    // Top-voted category; ties resolve to the smallest category
    Category predict(const Record& record) const;

    std::vector<VoteHistogram> classify_batch(const RecordSet& records) const;
    std::vector<Category> predict_batch(const RecordSet& records) const;

    static Category top_category(const VoteHistogram& votes);

    void add_tree(DecisionTree tree);
    size_t n_trees() const { return trees_.size(); }
    const DecisionTree& tree(size_t idx) const { return trees_.at(idx); }
    const std::vector<DecisionTree>& trees() const { return trees_; }

private:
    std::vector<DecisionTree> trees_;
};

} // namespace arbor
