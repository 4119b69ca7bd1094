#pragma once

/**
 * Arbor: Evaluation Metrics
 *
 * Accuracy and confusion counts of a tree or forest over labeled records.
 */

#include "types.hpp"
#include "record.hpp"
#include "tree.hpp"
#include "forest.hpp"
#include <map>
#include <utility>
#include <vector>

namespace arbor {

// (actual, predicted) -> count
using ConfusionCounts = std::map<std::pair<Category, Category>, Count>;

class Metrics {
public:
    /**
     * Fraction of predictions equal to the record's category.
     * Throws std::invalid_argument for empty input or a size mismatch.
     */
    static double accuracy(const std::vector<Category>& predicted, const RecordSet& records);
    static double accuracy(const DecisionTree& tree, const RecordSet& records);
    static double accuracy(const RandomForest& forest, const RecordSet& records);

    static ConfusionCounts confusion(const std::vector<Category>& predicted,
                                     const RecordSet& records);
    static ConfusionCounts confusion(const DecisionTree& tree, const RecordSet& records);
    static ConfusionCounts confusion(const RandomForest& forest, const RecordSet& records);
};

} // namespace arbor
