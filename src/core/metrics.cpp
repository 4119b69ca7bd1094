/**
 * Arbor Metrics Implementation
 */

#include "arbor/metrics.hpp"
#include <stdexcept>

namespace arbor {

namespace {

void check_sizes(const std::vector<Category>& predicted, const RecordSet& records) {
    if (records.empty()) {
        throw std::invalid_argument("records must not be empty");
    }
    if (predicted.size() != records.size()) {
        throw std::invalid_argument("predicted and records must have same size");
    }
}

} // namespace

double Metrics::accuracy(const std::vector<Category>& predicted, const RecordSet& records) {
    check_sizes(predicted, records);

    size_t correct = 0;
    for (size_t i = 0; i < records.size(); ++i) {
        if (predicted[i] == records[i].category()) {
            ++correct;
        }
    }
    return static_cast<double>(correct) / records.size();
}

double Metrics::accuracy(const DecisionTree& tree, const RecordSet& records) {
    return accuracy(tree.classify_batch(records), records);
}

double Metrics::accuracy(const RandomForest& forest, const RecordSet& records) {
    return accuracy(forest.predict_batch(records), records);
}

ConfusionCounts Metrics::confusion(const std::vector<Category>& predicted,
                                   const RecordSet& records) {
    check_sizes(predicted, records);

    ConfusionCounts counts;
    for (size_t i = 0; i < records.size(); ++i) {
        ++counts[std::make_pair(records[i].category(), predicted[i])];
    }
    return counts;
}

ConfusionCounts Metrics::confusion(const DecisionTree& tree, const RecordSet& records) {
    return confusion(tree.classify_batch(records), records);
}

ConfusionCounts Metrics::confusion(const RandomForest& forest, const RecordSet& records) {
    return confusion(forest.predict_batch(records), records);
}

} // namespace arbor
