/**
 * Arbor Split Search Implementation
 */

#include "arbor/split.hpp"
#include <cmath>
#include <unordered_set>

namespace arbor {

// ============================================================================
// Category Statistics
// ============================================================================

CategoryCounts count_categories(const RecordRefs& items) {
    CategoryCounts counts;
    for (const Record* item : items) {
        ++counts[item->category()];
    }
    return counts;
}

double entropy(const CategoryCounts& counts) {
    double total = 0.0;
    for (const auto& entry : counts) {
        total += entry.second;
    }

    double h = 0.0;
    for (const auto& entry : counts) {
        double p = entry.second / total;
        h -= p * std::log(p);
    }
    return h;
}

double entropy(const RecordRefs& items) {
    return entropy(count_categories(items));
}

Category most_frequent_category(const CategoryCounts& counts) {
    Category best;
    Count best_count = 0;
    // Ascending iteration with strict improvement keeps the smallest tied category
    for (const auto& entry : counts) {
        if (entry.second > best_count) {
            best_count = entry.second;
            best = entry.first;
        }
    }
    return best;
}

Category most_frequent_category(const RecordRefs& items) {
    return most_frequent_category(count_categories(items));
}

// ============================================================================
// Split Finder
// ============================================================================

SplitResult SplitFinder::split(const Rule& rule, const RecordRefs& items) {
    SplitResult result{rule, {}, {}, 0.0};
    for (const Record* item : items) {
        if (rule.match(*item)) {
            result.matched.push_back(item);
        } else {
            result.not_matched.push_back(item);
        }
    }
    return result;
}

double SplitFinder::information_gain(double initial_entropy,
                                     const RecordRefs& matched,
                                     const RecordRefs& not_matched) {
    double total = static_cast<double>(matched.size() + not_matched.size());
    if (total == 0.0) {
        return 0.0;
    }
    double p_matched = matched.size() / total;
    double p_not_matched = not_matched.size() / total;
    return initial_entropy
        - p_matched * entropy(matched)
        - p_not_matched * entropy(not_matched);
}

std::optional<SplitResult> SplitFinder::find_best_split(const RecordRefs& items) const {
    return find_best_split(items, entropy(items));
}

std::optional<SplitResult> SplitFinder::find_best_split(const RecordRefs& items,
                                                        double initial_entropy) const {
    double best_gain = 0.0;
    std::optional<SplitResult> best;
    std::unordered_set<Rule> tested_rules;

    for (const Record* base_item : items) {
        for (const auto& attribute : base_item->attributes()) {
            const std::string& name = attribute.first;
            if (config_.is_ignored(name)) {
                continue;
            }

            for (const PredicatePtr& predicate : config_.predicates_for(name)) {
                Rule rule(name, predicate, attribute.second);

                // Each distinct rule is evaluated once per search
                if (!tested_rules.insert(rule).second) {
                    continue;
                }

                SplitResult candidate = split(rule, items);
                double gain = information_gain(initial_entropy,
                                               candidate.matched,
                                               candidate.not_matched);
                if (gain > best_gain) {
                    best_gain = gain;
                    candidate.gain = gain;
                    best = std::move(candidate);
                }
            }
        }
    }

    return best;
}

} // namespace arbor
