#pragma once

/**
 * Arbor Split Search
 *
 * Exhaustive information-gain search over (attribute, predicate, value)
 * rules, where every value observed in the current item set is a
 * candidate reference value.
 */

#include "types.hpp"
#include "config.hpp"
#include "record.hpp"
#include "rule.hpp"
#include <optional>

namespace arbor {

// ============================================================================
// Split Result
// ============================================================================

struct SplitResult {
    Rule rule;
    RecordRefs matched;
    RecordRefs not_matched;
    double gain = 0.0;
};

// ============================================================================
// Category Statistics
// ============================================================================

CategoryCounts count_categories(const RecordRefs& items);

/**
 * Shannon entropy (natural log) of a category distribution:
 *   H = -sum_i p_i * ln(p_i)
 * Zero for an empty or single-category distribution.
 */
double entropy(const CategoryCounts& counts);
double entropy(const RecordRefs& items);

/**
 * Most frequent category. Ties resolve to the smallest category in
 * Value order; an empty item set yields a null category.
 */
Category most_frequent_category(const CategoryCounts& counts);
Category most_frequent_category(const RecordRefs& items);

// ============================================================================
// Split Finder
// ============================================================================

class SplitFinder {
public:
    // The finder keeps a reference to config; it must outlive the finder
    explicit SplitFinder(const TreeConfig& config) : config_(config) {}

    /**
     * Find the rule with the highest information gain.
     * Candidates are visited item by item, then attribute name, then
     * predicate order; the first candidate reaching the maximum wins.
     * @return nullopt if no rule has a positive gain
     */
    std::optional<SplitResult> find_best_split(const RecordRefs& items) const;

    // Same search with a precomputed entropy of items
    std::optional<SplitResult> find_best_split(const RecordRefs& items,
                                               double initial_entropy) const;

    // Partition items by rule, preserving order in both halves
    static SplitResult split(const Rule& rule, const RecordRefs& items);

    // H0 - (p_matched * H(matched) + p_not_matched * H(not_matched))
    static double information_gain(double initial_entropy,
                                   const RecordRefs& matched,
                                   const RecordRefs& not_matched);

    const TreeConfig& config() const { return config_; }

private:
    const TreeConfig& config_;
};

} // namespace arbor
