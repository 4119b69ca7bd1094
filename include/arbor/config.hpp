#pragma once

/**
 * Arbor Configuration
 *
 * Induction parameters for single trees and ensembles.
 */

#include "types.hpp"
#include "predicate.hpp"
#include <map>
#include <set>
#include <stdexcept>
#include <string>

namespace arbor {

// ============================================================================
// Tree Configuration
// ============================================================================

struct TreeConfig {
    // Item sets of this size or smaller become leaves
    uint32_t min_leaf_size = 0;

    // Predicates tried for a specific attribute
    std::map<std::string, PredicateList> attribute_predicates;

    // Predicates tried for attributes without an entry above
    PredicateList default_predicates;

    // Attributes never used in rules
    std::set<std::string> ignored_attributes;

    /**
     * Predicates applicable to an attribute: its own non-empty list,
     * else the non-empty default list, else nothing.
     */
    const PredicateList& predicates_for(const std::string& attribute) const {
        static const PredicateList none;
        auto it = attribute_predicates.find(attribute);
        if (it != attribute_predicates.end() && !it->second.empty()) {
            return it->second;
        }
        if (!default_predicates.empty()) {
            return default_predicates;
        }
        return none;
    }

    bool is_ignored(const std::string& attribute) const {
        return ignored_attributes.count(attribute) > 0;
    }
};

// ============================================================================
// Forest Configuration
// ============================================================================

struct ForestConfig {
    uint32_t n_trees = 10;                     // Ensemble size
};

// ============================================================================
// Main Configuration
// ============================================================================

struct Config {
    TreeConfig tree;
    ForestConfig forest;

    // Verbosity and logging
    int32_t verbosity = 0;                     // 0=silent, 1=progress, 2=debug

    // Random state (training-set shuffle of the forest)
    uint64_t seed = 42;

    // ========================================================================
    // Factory Methods
    // ========================================================================

    // Attributes hold labels: split on equality only
    static Config categorical() {
        Config cfg;
        cfg.tree.default_predicates = {predicates::equal()};
        return cfg;
    }

    // Attributes hold numbers: threshold splits plus exact matches
    static Config numeric() {
        Config cfg;
        cfg.tree.default_predicates = {predicates::less_equal(), predicates::equal()};
        return cfg;
    }

    // ========================================================================
    // Validation
    // ========================================================================

    void validate() const {
        if (verbosity < 0 || verbosity > 2) {
            throw std::invalid_argument("verbosity must be 0, 1 or 2");
        }
        for (const PredicatePtr& predicate : tree.default_predicates) {
            if (!predicate) {
                throw std::invalid_argument("default_predicates contains a null predicate");
            }
        }
        for (const auto& entry : tree.attribute_predicates) {
            for (const PredicatePtr& predicate : entry.second) {
                if (!predicate) {
                    throw std::invalid_argument(
                        "attribute_predicates['" + entry.first + "'] contains a null predicate");
                }
            }
        }
    }
};

} // namespace arbor
