#pragma once

/**
 * Arbor: Entropy-Driven Decision Trees and Random Forests
 *
 * Classification over records with named attributes of mixed kinds.
 * Trees are induced by exhaustive information-gain search over
 * (attribute, predicate, observed value) rules; forests bag many trees
 * and vote.
 *
 * Usage:
 * ```cpp
 * #include <arbor/arbor.hpp>
 *
 * arbor::TreeBuilder builder(arbor::Config::categorical());
 * builder.set_training_set(records);
 *
 * arbor::DecisionTree tree = builder.build().merge_redundant_rules();
 * arbor::Category label = tree.classify(query);
 *
 * arbor::RandomForest forest = arbor::RandomForest::create(builder, 25);
 * arbor::VoteHistogram votes = forest.classify(query);
 * ```
 */

#define ARBOR_VERSION_MAJOR 0
#define ARBOR_VERSION_MINOR 1
#define ARBOR_VERSION_PATCH 0
#define ARBOR_VERSION_STRING "0.1.0"

#include "arbor/types.hpp"
#include "arbor/record.hpp"
#include "arbor/predicate.hpp"
#include "arbor/rule.hpp"
#include "arbor/config.hpp"
#include "arbor/split.hpp"
#include "arbor/tree.hpp"
#include "arbor/builder.hpp"
#include "arbor/forest.hpp"
#include "arbor/metrics.hpp"
#include <cstdio>

namespace arbor {

/**
 * Library version information
 */
struct Version {
    static constexpr int major = ARBOR_VERSION_MAJOR;
    static constexpr int minor = ARBOR_VERSION_MINOR;
    static constexpr int patch = ARBOR_VERSION_PATCH;
    static constexpr const char* string = ARBOR_VERSION_STRING;
};

/**
 * Get compile-time feature flags
 */
struct CompileFeatures {
    static constexpr bool has_openmp =
        #ifdef _OPENMP
            true;
        #else
            false;
        #endif
};

/**
 * Print library info
 */
inline void print_info() {
    std::printf("Arbor v%s\n", Version::string);
    std::printf("  OpenMP: %s\n", CompileFeatures::has_openmp ? "Yes" : "No");
}

} // namespace arbor
