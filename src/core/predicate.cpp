/**
 * Arbor Built-in Predicates
 */

#include "arbor/predicate.hpp"
#include <stdexcept>

namespace arbor {
namespace predicates {

PredicatePtr equal() {
    static const PredicatePtr instance = std::make_shared<EqualPredicate>();
    return instance;
}

PredicatePtr not_equal() {
    static const PredicatePtr instance = std::make_shared<NotEqualPredicate>();
    return instance;
}

PredicatePtr less() {
    static const PredicatePtr instance = std::make_shared<LessPredicate>();
    return instance;
}

PredicatePtr less_equal() {
    static const PredicatePtr instance = std::make_shared<LessEqualPredicate>();
    return instance;
}

PredicatePtr greater() {
    static const PredicatePtr instance = std::make_shared<GreaterPredicate>();
    return instance;
}

PredicatePtr greater_equal() {
    static const PredicatePtr instance = std::make_shared<GreaterEqualPredicate>();
    return instance;
}

const PredicateList& builtin() {
    static const PredicateList all = {
        equal(), not_equal(), less(), less_equal(), greater(), greater_equal()
    };
    return all;
}

PredicatePtr by_name(const std::string& name) {
    for (const PredicatePtr& predicate : builtin()) {
        if (name == predicate->name()) {
            return predicate;
        }
    }
    throw std::invalid_argument("Unknown predicate: " + name);
}

} // namespace predicates
} // namespace arbor
