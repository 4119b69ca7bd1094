/**
 * Arbor Rule Implementation
 */

#include "arbor/rule.hpp"
#include <functional>
#include <stdexcept>

namespace arbor {

Rule::Rule(std::string attribute, PredicatePtr predicate, Value reference)
    : attribute_(std::move(attribute)),
      predicate_(std::move(predicate)),
      reference_(std::move(reference)) {
    if (!predicate_) {
        throw std::invalid_argument("Rule requires a predicate");
    }
}

std::string Rule::to_string() const {
    return attribute_ + " " + predicate_->name() + " " + reference_.to_string();
}

size_t Rule::hash() const {
    size_t h = std::hash<std::string>{}(attribute_);
    h ^= std::hash<const Predicate*>{}(predicate_.get()) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= reference_.hash() + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

} // namespace arbor
