#pragma once

/**
 * Arbor Rule
 *
 * (attribute, predicate, reference value) triple deciding which branch
 * a record follows at an internal tree node.
 */

#include "types.hpp"
#include "record.hpp"
#include "predicate.hpp"
#include <string>

namespace arbor {

class Rule {
public:
    Rule(std::string attribute, PredicatePtr predicate, Value reference);

    // Throws MissingAttributeError if the record lacks the attribute
    bool match(const Record& record) const {
        return predicate_->test(record.value(attribute_), reference_);
    }

    const std::string& attribute() const { return attribute_; }
    const PredicatePtr& predicate() const { return predicate_; }
    const Value& reference() const { return reference_; }

    // "color == red"
    std::string to_string() const;

    // Predicates compare by identity
    bool operator==(const Rule& other) const {
        return predicate_ == other.predicate_ &&
               attribute_ == other.attribute_ &&
               reference_ == other.reference_;
    }
    bool operator!=(const Rule& other) const { return !(*this == other); }

    size_t hash() const;

private:
    std::string attribute_;
    PredicatePtr predicate_;
    Value reference_;
};

} // namespace arbor

namespace std {

template <>
struct hash<arbor::Rule> {
    size_t operator()(const arbor::Rule& rule) const { return rule.hash(); }
};

} // namespace std
