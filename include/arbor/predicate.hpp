#pragma once

/**
 * Arbor Predicates
 *
 * A predicate is a reusable test between a record's attribute value
 * (candidate) and a reference value taken from a training record.
 * Split search builds one rule per (attribute, predicate, observed value).
 */

#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace arbor {

class Predicate {
public:
    virtual ~Predicate() = default;

    // Short operator-like name, e.g. "==" or "<="
    virtual const char* name() const = 0;

    virtual bool test(const Value& candidate, const Value& reference) const = 0;
};

using PredicatePtr = std::shared_ptr<const Predicate>;
using PredicateList = std::vector<PredicatePtr>;

// ============================================================================
// Built-in Predicates
// ============================================================================

class EqualPredicate : public Predicate {
public:
    const char* name() const override { return "=="; }
    bool test(const Value& candidate, const Value& reference) const override {
        return candidate == reference;
    }
};

class NotEqualPredicate : public Predicate {
public:
    const char* name() const override { return "!="; }
    bool test(const Value& candidate, const Value& reference) const override {
        return candidate != reference;
    }
};

// Ordering predicates never match values that cannot be ordered (text vs number, null)
class LessPredicate : public Predicate {
public:
    const char* name() const override { return "<"; }
    bool test(const Value& candidate, const Value& reference) const override {
        return candidate.orderable_with(reference) && candidate < reference;
    }
};

class LessEqualPredicate : public Predicate {
public:
    const char* name() const override { return "<="; }
    bool test(const Value& candidate, const Value& reference) const override {
        return candidate.orderable_with(reference) && candidate <= reference;
    }
};

class GreaterPredicate : public Predicate {
public:
    const char* name() const override { return ">"; }
    bool test(const Value& candidate, const Value& reference) const override {
        return candidate.orderable_with(reference) && candidate > reference;
    }
};

class GreaterEqualPredicate : public Predicate {
public:
    const char* name() const override { return ">="; }
    bool test(const Value& candidate, const Value& reference) const override {
        return candidate.orderable_with(reference) && candidate >= reference;
    }
};

/**
 * Shared instances of the built-in predicates.
 * Rules compare predicates by identity, so reusing these instances
 * lets split search deduplicate equivalent candidate rules.
 */
namespace predicates {

PredicatePtr equal();
PredicatePtr not_equal();
PredicatePtr less();
PredicatePtr less_equal();
PredicatePtr greater();
PredicatePtr greater_equal();

// All built-ins in the order above
const PredicateList& builtin();

// Lookup by name ("==", "!=", "<", "<=", ">", ">="); throws std::invalid_argument
PredicatePtr by_name(const std::string& name);

} // namespace predicates

} // namespace arbor
