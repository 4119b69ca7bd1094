#pragma once

/**
 * Arbor: Entropy-Driven Decision Trees and Random Forests
 *
 * Core type definitions:
 * - Value: the tagged scalar stored in record attributes and used as category
 * - Ordering, equality and hashing rules shared by rules, histograms and leaves
 */

#include <cstdint>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace arbor {

// ============================================================================
// Basic Types
// ============================================================================

using NodeIndex = uint32_t;             // Index into a tree's node array
using Count = uint32_t;                 // Vote / category counts

// ============================================================================
// Value
// ============================================================================

enum class ValueKind : uint8_t {
    Null = 0,
    Bool = 1,
    Integer = 2,
    Real = 3,
    Text = 4
};

/**
 * Scalar attribute value or category label.
 *
 * Integers and reals compare numerically with each other (1 == 1.0).
 * Values of different kinds are ordered null < bool < number < text,
 * which makes every Value usable as an ordered map key.
 */
class Value {
public:
    Value() = default;
    Value(bool v) : data_(v) {}
    Value(double v) : data_(v) {}
    Value(float v) : data_(static_cast<double>(v)) {}
    Value(const char* v) : data_(std::string(v)) {}
    Value(std::string v) : data_(std::move(v)) {}

    template <typename T,
              typename std::enable_if<std::is_integral<T>::value &&
                                      !std::is_same<T, bool>::value, int>::type = 0>
    Value(T v) : data_(static_cast<int64_t>(v)) {}

    ValueKind kind() const { return static_cast<ValueKind>(data_.index()); }

    bool is_null() const { return kind() == ValueKind::Null; }
    bool is_bool() const { return kind() == ValueKind::Bool; }
    bool is_integer() const { return kind() == ValueKind::Integer; }
    bool is_real() const { return kind() == ValueKind::Real; }
    bool is_number() const { return is_integer() || is_real(); }
    bool is_text() const { return kind() == ValueKind::Text; }

    // Accessors throw std::bad_variant_access on kind mismatch
    bool as_bool() const { return std::get<bool>(data_); }
    int64_t as_integer() const { return std::get<int64_t>(data_); }
    double as_real() const;   // Converts integers
    const std::string& as_text() const { return std::get<std::string>(data_); }

    // Two values are orderable against each other by <, <=, >, >=
    bool orderable_with(const Value& other) const;

    // Total order: negative, zero or positive
    int compare(const Value& other) const;

    std::string to_string() const;
    size_t hash() const;

    bool operator==(const Value& other) const { return compare(other) == 0; }
    bool operator!=(const Value& other) const { return compare(other) != 0; }
    bool operator<(const Value& other) const { return compare(other) < 0; }
    bool operator<=(const Value& other) const { return compare(other) <= 0; }
    bool operator>(const Value& other) const { return compare(other) > 0; }
    bool operator>=(const Value& other) const { return compare(other) >= 0; }

private:
    std::variant<std::monostate, bool, int64_t, double, std::string> data_;
};

std::ostream& operator<<(std::ostream& out, const Value& value);

// Category labels share the Value representation; a null category means "none"
using Category = Value;

// Category -> number of occurrences (ascending category order)
using CategoryCounts = std::map<Category, Count>;

} // namespace arbor

namespace std {

template <>
struct hash<arbor::Value> {
    size_t operator()(const arbor::Value& value) const { return value.hash(); }
};

} // namespace std
