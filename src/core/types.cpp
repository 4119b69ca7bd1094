/**
 * Arbor Value Implementation
 */

#include "arbor/types.hpp"
#include <cmath>
#include <ostream>
#include <sstream>

namespace arbor {

namespace {

// Rank used to order values of different kinds; integers and reals share one
int kind_rank(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null:    return 0;
        case ValueKind::Bool:    return 1;
        case ValueKind::Integer:
        case ValueKind::Real:    return 2;
        case ValueKind::Text:    return 3;
    }
    return 0;
}

template <typename T>
int three_way(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

// Bounds of int64_t as doubles: [-2^63, 2^63)
constexpr double kInt64Lower = -9223372036854775808.0;
constexpr double kInt64Upper = 9223372036854775808.0;

// Exact comparison of an integer against a non-NaN real
int compare_integer_real(int64_t i, double d) {
    if (d >= kInt64Upper) return -1;
    if (d < kInt64Lower) return 1;
    double whole = std::trunc(d);
    int c = three_way(i, static_cast<int64_t>(whole));
    if (c != 0) return c;
    return three_way(whole, d);
}

// NaN sorts after every other number and equals only itself
int compare_numbers(const Value& a, const Value& b) {
    if (a.is_integer() && b.is_integer()) {
        return three_way(a.as_integer(), b.as_integer());
    }
    bool a_nan = a.is_real() && std::isnan(a.as_real());
    bool b_nan = b.is_real() && std::isnan(b.as_real());
    if (a_nan || b_nan) {
        return three_way(a_nan, b_nan);
    }
    if (a.is_integer()) {
        return compare_integer_real(a.as_integer(), b.as_real());
    }
    if (b.is_integer()) {
        return -compare_integer_real(b.as_integer(), a.as_real());
    }
    return three_way(a.as_real(), b.as_real());
}

} // namespace

double Value::as_real() const {
    if (is_integer()) {
        return static_cast<double>(std::get<int64_t>(data_));
    }
    return std::get<double>(data_);
}

bool Value::orderable_with(const Value& other) const {
    if (is_null() || other.is_null()) {
        return false;
    }
    return kind_rank(kind()) == kind_rank(other.kind());
}

int Value::compare(const Value& other) const {
    int rank = kind_rank(kind());
    int other_rank = kind_rank(other.kind());
    if (rank != other_rank) {
        return rank < other_rank ? -1 : 1;
    }

    switch (kind()) {
        case ValueKind::Null:
            return 0;
        case ValueKind::Bool:
            return three_way(as_bool(), other.as_bool());
        case ValueKind::Integer:
        case ValueKind::Real:
            return compare_numbers(*this, other);
        case ValueKind::Text: {
            int c = as_text().compare(other.as_text());
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
    }
    return 0;
}

std::string Value::to_string() const {
    switch (kind()) {
        case ValueKind::Null:
            return "null";
        case ValueKind::Bool:
            return as_bool() ? "true" : "false";
        case ValueKind::Integer:
            return std::to_string(as_integer());
        case ValueKind::Real: {
            std::ostringstream out;
            out << std::get<double>(data_);
            return out.str();
        }
        case ValueKind::Text:
            return as_text();
    }
    return std::string();
}

size_t Value::hash() const {
    switch (kind()) {
        case ValueKind::Null:
            return 0x9e3779b9u;
        case ValueKind::Bool:
            return std::hash<bool>{}(as_bool());
        case ValueKind::Integer:
            return std::hash<int64_t>{}(as_integer());
        case ValueKind::Real: {
            // Integral reals hash as the integer they equal
            double d = std::get<double>(data_);
            if (std::isnan(d)) {
                return 0x7ff8u;
            }
            if (d >= kInt64Lower && d < kInt64Upper && std::trunc(d) == d) {
                return std::hash<int64_t>{}(static_cast<int64_t>(d));
            }
            return std::hash<double>{}(d);
        }
        case ValueKind::Text:
            return std::hash<std::string>{}(as_text());
    }
    return 0;
}

std::ostream& operator<<(std::ostream& out, const Value& value) {
    return out << value.to_string();
}

} // namespace arbor
