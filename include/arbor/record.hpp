#pragma once

/**
 * Arbor Record
 *
 * A labeled training or query sample: named attribute values plus a category.
 */

#include "types.hpp"
#include <initializer_list>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace arbor {

// Raised when a rule reads an attribute the record does not carry
class MissingAttributeError : public std::out_of_range {
public:
    explicit MissingAttributeError(const std::string& attribute)
        : std::out_of_range("record has no attribute '" + attribute + "'"),
          attribute_(attribute) {}

    const std::string& attribute() const { return attribute_; }

private:
    std::string attribute_;
};

class Record {
public:
    using AttributeMap = std::map<std::string, Value>;

    Record() = default;
    Record(std::initializer_list<AttributeMap::value_type> attributes,
           Category category = Category())
        : attributes_(attributes), category_(std::move(category)) {}
    Record(AttributeMap attributes, Category category)
        : attributes_(std::move(attributes)), category_(std::move(category)) {}

    Record& set(const std::string& name, Value value);
    bool has(const std::string& name) const { return attributes_.count(name) > 0; }

    // Throws MissingAttributeError if the attribute is absent
    const Value& value(const std::string& name) const;

    // Attribute names in ascending order
    std::vector<std::string> attribute_names() const;
    const AttributeMap& attributes() const { return attributes_; }
    size_t n_attributes() const { return attributes_.size(); }

    const Category& category() const { return category_; }
    void set_category(Category category) { category_ = std::move(category); }

    std::string to_string() const;

private:
    AttributeMap attributes_;
    Category category_;
};

using RecordSet = std::vector<Record>;

// Non-owning view of records; partitions during induction are built from these
using RecordRefs = std::vector<const Record*>;

RecordRefs make_refs(const RecordSet& records);

} // namespace arbor
