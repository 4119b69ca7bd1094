/**
 * Arbor Record Implementation
 */

#include "arbor/record.hpp"
#include <sstream>

namespace arbor {

Record& Record::set(const std::string& name, Value value) {
    attributes_[name] = std::move(value);
    return *this;
}

const Value& Record::value(const std::string& name) const {
    auto it = attributes_.find(name);
    if (it == attributes_.end()) {
        throw MissingAttributeError(name);
    }
    return it->second;
}

std::vector<std::string> Record::attribute_names() const {
    std::vector<std::string> names;
    names.reserve(attributes_.size());
    for (const auto& entry : attributes_) {
        names.push_back(entry.first);
    }
    return names;
}

std::string Record::to_string() const {
    std::ostringstream out;
    out << '{';
    bool first = true;
    for (const auto& entry : attributes_) {
        if (!first) out << ", ";
        out << entry.first << ": " << entry.second;
        first = false;
    }
    out << "} -> " << category_;
    return out.str();
}

RecordRefs make_refs(const RecordSet& records) {
    RecordRefs refs;
    refs.reserve(records.size());
    for (const Record& record : records) {
        refs.push_back(&record);
    }
    return refs;
}

} // namespace arbor
