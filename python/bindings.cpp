/**
 * Arbor Python Bindings
 *
 * Records are built from dicts of bool/int/float/str values.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <sstream>

#include "arbor/arbor.hpp"

namespace py = pybind11;
using namespace arbor;

// ============================================================================
// Value Conversion
// ============================================================================

static Value value_from_python(const py::handle& obj) {
    if (obj.is_none()) {
        return Value();
    }
    // bool before int: Python bools are ints
    if (py::isinstance<py::bool_>(obj)) {
        return Value(obj.cast<bool>());
    }
    if (py::isinstance<py::int_>(obj)) {
        return Value(obj.cast<int64_t>());
    }
    if (py::isinstance<py::float_>(obj)) {
        return Value(obj.cast<double>());
    }
    if (py::isinstance<py::str>(obj)) {
        return Value(obj.cast<std::string>());
    }
    throw py::type_error("unsupported value type: " +
                         py::str(obj.get_type()).cast<std::string>());
}

static py::object value_to_python(const Value& value) {
    switch (value.kind()) {
        case ValueKind::Null:    return py::none();
        case ValueKind::Bool:    return py::bool_(value.as_bool());
        case ValueKind::Integer: return py::int_(value.as_integer());
        case ValueKind::Real:    return py::float_(value.as_real());
        case ValueKind::Text:    return py::str(value.as_text());
    }
    return py::none();
}

static Record record_from_python(const py::dict& attributes, const py::handle& category) {
    Record record;
    for (const auto& item : attributes) {
        record.set(item.first.cast<std::string>(), value_from_python(item.second));
    }
    record.set_category(value_from_python(category));
    return record;
}

static py::dict votes_to_python(const VoteHistogram& votes) {
    py::dict result;
    for (const auto& entry : votes) {
        result[value_to_python(entry.first)] = entry.second;
    }
    return result;
}

static PredicateList predicates_from_names(const std::vector<std::string>& names) {
    PredicateList list;
    for (const std::string& name : names) {
        list.push_back(predicates::by_name(name));
    }
    return list;
}

// ============================================================================
// Module Definition
// ============================================================================

PYBIND11_MODULE(_arbor, m) {
    m.doc() = "Arbor: entropy-driven decision trees and random forests";

    m.attr("__version__") = ARBOR_VERSION_STRING;

    py::register_exception<MissingAttributeError>(m, "MissingAttributeError", PyExc_KeyError);

    py::class_<Record>(m, "Record")
        .def(py::init([](const py::dict& attributes, const py::object& category) {
                 return record_from_python(attributes, category);
             }),
             py::arg("attributes"),
             py::arg("category") = py::none())
        .def("value", [](const Record& r, const std::string& name) {
            return value_to_python(r.value(name));
        })
        .def("has", &Record::has)
        .def("attribute_names", &Record::attribute_names)
        .def_property_readonly("category", [](const Record& r) {
            return value_to_python(r.category());
        })
        .def("__repr__", &Record::to_string);

    py::class_<DecisionTree>(m, "DecisionTree")
        .def("classify", [](const DecisionTree& t, const Record& r) {
            return value_to_python(t.classify(r));
        })
        .def("merge_redundant_rules", &DecisionTree::merge_redundant_rules,
             py::return_value_policy::reference_internal)
        .def_property_readonly("n_nodes", &DecisionTree::n_nodes)
        .def_property_readonly("n_leaves", &DecisionTree::n_leaves)
        .def_property_readonly("depth", &DecisionTree::depth)
        .def("__str__", &DecisionTree::to_string);

    py::class_<TreeBuilder>(m, "TreeBuilder")
        .def(py::init<>())
        .def("set_training_set", [](TreeBuilder& b, const std::vector<Record>& records) -> TreeBuilder& {
                 return b.set_training_set(records);
             }, py::return_value_policy::reference_internal)
        .def("add_record", [](TreeBuilder& b, const Record& record) -> TreeBuilder& {
                 return b.add_record(record);
             }, py::return_value_policy::reference_internal)
        .def("set_min_leaf_size", &TreeBuilder::set_min_leaf_size,
             py::return_value_policy::reference_internal)
        .def("set_default_predicates",
             [](TreeBuilder& b, const std::vector<std::string>& names) -> TreeBuilder& {
                 return b.set_default_predicates(predicates_from_names(names));
             }, py::return_value_policy::reference_internal)
        .def("set_attribute_predicates",
             [](TreeBuilder& b, const std::string& attribute,
                const std::vector<std::string>& names) -> TreeBuilder& {
                 return b.set_attribute_predicates(attribute, predicates_from_names(names));
             }, py::return_value_policy::reference_internal)
        .def("ignore_attribute", &TreeBuilder::ignore_attribute,
             py::return_value_policy::reference_internal)
        .def("set_seed", &TreeBuilder::set_seed,
             py::return_value_policy::reference_internal)
        .def("set_verbosity", &TreeBuilder::set_verbosity,
             py::return_value_policy::reference_internal)
        .def("build", &TreeBuilder::build);

    py::class_<RandomForest>(m, "RandomForest")
        .def_static("create", [](const TreeBuilder& builder, uint32_t n_trees) {
                        return RandomForest::create(builder, n_trees);
                    },
                    py::arg("builder"), py::arg("n_trees") = 10)
        .def("classify", [](const RandomForest& f, const Record& r) {
            return votes_to_python(f.classify(r));
        })
        .def("predict", [](const RandomForest& f, const Record& r) {
            return value_to_python(f.predict(r));
        })
        .def_property_readonly("n_trees", &RandomForest::n_trees);

    m.def("print_info", &print_info, "Print Arbor library information");
}
