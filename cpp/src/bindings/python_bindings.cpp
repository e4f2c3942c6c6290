#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "libbnx/enumeration_query.hpp"
#include "libbnx/errors.hpp"
#include "libbnx/joint_distribution.hpp"
#include "libbnx/network.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace py = pybind11;
using namespace libbnx;

namespace {

Outcome to_outcome(py::handle value) {
    // bool before int: Python bools are ints.
    if (py::isinstance<py::bool_>(value)) {
        return Outcome(value.cast<bool>());
    }
    if (py::isinstance<py::int_>(value)) {
        return Outcome(value.cast<std::int64_t>());
    }
    if (py::isinstance<py::str>(value)) {
        return Outcome(value.cast<std::string>());
    }
    throw py::type_error("outcome must be bool, int or str, got " + std::string(py::str(value.get_type())));
}

py::object from_outcome(const Outcome& outcome) {
    if (outcome.is_bool()) {
        return py::bool_(outcome.as_bool());
    }
    if (outcome.is_integer()) {
        return py::int_(outcome.as_integer());
    }
    return py::str(outcome.as_string());
}

bool is_scalar(py::handle value) {
    return !py::isinstance<py::bool_>(value) && (py::isinstance<py::float_>(value) || py::isinstance<py::int_>(value));
}

DistributionSpec to_distribution(py::handle value) {
    if (is_scalar(value)) {
        return DistributionSpec(value.cast<double>());
    }
    if (!py::isinstance<py::dict>(value)) {
        throw py::type_error("distribution must be a float or a dict of outcome weights");
    }
    Weights weights;
    for (auto item : value.cast<py::dict>()) {
        weights.emplace_back(to_outcome(item.first), item.second.cast<double>());
    }
    return DistributionSpec(std::move(weights));
}

RowKey to_row_key(py::handle key) {
    if (py::isinstance<py::tuple>(key)) {
        Row row;
        for (auto item : key.cast<py::tuple>()) {
            row.push_back(to_outcome(item));
        }
        return RowKey(std::move(row));
    }
    return RowKey(to_outcome(key));
}

// A float, or a dict without a () key, is a bare distribution when there are no parents.
CptSpec to_cpt_spec(py::handle cpt, std::size_t parent_count) {
    if (is_scalar(cpt)) {
        return CptSpec::prior(to_distribution(cpt));
    }
    if (!py::isinstance<py::dict>(cpt)) {
        throw py::type_error("cpt must be a float or a dict");
    }
    auto table = cpt.cast<py::dict>();
    if (parent_count == 0 && !table.contains(py::tuple())) {
        return CptSpec::prior(to_distribution(cpt));
    }
    std::vector<CptSpec::Entry> entries;
    for (auto item : table) {
        entries.push_back(CptSpec::Entry{to_row_key(item.first), to_distribution(item.second)});
    }
    return CptSpec::rows(std::move(entries));
}

py::dict to_dict(const ProbabilityTable& table) {
    py::dict result;
    for (const auto& [outcome, probability] : table.entries()) {
        result[from_outcome(outcome)] = probability;
    }
    return result;
}

NamedEvidence to_evidence(const py::dict& evidence) {
    NamedEvidence result;
    for (auto item : evidence) {
        result.emplace(item.first.cast<std::string>(), to_outcome(item.second));
    }
    return result;
}

}  // namespace

PYBIND11_MODULE(_libbnx, m) {
    m.doc() = "libbnx python bindings";

    py::register_exception<UnknownVariable>(m, "UnknownVariable", PyExc_KeyError);
    py::register_exception<MissingConditionalRow>(m, "MissingConditionalRow", PyExc_KeyError);
    py::register_exception<VariableNotInNetwork>(m, "VariableNotInNetwork", PyExc_ValueError);
    py::register_exception<ZeroTotalProbability>(m, "ZeroTotalProbability", PyExc_ZeroDivisionError);
    py::register_exception<InvalidProbabilityValue>(m, "InvalidProbabilityValue", PyExc_ValueError);

    py::class_<InferenceOptions>(m, "InferenceOptions")
        .def(py::init<>())
        .def_readwrite("verbose", &InferenceOptions::verbose)
        .def_readwrite("cache_joint", &InferenceOptions::cache_joint)
        .def_readwrite("max_joint_rows", &InferenceOptions::max_joint_rows);

    py::class_<Network>(m, "Network")
        .def(py::init<>())
        .def("add",
             [](Network& network, std::string name, std::vector<std::string> parents, py::object cpt) -> Network& {
                 auto spec = to_cpt_spec(cpt, parents.size());
                 return network.add(std::move(name), std::move(parents), spec);
             },
             py::arg("name"), py::arg("parents"), py::arg("cpt"),
             py::return_value_policy::reference_internal)
        .def("names", &Network::names)
        .def("domain",
             [](const Network& network, const std::string& name) {
                 py::list result;
                 for (const auto& outcome : network.lookup(name).domain()) {
                     result.append(from_outcome(outcome));
                 }
                 return result;
             },
             py::arg("name"))
        .def("parents",
             [](const Network& network, const std::string& name) { return network.lookup(name).parent_names(); },
             py::arg("name"))
        .def("ask",
             [](const Network& network, const std::string& query, const py::dict& evidence,
                const InferenceOptions& options) {
                 return to_dict(ask(network, query, to_evidence(evidence), options));
             },
             py::arg("query"), py::arg("evidence") = py::dict(), py::arg("options") = InferenceOptions{})
        .def("posterior_marginals",
             [](const Network& network, const py::dict& evidence, const InferenceOptions& options) {
                 EnumerationQuery query(network, options);
                 auto marginals = query.posterior_marginals(query.resolve(to_evidence(evidence)));
                 py::dict result;
                 for (std::size_t i = 0; i < marginals.size(); ++i) {
                     result[py::str(network.variable(i).name())] = to_dict(marginals[i]);
                 }
                 return result;
             },
             py::arg("evidence") = py::dict(), py::arg("options") = InferenceOptions{})
        .def("joint_distribution",
             [](const Network& network, const InferenceOptions& options) {
                 const auto& joint = network.joint_distribution(options);
                 py::dict result;
                 for (std::size_t r = 0; r < joint.size(); ++r) {
                     py::tuple key(joint.row(r).size());
                     for (std::size_t i = 0; i < joint.row(r).size(); ++i) {
                         key[i] = from_outcome(joint.row(r)[i]);
                     }
                     result[key] = joint.probabilities()[static_cast<Eigen::Index>(r)];
                 }
                 return result;
             },
             py::arg("options") = InferenceOptions{})
        .def("__len__", &Network::size)
        .def("__contains__", &Network::contains);
}
