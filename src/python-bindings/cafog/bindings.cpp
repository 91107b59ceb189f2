#include <cctype>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <tuple>

#include "pybind11/pybind11.h"
#include "pybind11/stl.h"

#include "composition/composition.hpp"
#include "correction/correction.hpp"
#include "correction/correction_serialize.hpp"
#include "dataset/dataset.hpp"
#include "dataset/dataset_files.hpp"
#include "export/export.hpp"
#include "export/export_files.hpp"
#include "glycan/glycan.hpp"
#include "glycation/conversion_rates.hpp"
#include "glycation/glycation_graph.hpp"
#include "glycation/glycation_graph_serialize.hpp"
#include "glycoform_space/glycoform_space.hpp"
#include "protein/protein.hpp"
#include "utils/compression.hpp"
#include "utils/diagnostics.hpp"
#include "utils/uncertainty.hpp"

namespace py = pybind11;

namespace PythonAPI {
std::tuple<std::vector<Dataset::Record>, std::vector<Diagnostics::Warning>>
read_dataset(std::string &input_file) {
    pybind11::gil_scoped_release release;
    std::vector<Diagnostics::Warning> warnings;
    auto records = Dataset::Files::read_dataset(input_file, &warnings);
    pybind11::gil_scoped_acquire acquire;
    return {records, warnings};
}

std::vector<Dataset::LibraryEntry> read_library(std::string &input_file) {
    pybind11::gil_scoped_release release;
    auto entries = Dataset::Files::read_library(input_file);
    pybind11::gil_scoped_acquire acquire;
    return entries;
}

std::tuple<Glycation::Graph, std::vector<Diagnostics::Warning>> build_graph(
    const std::vector<Dataset::Record> &glycoforms,
    const Glycation::RateTable &rates,
    const std::optional<std::vector<Dataset::LibraryEntry>> &library,
    std::optional<uint64_t> num_sites) {
    pybind11::gil_scoped_release release;
    std::vector<Diagnostics::Warning> warnings;
    Glycation::Parameters parameters = {num_sites};
    auto graph = Glycation::build_graph(glycoforms, library, rates, parameters,
                                        &warnings);
    pybind11::gil_scoped_acquire acquire;
    return {graph, warnings};
}

Correction::Result correct_abundances(
    const Glycation::Graph &graph,
    const std::optional<std::vector<uint64_t>> &order) {
    pybind11::gil_scoped_release release;
    Correction::Result result;
    if (order) {
        result = Correction::correct_abundances(graph, *order);
    } else {
        result = Correction::correct_abundances(graph);
    }
    pybind11::gil_scoped_acquire acquire;
    return result;
}

void write_glycoforms(const std::vector<Export::NodeRecord> &nodes,
                      std::string &output_file) {
    pybind11::gil_scoped_release release;
    std::ofstream stream(output_file);
    if (!stream) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't open output file " << output_file;
        throw std::invalid_argument(error_stream.str());
    }
    if (!Export::Files::Csv::write_glycoforms(stream, nodes)) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't write the glycoforms into the output "
                        "file "
                     << output_file;
        throw std::invalid_argument(error_stream.str());
    }
    pybind11::gil_scoped_acquire acquire;
}

void write_graph_file(const std::vector<Export::NodeRecord> &nodes,
                      const std::vector<Export::EdgeRecord> &edges,
                      std::string &output_file, std::string format) {
    for (auto &ch : format) {
        ch = std::tolower(ch);
    }
    if (format != "dot" && format != "gexf") {
        std::ostringstream error_stream;
        error_stream << "error: unknown graph format " << format;
        throw std::invalid_argument(error_stream.str());
    }

    pybind11::gil_scoped_release release;
    std::ofstream stream(output_file);
    if (!stream) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't open output file " << output_file;
        throw std::invalid_argument(error_stream.str());
    }
    bool ok = false;
    if (format == "dot") {
        ok = Export::Files::Dot::write_graph(stream, nodes, edges);
    } else {
        ok = Export::Files::Gexf::write_graph(stream, nodes, edges);
    }
    if (!ok) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't write the graph into the output file "
                     << output_file;
        throw std::invalid_argument(error_stream.str());
    }
    pybind11::gil_scoped_acquire acquire;
}

void write_corrected_graph(const Glycation::Graph &graph,
                           const Correction::Result &result,
                           std::string &output_file) {
    pybind11::gil_scoped_release release;
    // Open file stream.
    Compression::DeflateStream stream;
    stream.open(output_file);
    if (!stream) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't open output file " << output_file;
        throw std::invalid_argument(error_stream.str());
    }

    if (!Glycation::Serialize::write_graph(stream, graph) ||
        !Correction::Serialize::write_result(stream, result)) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't write the graph into the output file "
                     << output_file;
        throw std::invalid_argument(error_stream.str());
    }
    pybind11::gil_scoped_acquire acquire;
}

std::tuple<Glycation::Graph, Correction::Result> read_corrected_graph(
    std::string &input_file) {
    pybind11::gil_scoped_release release;
    // Open file stream.
    Compression::InflateStream stream;
    stream.open(input_file);
    if (!stream) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't open input file " << input_file;
        throw std::invalid_argument(error_stream.str());
    }

    Glycation::Graph graph;
    Correction::Result result;
    if (!Glycation::Serialize::read_graph(stream, &graph) ||
        !Correction::Serialize::read_result(stream, &result)) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't read the graph from the input file "
                     << input_file;
        throw std::invalid_argument(error_stream.str());
    }
    pybind11::gil_scoped_acquire acquire;
    return {graph, result};
}

std::string to_string(const Uncertainty::Value &value) {
    return std::to_string(value.nominal) + " +/- " +
           std::to_string(value.sigma);
}
}  // namespace PythonAPI

PYBIND11_MODULE(cafog, m) {
    // Documentation.
    m.doc() = "cafog: correction of glycation artifacts in glycoform "
              "abundances";

    // Exceptions.
    py::register_exception<Dataset::InputFormatError>(m, "InputFormatError",
                                                      PyExc_ValueError);
    py::register_exception<Glycan::NomenclatureError>(m, "NomenclatureError",
                                                      PyExc_ValueError);
    py::register_exception<Correction::InconsistentModelError>(
        m, "InconsistentModelError", PyExc_RuntimeError);

    // Structs.
    py::class_<Uncertainty::Value>(m, "Value")
        .def(py::init<double, double>(), py::arg("nominal"),
             py::arg("sigma") = 0.0)
        .def_readonly("nominal", &Uncertainty::Value::nominal)
        .def_readonly("sigma", &Uncertainty::Value::sigma)
        .def("__repr__", [](const Uncertainty::Value &v) {
            return "Value <" + PythonAPI::to_string(v) + ">";
        });

    py::class_<Composition::Composition>(m, "Composition")
        .def_readonly("counts", &Composition::Composition::counts)
        .def("total", &Composition::total)
        .def(
            "__eq__",
            [](const Composition::Composition &a,
               const Composition::Composition &b) { return a == b; },
            py::is_operator())
        .def("__hash__", &Composition::hash)
        .def("__repr__", [](const Composition::Composition &c) {
            return "Composition <" + Composition::to_string(c) + ">";
        });

    py::class_<Diagnostics::Warning>(m, "Warning")
        .def_readonly("message", &Diagnostics::Warning::message)
        .def_property_readonly(
            "kind",
            [](const Diagnostics::Warning &w) {
                return Diagnostics::kind_name(w.kind);
            })
        .def("__repr__", [](const Diagnostics::Warning &w) {
            return "Warning <" + Diagnostics::kind_name(w.kind) + ": " +
                   w.message + ">";
        });

    py::class_<Dataset::Record>(m, "Record")
        .def(py::init([](std::string label, double value, double uncertainty) {
                 return Dataset::Record{label, value, uncertainty};
             }),
             py::arg("label"), py::arg("value"), py::arg("uncertainty") = 0.0)
        .def_readonly("label", &Dataset::Record::label)
        .def_readonly("value", &Dataset::Record::value)
        .def_readonly("uncertainty", &Dataset::Record::uncertainty)
        .def("__repr__", [](const Dataset::Record &r) {
            return "Record <label: " + r.label +
                   ", value: " + std::to_string(r.value) +
                   ", uncertainty: " + std::to_string(r.uncertainty) + ">";
        });

    py::class_<Dataset::LibraryEntry>(m, "LibraryEntry")
        .def(py::init([](std::string name, std::string composition,
                         std::optional<double> abundance) {
                 return Dataset::LibraryEntry{name, composition, abundance};
             }),
             py::arg("name"), py::arg("composition") = "",
             py::arg("abundance") = std::nullopt)
        .def_readonly("name", &Dataset::LibraryEntry::name)
        .def_readonly("composition", &Dataset::LibraryEntry::composition)
        .def_readonly("abundance", &Dataset::LibraryEntry::abundance)
        .def("__repr__", [](const Dataset::LibraryEntry &e) {
            return "LibraryEntry <name: " + e.name +
                   ", composition: " + e.composition + ">";
        });

    py::class_<Glycan::Glycan>(m, "Glycan")
        .def(py::init(&Glycan::from_library_entry), py::arg("name"),
             py::arg("composition") = "", py::arg("abundance") = 1.0)
        .def_readonly("name", &Glycan::Glycan::name)
        .def_readonly("composition", &Glycan::Glycan::composition)
        .def_readonly("abundance", &Glycan::Glycan::abundance)
        .def("__repr__", [](const Glycan::Glycan &g) {
            return "Glycan <name: " + g.name +
                   ", composition: " + Composition::to_string(g.composition) +
                   ">";
        });

    py::class_<GlycoformSpace::Glycoform>(m, "Glycoform")
        .def_readonly("composition", &GlycoformSpace::Glycoform::composition)
        .def_readonly("name", &GlycoformSpace::Glycoform::name)
        .def_readonly("abundance", &GlycoformSpace::Glycoform::abundance)
        .def_readonly("mass", &GlycoformSpace::Glycoform::mass)
        .def("__repr__", [](const GlycoformSpace::Glycoform &g) {
            return "Glycoform <name: " + g.name +
                   ", abundance: " + std::to_string(g.abundance) + ">";
        });

    py::class_<Glycation::RateTable>(m, "RateTable")
        .def_readonly("unit", &Glycation::RateTable::unit)
        .def("rates",
             [](const Glycation::RateTable &table) {
                 std::vector<std::tuple<Composition::Composition,
                                        Uncertainty::Value>>
                     rates;
                 for (const auto &[delta, rate] : table.rates) {
                     rates.emplace_back(delta, rate);
                 }
                 return rates;
             })
        .def("__repr__", [](const Glycation::RateTable &table) {
            return "RateTable <unit: " + table.unit +
                   ", num_rates: " + std::to_string(table.rates.size()) + ">";
        });

    py::class_<Glycation::Node>(m, "Node")
        .def_readonly("id", &Glycation::Node::id)
        .def_readonly("composition", &Glycation::Node::composition)
        .def_readonly("name", &Glycation::Node::name)
        .def_readonly("observed", &Glycation::Node::observed)
        .def_readonly("matched", &Glycation::Node::matched)
        .def_readonly("theoretical_abundance",
                      &Glycation::Node::theoretical_abundance)
        .def_readonly("mass", &Glycation::Node::mass)
        .def("__repr__", [](const Glycation::Node &n) {
            return "Node <id: " + std::to_string(n.id) + ", name: " + n.name +
                   ", observed: " + PythonAPI::to_string(n.observed) + ">";
        });

    py::class_<Glycation::Edge>(m, "Edge")
        .def_readonly("source", &Glycation::Edge::source)
        .def_readonly("sink", &Glycation::Edge::sink)
        .def_readonly("delta", &Glycation::Edge::delta)
        .def_readonly("rate", &Glycation::Edge::rate)
        .def("__repr__", [](const Glycation::Edge &e) {
            return "Edge <" + std::to_string(e.source) + " -> " +
                   std::to_string(e.sink) +
                   ", delta: " + Composition::to_string(e.delta) +
                   ", rate: " + PythonAPI::to_string(e.rate) + ">";
        });

    py::class_<Glycation::Graph>(m, "Graph")
        .def_readonly("nodes", &Glycation::Graph::nodes)
        .def_readonly("edges", &Glycation::Graph::edges)
        .def("__repr__", [](const Glycation::Graph &g) {
            return "Graph <num_nodes: " + std::to_string(g.nodes.size()) +
                   ", num_edges: " + std::to_string(g.edges.size()) + ">";
        });

    py::class_<Correction::Result>(m, "Result")
        .def_readonly("corrected", &Correction::Result::corrected)
        .def_readonly("normalized", &Correction::Result::normalized)
        .def("__repr__", [](const Correction::Result &r) {
            return "Result <num_values: " +
                   std::to_string(r.corrected.size()) +
                   ", normalized: " + (r.normalized ? "true" : "false") + ">";
        });

    py::class_<Export::NodeRecord>(m, "NodeRecord")
        .def_readonly("id", &Export::NodeRecord::id)
        .def_readonly("name", &Export::NodeRecord::name)
        .def_readonly("label", &Export::NodeRecord::label)
        .def_readonly("composition", &Export::NodeRecord::composition)
        .def_readonly("mass", &Export::NodeRecord::mass)
        .def_readonly("observed", &Export::NodeRecord::observed)
        .def_readonly("corrected", &Export::NodeRecord::corrected)
        .def("__repr__", [](const Export::NodeRecord &n) {
            return "NodeRecord <id: " + std::to_string(n.id) +
                   ", label: " + n.label +
                   ", observed: " + PythonAPI::to_string(n.observed) +
                   ", corrected: " + PythonAPI::to_string(n.corrected) + ">";
        });

    py::class_<Export::EdgeRecord>(m, "EdgeRecord")
        .def_readonly("source", &Export::EdgeRecord::source)
        .def_readonly("sink", &Export::EdgeRecord::sink)
        .def_readonly("delta", &Export::EdgeRecord::delta)
        .def_readonly("rate", &Export::EdgeRecord::rate)
        .def("__repr__", [](const Export::EdgeRecord &e) {
            return "EdgeRecord <" + std::to_string(e.source) + " -> " +
                   std::to_string(e.sink) + ", delta: " + e.delta +
                   ", rate: " + PythonAPI::to_string(e.rate) + ">";
        });

    // Functions.
    m.def("parse_glycan_name", &Glycan::parse_name,
          "Derive the monosaccharide composition of a glycan from its name",
          py::arg("name"))
        .def("unique_glycoforms",
             py::overload_cast<const std::vector<Glycan::Glycan> &, size_t>(
                 &GlycoformSpace::unique_glycoforms),
             "Enumerate the glycoforms with a unique composition",
             py::arg("library"), py::arg("num_sites"))
        .def("protein_formula", &Protein::sequence_formula,
             "Elemental formula of an amino acid sequence", py::arg("sequence"),
             py::arg("chains") = 1, py::arg("disulfides") = 0)
        .def("glycoprotein_mass", &Protein::glycoprotein_mass,
             "Mass of a glycoprotein carrying a glycoform of the given mass",
             py::arg("sequence"), py::arg("glycoform_mass"),
             py::arg("chains") = 1, py::arg("disulfides") = 0)
        .def("read_dataset", &PythonAPI::read_dataset,
             "Read an abundance dataset from a CSV file", py::arg("file_name"))
        .def("read_library", &PythonAPI::read_library,
             "Read a glycan library from a CSV file", py::arg("file_name"))
        .def("build_rate_table", &Glycation::build_rate_table,
             "Build the conversion rate table from a glycation dataset",
             py::arg("glycation"), py::arg("unit") = "Hex")
        .def("build_graph", &PythonAPI::build_graph,
             "Build the glycation graph", py::arg("glycoforms"),
             py::arg("rates"), py::arg("library") = std::nullopt,
             py::arg("num_sites") = std::nullopt)
        .def("topological_order", &Glycation::topological_order,
             "Node ids in topological order", py::arg("graph"))
        .def("correct_abundances", &PythonAPI::correct_abundances,
             "Correct the glycoform abundances of the graph",
             py::arg("graph"), py::arg("order") = std::nullopt)
        .def("normalize", &Correction::normalize,
             "Scale the corrected abundances so that they add up to 100",
             py::arg("result"))
        .def("node_records", &Export::node_records,
             "Glycoforms with their observed and corrected abundances",
             py::arg("graph"), py::arg("result"))
        .def("edge_records", &Export::edge_records,
             "Conversion edges of the graph", py::arg("graph"))
        .def("write_glycoforms", &PythonAPI::write_glycoforms,
             "Write the corrected glycoforms to a CSV file", py::arg("nodes"),
             py::arg("file_name"))
        .def("write_graph_file", &PythonAPI::write_graph_file,
             "Write the graph in 'dot' or 'gexf' format", py::arg("nodes"),
             py::arg("edges"), py::arg("file_name"), py::arg("format"))
        .def("write_corrected_graph", &PythonAPI::write_corrected_graph,
             "Write the graph and its correction to a binary file",
             py::arg("graph"), py::arg("result"), py::arg("file_name"))
        .def("read_corrected_graph", &PythonAPI::read_corrected_graph,
             "Read the graph and its correction from a binary file",
             py::arg("file_name"));
}
