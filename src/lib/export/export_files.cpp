#include <algorithm>
#include <iomanip>
#include <set>
#include <sstream>

#include "export/export_files.hpp"

namespace {
// Quotes a CSV cell if needed.
std::string csv_cell(const std::string &value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (const auto &c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    return quoted + "\"";
}

std::string xml_escape(const std::string &value) {
    std::string escaped;
    for (const auto &c : value) {
        switch (c) {
            case '&':
                escaped += "&amp;";
                break;
            case '<':
                escaped += "&lt;";
                break;
            case '>':
                escaped += "&gt;";
                break;
            case '"':
                escaped += "&quot;";
                break;
            default:
                escaped += c;
        }
    }
    return escaped;
}

// Escapes the characters with a special meaning in Graphviz record labels.
std::string dot_record_escape(const std::string &value) {
    std::string escaped;
    for (const auto &c : value) {
        if (std::string("{}|<>\"\\").find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::string fixed(double value, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}
}  // namespace

bool Export::Files::Csv::write_glycoforms(
    std::ostream &stream, const std::vector<NodeRecord> &nodes) {
    char cell_delimiter = ',';
    char line_delimiter = '\n';

    // One column for each unit present in any glycoform.
    std::set<std::string> units;
    for (const auto &node : nodes) {
        for (const auto &entry : node.composition.counts) {
            units.insert(entry.first);
        }
    }

    // Write the CSV header.
    std::vector<std::string> header_columns = {
        "glycoform",      "abundance", "abundance_error",
        "corr_abundance", "corr_abundance_error",
    };
    header_columns.insert(header_columns.end(), units.begin(), units.end());
    for (size_t i = 0; i < header_columns.size(); ++i) {
        stream << csv_cell(header_columns[i]);
        if (i == header_columns.size() - 1) {
            stream << line_delimiter;
        } else {
            stream << cell_delimiter;
        }
    }

    std::vector<const NodeRecord *> sorted_nodes;
    for (const auto &node : nodes) {
        sorted_nodes.push_back(&node);
    }
    std::stable_sort(sorted_nodes.begin(), sorted_nodes.end(),
                     [](const NodeRecord *a, const NodeRecord *b) {
                         return a->corrected.nominal > b->corrected.nominal;
                     });

    auto previous_precision = stream.precision(8);
    for (const auto &node : sorted_nodes) {
        stream << csv_cell(node->name) << cell_delimiter
               << node->observed.nominal << cell_delimiter
               << node->observed.sigma << cell_delimiter
               << node->corrected.nominal << cell_delimiter
               << node->corrected.sigma;
        for (const auto &unit : units) {
            stream << cell_delimiter
                   << Composition::count(node->composition, unit);
        }
        stream << line_delimiter;
    }
    stream.precision(previous_precision);
    return stream.good();
}

bool Export::Files::Dot::write_graph(std::ostream &stream,
                                     const std::vector<NodeRecord> &nodes,
                                     const std::vector<EdgeRecord> &edges) {
    stream << "digraph {\n";
    for (const auto &node : nodes) {
        stream << "\t" << node.id << " [label=\""
               << dot_record_escape(node.name) << "|"
               << fixed(node.observed.nominal, 2) << "|"
               << fixed(node.corrected.nominal, 2)
               << "\", shape=record];\n";
    }
    for (const auto &edge : edges) {
        stream << "\t" << edge.source << " -> " << edge.sink << " [label=\""
               << dot_record_escape(edge.delta) << ": "
               << fixed(edge.rate.nominal * 100.0, 2) << "%\"];\n";
    }
    stream << "}\n";
    return stream.good();
}

bool Export::Files::Gexf::write_graph(std::ostream &stream,
                                      const std::vector<NodeRecord> &nodes,
                                      const std::vector<EdgeRecord> &edges) {
    stream << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
           << "<gexf xmlns=\"http://www.gexf.net/1.2draft\" version=\"1.2\">\n"
           << "  <graph defaultedgetype=\"directed\" mode=\"static\">\n";

    // Attribute declarations.
    std::vector<std::string> node_attributes = {
        "abundance", "abundance_error", "corr_abundance",
        "corr_abundance_error"};
    std::vector<std::string> edge_attributes = {"c", "c_error"};
    stream << "    <attributes class=\"node\" mode=\"static\">\n";
    for (size_t i = 0; i < node_attributes.size(); ++i) {
        stream << "      <attribute id=\"" << i << "\" title=\""
               << node_attributes[i] << "\" type=\"double\" />\n";
    }
    stream << "    </attributes>\n"
           << "    <attributes class=\"edge\" mode=\"static\">\n";
    for (size_t i = 0; i < edge_attributes.size(); ++i) {
        stream << "      <attribute id=\"" << i << "\" title=\""
               << edge_attributes[i] << "\" type=\"double\" />\n";
    }
    stream << "    </attributes>\n";

    auto previous_precision = stream.precision(8);
    stream << "    <nodes>\n";
    for (const auto &node : nodes) {
        std::vector<double> values = {node.observed.nominal,
                                      node.observed.sigma,
                                      node.corrected.nominal,
                                      node.corrected.sigma};
        stream << "      <node id=\"" << node.id << "\" label=\""
               << xml_escape(node.name) << "\">\n"
               << "        <attvalues>\n";
        for (size_t i = 0; i < values.size(); ++i) {
            stream << "          <attvalue for=\"" << i << "\" value=\""
                   << values[i] << "\" />\n";
        }
        stream << "        </attvalues>\n"
               << "      </node>\n";
    }
    stream << "    </nodes>\n";

    stream << "    <edges>\n";
    for (size_t i = 0; i < edges.size(); ++i) {
        const auto &edge = edges[i];
        stream << "      <edge id=\"" << i << "\" source=\"" << edge.source
               << "\" target=\"" << edge.sink << "\" label=\""
               << xml_escape(edge.delta) << "\">\n"
               << "        <attvalues>\n"
               << "          <attvalue for=\"0\" value=\"" << edge.rate.nominal
               << "\" />\n"
               << "          <attvalue for=\"1\" value=\"" << edge.rate.sigma
               << "\" />\n"
               << "        </attvalues>\n"
               << "      </edge>\n";
    }
    stream << "    </edges>\n"
           << "  </graph>\n"
           << "</gexf>\n";
    stream.precision(previous_precision);
    return stream.good();
}
