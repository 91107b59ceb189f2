#include <stdexcept>

#include "export/export.hpp"

std::vector<Export::NodeRecord> Export::node_records(
    const Glycation::Graph &graph, const Correction::Result &result) {
    if (result.corrected.size() != graph.nodes.size()) {
        throw std::invalid_argument(
            "the number of corrected abundances (" +
            std::to_string(result.corrected.size()) +
            ") doesn't match the number of glycoforms (" +
            std::to_string(graph.nodes.size()) + ")");
    }
    std::vector<NodeRecord> records;
    for (const auto &node : graph.nodes) {
        records.push_back({node.id, node.name, Glycation::short_name(node),
                           node.composition, node.mass, node.observed,
                           result.corrected[node.id]});
    }
    return records;
}

std::vector<Export::EdgeRecord> Export::edge_records(
    const Glycation::Graph &graph) {
    std::vector<EdgeRecord> records;
    for (const auto &edge : graph.edges) {
        records.push_back({edge.source, edge.sink,
                           Composition::to_string(edge.delta), edge.rate});
    }
    return records;
}
