#ifndef EXPORT_EXPORT_HPP
#define EXPORT_EXPORT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "composition/composition.hpp"
#include "correction/correction.hpp"
#include "glycation/glycation_graph.hpp"
#include "utils/uncertainty.hpp"

// Flat, read-only views of a corrected glycation graph, used by the file
// writers and the Python bindings.
namespace Export {

struct NodeRecord {
    uint64_t id;
    std::string name;
    // First alternative of the name.
    std::string label;
    Composition::Composition composition;
    std::optional<double> mass;
    Uncertainty::Value observed;
    Uncertainty::Value corrected;
};

struct EdgeRecord {
    uint64_t source;
    uint64_t sink;
    // Human readable delta, e.g. "1 Hex".
    std::string delta;
    Uncertainty::Value rate;
};

// Throws std::invalid_argument if the result doesn't belong to the graph.
std::vector<NodeRecord> node_records(const Glycation::Graph &graph,
                                     const Correction::Result &result);
std::vector<EdgeRecord> edge_records(const Glycation::Graph &graph);

}  // namespace Export

#endif /* EXPORT_EXPORT_HPP */
