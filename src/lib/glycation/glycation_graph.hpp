#ifndef GLYCATION_GLYCATIONGRAPH_HPP
#define GLYCATION_GLYCATIONGRAPH_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "composition/composition.hpp"
#include "dataset/dataset.hpp"
#include "glycation/conversion_rates.hpp"
#include "utils/diagnostics.hpp"
#include "utils/uncertainty.hpp"

namespace Glycation {

struct Parameters {
    // Number of glycosylation sites. If not set it is taken from the first
    // observed glycoform label, e.g. "A2G0F/A2G1F" has two sites.
    std::optional<uint64_t> num_sites;
};

// A glycoform, unique in terms of its monosaccharide composition.
struct Node {
    uint64_t id;
    Composition::Composition composition;
    // Alternative site combinations are separated by " or ".
    std::string name;
    Uncertainty::Value observed;
    // True if the observed abundance was found in the dataset, false if it
    // defaulted to zero.
    bool matched;
    // Theoretical abundance from the glycan library weights.
    double theoretical_abundance;
    std::optional<double> mass;
};

// The source glycoform is converted into the sink glycoform by adding delta,
// with the given rate.
struct Edge {
    uint64_t source;
    uint64_t sink;
    Composition::Composition delta;
    Uncertainty::Value rate;
};

// Glycation graph, stored as arrays of nodes and edges indexed by their ids.
// The graph is not modified after being built.
struct Graph {
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    // Edge ids for each node.
    std::vector<std::vector<uint64_t>> in_edges;
    std::vector<std::vector<uint64_t>> out_edges;
};

// Appends a node to the graph and returns its id, overriding node.id.
uint64_t add_node(Graph &graph, Node node);

// Appends an edge to the graph and returns its id. Throws
// std::invalid_argument if the nodes don't exist, the edge is a loop or there
// is already an edge between the two nodes.
uint64_t add_edge(Graph &graph, uint64_t source, uint64_t sink,
                  const Composition::Composition &delta,
                  const Uncertainty::Value &rate);

// Builds the glycation graph:
//
//   1. The glycan library is completed with the glycans that only appear in
//      the observed data, deriving their composition from the name. Without a
//      library, every glycan is derived from its name.
//   2. All glycoforms with a unique composition are enumerated.
//   3. Each glycoform is matched to its observed abundance, regardless of the
//      order of the sites, or to 0 ± 0 if it wasn't observed.
//   4. Two glycoforms are connected if their composition difference is in the
//      rate table, from the less to the more glycated one.
//
// Throws Glycan::NomenclatureError if a glycan name can't be parsed, and
// std::invalid_argument if the number of sites can't be determined.
Graph build_graph(const std::vector<Dataset::Record> &glycoforms,
                  const std::optional<std::vector<Dataset::LibraryEntry>> &library,
                  const RateTable &rates, const Parameters &parameters = {},
                  std::vector<Diagnostics::Warning> *warnings = nullptr);

// Key used to match glycoform labels irrespective of the site order, i.e.
// the site glycans sorted and joined by "/".
std::string site_key(const std::string &label);

// The first alternative of a node name, e.g. "A2G0F/A2G1F" for
// "A2G0F/A2G1F or A2G1F/A2G0F".
std::string short_name(const Node &node);

// Returns the node ids in topological order (Kahn's algorithm, lower ids
// first). Throws std::invalid_argument if the graph contains a cycle.
std::vector<uint64_t> topological_order(const Graph &graph);

// Checks that the given order is a permutation of the node ids in which every
// edge points forward.
bool is_topological_order(const Graph &graph,
                          const std::vector<uint64_t> &order);

}  // namespace Glycation

#endif /* GLYCATION_GLYCATIONGRAPH_HPP */
