#include <algorithm>
#include <map>
#include <queue>
#include <set>
#include <stdexcept>

#include "glycan/glycan.hpp"
#include "glycation/glycation_graph.hpp"
#include "glycoform_space/glycoform_space.hpp"

namespace {
std::vector<std::string> split(const std::string &str,
                               const std::string &separator) {
    std::vector<std::string> parts;
    size_t begin = 0;
    while (true) {
        size_t end = str.find(separator, begin);
        if (end == std::string::npos) {
            parts.push_back(str.substr(begin));
            return parts;
        }
        parts.push_back(str.substr(begin, end - begin));
        begin = end + separator.size();
    }
}

std::string join(const std::vector<std::string> &parts,
                 const std::string &separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}
}  // namespace

uint64_t Glycation::add_node(Graph &graph, Node node) {
    node.id = graph.nodes.size();
    graph.nodes.push_back(node);
    graph.in_edges.emplace_back();
    graph.out_edges.emplace_back();
    return node.id;
}

uint64_t Glycation::add_edge(Graph &graph, uint64_t source, uint64_t sink,
                             const Composition::Composition &delta,
                             const Uncertainty::Value &rate) {
    if (source >= graph.nodes.size() || sink >= graph.nodes.size()) {
        throw std::invalid_argument("edge references a non existing node");
    }
    if (source == sink) {
        throw std::invalid_argument("self loops are not allowed");
    }
    for (const auto &edge_id : graph.out_edges[source]) {
        if (graph.edges[edge_id].sink == sink) {
            throw std::invalid_argument("duplicated edge");
        }
    }
    for (const auto &edge_id : graph.in_edges[source]) {
        if (graph.edges[edge_id].source == sink) {
            throw std::invalid_argument("duplicated edge");
        }
    }
    uint64_t id = graph.edges.size();
    graph.edges.push_back({source, sink, delta, rate});
    graph.out_edges[source].push_back(id);
    graph.in_edges[sink].push_back(id);
    return id;
}

std::string Glycation::site_key(const std::string &label) {
    auto sites = split(label, "/");
    std::sort(sites.begin(), sites.end());
    return join(sites, "/");
}

std::string Glycation::short_name(const Node &node) {
    return split(node.name, " or ")[0];
}

Glycation::Graph Glycation::build_graph(
    const std::vector<Dataset::Record> &glycoforms,
    const std::optional<std::vector<Dataset::LibraryEntry>> &library,
    const RateTable &rates, const Parameters &parameters,
    std::vector<Diagnostics::Warning> *warnings) {
    // Number of sites.
    uint64_t num_sites = 0;
    if (parameters.num_sites) {
        num_sites = *parameters.num_sites;
    } else if (!glycoforms.empty()) {
        num_sites = split(glycoforms[0].label, "/").size();
    }
    if (num_sites == 0) {
        throw std::invalid_argument(
            "the number of glycosylation sites can't be determined");
    }

    // Index the observed abundances by their site independent key.
    std::map<std::string, Uncertainty::Value> observed;
    std::map<std::string, std::string> observed_labels;
    std::vector<std::string> observed_glycans;
    std::set<std::string> observed_glycans_set;
    for (const auto &record : glycoforms) {
        auto sites = split(record.label, "/");
        if (sites.size() != num_sites) {
            Diagnostics::warn(warnings,
                              Diagnostics::Warning::INCONSISTENT_LABEL,
                              "glycoform '" + record.label + "' doesn't have " +
                                  std::to_string(num_sites) +
                                  " sites and will be ignored");
            continue;
        }
        auto key = site_key(record.label);
        if (observed.count(key) != 0) {
            Diagnostics::warn(warnings, Diagnostics::Warning::DUPLICATE_LABEL,
                              "glycoform '" + record.label +
                                  "' was already observed as '" +
                                  observed_labels[key] +
                                  "' and will be ignored");
            continue;
        }
        observed[key] = {record.value, record.uncertainty};
        observed_labels[key] = record.label;
        for (const auto &site : sites) {
            if (observed_glycans_set.insert(site).second) {
                observed_glycans.push_back(site);
            }
        }
    }

    // Assemble the working glycan library. Every name is parsed before any
    // node is created.
    std::vector<Glycan::Glycan> glycans;
    if (!library) {
        for (const auto &name : observed_glycans) {
            glycans.push_back(Glycan::from_name(name));
        }
    } else {
        std::set<std::string> library_glycans;
        for (const auto &entry : *library) {
            glycans.push_back(Glycan::from_library_entry(
                entry.name, entry.composition, entry.abundance.value_or(1.0)));
            library_glycans.insert(entry.name);
        }
        for (const auto &name : library_glycans) {
            if (observed_glycans_set.count(name) == 0) {
                Diagnostics::warn(warnings,
                                  Diagnostics::Warning::ONLY_IN_LIBRARY,
                                  "glycan '" + name +
                                      "' only appears in the glycan library");
            }
        }
        for (const auto &name : observed_glycans_set) {
            if (library_glycans.count(name) == 0) {
                Diagnostics::warn(
                    warnings, Diagnostics::Warning::ONLY_IN_OBSERVED,
                    "glycan '" + name +
                        "' only appears in the list of glycoforms and will "
                        "be added to the library");
                glycans.push_back(Glycan::from_name(name));
            }
        }
    }

    Graph graph;
    std::set<std::string> used_keys;
    for (const auto &glycoform :
         GlycoformSpace::unique_glycoforms(glycans, num_sites)) {
        Node node = {};
        node.composition = glycoform.composition;
        node.name = glycoform.name;
        node.observed = {0.0, 0.0};
        node.matched = false;
        node.theoretical_abundance = glycoform.abundance;
        node.mass = glycoform.mass;

        // The first alternative that was observed is used.
        std::string matched_key;
        for (const auto &alternative : split(glycoform.name, " or ")) {
            auto key = site_key(alternative);
            auto it = observed.find(key);
            if (it == observed.end()) {
                continue;
            }
            if (!node.matched) {
                node.observed = it->second;
                node.matched = true;
                matched_key = key;
                used_keys.insert(key);
            } else if (used_keys.count(key) == 0) {
                Diagnostics::warn(
                    warnings, Diagnostics::Warning::UNUSED_LABEL,
                    "glycoform '" + observed_labels[key] +
                        "' has the same composition as '" +
                        observed_labels[matched_key] +
                        "', its abundance will be ignored");
                used_keys.insert(key);
            }
        }
        if (!node.matched) {
            Diagnostics::warn(warnings,
                              Diagnostics::Warning::MISSING_ABUNDANCE,
                              "no abundance found for glycoform '" +
                                  glycoform.name + "', assuming 0 ± 0");
        }
        uint64_t id = add_node(graph, node);

        // Connect to the existing nodes. The delta towards the new node takes
        // precedence over the opposite direction.
        for (uint64_t other = 0; other < id; ++other) {
            auto delta = Composition::sub(graph.nodes[id].composition,
                                          graph.nodes[other].composition);
            if (auto rate = find_rate(rates, delta)) {
                add_edge(graph, other, id, delta, *rate);
                continue;
            }
            delta = Composition::neg(delta);
            if (auto rate = find_rate(rates, delta)) {
                add_edge(graph, id, other, delta, *rate);
            }
        }
    }
    return graph;
}

std::vector<uint64_t> Glycation::topological_order(const Graph &graph) {
    std::vector<uint64_t> in_degree(graph.nodes.size(), 0);
    std::queue<uint64_t> ready;
    for (uint64_t id = 0; id < graph.nodes.size(); ++id) {
        in_degree[id] = graph.in_edges[id].size();
        if (in_degree[id] == 0) {
            ready.push(id);
        }
    }

    std::vector<uint64_t> order;
    order.reserve(graph.nodes.size());
    while (!ready.empty()) {
        uint64_t id = ready.front();
        ready.pop();
        order.push_back(id);
        for (const auto &edge_id : graph.out_edges[id]) {
            uint64_t sink = graph.edges[edge_id].sink;
            if (--in_degree[sink] == 0) {
                ready.push(sink);
            }
        }
    }
    if (order.size() != graph.nodes.size()) {
        throw std::invalid_argument("the glycation graph contains a cycle");
    }
    return order;
}

bool Glycation::is_topological_order(const Graph &graph,
                                     const std::vector<uint64_t> &order) {
    if (order.size() != graph.nodes.size()) {
        return false;
    }
    std::vector<int64_t> position(graph.nodes.size(), -1);
    for (size_t i = 0; i < order.size(); ++i) {
        if (order[i] >= graph.nodes.size() || position[order[i]] != -1) {
            return false;
        }
        position[order[i]] = i;
    }
    for (const auto &edge : graph.edges) {
        if (position[edge.source] >= position[edge.sink]) {
            return false;
        }
    }
    return true;
}
