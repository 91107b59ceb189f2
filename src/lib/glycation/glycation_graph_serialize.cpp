#include "glycation/glycation_graph_serialize.hpp"
#include "utils/serialization.hpp"

bool Glycation::Serialize::read_composition(
    std::istream &stream, Composition::Composition *composition) {
    uint64_t num_units = 0;
    Serialization::read_uint64(stream, &num_units);
    composition->counts.clear();
    for (uint64_t i = 0; i < num_units && stream.good(); ++i) {
        std::string unit;
        int64_t count = 0;
        Serialization::read_string(stream, &unit);
        Serialization::read_int64(stream, &count);
        if (count != 0) {
            composition->counts[unit] = count;
        }
    }
    return stream.good();
}

bool Glycation::Serialize::write_composition(
    std::ostream &stream, const Composition::Composition &composition) {
    Serialization::write_uint64(stream, composition.counts.size());
    for (const auto &[unit, count] : composition.counts) {
        Serialization::write_string(stream, unit);
        Serialization::write_int64(stream, count);
    }
    return stream.good();
}

bool Glycation::Serialize::read_value(std::istream &stream,
                                      Uncertainty::Value *value) {
    Serialization::read_double(stream, &value->nominal);
    Serialization::read_double(stream, &value->sigma);
    return stream.good();
}

bool Glycation::Serialize::write_value(std::ostream &stream,
                                       const Uncertainty::Value &value) {
    Serialization::write_double(stream, value.nominal);
    Serialization::write_double(stream, value.sigma);
    return stream.good();
}

bool Glycation::Serialize::read_node(std::istream &stream, Node *node) {
    Serialization::read_uint64(stream, &node->id);
    read_composition(stream, &node->composition);
    Serialization::read_string(stream, &node->name);
    read_value(stream, &node->observed);
    uint8_t matched = 0;
    Serialization::read_uint8(stream, &matched);
    node->matched = matched != 0;
    Serialization::read_double(stream, &node->theoretical_abundance);
    uint8_t has_mass = 0;
    double mass = 0.0;
    Serialization::read_uint8(stream, &has_mass);
    Serialization::read_double(stream, &mass);
    node->mass = std::nullopt;
    if (has_mass != 0) {
        node->mass = mass;
    }
    return stream.good();
}

bool Glycation::Serialize::write_node(std::ostream &stream, const Node &node) {
    Serialization::write_uint64(stream, node.id);
    write_composition(stream, node.composition);
    Serialization::write_string(stream, node.name);
    write_value(stream, node.observed);
    Serialization::write_uint8(stream, node.matched ? 1 : 0);
    Serialization::write_double(stream, node.theoretical_abundance);
    Serialization::write_uint8(stream, node.mass ? 1 : 0);
    Serialization::write_double(stream, node.mass.value_or(0.0));
    return stream.good();
}

bool Glycation::Serialize::read_edge(std::istream &stream, Edge *edge) {
    Serialization::read_uint64(stream, &edge->source);
    Serialization::read_uint64(stream, &edge->sink);
    read_composition(stream, &edge->delta);
    read_value(stream, &edge->rate);
    return stream.good();
}

bool Glycation::Serialize::write_edge(std::ostream &stream, const Edge &edge) {
    Serialization::write_uint64(stream, edge.source);
    Serialization::write_uint64(stream, edge.sink);
    write_composition(stream, edge.delta);
    write_value(stream, edge.rate);
    return stream.good();
}

bool Glycation::Serialize::read_graph(std::istream &stream, Graph *graph) {
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    if (!Serialization::read_vector<Node>(stream, &nodes, read_node) ||
        !Serialization::read_vector<Edge>(stream, &edges, read_edge)) {
        return false;
    }

    *graph = {};
    for (const auto &node : nodes) {
        add_node(*graph, node);
    }
    for (const auto &edge : edges) {
        if (edge.source >= nodes.size() || edge.sink >= nodes.size() ||
            edge.source == edge.sink) {
            return false;
        }
        uint64_t id = graph->edges.size();
        graph->edges.push_back(edge);
        graph->out_edges[edge.source].push_back(id);
        graph->in_edges[edge.sink].push_back(id);
    }
    return stream.good();
}

bool Glycation::Serialize::write_graph(std::ostream &stream,
                                       const Graph &graph) {
    Serialization::write_vector<Node>(stream, graph.nodes, write_node);
    Serialization::write_vector<Edge>(stream, graph.edges, write_edge);
    return stream.good();
}
