#ifndef GLYCATION_GLYCATIONGRAPHSERIALIZE_HPP
#define GLYCATION_GLYCATIONGRAPHSERIALIZE_HPP

#include <iostream>

#include "glycation/glycation_graph.hpp"

// This namespace groups the functions used to serialize the glycation graph
// into a binary stream.
namespace Glycation::Serialize {

// Composition::Composition
bool read_composition(std::istream &stream,
                      Composition::Composition *composition);
bool write_composition(std::ostream &stream,
                       const Composition::Composition &composition);

// Uncertainty::Value
bool read_value(std::istream &stream, Uncertainty::Value *value);
bool write_value(std::ostream &stream, const Uncertainty::Value &value);

// Glycation::Node
bool read_node(std::istream &stream, Node *node);
bool write_node(std::ostream &stream, const Node &node);

// Glycation::Edge
bool read_edge(std::istream &stream, Edge *edge);
bool write_edge(std::ostream &stream, const Edge &edge);

// Glycation::Graph. The per node edge lists are not stored but rebuilt when
// reading, which fails if an edge references a non existing node.
bool read_graph(std::istream &stream, Graph *graph);
bool write_graph(std::ostream &stream, const Graph &graph);

}  // namespace Glycation::Serialize

#endif /* GLYCATION_GLYCATIONGRAPHSERIALIZE_HPP */
