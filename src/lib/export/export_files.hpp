#ifndef EXPORT_EXPORTFILES_HPP
#define EXPORT_EXPORTFILES_HPP

#include <iostream>
#include <vector>

#include "export/export.hpp"

namespace Export::Files::Csv {
// Writes one row per glycoform with its observed and corrected abundances
// followed by one column per monosaccharide, sorted by decreasing corrected
// abundance.
bool write_glycoforms(std::ostream &stream,
                      const std::vector<NodeRecord> &nodes);
}  // namespace Export::Files::Csv

namespace Export::Files::Dot {
// Writes the graph in Graphviz format. Nodes are labelled as
// "name|observed|corrected" records and edges as "delta: rate%".
bool write_graph(std::ostream &stream, const std::vector<NodeRecord> &nodes,
                 const std::vector<EdgeRecord> &edges);
}  // namespace Export::Files::Dot

namespace Export::Files::Gexf {
// Writes the graph in GEXF 1.2 format, with the abundances and the conversion
// rates as node and edge attributes.
bool write_graph(std::ostream &stream, const std::vector<NodeRecord> &nodes,
                 const std::vector<EdgeRecord> &edges);
}  // namespace Export::Files::Gexf

#endif /* EXPORT_EXPORTFILES_HPP */
