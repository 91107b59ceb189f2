#include <sstream>

#include "doctest.h"

#include "export/export.hpp"
#include "glycan/glycan.hpp"
#include "export/export_files.hpp"
#include "test_utils.hpp"

namespace {
Glycation::Graph chain_graph() {
    Glycation::Graph graph;
    TestUtils::mock_node(graph, "a", 80.0);
    TestUtils::mock_node(graph, "b", 20.0);
    TestUtils::mock_edge(graph, 0, 1, 0.1);
    return graph;
}
}  // namespace

TEST_CASE("Node and edge records") {
    Glycation::Graph graph;
    Glycation::Node node = {};
    node.composition = Glycan::parse_name("A2G0F");
    node.name = "A2G0F/A2G1F or A2G1F/A2G0F";
    node.observed = {10.0, 1.0};
    node.matched = true;
    node.mass = 1445.339486;
    Glycation::add_node(graph, node);
    TestUtils::mock_node(graph, "b", 5.0);
    TestUtils::mock_edge(graph, 1, 0, 0.05, 0.01);

    Correction::Result result = {{{12.0, 1.5}, {4.0, 0.5}}, false};
    auto nodes = Export::node_records(graph, result);
    REQUIRE(nodes.size() == 2);
    CHECK(nodes[0].id == 0);
    CHECK(nodes[0].name == "A2G0F/A2G1F or A2G1F/A2G0F");
    CHECK(nodes[0].label == "A2G0F/A2G1F");
    CHECK(nodes[0].composition == Glycan::parse_name("A2G0F"));
    CHECK(*nodes[0].mass == 1445.339486);
    CHECK(nodes[0].observed.nominal == 10.0);
    CHECK(nodes[0].corrected.nominal == 12.0);
    CHECK(nodes[1].label == "b");
    CHECK_FALSE(nodes[1].mass);

    auto edges = Export::edge_records(graph);
    REQUIRE(edges.size() == 1);
    CHECK(edges[0].source == 1);
    CHECK(edges[0].sink == 0);
    CHECK(edges[0].delta == "1 Hex");
    CHECK(edges[0].rate.sigma == 0.01);

    Correction::Result wrong_size = {{{12.0, 1.5}}, false};
    CHECK_THROWS_AS(Export::node_records(graph, wrong_size),
                    std::invalid_argument);
}

TEST_CASE("Writing the corrected glycoforms") {
    SUBCASE("Chain") {
        auto graph = chain_graph();
        auto nodes = Export::node_records(
            graph, Correction::correct_abundances(graph));
        std::stringstream stream;
        CHECK(Export::Files::Csv::write_glycoforms(stream, nodes));
        CHECK(stream.str() ==
              "glycoform,abundance,abundance_error,corr_abundance,"
              "corr_abundance_error,a,b\n"
              "a,80,0,88.888889,0,1,0\n"
              "b,20,0,11.111111,0,0,1\n");
    }

    SUBCASE("The stream precision is restored") {
        auto graph = chain_graph();
        auto nodes = Export::node_records(
            graph, Correction::correct_abundances(graph));
        std::stringstream stream;
        stream.precision(3);
        CHECK(Export::Files::Csv::write_glycoforms(stream, nodes));
        CHECK(stream.precision() == 3);
        CHECK(Export::Files::Gexf::write_graph(stream, nodes,
                                               Export::edge_records(graph)));
        CHECK(stream.precision() == 3);
    }

    SUBCASE("Rows are sorted by corrected abundance") {
        std::vector<Export::NodeRecord> nodes = {
            {0, "x", "x", Composition::from_counts({{"Hex", 1}}), std::nullopt,
             {1.0, 0.5}, {10.0, 1.0}},
            {1, "y, z", "y, z", Composition::from_counts({{"Fuc", 2}}),
             std::nullopt, {2.0, 0.0}, {20.0, 0.0}},
            {2, "w", "w", Composition::Composition{}, std::nullopt,
             {3.0, 0.0}, {10.0, 0.0}},
        };
        std::stringstream stream;
        CHECK(Export::Files::Csv::write_glycoforms(stream, nodes));
        CHECK(stream.str() ==
              "glycoform,abundance,abundance_error,corr_abundance,"
              "corr_abundance_error,Fuc,Hex\n"
              "\"y, z\",2,0,20,0,2,0\n"
              "x,1,0.5,10,1,0,1\n"
              "w,3,0,10,0,0,0\n");
    }
}

TEST_CASE("Writing glycation graphs") {
    auto graph = chain_graph();
    graph.nodes[1].name = "b<1>";
    auto nodes =
        Export::node_records(graph, Correction::correct_abundances(graph));
    auto edges = Export::edge_records(graph);

    SUBCASE("Graphviz") {
        std::stringstream stream;
        CHECK(Export::Files::Dot::write_graph(stream, nodes, edges));
        CHECK(stream.str() ==
              "digraph {\n"
              "\t0 [label=\"a|80.00|88.89\", shape=record];\n"
              "\t1 [label=\"b\\<1\\>|20.00|11.11\", shape=record];\n"
              "\t0 -> 1 [label=\"1 Hex: 10.00%\"];\n"
              "}\n");
    }

    SUBCASE("GEXF") {
        std::stringstream stream;
        CHECK(Export::Files::Gexf::write_graph(stream, nodes, edges));
        auto gexf = stream.str();
        CHECK(gexf.find("<gexf xmlns=\"http://www.gexf.net/1.2draft\"") !=
              std::string::npos);
        CHECK(gexf.find("defaultedgetype=\"directed\"") != std::string::npos);
        CHECK(gexf.find("title=\"corr_abundance_error\"") !=
              std::string::npos);
        CHECK(gexf.find("<node id=\"0\" label=\"a\">") != std::string::npos);
        CHECK(gexf.find("<node id=\"1\" label=\"b&lt;1&gt;\">") !=
              std::string::npos);
        CHECK(gexf.find("<attvalue for=\"2\" value=\"88.888889\" />") !=
              std::string::npos);
        CHECK(gexf.find("source=\"0\" target=\"1\" label=\"1 Hex\"") !=
              std::string::npos);
        CHECK(gexf.find("<attvalue for=\"0\" value=\"0.1\" />") !=
              std::string::npos);
        CHECK(gexf.substr(gexf.size() - 8) == "</gexf>\n");
    }
}
