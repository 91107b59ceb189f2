#include <sstream>

#include "doctest.h"

#include "correction/correction_serialize.hpp"
#include "glycation/glycation_graph_serialize.hpp"
#include "test_utils.hpp"

TEST_CASE("Serialization of corrected glycation graphs") {
    std::vector<Dataset::Record> glycoforms = {
        {"A2G0F/A2G0F", 50.0, 1.0},
        {"A2G0F/A2G1F", 30.0, 1.0},
        {"A2G1F/A2G1F", 20.0, 1.0},
    };
    Glycation::RateTable rates = {"Hex", {}};
    Glycation::add_rate(rates, Composition::from_counts({{"Hex", 1}}),
                        {0.1, 0.01});
    auto graph = Glycation::build_graph(glycoforms, std::nullopt, rates);
    auto result =
        Correction::normalize(Correction::correct_abundances(graph));

    std::stringstream stream;
    CHECK(Glycation::Serialize::write_graph(stream, graph));
    CHECK(Correction::Serialize::write_result(stream, result));

    Glycation::Graph read_graph;
    Correction::Result read_result;
    CHECK(Glycation::Serialize::read_graph(stream, &read_graph));
    CHECK(Correction::Serialize::read_result(stream, &read_result));

    REQUIRE(read_graph.nodes.size() == graph.nodes.size());
    for (size_t i = 0; i < graph.nodes.size(); ++i) {
        const auto &expected = graph.nodes[i];
        const auto &node = read_graph.nodes[i];
        CHECK(node.id == expected.id);
        CHECK(node.composition == expected.composition);
        CHECK(node.name == expected.name);
        CHECK(node.observed.nominal == expected.observed.nominal);
        CHECK(node.observed.sigma == expected.observed.sigma);
        CHECK(node.matched == expected.matched);
        CHECK(node.theoretical_abundance == expected.theoretical_abundance);
        CHECK(node.mass == expected.mass);
    }
    REQUIRE(read_graph.edges.size() == graph.edges.size());
    for (size_t i = 0; i < graph.edges.size(); ++i) {
        CHECK(read_graph.edges[i].source == graph.edges[i].source);
        CHECK(read_graph.edges[i].sink == graph.edges[i].sink);
        CHECK(read_graph.edges[i].delta == graph.edges[i].delta);
        CHECK(read_graph.edges[i].rate.sigma == graph.edges[i].rate.sigma);
    }
    CHECK(read_graph.in_edges == graph.in_edges);
    CHECK(read_graph.out_edges == graph.out_edges);

    CHECK(read_result.normalized);
    REQUIRE(read_result.corrected.size() == result.corrected.size());
    for (size_t i = 0; i < result.corrected.size(); ++i) {
        CHECK(read_result.corrected[i].nominal == result.corrected[i].nominal);
        CHECK(read_result.corrected[i].sigma == result.corrected[i].sigma);
    }
}

TEST_CASE("Invalid serialized graphs") {
    Glycation::Graph graph;
    TestUtils::mock_node(graph, "a", 1.0);
    TestUtils::mock_node(graph, "b", 1.0);

    SUBCASE("Edges to missing nodes") {
        graph.edges.push_back(
            {0, 5, Composition::from_counts({{"Hex", 1}}), {0.1, 0.0}});
        std::stringstream stream;
        CHECK(Glycation::Serialize::write_graph(stream, graph));
        Glycation::Graph read_graph;
        CHECK_FALSE(Glycation::Serialize::read_graph(stream, &read_graph));
    }

    SUBCASE("Truncated data") {
        std::stringstream stream;
        CHECK(Glycation::Serialize::write_graph(stream, graph));
        auto data = stream.str();
        std::stringstream truncated(data.substr(0, data.size() / 2));
        Glycation::Graph read_graph;
        CHECK_FALSE(Glycation::Serialize::read_graph(truncated, &read_graph));
    }
}
