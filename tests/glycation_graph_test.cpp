#include <algorithm>

#include "doctest.h"

#include "glycan/glycan.hpp"
#include "glycation/glycation_graph.hpp"
#include "test_utils.hpp"

namespace {
Glycation::RateTable hex_rates(
    const std::vector<std::pair<int64_t, double>> &levels) {
    Glycation::RateTable table = {"Hex", {}};
    for (const auto &[count, rate] : levels) {
        Glycation::add_rate(table, Composition::from_counts({{"Hex", count}}),
                            {rate, 0.0});
    }
    return table;
}

size_t count_warnings(const std::vector<Diagnostics::Warning> &warnings,
                      Diagnostics::Warning::Kind kind) {
    return std::count_if(
        warnings.begin(), warnings.end(),
        [kind](const Diagnostics::Warning &w) { return w.kind == kind; });
}
}  // namespace

TEST_CASE("Graph from observed glycoforms") {
    std::vector<Dataset::Record> glycoforms = {
        {"A2G0F/A2G0F", 50.0, 1.0},
        {"A2G0F/A2G1F", 30.0, 1.0},
        {"A2G1F/A2G1F", 20.0, 1.0},
    };
    std::vector<Diagnostics::Warning> warnings;

    SUBCASE("Single hexose conversions") {
        auto graph = Glycation::build_graph(glycoforms, std::nullopt,
                                            hex_rates({{1, 0.1}}), {},
                                            &warnings);
        CHECK(warnings.empty());
        REQUIRE(graph.nodes.size() == 3);
        for (uint64_t i = 0; i < graph.nodes.size(); ++i) {
            CHECK(graph.nodes[i].id == i);
            CHECK(graph.nodes[i].matched);
            CHECK(Composition::count(graph.nodes[i].composition, "Hex") ==
                  6 + int64_t(i));
        }
        CHECK(graph.nodes[0].observed.nominal == 50.0);
        CHECK(graph.nodes[1].observed.nominal == 30.0);
        CHECK(graph.nodes[1].name == "A2G0F/A2G1F or A2G1F/A2G0F");
        CHECK(Glycation::short_name(graph.nodes[1]) == "A2G0F/A2G1F");

        REQUIRE(graph.edges.size() == 2);
        CHECK(graph.edges[0].source == 0);
        CHECK(graph.edges[0].sink == 1);
        CHECK(graph.edges[1].source == 1);
        CHECK(graph.edges[1].sink == 2);
        CHECK(graph.edges[0].delta == Composition::from_counts({{"Hex", 1}}));
        CHECK(graph.edges[0].rate.nominal == 0.1);
        CHECK(graph.out_edges[0] == std::vector<uint64_t>{0});
        CHECK(graph.in_edges[2] == std::vector<uint64_t>{1});
    }

    SUBCASE("Multiple hexose conversions") {
        auto graph = Glycation::build_graph(
            glycoforms, std::nullopt, hex_rates({{1, 0.1}, {2, 0.01}}));
        REQUIRE(graph.edges.size() == 3);
        CHECK(graph.edges[0].source == 0);
        CHECK(graph.edges[0].sink == 1);
        CHECK(graph.edges[1].source == 0);
        CHECK(graph.edges[1].sink == 2);
        CHECK(graph.edges[1].rate.nominal == 0.01);
        CHECK(graph.edges[2].source == 1);
        CHECK(graph.edges[2].sink == 2);
    }

    SUBCASE("The site order of the labels is ignored") {
        glycoforms[1].label = "A2G1F/A2G0F";
        auto graph = Glycation::build_graph(glycoforms, std::nullopt,
                                            hex_rates({{1, 0.1}}));
        REQUIRE(graph.nodes.size() == 3);
        CHECK(graph.nodes[1].matched);
        CHECK(graph.nodes[1].observed.nominal == 30.0);
    }

    SUBCASE("Unobserved glycoforms default to zero") {
        glycoforms.erase(glycoforms.begin() + 1);
        auto graph = Glycation::build_graph(glycoforms, std::nullopt,
                                            hex_rates({{1, 0.1}}), {},
                                            &warnings);
        REQUIRE(graph.nodes.size() == 3);
        CHECK_FALSE(graph.nodes[1].matched);
        CHECK(graph.nodes[1].observed.nominal == 0.0);
        CHECK(graph.nodes[1].observed.sigma == 0.0);
        CHECK(count_warnings(warnings,
                             Diagnostics::Warning::MISSING_ABUNDANCE) == 1);
    }

    SUBCASE("Inconsistent and duplicated labels are skipped") {
        glycoforms.push_back({"A2G0F", 5.0, 0.0});
        glycoforms.push_back({"A2G1F/A2G0F", 7.0, 0.0});
        auto graph = Glycation::build_graph(glycoforms, std::nullopt,
                                            hex_rates({{1, 0.1}}), {},
                                            &warnings);
        CHECK(graph.nodes.size() == 3);
        CHECK(graph.nodes[1].observed.nominal == 30.0);
        CHECK(count_warnings(warnings,
                             Diagnostics::Warning::INCONSISTENT_LABEL) == 1);
        CHECK(count_warnings(warnings,
                             Diagnostics::Warning::DUPLICATE_LABEL) == 1);
    }

    SUBCASE("Explicit number of sites") {
        Glycation::Parameters parameters;
        parameters.num_sites = 1;
        auto graph = Glycation::build_graph({{"A2G0F", 60.0, 0.0},
                                             {"A2G1F", 40.0, 0.0}},
                                            std::nullopt, hex_rates({{1, 0.1}}),
                                            parameters);
        CHECK(graph.nodes.size() == 2);
        CHECK(graph.edges.size() == 1);

        parameters.num_sites = 0;
        CHECK_THROWS_AS(Glycation::build_graph(glycoforms, std::nullopt,
                                               hex_rates({{1, 0.1}}),
                                               parameters),
                        std::invalid_argument);
        CHECK_THROWS_AS(Glycation::build_graph({}, std::nullopt,
                                               hex_rates({{1, 0.1}})),
                        std::invalid_argument);
    }

    SUBCASE("Invalid glycan names") {
        glycoforms.push_back({"A2G0F/unknown", 1.0, 0.0});
        CHECK_THROWS_AS(Glycation::build_graph(glycoforms, std::nullopt,
                                               hex_rates({{1, 0.1}})),
                        Glycan::NomenclatureError);
        CHECK_THROWS_AS(
            Glycation::build_graph({{"A2G0F/A99999999999999999999G1F", 1.0,
                                     0.0}},
                                   std::nullopt, hex_rates({{1, 0.1}})),
            Glycan::NomenclatureError);
    }
}

TEST_CASE("Graph from a glycan library") {
    std::vector<Dataset::Record> glycoforms = {
        {"A2G0F", 60.0, 0.0},
        {"A2G1F", 30.0, 0.0},
        {"M5", 10.0, 0.0},
    };
    std::vector<Dataset::LibraryEntry> library = {
        {"A2G1F", "", std::nullopt},
        {"A2G0F", "", std::nullopt},
        {"A2G2F", "", std::nullopt},
    };
    std::vector<Diagnostics::Warning> warnings;
    auto graph = Glycation::build_graph(glycoforms, library,
                                        hex_rates({{1, 0.1}}), {}, &warnings);

    // Library glycans come first, followed by the observed-only ones.
    REQUIRE(graph.nodes.size() == 4);
    CHECK(graph.nodes[0].name == "A2G1F");
    CHECK(graph.nodes[1].name == "A2G0F");
    CHECK(graph.nodes[2].name == "A2G2F");
    CHECK(graph.nodes[3].name == "M5");
    CHECK_FALSE(graph.nodes[2].matched);

    CHECK(count_warnings(warnings, Diagnostics::Warning::ONLY_IN_LIBRARY) ==
          1);
    CHECK(count_warnings(warnings, Diagnostics::Warning::ONLY_IN_OBSERVED) ==
          1);
    CHECK(count_warnings(warnings, Diagnostics::Warning::MISSING_ABUNDANCE) ==
          1);

    // Edges always go from the less to the more glycated glycoform.
    REQUIRE(graph.edges.size() == 2);
    CHECK(graph.edges[0].source == 1);
    CHECK(graph.edges[0].sink == 0);
    CHECK(graph.edges[1].source == 0);
    CHECK(graph.edges[1].sink == 2);
}

TEST_CASE("Library entries with explicit compositions") {
    std::vector<Dataset::Record> glycoforms = {
        {"low", 60.0, 0.0},
        {"high", 40.0, 0.0},
    };
    std::vector<Dataset::LibraryEntry> library = {
        {"low", "3 Hex, 4 HexNAc", 1.0},
        {"high", "4 Hex, 4 HexNAc", 1.0},
    };
    auto graph = Glycation::build_graph(glycoforms, library,
                                        hex_rates({{1, 0.1}}));
    REQUIRE(graph.nodes.size() == 2);
    CHECK(graph.nodes[0].matched);
    CHECK(graph.nodes[1].matched);
    REQUIRE(graph.edges.size() == 1);
    CHECK(graph.edges[0].source == 0);
}

TEST_CASE("Glycoforms with the same composition share a node") {
    std::vector<Dataset::Record> glycoforms = {
        {"A2G0F/A2G2F", 10.0, 0.0},
        {"A2G1F/A2G1F", 20.0, 0.0},
    };
    std::vector<Dataset::LibraryEntry> library = {
        {"A2G0F", "", std::nullopt},
        {"A2G1F", "", std::nullopt},
        {"A2G2F", "", std::nullopt},
    };
    std::vector<Diagnostics::Warning> warnings;
    auto graph = Glycation::build_graph(glycoforms, library,
                                        hex_rates({{1, 0.1}}), {}, &warnings);
    REQUIRE(graph.nodes.size() == 5);
    CHECK(graph.nodes[2].observed.nominal == 10.0);
    CHECK(count_warnings(warnings, Diagnostics::Warning::UNUSED_LABEL) == 1);
}

TEST_CASE("Graph construction") {
    Glycation::Graph graph;
    auto a = TestUtils::mock_node(graph, "a", 10.0);
    auto b = TestUtils::mock_node(graph, "b", 10.0);
    auto c = TestUtils::mock_node(graph, "c", 10.0);
    CHECK(a == 0);
    CHECK(c == 2);

    CHECK(TestUtils::mock_edge(graph, a, b, 0.1) == 0);
    CHECK_THROWS_AS(TestUtils::mock_edge(graph, a, b, 0.1),
                    std::invalid_argument);
    CHECK_THROWS_AS(TestUtils::mock_edge(graph, b, a, 0.1),
                    std::invalid_argument);
    CHECK_THROWS_AS(TestUtils::mock_edge(graph, a, a, 0.1),
                    std::invalid_argument);
    CHECK_THROWS_AS(TestUtils::mock_edge(graph, a, 3, 0.1),
                    std::invalid_argument);
    CHECK(graph.edges.size() == 1);
}

TEST_CASE("Topological order") {
    Glycation::Graph graph;
    for (const auto &name : {"a", "b", "c", "d"}) {
        TestUtils::mock_node(graph, name, 10.0);
    }
    TestUtils::mock_edge(graph, 3, 1, 0.1);
    TestUtils::mock_edge(graph, 1, 0, 0.1);
    TestUtils::mock_edge(graph, 3, 2, 0.1);

    auto order = Glycation::topological_order(graph);
    CHECK(order == std::vector<uint64_t>{3, 1, 2, 0});
    CHECK(Glycation::is_topological_order(graph, order));
    CHECK(Glycation::is_topological_order(graph, {3, 2, 1, 0}));
    CHECK_FALSE(Glycation::is_topological_order(graph, {0, 1, 2, 3}));
    CHECK_FALSE(Glycation::is_topological_order(graph, {3, 1, 2}));
    CHECK_FALSE(Glycation::is_topological_order(graph, {3, 1, 1, 0}));
    CHECK_FALSE(Glycation::is_topological_order(graph, {3, 1, 2, 7}));

    TestUtils::mock_edge(graph, 0, 2, 0.1);
    TestUtils::mock_edge(graph, 2, 1, 0.1);
    CHECK_THROWS_AS(Glycation::topological_order(graph),
                    std::invalid_argument);
}
