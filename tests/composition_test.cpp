#include <unordered_set>

#include "doctest.h"

#include "composition/composition.hpp"

TEST_CASE("Composition arithmetic") {
    auto a = Composition::from_counts({{"Hex", 5}, {"HexNAc", 4}});
    auto b = Composition::from_counts({{"Hex", 1}, {"Fuc", 1}});

    SUBCASE("Add") {
        auto sum = Composition::add(a, b);
        CHECK(Composition::count(sum, "Hex") == 6);
        CHECK(Composition::count(sum, "HexNAc") == 4);
        CHECK(Composition::count(sum, "Fuc") == 1);
        CHECK(Composition::total(sum) == 11);
    }

    SUBCASE("Subtracting removes zero entries") {
        auto diff = Composition::sub(a, Composition::from_counts({{"Hex", 5}}));
        CHECK(diff.counts.size() == 1);
        CHECK(diff == Composition::from_counts({{"HexNAc", 4}}));
        CHECK(Composition::empty(Composition::sub(a, a)));
    }

    SUBCASE("Negate") {
        auto neg = Composition::neg(b);
        CHECK(Composition::count(neg, "Hex") == -1);
        CHECK(Composition::count(neg, "Fuc") == -1);
        CHECK(Composition::add(b, neg) == Composition::Composition{});
    }

    SUBCASE("Multiply") {
        CHECK(Composition::multiply(b, 3) ==
              Composition::from_counts({{"Hex", 3}, {"Fuc", 3}}));
        CHECK(Composition::empty(Composition::multiply(b, 0)));
    }
}

TEST_CASE("Composition equality and hashing ignore zero entries") {
    auto a = Composition::from_counts({{"Hex", 1}, {"Fuc", 0}});
    auto b = Composition::from_string("Hex, 0 Fuc");
    CHECK(a == b);
    CHECK(Composition::hash(a) == Composition::hash(b));
    CHECK(a != Composition::from_counts({{"Hex", 2}}));

    std::unordered_set<Composition::Composition, Composition::Hash> set;
    set.insert(a);
    set.insert(b);
    set.insert(Composition::from_counts({{"Hex", 2}}));
    CHECK(set.size() == 2);
}

TEST_CASE("Composition strings") {
    SUBCASE("Parsing") {
        auto composition = Composition::from_string("4 Hex, 3 HexNAc,Fuc");
        CHECK(composition == Composition::from_counts(
                                 {{"Hex", 4}, {"HexNAc", 3}, {"Fuc", 1}}));
        // Repeated units are accumulated.
        CHECK(Composition::from_string("2 Hex, 1 Hex") ==
              Composition::from_counts({{"Hex", 3}}));
        CHECK(Composition::empty(Composition::from_string("")));
        CHECK_THROWS_AS(Composition::from_string("4 Hex 3 HexNAc"),
                        std::invalid_argument);
        CHECK_THROWS_AS(Composition::from_string("-1 Hex"),
                        std::invalid_argument);
        CHECK_THROWS_AS(Composition::from_string("99999999999999999999 Hex"),
                        std::invalid_argument);
    }

    SUBCASE("Formatting") {
        CHECK(Composition::to_string(Composition::from_counts(
                  {{"HexNAc", 2}, {"Hex", 1}})) == "1 Hex, 2 HexNAc");
        CHECK(Composition::to_string(Composition::Composition{}) ==
              "[no PTMs]");
    }
}

TEST_CASE("Elemental formulas") {
    auto glucose = Composition::from_formula("C6 H12 O6");
    CHECK(Composition::count(glucose, "C") == 6);
    CHECK(Composition::count(glucose, "H") == 12);
    CHECK(Composition::count(glucose, "O") == 6);
    CHECK(Composition::to_formula_string(glucose) == "C6 H12 O6");

    auto formula = Composition::from_formula("C50 H100 N-3 Cl");
    CHECK(Composition::count(formula, "N") == -3);
    CHECK(Composition::count(formula, "Cl") == 1);

    CHECK_THROWS_AS(Composition::from_formula("c6"), std::invalid_argument);
    CHECK_THROWS_AS(Composition::from_formula("C-"), std::invalid_argument);
    CHECK_THROWS_AS(Composition::from_formula("Xyz2"), std::invalid_argument);
    CHECK_THROWS_AS(Composition::from_formula("C99999999999999999999"),
                    std::invalid_argument);
}
