#include <cmath>

#include "doctest.h"

#include "test_utils.hpp"
#include "utils/uncertainty.hpp"

TEST_CASE("Uncertainty propagation") {
    Uncertainty::Value a = {10.0, 3.0};
    Uncertainty::Value b = {4.0, 4.0};

    SUBCASE("Addition and subtraction") {
        auto sum = Uncertainty::add(a, b);
        CHECK(sum.nominal == 14.0);
        CHECK(sum.sigma == 5.0);
        auto diff = Uncertainty::sub(a, b);
        CHECK(diff.nominal == 6.0);
        CHECK(diff.sigma == 5.0);
    }

    SUBCASE("Negation keeps the uncertainty") {
        auto neg = Uncertainty::neg(a);
        CHECK(neg.nominal == -10.0);
        CHECK(neg.sigma == 3.0);
    }

    SUBCASE("Scalar multiplication") {
        auto scaled = Uncertainty::scale(a, -2.0);
        CHECK(scaled.nominal == -20.0);
        CHECK(scaled.sigma == 6.0);
    }

    SUBCASE("Multiplication") {
        auto product = Uncertainty::mul(a, b);
        CHECK(product.nominal == 40.0);
        // sqrt((4 * 3)^2 + (10 * 4)^2)
        CHECK(TestUtils::compare_double(product.sigma, std::sqrt(1744.0)));
    }

    SUBCASE("Division") {
        auto quotient = Uncertainty::div(a, b);
        CHECK(quotient.nominal == 2.5);
        // sqrt((3 / 4)^2 + (10 * 4 / 16)^2)
        CHECK(TestUtils::compare_double(quotient.sigma,
                                        std::sqrt(0.5625 + 6.25)));
    }

    SUBCASE("Exact values") {
        auto quotient = Uncertainty::div({80.0, 0.0}, {0.9, 0.0});
        CHECK(TestUtils::compare_double(quotient.nominal, 88.8889));
        CHECK(quotient.sigma == 0.0);
    }

    SUBCASE("Sum") {
        auto total = Uncertainty::sum({{1.0, 3.0}, {2.0, 4.0}, {3.0, 0.0}});
        CHECK(total.nominal == 6.0);
        CHECK(total.sigma == 5.0);
        auto empty = Uncertainty::sum({});
        CHECK(empty.nominal == 0.0);
        CHECK(empty.sigma == 0.0);
    }
}
