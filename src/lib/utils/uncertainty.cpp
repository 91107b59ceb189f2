#include <cmath>

#include "utils/uncertainty.hpp"

Uncertainty::Value Uncertainty::add(const Value &a, const Value &b) {
    return {a.nominal + b.nominal, std::hypot(a.sigma, b.sigma)};
}

Uncertainty::Value Uncertainty::sub(const Value &a, const Value &b) {
    return {a.nominal - b.nominal, std::hypot(a.sigma, b.sigma)};
}

Uncertainty::Value Uncertainty::neg(const Value &a) {
    return {-a.nominal, a.sigma};
}

Uncertainty::Value Uncertainty::scale(const Value &a, double k) {
    return {a.nominal * k, std::abs(k) * a.sigma};
}

Uncertainty::Value Uncertainty::mul(const Value &a, const Value &b) {
    return {a.nominal * b.nominal,
            std::hypot(b.nominal * a.sigma, a.nominal * b.sigma)};
}

// NOTE: Division by a zero nominal value is not checked here, the result will
// contain inf/nan. Callers that can hit this case must validate beforehand.
Uncertainty::Value Uncertainty::div(const Value &a, const Value &b) {
    double quotient = a.nominal / b.nominal;
    double d_numerator = a.sigma / b.nominal;
    double d_denominator = a.nominal * b.sigma / (b.nominal * b.nominal);
    return {quotient, std::hypot(d_numerator, d_denominator)};
}

Uncertainty::Value Uncertainty::sum(const std::vector<Value> &values) {
    Value total = {0.0, 0.0};
    for (const auto &value : values) {
        total = add(total, value);
    }
    return total;
}
