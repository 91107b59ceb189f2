#ifndef UTILS_UNCERTAINTY_HPP
#define UTILS_UNCERTAINTY_HPP

#include <vector>

// This namespace contains the value-with-uncertainty type used for every
// abundance and conversion rate, and the only functions that propagate its
// error. The propagation is first order and assumes that the operands are
// independent:
//
//     (a ± da) + (b ± db) = (a + b) ± sqrt(da^2 + db^2)
//     (a ± da) * k        = (a * k) ± |k| * da
//     (a ± da) * (b ± db) = (a * b) ± sqrt((b * da)^2 + (a * db)^2)
//     (a ± da) / (b ± db) = (a / b) ± sqrt((da / b)^2 + (a * db / b^2)^2)
//
namespace Uncertainty {

struct Value {
    double nominal;
    // Standard deviation of the nominal value.
    double sigma;
};

Value add(const Value &a, const Value &b);
Value sub(const Value &a, const Value &b);
Value neg(const Value &a);
Value scale(const Value &a, double k);
Value mul(const Value &a, const Value &b);
Value div(const Value &a, const Value &b);

// Accumulates the given values with add(). An empty list sums to 0 ± 0.
Value sum(const std::vector<Value> &values);

}  // namespace Uncertainty

#endif /* UTILS_UNCERTAINTY_HPP */
