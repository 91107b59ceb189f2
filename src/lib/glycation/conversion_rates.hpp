#ifndef GLYCATION_CONVERSIONRATES_HPP
#define GLYCATION_CONVERSIONRATES_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "composition/composition.hpp"
#include "dataset/dataset.hpp"
#include "utils/uncertainty.hpp"

namespace Glycation {

// Maps the composition difference between two glycoforms to the fraction of
// the less modified glycoform that was converted into the other one.
struct RateTable {
    // The glycation unit, usually "Hex".
    std::string unit;
    std::unordered_map<Composition::Composition, Uncertainty::Value,
                       Composition::Hash>
        rates;
};

// Adds a conversion rate to the table. Only deltas with a strictly positive
// total unit count are accepted, so that a delta and its negation can never be
// in the same table and every edge points towards the more modified
// glycoform. Throws std::invalid_argument otherwise, or if the delta is
// already present.
void add_rate(RateTable &table, const Composition::Composition &delta,
              const Uncertainty::Value &rate);

// Builds the table from a glycation dataset, where each label is the number
// of extra glycation units and each value is an abundance in percent. Labels
// lower than one are ignored. Throws Dataset::InputFormatError if a label is
// not an integer or appears twice.
RateTable build_rate_table(const std::vector<Dataset::Record> &glycation,
                           const std::string &unit = "Hex");

// Returns the rate for the given delta, if any.
std::optional<Uncertainty::Value> find_rate(
    const RateTable &table, const Composition::Composition &delta);

}  // namespace Glycation

#endif /* GLYCATION_CONVERSIONRATES_HPP */
