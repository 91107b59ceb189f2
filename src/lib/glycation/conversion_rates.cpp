#include <regex>
#include <set>
#include <stdexcept>

#include "glycation/conversion_rates.hpp"

void Glycation::add_rate(RateTable &table,
                         const Composition::Composition &delta,
                         const Uncertainty::Value &rate) {
    if (Composition::total(delta) <= 0) {
        throw std::invalid_argument(
            "conversion deltas must add at least one unit: '" +
            Composition::to_string(delta) + "'");
    }
    if (table.rates.count(delta) != 0) {
        throw std::invalid_argument("duplicated conversion delta: '" +
                                    Composition::to_string(delta) + "'");
    }
    table.rates[delta] = rate;
}

Glycation::RateTable Glycation::build_rate_table(
    const std::vector<Dataset::Record> &glycation, const std::string &unit) {
    RateTable table = {unit, {}};
    std::regex integer_regex("^[+-]?[[:digit:]]+$");
    std::set<int64_t> seen;
    for (const auto &record : glycation) {
        if (!std::regex_match(record.label, integer_regex)) {
            throw Dataset::InputFormatError(
                "glycation levels must be integers, got '" + record.label +
                "'");
        }
        int64_t count = 0;
        try {
            count = std::stoll(record.label);
        } catch (const std::out_of_range &) {
            throw Dataset::InputFormatError("glycation level out of range: '" +
                                            record.label + "'");
        }
        if (!seen.insert(count).second) {
            throw Dataset::InputFormatError("duplicated glycation level: '" +
                                            record.label + "'");
        }
        if (count <= 0) {
            continue;
        }
        add_rate(table, Composition::from_counts({{unit, count}}),
                 Uncertainty::div({record.value, record.uncertainty},
                                  {100.0, 0.0}));
    }
    return table;
}

std::optional<Uncertainty::Value> Glycation::find_rate(
    const RateTable &table, const Composition::Composition &delta) {
    auto it = table.rates.find(delta);
    if (it == table.rates.end()) {
        return std::nullopt;
    }
    return it->second;
}
