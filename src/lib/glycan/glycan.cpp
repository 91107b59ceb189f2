#include <limits>
#include <regex>
#include <stdexcept>

#include "glycan/glycan.hpp"

Composition::Composition Glycan::parse_name(const std::string &name) {
    if (name == "non-glycosylated" || name == "unglycosylated" ||
        name == "null") {
        return {};
    }

    std::regex zhang_regex(
        "^(?:A([[:digit:]]+))?"     // antennas
        "(?:Sg([[:digit:]]+))?"     // Neu5Gc
        "(?:S([[:digit:]]+))?"      // Neu5Ac
        "(?:Ga([[:digit:]]+))?"     // alpha-Gal
        "(?:G([[:digit:]]+))?"      // Gal
        "(?:M([[:digit:]]+))?"      // Man
        "(F)?"                      // core Fuc
        "(B)?$");                   // bisecting GlcNAc
    std::smatch matches;
    if (!std::regex_match(name, matches, zhang_regex)) {
        throw NomenclatureError("invalid glycan name: '" + name + "'");
    }
    if (name.empty()) {
        return {};
    }

    // Counts are bounded so that the sums below can't overflow.
    auto group_count = [&matches, &name](size_t i) -> int64_t {
        if (!matches[i].matched) {
            return 0;
        }
        int64_t count = 0;
        try {
            count = std::stoll(matches[i].str());
        } catch (const std::out_of_range &) {
            count = -1;
        }
        if (count < 0 || count > std::numeric_limits<int32_t>::max()) {
            throw NomenclatureError("invalid glycan name: '" + name +
                                    "', count out of range");
        }
        return count;
    };
    int64_t antennas = group_count(1);
    int64_t neu5gc = group_count(2);
    int64_t neu5ac = group_count(3);
    int64_t alpha_gal = group_count(4);
    int64_t gal = group_count(5);
    int64_t man = group_count(6);
    int64_t fuc = matches[7].matched ? 1 : 0;
    int64_t bisecting = matches[8].matched ? 1 : 0;

    // There are always three Man in the core. Without an explicit number of
    // antennas the glycan is assumed to be biantennary.
    if (!matches[6].matched) {
        man = 3;
        if (!matches[1].matched) {
            antennas = 2;
        }
    }

    return Composition::from_counts({
        {"Hex", neu5gc + neu5ac + 2 * alpha_gal + gal + man},
        {"HexNAc", antennas + 2 + bisecting},
        {"Neu5Ac", neu5ac},
        {"Neu5Gc", neu5gc},
        {"Fuc", fuc},
    });
}

Glycan::Glycan Glycan::from_name(const std::string &name, double abundance) {
    return {name, parse_name(name), abundance};
}

Glycan::Glycan Glycan::from_library_entry(const std::string &name,
                                          const std::string &composition,
                                          double abundance) {
    if (composition.empty()) {
        return from_name(name, abundance);
    }
    try {
        return {name, Composition::from_string(composition), abundance};
    } catch (const std::logic_error &e) {
        throw NomenclatureError("invalid composition for glycan '" + name +
                                "': " + e.what());
    }
}

const std::map<std::string, Composition::Composition> &
Glycan::monosaccharide_formulas() {
    static const std::map<std::string, Composition::Composition> formulas = {
        {"Hex", Composition::from_formula("C6 H10 O5")},
        {"HexNAc", Composition::from_formula("C8 H13 O5 N1")},
        {"Neu5Ac", Composition::from_formula("C11 H17 O8 N1")},
        {"Neu5Gc", Composition::from_formula("C11 H17 O9 N1")},
        {"Fuc", Composition::from_formula("C6 H10 O4")},
    };
    return formulas;
}

const std::map<std::string, double> &Glycan::average_masses() {
    static const std::map<std::string, double> masses = {
        {"C", 12.010790},  {"H", 1.007968},  {"N", 14.006690},
        {"O", 15.999370},  {"P", 30.973763}, {"S", 32.063900},
        {"Cl", 35.45},     {"Na", 22.99},
    };
    return masses;
}

std::optional<Composition::Composition> Glycan::elemental_formula(
    const Composition::Composition &monosaccharides) {
    const auto &formulas = monosaccharide_formulas();
    Composition::Composition formula;
    for (const auto &[unit, count] : monosaccharides.counts) {
        auto it = formulas.find(unit);
        if (it == formulas.end()) {
            return std::nullopt;
        }
        formula = Composition::add(formula,
                                   Composition::multiply(it->second, count));
    }
    return formula;
}

std::optional<double> Glycan::mass(const Composition::Composition &formula) {
    const auto &masses = average_masses();
    double total = 0.0;
    for (const auto &[element, count] : formula.counts) {
        auto it = masses.find(element);
        if (it == masses.end()) {
            return std::nullopt;
        }
        total += it->second * count;
    }
    return total;
}
