#include <algorithm>
#include <cctype>
#include <functional>
#include <regex>
#include <sstream>
#include <stdexcept>

#include "composition/composition.hpp"

namespace {
void trim_space(std::string &s) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

void accumulate(std::map<std::string, int64_t> &counts,
                const std::string &unit, int64_t count) {
    auto &value = counts[unit];
    value += count;
    if (value == 0) {
        counts.erase(unit);
    }
}

// Converts the numeric part of an item, reporting counts that don't fit in
// an int64_t as malformed items.
int64_t parse_count(const std::string &digits, const std::string &item) {
    try {
        return std::stoll(digits);
    } catch (const std::out_of_range &) {
        throw std::invalid_argument("count out of range: '" + item + "'");
    }
}
}  // namespace

Composition::Composition Composition::from_counts(
    const std::map<std::string, int64_t> &counts) {
    Composition composition;
    for (const auto &[unit, count] : counts) {
        if (count != 0) {
            composition.counts[unit] = count;
        }
    }
    return composition;
}

Composition::Composition Composition::from_string(const std::string &str) {
    std::regex item_regex(R"(^(\d*)\s*([\w-]+)$)");
    Composition composition;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        trim_space(item);
        if (item.empty()) {
            continue;
        }
        std::smatch matches;
        if (!std::regex_match(item, matches, item_regex)) {
            throw std::invalid_argument("invalid composition item: '" + item +
                                        "'");
        }
        int64_t count = 1;
        if (matches[1].length() > 0) {
            count = parse_count(matches[1].str(), item);
        }
        accumulate(composition.counts, matches[2].str(), count);
    }
    return composition;
}

Composition::Composition Composition::from_formula(const std::string &str) {
    std::regex element_regex(R"(^([A-Z][a-z]?)(-?\d*)$)");
    Composition composition;
    std::stringstream ss(str);
    std::string element;
    while (ss >> element) {
        std::smatch matches;
        if (!std::regex_match(element, matches, element_regex) ||
            matches[2].str() == "-") {
            throw std::invalid_argument("invalid formula part: '" + element +
                                        "'");
        }
        int64_t count = 1;
        if (matches[2].length() > 0) {
            count = parse_count(matches[2].str(), element);
        }
        accumulate(composition.counts, matches[1].str(), count);
    }
    return composition;
}

Composition::Composition Composition::add(const Composition &a,
                                          const Composition &b) {
    Composition result = a;
    for (const auto &[unit, count] : b.counts) {
        accumulate(result.counts, unit, count);
    }
    return result;
}

Composition::Composition Composition::sub(const Composition &a,
                                          const Composition &b) {
    Composition result = a;
    for (const auto &[unit, count] : b.counts) {
        accumulate(result.counts, unit, -count);
    }
    return result;
}

Composition::Composition Composition::neg(const Composition &a) {
    return multiply(a, -1);
}

Composition::Composition Composition::multiply(const Composition &a,
                                               int64_t factor) {
    Composition result;
    if (factor == 0) {
        return result;
    }
    for (const auto &[unit, count] : a.counts) {
        result.counts[unit] = count * factor;
    }
    return result;
}

int64_t Composition::count(const Composition &a, const std::string &unit) {
    auto it = a.counts.find(unit);
    if (it == a.counts.end()) {
        return 0;
    }
    return it->second;
}

int64_t Composition::total(const Composition &a) {
    int64_t sum = 0;
    for (const auto &entry : a.counts) {
        sum += entry.second;
    }
    return sum;
}

bool Composition::empty(const Composition &a) { return a.counts.empty(); }

std::string Composition::to_string(const Composition &a) {
    if (a.counts.empty()) {
        return "[no PTMs]";
    }
    std::string result;
    for (const auto &[unit, count] : a.counts) {
        if (!result.empty()) {
            result += ", ";
        }
        result += std::to_string(count) + " " + unit;
    }
    return result;
}

std::string Composition::to_formula_string(const Composition &a) {
    std::string result;
    for (const auto &[element, count] : a.counts) {
        if (!result.empty()) {
            result += " ";
        }
        result += element;
        if (count != 1) {
            result += std::to_string(count);
        }
    }
    return result;
}

bool Composition::operator==(const Composition &a, const Composition &b) {
    return a.counts == b.counts;
}

bool Composition::operator!=(const Composition &a, const Composition &b) {
    return !(a == b);
}

bool Composition::operator<(const Composition &a, const Composition &b) {
    return a.counts < b.counts;
}

// Combines the hashes of the sorted (unit, count) pairs, the same mixing
// function as boost::hash_combine.
size_t Composition::hash(const Composition &a) {
    size_t seed = a.counts.size();
    for (const auto &[unit, count] : a.counts) {
        size_t h = std::hash<std::string>{}(unit) ^
                   (std::hash<int64_t>{}(count) << 1);
        seed ^= h + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
}
