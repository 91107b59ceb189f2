#ifndef COMPOSITION_COMPOSITION_HPP
#define COMPOSITION_COMPOSITION_HPP

#include <cstdint>
#include <map>
#include <string>

// A Composition is a multiset of named units with signed integer counts. The
// same type is used for elemental formulas ({C: 6, H: 12, O: 6}) and for
// monosaccharide compositions ({Hex: 5, HexNAc: 4, Fuc: 1}).
//
// The representation is canonical: entries are kept sorted by unit name and
// units with a count of zero are never stored. Two compositions are therefore
// equal if and only if their `counts` maps are equal, which makes the type
// suitable as a key for both ordered and hashed containers.
namespace Composition {

struct Composition {
    std::map<std::string, int64_t> counts;
};

// Builds a composition from arbitrary counts, dropping zero entries.
Composition from_counts(const std::map<std::string, int64_t> &counts);

// Parses a comma separated list of units with optional leading counts, e.g.
// "4 Hex, 3 HexNAc, Fuc". A missing count is read as 1 and repeated units are
// accumulated. Throws std::invalid_argument if a non empty item can't be read.
Composition from_string(const std::string &str);

// Parses a whitespace separated elemental formula, e.g. "C6 H10 O5" or
// "C50 H100 N-3 Cl". Throws std::invalid_argument on malformed elements.
Composition from_formula(const std::string &str);

Composition add(const Composition &a, const Composition &b);
Composition sub(const Composition &a, const Composition &b);
Composition neg(const Composition &a);

// Multiplies every count by the given factor.
Composition multiply(const Composition &a, int64_t factor);

// Count for the given unit, zero if the unit is absent.
int64_t count(const Composition &a, const std::string &unit);

// Sum of all counts.
int64_t total(const Composition &a);

bool empty(const Composition &a);

// Human readable representations, e.g. "4 Hex, 3 HexNAc" ("[no PTMs]" for the
// empty composition) and "C6 H10 O5" respectively.
std::string to_string(const Composition &a);
std::string to_formula_string(const Composition &a);

bool operator==(const Composition &a, const Composition &b);
bool operator!=(const Composition &a, const Composition &b);
bool operator<(const Composition &a, const Composition &b);

size_t hash(const Composition &a);
struct Hash {
    size_t operator()(const Composition &a) const { return hash(a); }
};

}  // namespace Composition

#endif /* COMPOSITION_COMPOSITION_HPP */
