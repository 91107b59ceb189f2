#ifndef GLYCAN_GLYCAN_HPP
#define GLYCAN_GLYCAN_HPP

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include "composition/composition.hpp"

namespace Glycan {

// Raised when a glycan name doesn't follow the shorthand nomenclature.
class NomenclatureError : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
};

// A glycan that can be attached to a single glycosylation site. The abundance
// is a relative weight used to estimate the theoretical abundance of the
// glycoforms containing it.
struct Glycan {
    std::string name;
    // Monosaccharide composition, e.g. {Hex: 4, HexNAc: 4, Fuc: 1}.
    Composition::Composition composition;
    double abundance;
};

// Converts a glycan abbreviation in Zhang nomenclature (e.g. "A2G1F") to its
// monosaccharide composition (e.g. "4 Hex, 4 HexNAc, 1 Fuc"). The grammar is
// a sequence of the following optional tokens, in this order:
//
//     A<n>   antennas (HexNAc)
//     Sg<n>  Neu5Gc
//     S<n>   Neu5Ac
//     Ga<n>  alpha-Gal
//     G<n>   Gal
//     M<n>   Man, 3 if absent. If both M and A are absent, A is 2.
//     F      core fucose
//     B      bisecting GlcNAc
//
// The empty string and the names "non-glycosylated", "unglycosylated" and
// "null" are accepted as a glycan without monosaccharides.
//
// Throws NomenclatureError if the name can't be parsed.
Composition::Composition parse_name(const std::string &name);

// Creates a glycan deriving its composition from the name.
Glycan from_name(const std::string &name, double abundance = 1.0);

// Creates a glycan from a library entry. If the composition string is empty,
// the composition is derived from the name. Throws NomenclatureError if
// neither can be parsed.
Glycan from_library_entry(const std::string &name,
                          const std::string &composition,
                          double abundance = 1.0);

// Elemental formulas of the monosaccharide residues, e.g. Hex -> C6 H10 O5.
const std::map<std::string, Composition::Composition> &
monosaccharide_formulas();

// Average atomic masses of the supported elements.
const std::map<std::string, double> &average_masses();

// Converts a monosaccharide composition to its elemental formula. Returns
// std::nullopt if any unit has no known formula.
std::optional<Composition::Composition> elemental_formula(
    const Composition::Composition &monosaccharides);

// Average mass of an elemental formula. Returns std::nullopt if any element
// has no known mass.
std::optional<double> mass(const Composition::Composition &formula);

}  // namespace Glycan

#endif /* GLYCAN_GLYCAN_HPP */
