#ifndef PROTEIN_PROTEIN_HPP
#define PROTEIN_PROTEIN_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "composition/composition.hpp"

// Elemental formula and mass of the protein backbone of a glycoprotein. Adding
// the mass of a glycoform gives the mass of the intact glycoprotein.
namespace Protein {

// Residue formulas for the one letter amino acid codes, plus the modified
// residues 6 (pyroglutamate), 7 (hydroxyproline), J (phosphoserine) and Z
// (phosphothreonine).
const std::map<char, Composition::Composition> &residue_formulas();

// Formula of the given sequence. Each chain adds a water molecule and each
// disulfide bond removes two hydrogens. A chain count of zero is read as one.
// Throws std::invalid_argument on unknown residues.
Composition::Composition sequence_formula(const std::string &sequence,
                                          uint64_t chains = 1,
                                          uint64_t disulfides = 0);

// Average mass of the given sequence.
double sequence_mass(const std::string &sequence, uint64_t chains = 1,
                     uint64_t disulfides = 0);

// Mass of the glycoprotein carrying a glycoform of the given mass, if known.
std::optional<double> glycoprotein_mass(
    const std::string &sequence, const std::optional<double> &glycoform_mass,
    uint64_t chains = 1, uint64_t disulfides = 0);

}  // namespace Protein

#endif /* PROTEIN_PROTEIN_HPP */
