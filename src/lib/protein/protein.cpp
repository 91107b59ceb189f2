#include <stdexcept>

#include "glycan/glycan.hpp"
#include "protein/protein.hpp"

const std::map<char, Composition::Composition> &Protein::residue_formulas() {
    static const std::map<char, Composition::Composition> formulas = {
        {'A', Composition::from_formula("C3 H5 N O")},
        {'C', Composition::from_formula("C3 H5 N O S")},
        {'D', Composition::from_formula("C4 H5 N O3")},
        {'E', Composition::from_formula("C5 H7 N O3")},
        {'F', Composition::from_formula("C9 H9 N O")},
        {'G', Composition::from_formula("C2 H3 N O")},
        {'H', Composition::from_formula("C6 H7 N3 O")},
        {'I', Composition::from_formula("C6 H11 N O")},
        {'K', Composition::from_formula("C6 H12 N2 O")},
        {'L', Composition::from_formula("C6 H11 N O")},
        {'M', Composition::from_formula("C5 H9 N O S")},
        {'N', Composition::from_formula("C4 H6 N2 O2")},
        {'P', Composition::from_formula("C5 H7 N O")},
        {'Q', Composition::from_formula("C5 H8 N2 O2")},
        {'R', Composition::from_formula("C6 H12 N4 O")},
        {'S', Composition::from_formula("C3 H5 N O2")},
        {'T', Composition::from_formula("C4 H7 N O2")},
        {'V', Composition::from_formula("C5 H9 N O")},
        {'W', Composition::from_formula("C11 H10 N2 O")},
        {'Y', Composition::from_formula("C9 H9 N O2")},
        {'6', Composition::from_formula("C5 H5 N O2")},
        {'7', Composition::from_formula("C5 H7 N O2")},
        {'J', Composition::from_formula("C3 H6 N O5 P")},
        {'Z', Composition::from_formula("C4 H8 N O5 P")},
    };
    return formulas;
}

Composition::Composition Protein::sequence_formula(const std::string &sequence,
                                                   uint64_t chains,
                                                   uint64_t disulfides) {
    const auto &formulas = residue_formulas();
    std::map<char, int64_t> residue_counts;
    for (size_t i = 0; i < sequence.size(); ++i) {
        if (formulas.count(sequence[i]) == 0) {
            throw std::invalid_argument("unknown amino acid '" +
                                        std::string(1, sequence[i]) +
                                        "' at position " + std::to_string(i));
        }
        ++residue_counts[sequence[i]];
    }

    Composition::Composition formula;
    for (const auto &[residue, count] : residue_counts) {
        formula = Composition::add(
            formula, Composition::multiply(formulas.at(residue), count));
    }
    if (chains == 0) {
        chains = 1;
    }
    formula = Composition::add(
        formula, Composition::from_counts({{"H", 2 * int64_t(chains)},
                                           {"O", int64_t(chains)}}));
    return Composition::sub(
        formula, Composition::from_counts({{"H", 2 * int64_t(disulfides)}}));
}

double Protein::sequence_mass(const std::string &sequence, uint64_t chains,
                              uint64_t disulfides) {
    // Residue formulas only contain elements with a known average mass.
    return *Glycan::mass(sequence_formula(sequence, chains, disulfides));
}

std::optional<double> Protein::glycoprotein_mass(
    const std::string &sequence, const std::optional<double> &glycoform_mass,
    uint64_t chains, uint64_t disulfides) {
    if (!glycoform_mass) {
        return std::nullopt;
    }
    return sequence_mass(sequence, chains, disulfides) + *glycoform_mass;
}
