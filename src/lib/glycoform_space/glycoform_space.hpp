#ifndef GLYCOFORMSPACE_GLYCOFORMSPACE_HPP
#define GLYCOFORMSPACE_GLYCOFORMSPACE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "composition/composition.hpp"
#include "glycan/glycan.hpp"

namespace GlycoformSpace {

// One glycan library per glycosylation site.
typedef std::vector<std::vector<Glycan::Glycan>> SiteLibraries;

// A glycoform that is unique in terms of its monosaccharide composition.
struct Glycoform {
    Composition::Composition composition;
    // The site glycans of every combination with this composition, separated
    // by "/", and alternative combinations separated by " or ", e.g.
    // "A2G0F/A2G1F or A2G1F/A2G0F".
    std::string name;
    // Theoretical abundance, relative to the most abundant glycoform (100).
    double abundance;
    // Average mass, only present if all monosaccharides have a known formula.
    std::optional<double> mass;
};

// Total number of combinations of one glycan per site, i.e. the product of the
// library sizes.
uint64_t num_combinations(const SiteLibraries &site_libraries);

// Advances the per-site indices to the next combination, the last site
// varying fastest. Returns false once all combinations have been visited, in
// which case the indices are reset to the first combination.
bool next_combination(const SiteLibraries &site_libraries,
                      std::vector<size_t> &indices);

// Enumerates the cartesian product of the site libraries and merges all
// combinations with equal composition. The abundance of each combination is
// the product of the glycan abundances, and merged combinations add up. The
// glycoforms are returned in order of first occurrence.
std::vector<Glycoform> unique_glycoforms(const SiteLibraries &site_libraries);

// Same as above with the same library on every site.
std::vector<Glycoform> unique_glycoforms(
    const std::vector<Glycan::Glycan> &library, size_t num_sites);

}  // namespace GlycoformSpace

#endif /* GLYCOFORMSPACE_GLYCOFORMSPACE_HPP */
