#include <algorithm>
#include <unordered_map>

#include "glycoform_space/glycoform_space.hpp"

uint64_t GlycoformSpace::num_combinations(const SiteLibraries &site_libraries) {
    uint64_t total = 1;
    for (const auto &library : site_libraries) {
        total *= library.size();
    }
    return total;
}

bool GlycoformSpace::next_combination(const SiteLibraries &site_libraries,
                                      std::vector<size_t> &indices) {
    for (size_t i = indices.size(); i > 0; --i) {
        size_t site = i - 1;
        ++indices[site];
        if (indices[site] < site_libraries[site].size()) {
            return true;
        }
        indices[site] = 0;
    }
    return false;
}

std::vector<GlycoformSpace::Glycoform> GlycoformSpace::unique_glycoforms(
    const SiteLibraries &site_libraries) {
    std::vector<Glycoform> glycoforms;
    if (num_combinations(site_libraries) == 0) {
        return glycoforms;
    }

    // The mass of each glycan is only calculated once.
    std::vector<std::vector<std::optional<double>>> glycan_masses;
    for (const auto &library : site_libraries) {
        std::vector<std::optional<double>> masses;
        for (const auto &glycan : library) {
            auto formula = Glycan::elemental_formula(glycan.composition);
            masses.push_back(formula ? Glycan::mass(*formula) : std::nullopt);
        }
        glycan_masses.push_back(masses);
    }

    // Maps compositions to their position in the output, and keeps the
    // combination names of every group.
    std::unordered_map<Composition::Composition, size_t, Composition::Hash>
        positions;
    std::vector<std::vector<std::string>> group_names;

    std::vector<size_t> indices(site_libraries.size(), 0);
    do {
        Composition::Composition composition;
        std::string name;
        double abundance = 1.0;
        std::optional<double> mass = 0.0;
        for (size_t site = 0; site < site_libraries.size(); ++site) {
            const auto &glycan = site_libraries[site][indices[site]];
            composition = Composition::add(composition, glycan.composition);
            if (site > 0) {
                name += "/";
            }
            name += glycan.name;
            abundance *= glycan.abundance;
            const auto &glycan_mass = glycan_masses[site][indices[site]];
            if (mass && glycan_mass) {
                *mass += *glycan_mass;
            } else {
                mass = std::nullopt;
            }
        }

        auto it = positions.find(composition);
        if (it == positions.end()) {
            positions[composition] = glycoforms.size();
            glycoforms.push_back({composition, name, abundance, mass});
            group_names.push_back({name});
            continue;
        }
        auto &glycoform = glycoforms[it->second];
        glycoform.abundance += abundance;
        auto &names = group_names[it->second];
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
            glycoform.name += " or " + name;
        }
    } while (next_combination(site_libraries, indices));

    double max_abundance = 0.0;
    for (const auto &glycoform : glycoforms) {
        max_abundance = std::max(max_abundance, glycoform.abundance);
    }
    if (max_abundance > 0.0) {
        for (auto &glycoform : glycoforms) {
            glycoform.abundance = glycoform.abundance / max_abundance * 100.0;
        }
    }
    return glycoforms;
}

std::vector<GlycoformSpace::Glycoform> GlycoformSpace::unique_glycoforms(
    const std::vector<Glycan::Glycan> &library, size_t num_sites) {
    return unique_glycoforms(SiteLibraries(num_sites, library));
}
