#ifndef UTILS_DIAGNOSTICS_HPP
#define UTILS_DIAGNOSTICS_HPP

#include <string>
#include <vector>

// Non-fatal problems found while reading datasets or building a glycation
// graph. The library never prints them; callers pass an optional vector that
// collects them and decide how to report them.
namespace Diagnostics {

struct Warning {
    enum Kind {
        // An enumerated glycoform has no observed abundance.
        MISSING_ABUNDANCE,
        // A glycan appears in the library but not in the observed data.
        ONLY_IN_LIBRARY,
        // A glycan appears in the observed data but not in the library.
        ONLY_IN_OBSERVED,
        // A dataset has a single data column.
        MISSING_UNCERTAINTY,
        // A dataset has more than two data columns.
        EXTRA_COLUMNS,
        // An observed label doesn't have one glycan per site.
        INCONSISTENT_LABEL,
        // The same glycoform was observed more than once.
        DUPLICATE_LABEL,
        // An observed glycoform has the same composition as another one that
        // was already matched, so its abundance is not used.
        UNUSED_LABEL,
    };
    Kind kind;
    std::string message;
};

// Appends a warning if the collector is not null.
inline void warn(std::vector<Warning> *warnings, Warning::Kind kind,
                 const std::string &message) {
    if (warnings != nullptr) {
        warnings->push_back({kind, message});
    }
}

std::string kind_name(Warning::Kind kind);

}  // namespace Diagnostics

#endif /* UTILS_DIAGNOSTICS_HPP */
