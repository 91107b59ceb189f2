#include "utils/diagnostics.hpp"

std::string Diagnostics::kind_name(Warning::Kind kind) {
    switch (kind) {
        case Warning::MISSING_ABUNDANCE:
            return "missing_abundance";
        case Warning::ONLY_IN_LIBRARY:
            return "only_in_library";
        case Warning::ONLY_IN_OBSERVED:
            return "only_in_observed";
        case Warning::MISSING_UNCERTAINTY:
            return "missing_uncertainty";
        case Warning::EXTRA_COLUMNS:
            return "extra_columns";
        case Warning::INCONSISTENT_LABEL:
            return "inconsistent_label";
        case Warning::DUPLICATE_LABEL:
            return "duplicate_label";
        case Warning::UNUSED_LABEL:
            return "unused_label";
    }
    return "unknown";
}
