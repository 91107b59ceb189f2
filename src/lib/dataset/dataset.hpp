#ifndef DATASET_DATASET_HPP
#define DATASET_DATASET_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// The records exchanged between the input files and the glycation code.
namespace Dataset {

// Raised when an input file can't be interpreted, e.g. when it has no data
// columns or a cell that should be numeric isn't.
class InputFormatError : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
};

// A labelled measurement, either the abundance of a glycoform or the
// abundance of a glycation level (the label being the number of hexoses).
struct Record {
    std::string label;
    double value;
    double uncertainty;
};

// An entry of a glycan library. The composition may be empty, in which case
// it is derived from the glycan name.
struct LibraryEntry {
    std::string name;
    std::string composition;
    std::optional<double> abundance;
};

}  // namespace Dataset

#endif /* DATASET_DATASET_HPP */
