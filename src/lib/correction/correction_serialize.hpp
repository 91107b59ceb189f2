#ifndef CORRECTION_CORRECTIONSERIALIZE_HPP
#define CORRECTION_CORRECTIONSERIALIZE_HPP

#include <iostream>

#include "correction/correction.hpp"

// This namespace groups the functions used to serialize the correction results
// into a binary stream.
namespace Correction::Serialize {

// Correction::Result
bool read_result(std::istream &stream, Result *result);
bool write_result(std::ostream &stream, const Result &result);

}  // namespace Correction::Serialize

#endif /* CORRECTION_CORRECTIONSERIALIZE_HPP */
