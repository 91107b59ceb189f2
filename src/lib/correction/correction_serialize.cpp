#include "correction/correction_serialize.hpp"
#include "glycation/glycation_graph_serialize.hpp"
#include "utils/serialization.hpp"

bool Correction::Serialize::read_result(std::istream &stream,
                                        Result *result) {
    uint8_t normalized = 0;
    Serialization::read_uint8(stream, &normalized);
    result->normalized = normalized != 0;
    return Serialization::read_vector<Uncertainty::Value>(
        stream, &result->corrected, Glycation::Serialize::read_value);
}

bool Correction::Serialize::write_result(std::ostream &stream,
                                         const Result &result) {
    Serialization::write_uint8(stream, result.normalized ? 1 : 0);
    return Serialization::write_vector<Uncertainty::Value>(
        stream, result.corrected, Glycation::Serialize::write_value);
}
