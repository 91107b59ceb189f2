#ifndef UTILS_SERIALIZATION_HPP
#define UTILS_SERIALIZATION_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

// This namespace contains necessary functions to serialize commonly used types
// into a binary stream using the little endian byte order.
namespace Serialization {

// Write/read a single byte to/from the stream.
bool read_uint8(std::istream &stream, uint8_t *value);
bool write_uint8(std::ostream &stream, uint8_t value);

// Write/read an uint32 to/from the stream.
bool read_uint32(std::istream &stream, uint32_t *value);
bool write_uint32(std::ostream &stream, uint32_t value);

// Write/read an uint64 to/from the stream.
bool read_uint64(std::istream &stream, uint64_t *value);
bool write_uint64(std::ostream &stream, uint64_t value);

// Signed integers are stored as their two's complement uint64 representation.
bool read_int64(std::istream &stream, int64_t *value);
bool write_int64(std::ostream &stream, int64_t value);

bool read_double(std::istream &stream, double *value);
bool write_double(std::ostream &stream, double value);

// Strings are stored as an uint64 byte count followed by the raw bytes.
bool read_string(std::istream &stream, std::string *value);
bool write_string(std::ostream &stream, const std::string &value);

// Vectors are stored as an uint64 element count followed by the elements, each
// written with the given element serializer.
template <typename T>
bool read_vector(std::istream &stream, std::vector<T> *vec,
                 bool (*read_elem)(std::istream &, T *)) {
    uint64_t size = 0;
    if (!read_uint64(stream, &size)) {
        return false;
    }
    vec->clear();
    for (uint64_t i = 0; i < size; ++i) {
        T elem = {};
        if (!read_elem(stream, &elem)) {
            return false;
        }
        vec->push_back(elem);
    }
    return stream.good();
}

template <typename T>
bool write_vector(std::ostream &stream, const std::vector<T> &vec,
                  bool (*write_elem)(std::ostream &, const T &)) {
    write_uint64(stream, vec.size());
    for (const auto &elem : vec) {
        if (!write_elem(stream, elem)) {
            return false;
        }
    }
    return stream.good();
}

}  // namespace Serialization

#endif /* UTILS_SERIALIZATION_HPP */
