#include <cstring>

#include "utils/serialization.hpp"

// Integers are written byte by byte starting from the least significant one,
// which makes the format independent of the host endianness.
namespace {
template <typename T>
bool read_little_endian(std::istream &stream, T *value) {
    unsigned char bytes[sizeof(T)] = {};
    stream.read(reinterpret_cast<char *>(bytes), sizeof(T));
    T result = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        result |= static_cast<T>(bytes[i]) << (8 * i);
    }
    *value = result;
    return stream.good();
}

template <typename T>
bool write_little_endian(std::ostream &stream, T value) {
    unsigned char bytes[sizeof(T)] = {};
    for (size_t i = 0; i < sizeof(T); ++i) {
        bytes[i] = static_cast<unsigned char>((value >> (8 * i)) & 0xFF);
    }
    stream.write(reinterpret_cast<const char *>(bytes), sizeof(T));
    return stream.good();
}
}  // namespace

bool Serialization::read_uint8(std::istream &stream, uint8_t *value) {
    return read_little_endian(stream, value);
}

bool Serialization::write_uint8(std::ostream &stream, uint8_t value) {
    return write_little_endian(stream, value);
}

bool Serialization::read_uint32(std::istream &stream, uint32_t *value) {
    return read_little_endian(stream, value);
}

bool Serialization::write_uint32(std::ostream &stream, uint32_t value) {
    return write_little_endian(stream, value);
}

bool Serialization::read_uint64(std::istream &stream, uint64_t *value) {
    return read_little_endian(stream, value);
}

bool Serialization::write_uint64(std::ostream &stream, uint64_t value) {
    return write_little_endian(stream, value);
}

bool Serialization::read_int64(std::istream &stream, int64_t *value) {
    uint64_t raw = 0;
    read_uint64(stream, &raw);
    std::memcpy(value, &raw, sizeof(raw));
    return stream.good();
}

bool Serialization::write_int64(std::ostream &stream, int64_t value) {
    uint64_t raw = 0;
    std::memcpy(&raw, &value, sizeof(raw));
    return write_uint64(stream, raw);
}

bool Serialization::read_double(std::istream &stream, double *value) {
    uint64_t raw = 0;
    read_uint64(stream, &raw);
    std::memcpy(value, &raw, sizeof(raw));
    return stream.good();
}

bool Serialization::write_double(std::ostream &stream, double value) {
    uint64_t raw = 0;
    std::memcpy(&raw, &value, sizeof(raw));
    return write_uint64(stream, raw);
}

bool Serialization::read_string(std::istream &stream, std::string *value) {
    uint64_t size = 0;
    if (!read_uint64(stream, &size)) {
        return false;
    }
    // The size comes from the file, so the string grows in bounded chunks and
    // a corrupt size fails when the stream runs out of data.
    const uint64_t chunk_size = 4096;
    value->clear();
    char chunk[chunk_size];
    while (size > 0) {
        uint64_t n = size < chunk_size ? size : chunk_size;
        stream.read(chunk, n);
        if (!stream.good()) {
            return false;
        }
        value->append(chunk, n);
        size -= n;
    }
    return stream.good();
}

bool Serialization::write_string(std::ostream &stream,
                                 const std::string &value) {
    write_uint64(stream, value.size());
    stream.write(value.data(), value.size());
    return stream.good();
}
