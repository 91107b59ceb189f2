#ifndef UTILS_COMPRESSION_HPP
#define UTILS_COMPRESSION_HPP

#include <zlib.h>
#include <cstdio>
#include <iostream>
#include <streambuf>
#include <string>
#include <vector>

// This namespace contains the streams used to read and write compressed files.
// Binary graph files are written as zlib streams, while tabular files can be
// read from or written to gzip files (e.g. "glycoforms.csv.gz").
namespace Compression {

enum state { OK, ERROR };

// Container used around the deflate data.
enum Format { ZLIB, GZIP };

// Returns true if the file name has a ".gz" extension.
bool is_gzip_path(const std::string &filename);

// Streambuf class allows a stream to write compressed data to a file by use of
// an intermediate buffer.
class DeflateStreambuf : public std::streambuf {
    // Buffer to store information before compression.
    char *buffer;
    size_t buffer_size;

    // File to write compressed data to.
    FILE *out_file = nullptr;

    // Zlib stream used in compression.
    z_stream strm = {};
    bool strm_initialized = false;

   public:
    // Constructor sets buffer size.
    DeflateStreambuf(size_t _buffer_size = 16384);
    // Destructor flushes the buffer, closes the file, and deletes buffer.
    virtual ~DeflateStreambuf();

    // Open file and allocate Zlib state.
    int open(std::string const &filename, Format format);

   private:
    virtual int overflow(int c);  // Writes byte when buffer is full.
    virtual int sync();           // Flushes the buffer.
    int write_buffer(int flush);  // Compress data form buffer to file.
};

// DeflateStream uses the DeflateStreambuf to compress the data and write to a
// file.
class DeflateStream : private DeflateStreambuf, public std::ostream {
   public:
    DeflateStream(size_t buffer_size = 16384)
        : DeflateStreambuf(buffer_size), std::ostream(this) {}
    DeflateStream(std::string const &filename, Format format = ZLIB,
                  size_t buffer_size = 16384)
        : DeflateStreambuf(buffer_size), std::ostream(this) {
        open(filename, format);
    }

    // Open streambuf and check for success.
    void open(std::string const &filename, Format format = ZLIB);
};

// Streambuf class allows a stream to read data from a file and decompress it
// using an intermediate buffer. Both zlib and gzip headers are detected
// automatically.
class InflateStreambuf : public std::streambuf {
    // Buffer to store decompressed data.
    char *buffer;
    size_t buffer_size;

    // Compressed data read from the file but not yet consumed by Zlib.
    std::vector<unsigned char> in_buffer;
    bool stream_end = false;

    // File to read compressed data from.
    FILE *in_file = nullptr;

    // Zlib stream used in decompression.
    z_stream strm = {};
    bool strm_initialized = false;

   public:
    // Constructor sets buffer size.
    InflateStreambuf(size_t _buffer_size = 16384);
    // Destructor closes the input file, frees the Zlib state and deletes the
    // buffer.
    virtual ~InflateStreambuf();

    // Open file and allocate Zlib state.
    int open(std::string const &filename);

   private:
    virtual int underflow();  // Read byte when buffer is empty.
    int read_buffer();        // Decompress data from file into the buffer.
};

// InflateStream uses the InflateStreambuf to decompress the data read from a
// file.
class InflateStream : private InflateStreambuf, public std::istream {
   public:
    InflateStream(size_t buffer_size = 16384)
        : InflateStreambuf(buffer_size), std::istream(this) {}
    InflateStream(std::string const &filename, size_t buffer_size = 16384)
        : InflateStreambuf(buffer_size), std::istream(this) {
        open(filename);
    }

    // Open streambuf and check for success.
    void open(std::string const &filename);
};

}  // namespace Compression

#endif /* UTILS_COMPRESSION_HPP */
