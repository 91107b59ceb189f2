#include <zlib.h>
#include <cstdint>
#include <cstring>
#include <vector>

#include "utils/compression.hpp"

// zlib window bits. Adding 16 writes a gzip wrapper instead of a zlib one, and
// adding 32 when inflating enables automatic header detection.
#define WINDOW_BITS 15
#define GZIP_ENCODING 16
#define AUTO_HEADER_DETECTION 32

bool Compression::is_gzip_path(const std::string &filename) {
    const std::string extension = ".gz";
    if (filename.size() < extension.size()) {
        return false;
    }
    return filename.compare(filename.size() - extension.size(),
                            extension.size(), extension) == 0;
}

// Initialize buffer.
Compression::DeflateStreambuf::DeflateStreambuf(size_t _buffer_size)
    : buffer_size(_buffer_size) {
    // Allocate new buffer.
    buffer = new char[buffer_size];
    // Set streambuf's internal pointer to buffer.
    setp(buffer, buffer + buffer_size);
}

// Destructor flushes the buffer, deletes the allocated memory, closes the
// output file, and frees the allocated Zlib state.
Compression::DeflateStreambuf::~DeflateStreambuf() {
    if (out_file && strm_initialized) {
        // Flush current buffer.
        sync();

        // Perform last write for Zlib to flush it's internal buffer.
        setp(buffer, buffer);
        write_buffer(Z_FINISH);
    }

    delete[] buffer;
    if (out_file) {
        fclose(out_file);
    }
    if (strm_initialized) {
        (void)deflateEnd(&strm);
    }
}

// Open file, allocate buffer, and initialize Zlib state.
int Compression::DeflateStreambuf::open(std::string const &filename,
                                        Format format) {
    // Open file.
    out_file = fopen(filename.c_str(), "wb");
    if (out_file == NULL) {
        return ERROR;
    }

    // Initialize zlib stream.
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    int window_bits = WINDOW_BITS;
    if (format == GZIP) {
        window_bits += GZIP_ENCODING;
    }
    int ret = deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                           window_bits, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        return ERROR;
    }
    strm_initialized = true;
    return OK;
}

// This function writes a character when the buffer is full.
int Compression::DeflateStreambuf::overflow(int c) {
    // Flush buffer.
    if (sync() == -1) {
        // Signal error when sync fails
        return EOF;
    }
    if (c == EOF) {
        return 0;
    }

    // Set pointer to buffer.
    setp(buffer, buffer + buffer_size);
    return sputc(c);
}

// Flushes the buffer using the Zlib library for compression.
int Compression::DeflateStreambuf::sync() {
    if (!strm_initialized) {
        return -1;
    }
    if (pptr() > pbase()) {  // buffer not empty
        int ret = write_buffer(Z_NO_FLUSH);
        if (ret != Z_OK) {
            return -1;
        }
        // Set pointer to buffer.
        setp(buffer, buffer + buffer_size);
    }
    return 0;
}

// Write the current buffer using the Zlib library. While this flushes our
// intermediate buffer, the Zlib library may not write all of the compressed
// data to the file immediately.
// When writing the buffer in between compression, the argument flush should
// be equal to Z_NO_FLUSH. After writing the final block of data, the
// argument flush should be equal to Z_FINISH so Zlib knows to flush all of
// the compressed data.
int Compression::DeflateStreambuf::write_buffer(int flush) {
    // Set buffer and buffer size.
    strm.avail_in = pptr() - pbase();
    strm.next_in = reinterpret_cast<unsigned char *>(pbase());

    int ret;
    // Intermediate buffer for compressed data.
    std::vector<unsigned char> out(buffer_size);
    // Deflate and write compressed data to file until we do not fill the
    // output buffer.
    do {
        strm.avail_out = buffer_size;
        strm.next_out = out.data();

        // Deflate buffer.
        ret = deflate(&strm, flush);
        if (ret == Z_STREAM_ERROR) {
            return ret;
        }

        // Write compressed data to file.
        size_t have = buffer_size - strm.avail_out;
        if (fwrite(out.data(), 1, have, out_file) != have ||
            ferror(out_file)) {
            return Z_ERRNO;
        }
    } while (strm.avail_out == 0);

    if (flush == Z_FINISH) {
        return ret == Z_STREAM_END ? Z_OK : Z_DATA_ERROR;
    }
    return ret == Z_BUF_ERROR ? Z_OK : ret;
}

// Open streambuf and check for success.
void Compression::DeflateStream::open(std::string const &filename,
                                      Format format) {
    int state = DeflateStreambuf::open(filename, format);
    if (state == ERROR) {
        setstate(std::ios::badbit);
    }
}

// Initialize buffer.
Compression::InflateStreambuf::InflateStreambuf(size_t _buffer_size)
    : buffer_size(_buffer_size), in_buffer(_buffer_size) {
    // Allocate new buffer.
    buffer = new char[buffer_size];
    // Set streambuf's internal pointer to buffer.
    setg(buffer, buffer + buffer_size, buffer + buffer_size);
}

// Destructor deleted the allocated memory, closes the input file, and frees the
// allocated Zlib state.
Compression::InflateStreambuf::~InflateStreambuf() {
    delete[] buffer;
    if (in_file) {
        fclose(in_file);
    }
    if (strm_initialized) {
        (void)inflateEnd(&strm);
    }
}

// Open file and initialize Zlib state.
int Compression::InflateStreambuf::open(std::string const &filename) {
    // Open file.
    in_file = fopen(filename.c_str(), "rb");
    if (in_file == NULL) {
        return ERROR;
    }

    // Initialize zlib stream.
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    strm.avail_in = 0;
    strm.next_in = Z_NULL;
    int ret = inflateInit2(&strm, WINDOW_BITS + AUTO_HEADER_DETECTION);
    if (ret != Z_OK) {
        return ERROR;
    }
    strm_initialized = true;
    return OK;
}

// Read a character when the buffer is empty.
int Compression::InflateStreambuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    int nread = read_buffer();
    if (nread <= 0) {
        return EOF;
    }
    setg(buffer, buffer, buffer + nread);
    return traits_type::to_int_type(*gptr());
}

// Fill the buffer using the Zlib library for decompression, returns the number
// of bytes that were read to the buffer, or a negative zlib error code.
int Compression::InflateStreambuf::read_buffer() {
    if (in_file == nullptr || !strm_initialized || stream_end) {
        return 0;
    }

    size_t bytes_read = 0;
    // Read and inflate data until the output buffer is full or the compressed
    // stream ends.
    do {
        // Refill the input buffer once Zlib has consumed it.
        if (strm.avail_in == 0) {
            strm.avail_in = fread(in_buffer.data(), 1, buffer_size, in_file);
            if (ferror(in_file)) {
                return Z_ERRNO;
            }
            strm.next_in = in_buffer.data();
        }

        // Set output buffer.
        size_t size = buffer_size - bytes_read;
        strm.avail_out = size;
        strm.next_out = reinterpret_cast<unsigned char *>(buffer + bytes_read);

        // Inflate data.
        int ret = inflate(&strm, Z_NO_FLUSH);
        switch (ret) {
            case Z_NEED_DICT:
                ret = Z_DATA_ERROR;
                [[fallthrough]];
            case Z_DATA_ERROR:
            case Z_MEM_ERROR:
            case Z_STREAM_ERROR:
                return ret;
        }
        bytes_read += size - strm.avail_out;
        if (ret == Z_STREAM_END) {
            stream_end = true;
            break;
        }
        // No progress is possible with an exhausted file.
        if (ret == Z_BUF_ERROR && feof(in_file)) {
            return bytes_read > 0 ? static_cast<int>(bytes_read) : Z_DATA_ERROR;
        }
    } while (bytes_read < buffer_size);

    return static_cast<int>(bytes_read);
}

// Open streambuf and check for success.
void Compression::InflateStream::open(std::string const &filename) {
    int state = InflateStreambuf::open(filename);
    if (state == ERROR) {
        setstate(std::ios::badbit);
    }
}
