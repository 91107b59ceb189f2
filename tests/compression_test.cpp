#include <filesystem>
#include <fstream>
#include <string>

#include "doctest.h"

#include "utils/compression.hpp"

namespace {
std::string read_all(std::istream &stream) {
    return std::string(std::istreambuf_iterator<char>(stream),
                       std::istreambuf_iterator<char>());
}
}  // namespace

TEST_CASE("Gzip file names") {
    CHECK(Compression::is_gzip_path("glycoforms.csv.gz"));
    CHECK(Compression::is_gzip_path("/tmp/data/x.gz"));
    CHECK_FALSE(Compression::is_gzip_path("glycoforms.csv"));
    CHECK_FALSE(Compression::is_gzip_path("gz"));
    CHECK_FALSE(Compression::is_gzip_path(""));
}

TEST_CASE("Compressed files can be read back") {
    auto dir = std::filesystem::temp_directory_path();
    // Larger than the stream buffers, so that several blocks are processed.
    std::string content;
    for (size_t i = 0; i < 5000; ++i) {
        content += "A2G0F/A2G1F," + std::to_string(i) + ",0.5\n";
    }

    SUBCASE("zlib") {
        auto path = (dir / "cafog_compression_test.cgf").string();
        {
            Compression::DeflateStream stream(path);
            REQUIRE(stream.good());
            stream << content;
            CHECK(stream.good());
        }
        Compression::InflateStream stream(path);
        REQUIRE(stream.good());
        CHECK(read_all(stream) == content);
        std::filesystem::remove(path);
    }

    SUBCASE("gzip") {
        auto path = (dir / "cafog_compression_test.csv.gz").string();
        {
            Compression::DeflateStream stream(path, Compression::GZIP, 1024);
            REQUIRE(stream.good());
            stream << content;
        }
        // The gzip header is written.
        std::ifstream raw(path, std::ios::binary);
        CHECK(static_cast<unsigned char>(raw.get()) == 0x1f);
        CHECK(static_cast<unsigned char>(raw.get()) == 0x8b);
        raw.close();

        Compression::InflateStream stream(path, 512);
        REQUIRE(stream.good());
        CHECK(read_all(stream) == content);
        std::filesystem::remove(path);
    }
}

TEST_CASE("Opening a missing file sets the bad bit") {
    auto path = std::filesystem::temp_directory_path() /
                "cafog_missing_directory" / "missing.gz";
    Compression::InflateStream stream(path.string());
    CHECK_FALSE(stream.good());
}
