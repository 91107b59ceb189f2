#ifndef DATASET_DATASETFILES_HPP
#define DATASET_DATASETFILES_HPP

#include <iostream>
#include <string>
#include <vector>

#include "dataset/dataset.hpp"
#include "utils/diagnostics.hpp"

namespace Dataset::Files::Csv {

// Splits a CSV line into its fields. Fields may be enclosed in double quotes,
// in which case they can contain commas and escaped ("") quotes. Whitespace
// around unquoted fields is removed.
std::vector<std::string> split_row(const std::string &line);

// Reads an abundance dataset. The file has no header, lines starting with '#'
// (or the part of a line after it) are comments, the first column holds the
// labels, the second the values and the third the uncertainties. A missing
// uncertainty column is read as zero and surplus columns are ignored, both
// with a warning. Throws InputFormatError if there are no data columns or a
// row can't be read. The source name is only used in messages.
std::vector<Record> read_dataset(
    std::istream &stream, const std::string &source_name,
    std::vector<Diagnostics::Warning> *warnings = nullptr);

// Reads a glycan library. The first row is a header that must contain a
// "glycan" column and may contain "composition" and "abundance" columns.
// Throws InputFormatError on malformed input.
std::vector<LibraryEntry> read_library(std::istream &stream,
                                       const std::string &source_name);

}  // namespace Dataset::Files::Csv

namespace Dataset::Files {

// Opens the given file, decompressing it if the name ends in ".gz", and reads
// it with the matching Csv function. Throws std::runtime_error if the file
// can't be opened.
std::vector<Record> read_dataset(
    const std::string &path,
    std::vector<Diagnostics::Warning> *warnings = nullptr);
std::vector<LibraryEntry> read_library(const std::string &path);

}  // namespace Dataset::Files

#endif /* DATASET_DATASETFILES_HPP */
