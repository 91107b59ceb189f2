#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>

#include "dataset/dataset_files.hpp"
#include "utils/compression.hpp"

namespace {
std::string trim_space(const std::string &s) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    auto begin = std::find_if(s.begin(), s.end(), not_space);
    auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

// Removes the comment part of a line, ignoring '#' inside quoted fields.
std::string strip_comment(const std::string &line) {
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            quoted = !quoted;
        } else if (line[i] == '#' && !quoted) {
            return line.substr(0, i);
        }
    }
    return line;
}

// Reads a line, removing the carriage return of files with DOS line endings.
bool next_line(std::istream &stream, std::string &line) {
    if (!std::getline(stream, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

double parse_number(const std::string &cell, const std::string &source_name,
                    size_t line_number) {
    size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(cell, &pos);
    } catch (const std::exception &) {
        pos = 0;
    }
    if (cell.empty() || pos != cell.size()) {
        throw Dataset::InputFormatError(
            source_name + ":" + std::to_string(line_number) +
            ": invalid number '" + cell + "'");
    }
    return value;
}
}  // namespace

std::vector<std::string> Dataset::Files::Csv::split_row(
    const std::string &line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    bool was_quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                field += c;
            }
            continue;
        }
        if (c == '"') {
            quoted = true;
            was_quoted = true;
            // Whitespace before the opening quote is not part of the field.
            field = trim_space(field);
        } else if (c == ',') {
            fields.push_back(was_quoted ? field : trim_space(field));
            field.clear();
            was_quoted = false;
        } else if (!was_quoted || !std::isspace(static_cast<unsigned char>(c))) {
            field += c;
        }
    }
    fields.push_back(was_quoted ? field : trim_space(field));
    return fields;
}

std::vector<Dataset::Record> Dataset::Files::Csv::read_dataset(
    std::istream &stream, const std::string &source_name,
    std::vector<Diagnostics::Warning> *warnings) {
    std::vector<Record> records;
    size_t num_fields = 0;
    size_t line_number = 0;
    std::string line;
    while (next_line(stream, line)) {
        ++line_number;
        line = strip_comment(line);
        if (trim_space(line).empty()) {
            continue;
        }
        auto fields = split_row(line);

        // The first row determines the number of columns.
        if (num_fields == 0) {
            num_fields = fields.size();
            if (num_fields < 2) {
                throw InputFormatError(source_name +
                                       " contains too few columns");
            }
            if (num_fields == 2) {
                Diagnostics::warn(warnings,
                                  Diagnostics::Warning::MISSING_UNCERTAINTY,
                                  source_name +
                                      " lacks a column containing errors, "
                                      "assuming errors of zero");
            } else if (num_fields > 3) {
                Diagnostics::warn(
                    warnings, Diagnostics::Warning::EXTRA_COLUMNS,
                    source_name + " contains " +
                        std::to_string(num_fields - 3) +
                        " additional columns, which will be ignored");
            }
        }
        if (fields.size() != num_fields) {
            throw InputFormatError(source_name + ":" +
                                   std::to_string(line_number) + ": expected " +
                                   std::to_string(num_fields) + " columns, got " +
                                   std::to_string(fields.size()));
        }

        Record record = {};
        record.label = fields[0];
        record.value = parse_number(fields[1], source_name, line_number);
        if (num_fields > 2) {
            record.uncertainty =
                parse_number(fields[2], source_name, line_number);
        }
        records.push_back(record);
    }
    if (stream.bad()) {
        throw InputFormatError("error reading " + source_name);
    }
    if (num_fields == 0) {
        throw InputFormatError(source_name + " contains too few columns");
    }
    return records;
}

std::vector<Dataset::LibraryEntry> Dataset::Files::Csv::read_library(
    std::istream &stream, const std::string &source_name) {
    std::string line;
    size_t line_number = 0;
    std::vector<std::string> header;
    while (next_line(stream, line)) {
        ++line_number;
        if (!trim_space(line).empty()) {
            header = split_row(line);
            break;
        }
    }

    // Find the position of the known columns.
    std::map<std::string, size_t> columns;
    for (size_t i = 0; i < header.size(); ++i) {
        columns[header[i]] = i;
    }
    if (columns.count("glycan") == 0) {
        throw InputFormatError(source_name + " lacks a 'glycan' column");
    }

    std::vector<LibraryEntry> entries;
    while (next_line(stream, line)) {
        ++line_number;
        if (trim_space(line).empty()) {
            continue;
        }
        auto fields = split_row(line);
        if (fields.size() != header.size()) {
            throw InputFormatError(source_name + ":" +
                                   std::to_string(line_number) + ": expected " +
                                   std::to_string(header.size()) +
                                   " columns, got " +
                                   std::to_string(fields.size()));
        }
        LibraryEntry entry = {};
        entry.name = fields[columns["glycan"]];
        if (columns.count("composition") != 0) {
            entry.composition = fields[columns["composition"]];
        }
        if (columns.count("abundance") != 0 &&
            !fields[columns["abundance"]].empty()) {
            entry.abundance = parse_number(fields[columns["abundance"]],
                                           source_name, line_number);
        }
        entries.push_back(entry);
    }
    if (stream.bad()) {
        throw InputFormatError("error reading " + source_name);
    }
    return entries;
}

std::vector<Dataset::Record> Dataset::Files::read_dataset(
    const std::string &path, std::vector<Diagnostics::Warning> *warnings) {
    if (Compression::is_gzip_path(path)) {
        Compression::InflateStream stream(path);
        if (!stream.good()) {
            throw std::runtime_error("couldn't open input file " + path);
        }
        return Csv::read_dataset(stream, path, warnings);
    }
    std::ifstream stream(path);
    if (!stream.good()) {
        throw std::runtime_error("couldn't open input file " + path);
    }
    return Csv::read_dataset(stream, path, warnings);
}

std::vector<Dataset::LibraryEntry> Dataset::Files::read_library(
    const std::string &path) {
    if (Compression::is_gzip_path(path)) {
        Compression::InflateStream stream(path);
        if (!stream.good()) {
            throw std::runtime_error("couldn't open input file " + path);
        }
        return Csv::read_library(stream, path);
    }
    std::ifstream stream(path);
    if (!stream.good()) {
        throw std::runtime_error("couldn't open input file " + path);
    }
    return Csv::read_library(stream, path);
}
