#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <regex>
#include <sstream>
#include <vector>

#include "correction/correction.hpp"
#include "correction/correction_serialize.hpp"
#include "dataset/dataset_files.hpp"
#include "export/export.hpp"
#include "export/export_files.hpp"
#include "glycation/conversion_rates.hpp"
#include "glycation/glycation_graph.hpp"
#include "glycation/glycation_graph_serialize.hpp"
#include "utils/compression.hpp"
#include "utils/diagnostics.hpp"

// Type aliases.
using options_map = std::map<std::string, std::string>;

void print_usage() {
    std::cerr << "USAGE: cafog [-help] [options] -glycoforms <csv> "
                 "-glycation <csv>"
              << std::endl;
}

// Helper function to check if the given string contains an unsigned integer.
bool is_unsigned_int(std::string& s) {
    std::regex int_regex("^([[:digit:]]+)$");
    return std::regex_search(s, int_regex);
}

// Helper function to trim the whitespace surrounding a string.
void trim_space(std::string& s) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

// Reads the "key": "value" pairs of the given object into the options that
// were not already specified. Returns false if the object is malformed.
bool parse_json_object(const std::string& content, const std::string& name,
                       options_map& options) {
    auto pos = content.find("\"" + name + "\"");
    if (pos == std::string::npos) {
        return true;
    }
    auto begin = content.find("{", pos);
    if (begin == std::string::npos) {
        return false;
    }
    auto end = content.find("}", begin);
    if (end == std::string::npos) {
        return false;
    }

    auto object = content.substr(begin + 1, end - begin - 1);
    for (auto& ch : object) {
        if (ch == ',' || ch == ':' || ch == '"') {
            ch = ' ';
        }
    }
    std::stringstream ss(object);
    while (ss.good()) {
        std::string key;
        std::string value;
        ss >> key;
        ss >> value;
        if (key.empty()) {
            continue;
        }
        key = "-" + key;
        if (options.find(key) == options.end()) {
            options[key] = value;
        }
    }
    return true;
}

// Parses the "cafog" object of a JSON configuration file. Note that this is a
// very simplistic parser: the "paths" and "parameters" objects are flat
// key/value lists and the values can't contain whitespace, commas or colons.
bool parse_json(const std::filesystem::path& path, options_map& options) {
    std::ifstream stream(path);
    std::string line;
    std::string content;

    // Read all the lines.
    while (std::getline(stream, line)) {
        trim_space(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        content += line + " ";
    }

    // Find the contents of the cafog configuration.
    std::regex cafog_regex("\"cafog\"[[:space:]]*:[[:space:]]*\\{(.*)\\}");
    std::smatch matches;
    std::regex_search(content, matches, cafog_regex);
    if (matches.size() != 2 || matches[1].str().empty()) {
        std::cerr << "error: could not find \"cafog\" on the config file"
                  << std::endl;
        return false;
    }
    content = matches[1];

    if (!parse_json_object(content, "paths", options) ||
        !parse_json_object(content, "parameters", options)) {
        std::cerr << "error: malformed config file" << std::endl;
        return false;
    }
    return true;
}

void print_warnings(const std::vector<Diagnostics::Warning>& warnings) {
    for (const auto& warning : warnings) {
        std::cerr << "warning: " << warning.message << std::endl;
    }
}

// The dataset name is the glycoforms file name without its extensions, e.g.
// "glycoforms" for "data/glycoforms.csv.gz".
std::string dataset_name(const std::filesystem::path& path) {
    auto name = path.filename();
    if (name.extension() == ".gz") {
        name = name.stem();
    }
    return name.stem().string();
}

int main(int argc, char* argv[]) {
    // Flag format is map where the key is the flag name and contains a tuple
    // with the description and if it takes extra parameters or not:
    // <description, takes_parameters>
    const std::map<std::string, std::pair<std::string, bool>> accepted_flags = {
        // Input files.
        {"-glycoforms", {"CSV file containing glycoform abundances", true}},
        {"-glycation", {"CSV file containing glycation abundances", true}},
        {"-library", {"CSV file containing a glycan library", true}},
        // Model parameters.
        {"-sites",
         {"The number of glycosylation sites, taken from the glycoform labels "
          "by default",
          true}},
        {"-unit", {"The glycation unit (default: Hex)", true}},
        {"-normalize",
         {"Scale the corrected abundances so that they add up to 100", false}},
        // Output.
        {"-graph_format",
         {"Write the glycation graph as 'dot', 'gexf' or 'bin'", true}},
        {"-out_dir",
         {"The output directory for the graph file (default: the directory of "
          "the glycoforms file)",
          true}},
        // Command parameters.
        {"-help", {"Display available options", false}},
        {"-version", {"Display the version number", false}},
        {"-config", {"Specify the configuration file", true}},
    };

    if (argc == 1) {
        print_usage();
        return -1;
    }

    // Parse arguments and extract options.
    options_map options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.empty() || arg[0] != '-') {
            std::cerr << "error: unexpected argument: " << arg << std::endl;
            print_usage();
            return -1;
        }
        if (accepted_flags.find(arg) == accepted_flags.end()) {
            std::cerr << "unknown option: " << arg << std::endl;
            print_usage();
            return -1;
        }

        auto flag = accepted_flags.at(arg);
        if (flag.second) {
            if (i + 1 >= argc || argv[i + 1][0] == '-') {
                std::cerr << "no parameters specified for " << arg
                          << std::endl;
                print_usage();
                return -1;
            }
            ++i;
            options[arg] = argv[i];
        } else {
            options[arg] = "";
        }
    }

    if (options.find("-help") != options.end()) {
        print_usage();
        // Find maximum option length to adjust text padding.
        size_t padding = 0;
        for (const auto& e : accepted_flags) {
            if (e.first.size() > padding) {
                padding = e.first.size();
            }
        }

        // Print options with a 4 space padding between flag name and
        // description.
        std::cerr << "OPTIONS:" << std::endl;
        for (const auto& e : accepted_flags) {
            std::cerr << e.first;
            // If the option requires an argument we have to specify it,
            // otherwise we add padding.
            if (e.second.second) {
                std::cerr << " <arg>";
            } else {
                std::cerr << "      ";
            }
            for (size_t i = 0; i < (padding - e.first.size()) + 4; ++i) {
                std::cerr << " ";
            }
            std::cerr << e.second.first << std::endl;
        }
        return 0;
    }

    if (options.find("-version") != options.end()) {
        std::cout << "cafog " << CAFOG_VERSION << std::endl;
        return 0;
    }

    // If config file is provided, read it and parse it. The parameters
    // specified as command line arguments will override the config file.
    if (options.find("-config") != options.end()) {
        std::filesystem::path config_path = options["-config"];
        if (!std::filesystem::exists(config_path)) {
            std::cerr << "error: couldn't find config file " << config_path
                      << std::endl;
            print_usage();
            return -1;
        }
        if (config_path.extension() != ".json") {
            std::cerr << "error: invalid format for config file "
                      << config_path << std::endl;
            print_usage();
            return -1;
        }
        if (!parse_json(config_path, options)) {
            return -1;
        }
    }

    // Check the input files.
    if (options.find("-glycoforms") == options.end() ||
        options.find("-glycation") == options.end()) {
        std::cerr << "error: input files (glycoforms, glycation) not specified"
                  << std::endl;
        print_usage();
        return -1;
    }
    for (const auto& flag : {"-glycoforms", "-glycation", "-library"}) {
        if (options.find(flag) == options.end()) {
            continue;
        }
        if (!std::filesystem::exists(options[flag])) {
            std::cerr << "error: couldn't find file " << options[flag]
                      << std::endl;
            return -1;
        }
    }

    // Parse the options to build the Glycation::Parameters struct.
    Glycation::Parameters parameters;
    if (options.find("-sites") != options.end()) {
        auto sites = options["-sites"];
        if (!is_unsigned_int(sites) || std::stoull(sites) == 0) {
            std::cerr << "error: sites has to be a positive integer"
                      << std::endl;
            print_usage();
            return -1;
        }
        parameters.num_sites = std::stoull(sites);
    }
    std::string unit = "Hex";
    if (options.find("-unit") != options.end()) {
        unit = options["-unit"];
    }
    bool normalize = options.find("-normalize") != options.end() &&
                     (options["-normalize"] == "true" ||
                      options["-normalize"] == "");

    std::string graph_format;
    if (options.find("-graph_format") != options.end()) {
        graph_format = options["-graph_format"];
        for (auto& ch : graph_format) {
            ch = std::tolower(ch);
        }
        if (graph_format != "dot" && graph_format != "gexf" &&
            graph_format != "bin") {
            std::cerr << "error: unknown graph format: " << graph_format
                      << std::endl;
            print_usage();
            return -1;
        }
    }

    // Set up the output directory and check if it exists.
    std::filesystem::path glycoforms_path = options["-glycoforms"];
    std::filesystem::path out_dir = glycoforms_path.parent_path();
    if (options.find("-out_dir") != options.end()) {
        out_dir = options["-out_dir"];
    }
    if (!graph_format.empty() && !out_dir.empty() &&
        !std::filesystem::exists(out_dir)) {
        std::cerr << "error: couldn't find output directory " << out_dir
                  << std::endl;
        print_usage();
        return -1;
    }

    std::vector<Diagnostics::Warning> warnings;
    Glycation::Graph graph;
    Correction::Result result;
    try {
        // Read input files.
        auto glycoforms =
            Dataset::Files::read_dataset(options["-glycoforms"], &warnings);
        auto glycation =
            Dataset::Files::read_dataset(options["-glycation"], &warnings);
        std::optional<std::vector<Dataset::LibraryEntry>> library;
        if (options.find("-library") != options.end()) {
            library = Dataset::Files::read_library(options["-library"]);
        }

        // Assemble the glycation graph and correct abundances.
        std::cerr << "Correcting dataset " << glycoforms_path << "..."
                  << std::endl;
        auto rates = Glycation::build_rate_table(glycation, unit);
        graph = Glycation::build_graph(glycoforms, library, rates, parameters,
                                       &warnings);
        result = Correction::correct_abundances(graph);
        if (normalize) {
            result = Correction::normalize(result);
        }
    } catch (const std::exception& e) {
        print_warnings(warnings);
        std::cerr << "error: " << e.what() << std::endl;
        return -1;
    }
    print_warnings(warnings);

    // Write the corrected glycoforms to stdout.
    auto nodes = Export::node_records(graph, result);
    auto edges = Export::edge_records(graph);
    if (!Export::Files::Csv::write_glycoforms(std::cout, nodes)) {
        std::cerr << "error: couldn't write the glycoform list" << std::endl;
        return -1;
    }

    // Write the graph file.
    if (!graph_format.empty()) {
        auto name = dataset_name(glycoforms_path) + "_corr";
        std::filesystem::path outfile;
        bool ok = false;
        if (graph_format == "dot") {
            outfile = out_dir / (name + ".gv");
            std::ofstream stream(outfile);
            ok = stream.good() &&
                 Export::Files::Dot::write_graph(stream, nodes, edges);
        } else if (graph_format == "gexf") {
            outfile = out_dir / (name + ".gexf");
            std::ofstream stream(outfile);
            ok = stream.good() &&
                 Export::Files::Gexf::write_graph(stream, nodes, edges);
        } else {
            outfile = out_dir / (name + ".cgf");
            Compression::DeflateStream stream(outfile.string());
            ok = stream.good() &&
                 Glycation::Serialize::write_graph(stream, graph) &&
                 Correction::Serialize::write_result(stream, result);
        }
        if (!ok) {
            std::cerr << "error: couldn't write graph file " << outfile
                      << std::endl;
            return -1;
        }
        std::cerr << "Graph written to " << outfile << std::endl;
    }

    std::cerr << "Done!" << std::endl;
    return 0;
}
