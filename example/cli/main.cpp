// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// main.cpp
// jsoncmp command-line tool - compares two JSON object documents
//
// Exit codes:
//   0  documents match
//   1  documents differ
//   2  usage, I/O, parse or root-type error

#include <jsoncmp/comparison.h>
#include <jsoncmp/errors.h>
#include <jsoncmp/report.h>
#include <jsoncmp/serialization.h>

#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace jsoncmp;

namespace {

constexpr int kExitMatch = 0;
constexpr int kExitDiffer = 1;
constexpr int kExitError = 2;

struct CliOptions {
    bool json_output = false;
    bool compact = false;
    bool help = false;
    PrintOptions print;
    CompareOptions compare;
    ParseOptions parse;
    std::vector<std::string> files;
};

void print_usage(std::ostream& os)
{
    os << "Usage: jsoncmp [options] <first.json> <second.json>\n"
       << "\n"
       << "Options:\n"
       << "  --json                print the comparison tree as JSON\n"
       << "  --compact             compact JSON output (with --json)\n"
       << "  --mismatches          only show mismatched fields\n"
       << "  --strict-numbers      1 and 1.0 are different\n"
       << "  --summary-containers  show containers as sizes instead of JSON\n"
       << "  --max-depth N         maximum nesting depth accepted by the reader\n"
       << "  -h, --help            show this help\n";
}

bool parse_args(int argc, char* argv[], CliOptions& out, std::string& error)
{
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            out.help = true;
        } else if (arg == "--json") {
            out.json_output = true;
        } else if (arg == "--compact") {
            out.compact = true;
        } else if (arg == "--mismatches") {
            out.print.only_mismatches = true;
        } else if (arg == "--strict-numbers") {
            out.compare.numeric = NumericEquality::ByRepresentation;
        } else if (arg == "--summary-containers") {
            out.compare.render.containers = ContainerRendering::Summary;
        } else if (arg == "--max-depth") {
            if (i + 1 >= argc) {
                error = "--max-depth requires a value";
                return false;
            }
            std::string_view value = argv[++i];
            std::size_t depth = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), depth);
            if (ec != std::errc{} || ptr != value.data() + value.size() || depth == 0) {
                error = "invalid --max-depth value: " + std::string(value);
                return false;
            }
            out.parse.max_depth = depth;
        } else if (arg.size() > 1 && arg[0] == '-') {
            error = "unknown option: " + std::string(arg);
            return false;
        } else {
            out.files.emplace_back(arg);
        }
    }

    if (!out.help && out.files.size() != 2) {
        error = "expected exactly two input files";
        return false;
    }
    return true;
}

bool read_file(const std::string& path, std::string& content)
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    content = buffer.str();
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    CliOptions options;
    std::string error;
    if (!parse_args(argc, argv, options, error)) {
        std::cerr << "jsoncmp: " << error << "\n";
        print_usage(std::cerr);
        return kExitError;
    }
    if (options.help) {
        print_usage(std::cout);
        return kExitMatch;
    }

    std::string texts[2];
    for (std::size_t i = 0; i < 2; ++i) {
        if (!read_file(options.files[i], texts[i])) {
            std::cerr << "jsoncmp: cannot read " << options.files[i] << "\n";
            return kExitError;
        }
    }

    Value docs[2];
    for (std::size_t i = 0; i < 2; ++i) {
        try {
            docs[i] = parse_json(texts[i], options.parse);
        } catch (const JsonParseError& e) {
            std::cerr << "jsoncmp: " << options.files[i] << ": " << e.what() << "\n";
            return kExitError;
        }
    }

    ComparisonResult result;
    try {
        result = compare(docs[0], docs[1], options.compare);
    } catch (const InvalidRootType& e) {
        std::cerr << "jsoncmp: " << e.what() << "\n";
        return kExitError;
    }

    if (options.json_output) {
        std::cout << comparison_to_json(result, options.compact) << "\n";
    } else {
        print_comparison(result, std::cout, options.print);
        const auto summary = summarize(result);
        std::cout << "\n" << summary.matched << "/" << summary.total << " fields matched";
        if (summary.mismatched_leaves > 0) {
            std::cout << ", " << summary.mismatched_leaves << " mismatched ("
                      << summary.missing_in_first << " missing in first, "
                      << summary.missing_in_second << " missing in second, "
                      << summary.type_mismatches << " type, "
                      << summary.value_mismatches << " value)";
        }
        std::cout << "\n";
    }

    return all_matched(result) ? kExitMatch : kExitDiffer;
}
