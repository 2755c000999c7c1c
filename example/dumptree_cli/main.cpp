// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file main.cpp
/// @brief Command-line front end: parse one dump, or diff two
///
/// Usage:
///   dumptree parse "Person[name=Alice, age=30]"          # indented tree
///   dumptree parse --json "Person[name=Alice]"           # JSON
///   dumptree diff "Foo[a=1]" "Foo[a=2, b=3]"             # one diff per line
///   dumptree diff -f before.txt after.txt                # inputs are files
///   some_tool | dumptree parse -f -                      # read stdin
///
/// Exit codes: 0 ok / no differences, 1 differences found, 2 usage or parse error

#include <dumptree/dump_parser.h>
#include <dumptree/serialization.h>
#include <dumptree/value.h>
#include <dumptree/value_diff.h>

#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace dumptree;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitDifferent = 1;
constexpr int kExitError = 2;

struct CliOptions {
    std::string command;
    std::vector<std::string> inputs;
    ParseOptions parse;
    bool json = false;
    bool compact = false;
    bool from_file = false;
};

void print_usage() {
    std::cout << "Usage: dumptree <command> [options] <input>...\n";
    std::cout << "\nCommands:\n";
    std::cout << "  parse <input>            - Print the parsed tree\n";
    std::cout << "  diff <first> <second>    - Print the differences between two dumps\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --json                   Print parse output as JSON\n";
    std::cout << "  --compact                Compact JSON (implies --json)\n";
    std::cout << "  --strict                 Reject unbalanced brackets\n";
    std::cout << "  --bare-key K             Keep bare tokens in a list under key K\n";
    std::cout << "  --file, -f               Inputs are file paths ('-' reads stdin)\n";
    std::cout << "  --help, -h               Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  dumptree parse \"Person[name=Alice, address=Address[city=NYC]]\"\n";
    std::cout << "  dumptree diff -f before.txt after.txt\n";
}

std::string read_stream(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string load_input(const std::string& input, bool from_file) {
    if (!from_file) {
        return input;
    }
    if (input == "-") {
        return read_stream(std::cin);
    }
    std::ifstream file(input, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot open file: " + input);
    }
    return read_stream(file);
}

int run_parse(const CliOptions& opts) {
    if (opts.inputs.size() != 1) {
        std::cerr << "parse expects exactly one input\n";
        return kExitError;
    }

    Value tree = parse_dump(load_input(opts.inputs[0], opts.from_file), opts.parse);

    if (opts.json) {
        std::cout << to_json(tree, opts.compact) << "\n";
    } else {
        print_value(tree, std::cout);
    }
    return kExitOk;
}

int run_diff(const CliOptions& opts) {
    if (opts.inputs.size() != 2) {
        std::cerr << "diff expects exactly two inputs\n";
        return kExitError;
    }
    if (opts.from_file && opts.inputs[0] == "-" && opts.inputs[1] == "-") {
        std::cerr << "only one input can be read from stdin\n";
        return kExitError;
    }

    Value first = parse_dump(load_input(opts.inputs[0], opts.from_file), opts.parse);
    Value second = parse_dump(load_input(opts.inputs[1], opts.from_file), opts.parse);

    DiffCollector collector;
    collector.diff(first, second);

    for (const auto& d : collector.get_diffs()) {
        std::cout << diff_to_string(d) << "\n";
    }
    return collector.has_changes() ? kExitDifferent : kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return kExitOk;
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--compact") {
            opts.json = true;
            opts.compact = true;
        } else if (arg == "--strict") {
            opts.parse.strict = true;
        } else if (arg == "--bare-key") {
            if (i + 1 >= argc) {
                std::cerr << "--bare-key requires a key name\n";
                return kExitError;
            }
            opts.parse.bare_entries_key = argv[++i];
        } else if (arg == "--file" || arg == "-f") {
            opts.from_file = true;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.inputs.push_back(arg);
        }
    }

    try {
        if (opts.command == "parse") {
            return run_parse(opts);
        } else if (opts.command == "diff") {
            return run_diff(opts);
        }
    } catch (const ParseError& e) {
        std::cerr << "Parse error: " << e.what() << "\n";
        return kExitError;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitError;
    }

    print_usage();
    return kExitError;
}
