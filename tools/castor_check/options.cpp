#include "options.hpp"

#include <cstdlib>
#include <iostream>
#include <string_view>

namespace castor_check {

[[noreturn]] void print_usage() {
    std::cout << R"(castor_check: cast and validate payloads against OpenAPI schemas

Usage:
  castor_check check    -i <document> [--strict] [--json]
  castor_check validate -i <document> --schema <name> (--value <text> | --value-file <file>) [options]
  castor_check examples -i <document> [--json]

Options:
  -i, --input <file>         OpenAPI document path (JSON/YAML)
  --schema <name>            Component schema to cast against
  --value <text>             Value as JSON text (raw text with --parameter)
  --value-file <file>        Read the value from a JSON/YAML file
  --parameter                Treat the value as path/query/header text
  --response                 Cast in the response direction (writeOnly fields optional)
  --json                     Output as JSON format
  --strict                   check: also fail when a documented example does not cast
  -h, --help                 Show this help

Examples:
  castor_check check -i api/openapi.yaml --strict
  castor_check validate -i api/openapi.yaml --schema Pet --value '{"id": 1, "name": "Rex"}'
  castor_check validate -i api/openapi.yaml --schema PetId --value 42 --parameter
)";
    std::exit(1);
}

options parse_args(int argc, char** argv) {
    options opts;
    if (argc < 2) {
        print_usage();
    }
    opts.subcommand = argv[1];
    if (opts.subcommand == "-h" || opts.subcommand == "--help") {
        print_usage();
    }
    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
        } else if (arg == "-i" || arg == "--input") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.input = argv[++i];
        } else if (arg == "--schema") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.schema = argv[++i];
        } else if (arg == "--value") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.value_text = argv[++i];
        } else if (arg == "--value-file") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.value_file = argv[++i];
        } else if (arg == "--parameter") {
            opts.parameter = true;
        } else if (arg == "--response") {
            opts.response = true;
        } else if (arg == "--strict") {
            opts.strict = true;
        } else if (arg == "--json") {
            opts.json_output = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
        }
    }
    return opts;
}

} // namespace castor_check
