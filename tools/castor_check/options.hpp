#pragma once

#include <string>

namespace castor_check {

struct options {
    std::string subcommand; // validate, examples, check
    std::string input;
    std::string schema;
    std::string value_text;
    std::string value_file;
    bool parameter = false; // value is raw parameter text, string coercion allowed
    bool response = false;  // cast in the response direction
    bool strict = false;
    bool json_output = false;
};

[[noreturn]] void print_usage();
options parse_args(int argc, char** argv);

} // namespace castor_check
