#pragma once

#include <cstddef>
#include <string>

namespace spanx_dump {

struct options {
    std::string subcommand;          // http-request,http-response,json
    std::string input = "-";         // "-" reads stdin
    std::string path;                // json: dotted lookup instead of the full tree
    size_t max_headers = 128;
    size_t max_depth = 128;
    bool allow_trailing = false;
    bool read_to_close = false;
    bool head_request = false;
    bool check_only = false;
};

[[noreturn]] void print_usage();
[[noreturn]] void print_examples();
options parse_args(int argc, char** argv);

} // namespace spanx_dump
