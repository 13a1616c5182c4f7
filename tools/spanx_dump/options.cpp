#include "options.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string_view>

namespace spanx_dump {

namespace {

size_t parse_count(std::string_view flag, std::string_view text) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value == 0) {
        std::cerr << "[spanx_dump] " << flag << " expects a positive integer, got '" << text
                  << "'\n";
        print_usage();
    }
    return value;
}

} // namespace

[[noreturn]] void print_usage() {
    std::cout << R"(spanx_dump - print the span tree of an HTTP message or JSON document

Usage:
  spanx_dump http-request  [-i <file>] [options]
  spanx_dump http-response [-i <file>] [options]
  spanx_dump json          [-i <file>] [options]
  spanx_dump examples

Options:
  -i, --input <file>         Input file, '-' for stdin (default: -)
  --check                    Parse only and print a one-line summary
  --max-headers <n>          Header field limit (default: 128)
  --read-to-close            Response: unframed body extends to end of input
  --head-request             Response: answers a HEAD request, no body
  --max-depth <n>            JSON nesting limit (default: 128)
  --allow-trailing           JSON: ignore bytes after the value
  --path <a.b.0>             JSON: print only the value at a dotted path
  -h, --help                 Show this help
)";
    std::exit(1);
}

[[noreturn]] void print_examples() {
    std::cout << R"(spanx_dump examples:

  # Span tree of a captured request
  spanx_dump http-request -i request.bin

  # Response from a connection that was closed after the body
  spanx_dump http-response -i response.bin --read-to-close

  # Where a field lives inside a JSON document
  spanx_dump json -i payload.json --path items.0.name

  # Validate only
  cat payload.json | spanx_dump json --check
)";
    std::exit(0);
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
    if (opts.subcommand == "examples") {
        print_examples();
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
        } else if (arg == "--path") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.path = argv[++i];
        } else if (arg == "--max-headers") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.max_headers = parse_count(arg, argv[++i]);
        } else if (arg == "--max-depth") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.max_depth = parse_count(arg, argv[++i]);
        } else if (arg == "--allow-trailing") {
            opts.allow_trailing = true;
        } else if (arg == "--read-to-close") {
            opts.read_to_close = true;
        } else if (arg == "--head-request") {
            opts.head_request = true;
        } else if (arg == "--check") {
            opts.check_only = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
        }
    }
    return opts;
}

} // namespace spanx_dump
