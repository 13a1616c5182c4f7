#include "spanx/core/http.hpp"
#include "spanx/core/json.hpp"
#include "spanx/core/source.hpp"
#include "spanx_dump/dump.hpp"
#include "spanx_dump/options.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace spanx_dump;

namespace {

std::optional<spanx::source> read_input(const std::string& input) {
    std::vector<uint8_t> bytes;
    if (input == "-") {
        bytes.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream in(input, std::ios::binary);
        if (!in) {
            std::cerr << "[spanx_dump] cannot open " << input << "\n";
            return std::nullopt;
        }
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    return spanx::source::adopt(std::move(bytes));
}

void report(std::string_view component, const spanx::source& src, const spanx::parse_error& err) {
    std::cerr << "[" << component << "] " << err.describe() << "\n";
    constexpr size_t context = 16;
    const size_t from = err.offset > context ? err.offset - context : 0;
    const size_t to = std::min(src.size(), err.offset + context);
    if (from < to) {
        std::cerr << "[" << component << "] near \"" << escape_json(src.chars().substr(from, to - from))
                  << "\"\n";
    }
}

int run_http_request(const options& opts, const spanx::source& src) {
    spanx::http::http_options http_opts;
    http_opts.max_headers = opts.max_headers;

    auto req = spanx::http::parse_request(src.bytes(), http_opts);
    if (!req) {
        report("http", src, req.error());
        return 1;
    }
    if (opts.check_only) {
        std::cout << "[check] OK: method=" << (*req)->method_text.value
                  << ", headers=" << (*req)->headers.size()
                  << ", body=" << spanx::http::body_kind_to_string((*req)->body->kind) << "\n";
    } else {
        std::cout << dump_request(*req) << "\n";
    }
    if (req->span.end() < src.size()) {
        std::cerr << "[http] " << src.size() - req->span.end()
                  << " byte(s) after the request left unparsed\n";
    }
    return 0;
}

int run_http_response(const options& opts, const spanx::source& src) {
    spanx::http::http_options http_opts;
    http_opts.max_headers = opts.max_headers;
    spanx::http::framing_hint hint;
    hint.read_to_close = opts.read_to_close;
    hint.head_request = opts.head_request;

    auto res = spanx::http::parse_response(src.bytes(), hint, http_opts);
    if (!res) {
        report("http", src, res.error());
        return 1;
    }
    if (opts.check_only) {
        std::cout << "[check] OK: status=" << (*res)->status.value
                  << ", headers=" << (*res)->headers.size()
                  << ", body=" << spanx::http::body_kind_to_string((*res)->body->kind) << "\n";
    } else {
        std::cout << dump_response(*res) << "\n";
    }
    return 0;
}

int run_json(const options& opts, const spanx::source& src) {
    spanx::json::json_options json_opts;
    json_opts.max_depth = opts.max_depth;
    json_opts.trailing =
        opts.allow_trailing ? spanx::json::trailing_policy::allow : spanx::json::trailing_policy::reject;

    auto root = spanx::json::parse_json(src.bytes(), json_opts);
    if (!root) {
        report("json", src, root.error());
        return 1;
    }

    if (!opts.path.empty()) {
        const auto* found = (*root)->get(opts.path);
        if (!found) {
            std::cerr << "[json] no value at path " << opts.path << "\n";
            return 1;
        }
        auto text = src.slice(*found);
        if (!text) {
            report("json", src, text.error());
            return 1;
        }
        std::cout << "{\"path\":\"" << escape_json(opts.path) << "\",\"span\":"
                  << span_json(found->span) << ",\"raw\":\"" << escape_json(*text) << "\"}\n";
        return 0;
    }

    if (opts.check_only) {
        std::cout << "[check] OK: root=" << spanx::json::kind_to_string((*root)->type())
                  << ", span=" << span_json(root->span) << "\n";
    } else {
        std::cout << dump_json(*root) << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    options opts = parse_args(argc, argv);

    int (*run)(const options&, const spanx::source&) = nullptr;
    if (opts.subcommand == "http-request") {
        run = run_http_request;
    } else if (opts.subcommand == "http-response") {
        run = run_http_response;
    } else if (opts.subcommand == "json") {
        run = run_json;
    } else {
        std::cerr << "Unknown subcommand: " << opts.subcommand << "\n";
        print_usage();
    }

    auto src = read_input(opts.input);
    if (!src) {
        return 1;
    }
    return run(opts, *src);
}
