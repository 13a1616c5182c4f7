#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace spanx {

enum class error_code : int {
    ok = 0,
    unexpected_eof = 1,
    unexpected_token = 2,
    invalid_range = 3,
    non_contiguous = 4,
    malformed_header_name = 5,
    ambiguous_framing = 6,
    invalid_chunk_size = 7,
    trailing_data = 8,
    delimiter_not_found = 9,
    too_few_repetitions = 10,
    too_many_headers = 11,
    invalid_content_length = 12,
    unsupported_transfer_coding = 13,
    unframed_body = 14,
    invalid_escape = 15,
    invalid_number = 16,
    depth_limit_exceeded = 17,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "spanx"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::unexpected_eof:
            return "unexpected end of input";
        case ec::unexpected_token:
            return "unexpected token";
        case ec::invalid_range:
            return "invalid range";
        case ec::non_contiguous:
            return "ranges are not contiguous";
        case ec::malformed_header_name:
            return "malformed header name";
        case ec::ambiguous_framing:
            return "ambiguous message framing";
        case ec::invalid_chunk_size:
            return "invalid chunk size";
        case ec::trailing_data:
            return "trailing data after value";
        case ec::delimiter_not_found:
            return "delimiter not found";
        case ec::too_few_repetitions:
            return "too few repetitions";
        case ec::too_many_headers:
            return "too many header fields";
        case ec::invalid_content_length:
            return "invalid Content-Length";
        case ec::unsupported_transfer_coding:
            return "unsupported transfer coding";
        case ec::unframed_body:
            return "response body without framing";
        case ec::invalid_escape:
            return "invalid escape sequence";
        case ec::invalid_number:
            return "invalid number";
        case ec::depth_limit_exceeded:
            return "nesting depth limit exceeded";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

// A located failure. `offset` is an absolute byte offset into the parsed
// buffer; `expected` names what the grammar wanted there, when known. It is
// owned so errors outlive the literals and delimiters they quote.
struct parse_error {
    std::error_code code;
    size_t offset = 0;
    std::string expected;

    [[nodiscard]] bool is(error_code e) const noexcept { return code == make_error_code(e); }

    [[nodiscard]] std::string describe() const {
        std::string out = code.message();
        out.append(" at offset ");
        out.append(std::to_string(offset));
        if (!expected.empty()) {
            out.append(" (expected ");
            out.append(expected);
            out.push_back(')');
        }
        return out;
    }
};

template <typename T> using result = std::expected<T, parse_error>;

inline std::unexpected<parse_error>
fail(error_code e, size_t offset, std::string_view expected = {}) {
    return std::unexpected(parse_error{make_error_code(e), offset, std::string(expected)});
}

} // namespace spanx

namespace std {
template <> struct is_error_code_enum<spanx::error_code> : true_type {};
} // namespace std
