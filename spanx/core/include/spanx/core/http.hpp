#pragma once

#include "ascii.hpp"
#include "cursor.hpp"
#include "result.hpp"
#include "span.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spanx::http {

// Parsing limits
constexpr size_t MAX_HEADER_COUNT = 128;
constexpr size_t MAX_CHUNK_SIZE_DIGITS = 16;
constexpr size_t MAX_CONTENT_LENGTH_DIGITS = 19;

enum class method : uint8_t { get, post, put, del, patch, head, options, trace, connect, unknown };

enum class body_kind : uint8_t { empty, content_length, chunked, to_end };

struct http_options {
    size_t max_headers = MAX_HEADER_COUNT;
};

// What the caller knows about the connection a response arrived on.
struct framing_hint {
    // The connection is closed after this response, so an unframed body
    // extends to the end of the buffer.
    bool read_to_close = false;
    // The response answers a HEAD request and never carries a body.
    bool head_request = false;
};

struct header_field {
    spanned<std::string_view> name;
    // Excludes the OWS around the value.
    spanned<std::string_view> value;

    [[nodiscard]] bool is(std::string_view field_name) const noexcept {
        return ascii::ci_equal(name.value, field_name);
    }

    void shift(size_t delta) noexcept;
};

struct chunk {
    uint64_t size = 0;
    spanned<std::string_view> size_text;
    // Everything between the hex digits and CRLF; not interpreted.
    spanned<std::string_view> extensions;
    spanned<std::string_view> data;

    void shift(size_t delta) noexcept;
};

struct body {
    body_kind kind = body_kind::empty;
    // content_length / to_end: the payload bytes. chunked: the raw coded
    // section, identical to the enclosing span.
    spanned<std::string_view> content;
    // chunked only; the last entry is the zero-size chunk.
    std::vector<spanned<chunk>> chunks;
    std::vector<spanned<header_field>> trailers;

    // Payload length after removing the chunked coding.
    [[nodiscard]] size_t payload_size() const noexcept;
    // Copies the payload; for chunked bodies the chunk data is concatenated.
    [[nodiscard]] std::string decoded() const;

    void shift(size_t delta) noexcept;
};

using header_list = std::vector<spanned<header_field>>;

[[nodiscard]] const spanned<header_field>* find_header(const header_list& headers,
                                                       std::string_view name) noexcept;
[[nodiscard]] std::vector<const spanned<header_field>*>
find_headers(const header_list& headers, std::string_view name);

struct request {
    method http_method = method::unknown;
    spanned<std::string_view> method_text;
    spanned<std::string_view> target;
    spanned<std::string_view> version;
    header_list headers;
    spanned<http::body> body;
    // Request-line, header section and the blank line.
    span head;

    [[nodiscard]] const spanned<header_field>* header(std::string_view name) const noexcept {
        return find_header(headers, name);
    }
    [[nodiscard]] std::vector<const spanned<header_field>*>
    headers_named(std::string_view name) const {
        return find_headers(headers, name);
    }
    [[nodiscard]] std::optional<uint64_t> content_length() const noexcept;
    [[nodiscard]] bool is_chunked() const noexcept { return body->kind == body_kind::chunked; }

    void shift(size_t delta) noexcept;
};

struct response {
    spanned<std::string_view> version;
    spanned<uint16_t> status;
    // May be empty; then positioned right after the status code.
    spanned<std::string_view> reason;
    header_list headers;
    spanned<http::body> body;
    span head;

    [[nodiscard]] const spanned<header_field>* header(std::string_view name) const noexcept {
        return find_header(headers, name);
    }
    [[nodiscard]] std::vector<const spanned<header_field>*>
    headers_named(std::string_view name) const {
        return find_headers(headers, name);
    }
    [[nodiscard]] std::optional<uint64_t> content_length() const noexcept;
    [[nodiscard]] bool is_chunked() const noexcept { return body->kind == body_kind::chunked; }

    void shift(size_t delta) noexcept;
};

// Grammar pieces, usable on their own.
[[nodiscard]] result<spanned<header_field>> parse_field_line(cursor& cur);
// Field lines up to and including the terminating empty line.
[[nodiscard]] result<spanned<header_list>> parse_field_section(cursor& cur,
                                                               const http_options& opts = {});

// One message starting at the cursor. Bytes after the message are left
// unconsumed.
[[nodiscard]] result<spanned<request>> parse_request(cursor& cur, const http_options& opts = {});
[[nodiscard]] result<spanned<response>>
parse_response(cursor& cur, framing_hint hint = {}, const http_options& opts = {});

[[nodiscard]] result<spanned<request>> parse_request(std::span<const uint8_t> bytes,
                                                     const http_options& opts = {});
[[nodiscard]] result<spanned<request>> parse_request(std::string_view text,
                                                     const http_options& opts = {});
[[nodiscard]] result<spanned<response>> parse_response(std::span<const uint8_t> bytes,
                                                       framing_hint hint = {},
                                                       const http_options& opts = {});
[[nodiscard]] result<spanned<response>>
parse_response(std::string_view text, framing_hint hint = {}, const http_options& opts = {});

// Back-to-back requests (pipelining). The whole buffer must be consumed.
[[nodiscard]] result<std::vector<spanned<request>>>
parse_requests(std::span<const uint8_t> bytes, const http_options& opts = {});

method parse_method(std::string_view str) noexcept;
std::string_view method_to_string(method m) noexcept;
std::string_view body_kind_to_string(body_kind k) noexcept;

} // namespace spanx::http
