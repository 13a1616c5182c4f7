#include "spanx/core/http.hpp"
#include "spanx/core/http_chunked.hpp"

#include <charconv>

namespace spanx::http {

namespace {

constexpr std::string_view HTTP_VERSION_PREFIX = "HTTP/";
constexpr std::string_view CRLF = "\r\n";

template <typename T> void shift_span(spanned<T>& v, size_t delta) noexcept {
    v.span = v.span.shifted(delta);
}

result<spanned<std::string_view>> expect_crlf(cursor& cur) {
    if (cur.eof()) {
        return fail(error_code::unexpected_eof, cur.position(), "CRLF");
    }
    return cur.expect_literal(CRLF);
}

bool is_value_byte(uint8_t c) noexcept {
    return c != '\r' && ascii::is_field_value_char(c);
}

result<spanned<std::string_view>> parse_digit(cursor& cur) {
    auto d = cur.peek_byte();
    if (!d) {
        return fail(error_code::unexpected_eof, cur.position(), "DIGIT");
    }
    if (!ascii::is_digit(*d)) {
        return fail(error_code::unexpected_token, cur.position(), "DIGIT");
    }
    return cur.take(1);
}

// "HTTP/" DIGIT "." DIGIT
result<spanned<std::string_view>> parse_version(cursor& cur) {
    const size_t cp = cur.checkpoint();
    auto fail_here = [&](const parse_error& err) -> result<spanned<std::string_view>> {
        cur.restore(cp);
        return std::unexpected(err);
    };

    if (auto prefix = cur.expect_literal(HTTP_VERSION_PREFIX); !prefix) {
        return fail_here(prefix.error());
    }
    if (auto major = parse_digit(cur); !major) {
        return fail_here(major.error());
    }
    if (auto dot = cur.expect_byte('.', "'.'"); !dot) {
        return fail_here(dot.error());
    }
    if (auto minor = parse_digit(cur); !minor) {
        return fail_here(minor.error());
    }
    const span s = cur.span_from(cp);
    return spanned<std::string_view>{cur.view(s), s};
}

result<uint64_t> parse_decimal_length(const spanned<std::string_view>& value) {
    std::string_view digits = value.value;
    if (digits.empty() || digits.size() > MAX_CONTENT_LENGTH_DIGITS) {
        return fail(error_code::invalid_content_length, value.span.start(), "decimal length");
    }
    for (size_t i = 0; i < digits.size(); ++i) {
        if (!ascii::is_digit(static_cast<uint8_t>(digits[i]))) {
            return fail(error_code::invalid_content_length, value.span.start() + i, "DIGIT");
        }
    }
    uint64_t length = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), length);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return fail(error_code::invalid_content_length, value.span.start(), "decimal length");
    }
    return length;
}

struct framing {
    const spanned<header_field>* content_length = nullptr;
    uint64_t length = 0;
    const spanned<header_field>* transfer_encoding = nullptr;
    bool chunked = false;
};

// Walks the header list once, in wire order, so a conflict is reported at the
// header that introduced it.
result<framing> inspect_framing(const header_list& headers) {
    framing f;
    for (const auto& h : headers) {
        if (h->is("Content-Length")) {
            if (f.transfer_encoding) {
                return fail(error_code::ambiguous_framing, h.span.start(),
                            "either Content-Length or Transfer-Encoding");
            }
            auto length = parse_decimal_length(h->value);
            if (!length) {
                return std::unexpected(length.error());
            }
            if (f.content_length && *length != f.length) {
                return fail(error_code::ambiguous_framing, h.span.start(),
                            "consistent Content-Length");
            }
            f.content_length = &h;
            f.length = *length;
        } else if (h->is("Transfer-Encoding")) {
            if (f.content_length) {
                return fail(error_code::ambiguous_framing, h.span.start(),
                            "either Content-Length or Transfer-Encoding");
            }
            f.transfer_encoding = &h;
            f.chunked = ascii::ci_equal(ascii::last_list_element(h->value.value), "chunked");
        }
    }
    return f;
}

result<spanned<body>> read_fixed_body(cursor& cur, uint64_t length, body_kind kind) {
    if (length > cur.remaining()) {
        return fail(error_code::unexpected_eof, cur.position() + cur.remaining(), "body bytes");
    }
    auto content = cur.take(static_cast<size_t>(length));
    if (!content) {
        return std::unexpected(content.error());
    }
    body b;
    b.kind = kind;
    b.content = *content;
    return spanned<body>{std::move(b), content->span};
}

spanned<body> empty_body(const cursor& cur) {
    body b;
    b.content = spanned<std::string_view>{std::string_view{}, span::at(cur.position())};
    return spanned<body>{std::move(b), span::at(cur.position())};
}

bool status_forbids_body(uint16_t status) noexcept {
    return (status >= 100 && status < 200) || status == 204 || status == 304;
}

result<spanned<request>> parse_request_impl(cursor& cur, const http_options& opts) {
    const size_t start = cur.checkpoint();
    request req;

    auto method_tok = cur.take_while1(ascii::is_token_char, "method");
    if (!method_tok) {
        return std::unexpected(method_tok.error());
    }
    req.method_text = *method_tok;
    req.http_method = parse_method(method_tok->value);

    if (auto sp = cur.expect_byte(' ', "SP"); !sp) {
        return std::unexpected(sp.error());
    }
    auto target = cur.take_while1(ascii::is_target_char, "request-target");
    if (!target) {
        return std::unexpected(target.error());
    }
    req.target = *target;

    if (auto sp = cur.expect_byte(' ', "SP"); !sp) {
        return std::unexpected(sp.error());
    }
    auto version = parse_version(cur);
    if (!version) {
        return std::unexpected(version.error());
    }
    req.version = *version;

    if (auto crlf = expect_crlf(cur); !crlf) {
        return std::unexpected(crlf.error());
    }

    auto headers = parse_field_section(cur, opts);
    if (!headers) {
        return std::unexpected(headers.error());
    }
    req.headers = std::move(headers->value);
    req.head = cur.span_from(start);

    auto f = inspect_framing(req.headers);
    if (!f) {
        return std::unexpected(f.error());
    }

    if (f->content_length) {
        auto b = read_fixed_body(cur, f->length, body_kind::content_length);
        if (!b) {
            return std::unexpected(b.error());
        }
        req.body = std::move(*b);
    } else if (f->chunked) {
        chunked_decoder decoder(opts);
        auto b = decoder.decode(cur);
        if (!b) {
            return std::unexpected(b.error());
        }
        req.body = std::move(*b);
    } else if (f->transfer_encoding) {
        return fail(error_code::unsupported_transfer_coding, f->transfer_encoding->span.start(),
                    "chunked as final transfer coding");
    } else {
        req.body = empty_body(cur);
    }

    return spanned<request>{std::move(req), cur.span_from(start)};
}

result<spanned<response>>
parse_response_impl(cursor& cur, framing_hint hint, const http_options& opts) {
    const size_t start = cur.checkpoint();
    response res;

    auto version = parse_version(cur);
    if (!version) {
        return std::unexpected(version.error());
    }
    res.version = *version;

    if (auto sp = cur.expect_byte(' ', "SP"); !sp) {
        return std::unexpected(sp.error());
    }

    auto code = cur.take_while1(ascii::is_digit, "status code");
    if (!code) {
        return std::unexpected(code.error());
    }
    if (code->value.size() != 3) {
        return fail(error_code::unexpected_token, code->span.start(), "3-digit status code");
    }
    uint16_t status = 0;
    auto [ptr, ec] =
        std::from_chars(code->value.data(), code->value.data() + code->value.size(), status);
    if (ec != std::errc() || ptr != code->value.data() + code->value.size()) {
        return fail(error_code::unexpected_token, code->span.start(), "3-digit status code");
    }
    res.status = spanned<uint16_t>{status, code->span};

    if (cur.peek_byte() == uint8_t{' '}) {
        (void)cur.take(1);
        res.reason = cur.take_while(is_value_byte);
    } else {
        res.reason = spanned<std::string_view>{std::string_view{}, span::at(cur.position())};
    }

    if (auto crlf = expect_crlf(cur); !crlf) {
        return std::unexpected(crlf.error());
    }

    auto headers = parse_field_section(cur, opts);
    if (!headers) {
        return std::unexpected(headers.error());
    }
    res.headers = std::move(headers->value);
    res.head = cur.span_from(start);

    // Conflicting framing headers are rejected even where no body follows.
    auto f = inspect_framing(res.headers);
    if (!f) {
        return std::unexpected(f.error());
    }

    if (hint.head_request || status_forbids_body(status)) {
        res.body = empty_body(cur);
        return spanned<response>{std::move(res), cur.span_from(start)};
    }

    if (f->content_length) {
        auto b = read_fixed_body(cur, f->length, body_kind::content_length);
        if (!b) {
            return std::unexpected(b.error());
        }
        res.body = std::move(*b);
    } else if (f->chunked) {
        chunked_decoder decoder(opts);
        auto b = decoder.decode(cur);
        if (!b) {
            return std::unexpected(b.error());
        }
        res.body = std::move(*b);
    } else if (hint.read_to_close) {
        auto b = read_fixed_body(cur, cur.remaining(), body_kind::to_end);
        if (!b) {
            return std::unexpected(b.error());
        }
        res.body = std::move(*b);
    } else if (cur.eof() && !f->transfer_encoding) {
        res.body = empty_body(cur);
    } else {
        return fail(error_code::unframed_body, cur.position(),
                    "Content-Length, chunked coding or read-to-close framing");
    }

    return spanned<response>{std::move(res), cur.span_from(start)};
}

} // namespace

void header_field::shift(size_t delta) noexcept {
    shift_span(name, delta);
    shift_span(value, delta);
}

void chunk::shift(size_t delta) noexcept {
    shift_span(size_text, delta);
    shift_span(extensions, delta);
    shift_span(data, delta);
}

size_t body::payload_size() const noexcept {
    if (kind != body_kind::chunked) {
        return content.span.len();
    }
    size_t total = 0;
    for (const auto& c : chunks) {
        total += c->data.span.len();
    }
    return total;
}

std::string body::decoded() const {
    if (kind != body_kind::chunked) {
        return std::string(content.value);
    }
    std::string out;
    out.reserve(payload_size());
    for (const auto& c : chunks) {
        out.append(c->data.value);
    }
    return out;
}

void body::shift(size_t delta) noexcept {
    shift_span(content, delta);
    for (auto& c : chunks) {
        c->shift(delta);
        shift_span(c, delta);
    }
    for (auto& t : trailers) {
        t->shift(delta);
        shift_span(t, delta);
    }
}

const spanned<header_field>* find_header(const header_list& headers,
                                         std::string_view name) noexcept {
    for (const auto& h : headers) {
        if (h->is(name)) {
            return &h;
        }
    }
    return nullptr;
}

std::vector<const spanned<header_field>*> find_headers(const header_list& headers,
                                                       std::string_view name) {
    std::vector<const spanned<header_field>*> out;
    for (const auto& h : headers) {
        if (h->is(name)) {
            out.push_back(&h);
        }
    }
    return out;
}

namespace {

std::optional<uint64_t> first_content_length(const header_list& headers) noexcept {
    const auto* h = find_header(headers, "Content-Length");
    if (!h) {
        return std::nullopt;
    }
    auto length = parse_decimal_length((*h)->value);
    if (!length) {
        return std::nullopt;
    }
    return *length;
}

void shift_headers(header_list& headers, size_t delta) noexcept {
    for (auto& h : headers) {
        h->shift(delta);
        shift_span(h, delta);
    }
}

} // namespace

std::optional<uint64_t> request::content_length() const noexcept {
    return first_content_length(headers);
}

std::optional<uint64_t> response::content_length() const noexcept {
    return first_content_length(headers);
}

void request::shift(size_t delta) noexcept {
    shift_span(method_text, delta);
    shift_span(target, delta);
    shift_span(version, delta);
    shift_headers(headers, delta);
    body->shift(delta);
    shift_span(body, delta);
    head = head.shifted(delta);
}

void response::shift(size_t delta) noexcept {
    shift_span(version, delta);
    shift_span(status, delta);
    shift_span(reason, delta);
    shift_headers(headers, delta);
    body->shift(delta);
    shift_span(body, delta);
    head = head.shifted(delta);
}

result<spanned<header_field>> parse_field_line(cursor& cur) {
    const size_t start = cur.checkpoint();
    auto fail_here = [&](const parse_error& err) -> result<spanned<header_field>> {
        cur.restore(start);
        return std::unexpected(err);
    };

    auto first = cur.peek_byte();
    if (!first) {
        return fail(error_code::unexpected_eof, cur.position(), "field name");
    }
    if (ascii::is_ows(*first)) {
        return fail(error_code::unexpected_token, cur.position(), "field name (no line folding)");
    }

    header_field field;
    field.name = cur.take_while(ascii::is_token_char);

    auto sep = cur.peek_byte();
    if (!sep) {
        return fail_here(
            parse_error{make_error_code(error_code::unexpected_eof), cur.position(), "':'"});
    }
    if (*sep != ':' || field.name.span.empty()) {
        return fail_here(parse_error{make_error_code(error_code::malformed_header_name),
                                     cur.position(), "token character or ':'"});
    }
    (void)cur.take(1);

    (void)cur.take_while(ascii::is_ows);
    auto raw = cur.take_while(is_value_byte);
    std::string_view trimmed = ascii::trim_ows(raw.value);
    field.value = spanned<std::string_view>{
        trimmed, make_span_unchecked(raw.span.start(), raw.span.start() + trimmed.size())};

    if (auto crlf = expect_crlf(cur); !crlf) {
        return fail_here(crlf.error());
    }
    return spanned<header_field>{std::move(field), cur.span_from(start)};
}

result<spanned<header_list>> parse_field_section(cursor& cur, const http_options& opts) {
    const size_t start = cur.checkpoint();
    header_list fields;

    while (true) {
        auto next = cur.peek_byte();
        if (!next) {
            cur.restore(start);
            return fail(error_code::unexpected_eof, cur.position(), "field line or CRLF");
        }
        if (*next == '\r') {
            if (auto crlf = cur.expect_literal(CRLF); !crlf) {
                cur.restore(start);
                return std::unexpected(crlf.error());
            }
            break;
        }
        if (fields.size() >= opts.max_headers) {
            size_t at = cur.position();
            cur.restore(start);
            return fail(error_code::too_many_headers, at);
        }
        auto field = parse_field_line(cur);
        if (!field) {
            cur.restore(start);
            return std::unexpected(field.error());
        }
        fields.push_back(std::move(*field));
    }

    return spanned<header_list>{std::move(fields), cur.span_from(start)};
}

result<spanned<request>> parse_request(cursor& cur, const http_options& opts) {
    const size_t start = cur.checkpoint();
    auto req = parse_request_impl(cur, opts);
    if (!req) {
        cur.restore(start);
    }
    return req;
}

result<spanned<response>> parse_response(cursor& cur, framing_hint hint, const http_options& opts) {
    const size_t start = cur.checkpoint();
    auto res = parse_response_impl(cur, hint, opts);
    if (!res) {
        cur.restore(start);
    }
    return res;
}

result<spanned<request>> parse_request(std::span<const uint8_t> bytes, const http_options& opts) {
    cursor cur(bytes);
    return parse_request(cur, opts);
}

result<spanned<request>> parse_request(std::string_view text, const http_options& opts) {
    return parse_request(as_bytes(text), opts);
}

result<spanned<response>>
parse_response(std::span<const uint8_t> bytes, framing_hint hint, const http_options& opts) {
    cursor cur(bytes);
    return parse_response(cur, hint, opts);
}

result<spanned<response>>
parse_response(std::string_view text, framing_hint hint, const http_options& opts) {
    return parse_response(as_bytes(text), hint, opts);
}

result<std::vector<spanned<request>>> parse_requests(std::span<const uint8_t> bytes,
                                                     const http_options& opts) {
    cursor cur(bytes);
    std::vector<spanned<request>> out;
    while (!cur.eof()) {
        auto req = parse_request(cur, opts);
        if (!req) {
            return std::unexpected(req.error());
        }
        out.push_back(std::move(*req));
    }
    return out;
}

method parse_method(std::string_view str) noexcept {
    if (str == "GET") return method::get;
    if (str == "POST") return method::post;
    if (str == "PUT") return method::put;
    if (str == "DELETE") return method::del;
    if (str == "PATCH") return method::patch;
    if (str == "HEAD") return method::head;
    if (str == "OPTIONS") return method::options;
    if (str == "TRACE") return method::trace;
    if (str == "CONNECT") return method::connect;
    return method::unknown;
}

std::string_view method_to_string(method m) noexcept {
    switch (m) {
        case method::get: return "GET";
        case method::post: return "POST";
        case method::put: return "PUT";
        case method::del: return "DELETE";
        case method::patch: return "PATCH";
        case method::head: return "HEAD";
        case method::options: return "OPTIONS";
        case method::trace: return "TRACE";
        case method::connect: return "CONNECT";
        default: return "UNKNOWN";
    }
}

std::string_view body_kind_to_string(body_kind k) noexcept {
    switch (k) {
        case body_kind::empty: return "empty";
        case body_kind::content_length: return "content-length";
        case body_kind::chunked: return "chunked";
        case body_kind::to_end: return "to-end";
        default: return "unknown";
    }
}

} // namespace spanx::http
