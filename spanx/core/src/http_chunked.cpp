#include "spanx/core/http_chunked.hpp"
#include "spanx/core/ascii.hpp"

#include <charconv>

namespace spanx::http {

namespace {

constexpr int HEX_BASE = 16;

result<spanned<std::string_view>> expect_crlf(cursor& cur) {
    if (cur.eof()) {
        return fail(error_code::unexpected_eof, cur.position(), "CRLF");
    }
    return cur.expect_literal("\r\n");
}

} // namespace

result<spanned<body>> chunked_decoder::decode(cursor& cur) {
    const size_t start = cur.checkpoint();
    state_ = state::chunk_size;
    body_ = body{};
    body_.kind = body_kind::chunked;

    while (state_ != state::done) {
        result<state> next_state = [&]() -> result<state> {
            switch (state_) {
                case state::chunk_size:
                    return parse_chunk_size_state(cur);
                case state::chunk_data:
                    return parse_chunk_data_state(cur);
                case state::trailer:
                    return parse_trailer_state(cur);
                default:
                    return state_;
            }
        }();

        if (!next_state) {
            cur.restore(start);
            return std::unexpected(next_state.error());
        }
        state_ = *next_state;
    }

    const span whole = cur.span_from(start);
    body_.content = spanned<std::string_view>{cur.view(whole), whole};
    return spanned<body>{std::move(body_), whole};
}

result<chunked_decoder::state> chunked_decoder::parse_chunk_size_state(cursor& cur) {
    chunk_start_ = cur.checkpoint();
    pending_ = chunk{};

    auto digits = cur.take_while(ascii::is_hex_digit);
    if (digits.span.empty()) {
        if (cur.eof()) {
            return fail(error_code::unexpected_eof, cur.position(), "chunk size");
        }
        return fail(error_code::invalid_chunk_size, cur.position(), "hex digit");
    }
    if (digits.span.len() > MAX_CHUNK_SIZE_DIGITS) {
        return fail(error_code::invalid_chunk_size, digits.span.start(), "at most 16 hex digits");
    }

    uint64_t size = 0;
    auto [ptr, ec] = std::from_chars(digits.value.data(), digits.value.data() + digits.value.size(),
                                     size, HEX_BASE);
    if (ec != std::errc() || ptr != digits.value.data() + digits.value.size()) {
        return fail(error_code::invalid_chunk_size, digits.span.start(), "hex chunk size");
    }

    // chunk-ext is kept verbatim; it must start with ';' (optionally after BWS).
    const size_t ext_start = cur.checkpoint();
    auto ext = cur.take_while([](uint8_t c) { return c != '\r' && ascii::is_field_value_char(c); });
    size_t leading_ows = 0;
    while (leading_ows < ext.value.size() &&
           ascii::is_ows(static_cast<uint8_t>(ext.value[leading_ows]))) {
        ++leading_ows;
    }
    if (leading_ows < ext.value.size() && ext.value[leading_ows] != ';') {
        cur.restore(ext_start);
        return fail(error_code::invalid_chunk_size, ext.span.start() + leading_ows,
                    "chunk extension or CRLF");
    }

    if (auto crlf = expect_crlf(cur); !crlf) {
        return std::unexpected(crlf.error());
    }

    pending_.size = size;
    pending_.size_text = digits;
    pending_.extensions = ext;

    if (size == 0) {
        const span line = cur.span_from(chunk_start_);
        pending_.data = spanned<std::string_view>{std::string_view{}, span::at(line.end())};
        body_.chunks.push_back(spanned<chunk>{std::move(pending_), line});
        return state::trailer;
    }
    return state::chunk_data;
}

result<chunked_decoder::state> chunked_decoder::parse_chunk_data_state(cursor& cur) {
    if (pending_.size > cur.remaining()) {
        return fail(error_code::unexpected_eof, cur.position() + cur.remaining(), "chunk data");
    }

    auto data = cur.take(static_cast<size_t>(pending_.size));
    if (!data) {
        return std::unexpected(data.error());
    }

    if (auto crlf = expect_crlf(cur); !crlf) {
        return std::unexpected(crlf.error());
    }

    pending_.data = *data;
    body_.chunks.push_back(spanned<chunk>{std::move(pending_), cur.span_from(chunk_start_)});
    return state::chunk_size;
}

result<chunked_decoder::state> chunked_decoder::parse_trailer_state(cursor& cur) {
    auto trailers = parse_field_section(cur, opts_);
    if (!trailers) {
        return std::unexpected(trailers.error());
    }
    body_.trailers = std::move(trailers->value);
    return state::done;
}

} // namespace spanx::http
