#pragma once

#include "cursor.hpp"
#include "http.hpp"
#include "result.hpp"
#include "span.hpp"

#include <cstdint>

namespace spanx::http {

// Chunked transfer-coding state machine:
//
//   chunk_size -> chunk_data -> chunk_size -> ... -> (size 0) -> trailer -> done
//
// Works on a complete buffer. On any failure the cursor is restored to where
// decoding started.
class chunked_decoder {
public:
    enum class state : uint8_t { chunk_size, chunk_data, trailer, done };

    explicit chunked_decoder(const http_options& opts = {}) noexcept : opts_(opts) {}

    [[nodiscard]] result<spanned<body>> decode(cursor& cur);

    [[nodiscard]] state current_state() const noexcept { return state_; }

private:
    result<state> parse_chunk_size_state(cursor& cur);
    result<state> parse_chunk_data_state(cursor& cur);
    result<state> parse_trailer_state(cursor& cur);

    http_options opts_;
    state state_ = state::chunk_size;
    body body_;
    chunk pending_;
    size_t chunk_start_ = 0;
};

} // namespace spanx::http
