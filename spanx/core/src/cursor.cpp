#include "spanx/core/cursor.hpp"
#include "spanx/core/ascii.hpp"
#include "spanx/core/scan.hpp"

#include <algorithm>

namespace spanx {

result<std::string_view> cursor::peek(size_t n) const {
    if (n > remaining()) {
        return fail(error_code::unexpected_eof, base_ + bytes_.size());
    }
    return as_chars(bytes_.subspan(offset_, n));
}

result<spanned<std::string_view>> cursor::take(size_t n) {
    if (n > remaining()) {
        return fail(error_code::unexpected_eof, base_ + bytes_.size());
    }
    size_t start = offset_;
    offset_ += n;
    return consumed(start);
}

result<spanned<uint8_t>> cursor::expect_byte(uint8_t b, std::string_view expected) {
    if (eof()) {
        return fail(error_code::unexpected_eof, position(), expected);
    }
    if (bytes_[offset_] != b) {
        return fail(error_code::unexpected_token, position(), expected);
    }
    ++offset_;
    return spanned<uint8_t>{b, span_from(offset_ - 1)};
}

result<spanned<uint8_t>> cursor::expect_one_of(std::string_view set, std::string_view expected) {
    if (eof()) {
        return fail(error_code::unexpected_eof, position(), expected);
    }
    uint8_t c = bytes_[offset_];
    if (set.find(static_cast<char>(c)) == std::string_view::npos) {
        return fail(error_code::unexpected_token, position(), expected);
    }
    ++offset_;
    return spanned<uint8_t>{c, span_from(offset_ - 1)};
}

result<spanned<std::string_view>> cursor::expect_literal(std::string_view literal) {
    auto lit = as_bytes(literal);
    size_t avail = std::min(lit.size(), remaining());
    for (size_t i = 0; i < avail; ++i) {
        if (bytes_[offset_ + i] != lit[i]) {
            return fail(error_code::unexpected_token, position() + i, literal);
        }
    }
    if (avail < lit.size()) {
        return fail(error_code::unexpected_eof, base_ + bytes_.size(), literal);
    }
    return take(lit.size());
}

result<spanned<std::string_view>> cursor::expect_literal_ci(std::string_view literal) {
    auto lit = as_bytes(literal);
    size_t avail = std::min(lit.size(), remaining());
    for (size_t i = 0; i < avail; ++i) {
        if (ascii::lower(bytes_[offset_ + i]) != ascii::lower(lit[i])) {
            return fail(error_code::unexpected_token, position() + i, literal);
        }
    }
    if (avail < lit.size()) {
        return fail(error_code::unexpected_eof, base_ + bytes_.size(), literal);
    }
    return take(lit.size());
}

result<spanned<std::string_view>> cursor::take_until(std::string_view delimiter, size_t bound) {
    auto delim = as_bytes(delimiter);
    size_t window = remaining();
    if (bound != unbounded && window >= delim.size() && bound < window - delim.size()) {
        window = bound + delim.size();
    }

    size_t hit = scan::find_pattern(bytes_.data() + offset_, window, delim.data(), delim.size());
    if (hit == scan::npos) {
        return fail(error_code::delimiter_not_found, position(), delimiter);
    }
    return take(hit);
}

} // namespace spanx
