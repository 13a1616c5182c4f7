#pragma once

#include "result.hpp"
#include "span.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

namespace spanx {

// Position-tracking read-only view over a byte buffer.
//
// Every matcher is all-or-nothing: on failure the offset is exactly what it
// was before the call. Spans and error offsets are absolute, i.e. shifted by
// the base the cursor was created with, so a grammar run over a sub-slice
// still reports coordinates of the enclosing buffer.
class cursor {
public:
    static constexpr size_t unbounded = static_cast<size_t>(-1);

    explicit cursor(std::span<const uint8_t> bytes, size_t base = 0) noexcept
        : bytes_(bytes), base_(base) {}
    explicit cursor(std::string_view text, size_t base = 0) noexcept
        : bytes_(as_bytes(text)), base_(base) {}

    // Local offset into the wrapped buffer.
    [[nodiscard]] size_t offset() const noexcept { return offset_; }
    // Absolute offset (base + local).
    [[nodiscard]] size_t position() const noexcept { return base_ + offset_; }
    [[nodiscard]] size_t base() const noexcept { return base_; }
    [[nodiscard]] size_t size() const noexcept { return bytes_.size(); }
    [[nodiscard]] size_t remaining() const noexcept { return bytes_.size() - offset_; }
    [[nodiscard]] bool eof() const noexcept { return offset_ >= bytes_.size(); }
    [[nodiscard]] std::span<const uint8_t> rest() const noexcept {
        return bytes_.subspan(offset_);
    }

    [[nodiscard]] size_t checkpoint() const noexcept { return offset_; }
    void restore(size_t checkpoint) noexcept {
        if (checkpoint <= bytes_.size()) {
            offset_ = checkpoint;
        }
    }

    // Absolute span from a checkpoint to the current offset.
    [[nodiscard]] span span_from(size_t checkpoint) const noexcept {
        return make_span_unchecked(base_ + checkpoint, base_ + offset_);
    }

    // Text of an absolute span produced by this cursor.
    [[nodiscard]] std::string_view view(span s) const noexcept {
        return as_chars(bytes_.subspan(s.start() - base_, s.len()));
    }

    [[nodiscard]] result<std::string_view> peek(size_t n) const;
    [[nodiscard]] std::optional<uint8_t> peek_byte() const noexcept {
        if (eof()) {
            return std::nullopt;
        }
        return bytes_[offset_];
    }

    [[nodiscard]] result<spanned<std::string_view>> take(size_t n);
    [[nodiscard]] result<spanned<uint8_t>> expect_byte(uint8_t b, std::string_view expected = {});
    [[nodiscard]] result<spanned<uint8_t>> expect_one_of(std::string_view set,
                                                         std::string_view expected = {});
    [[nodiscard]] result<spanned<std::string_view>> expect_literal(std::string_view literal);
    [[nodiscard]] result<spanned<std::string_view>> expect_literal_ci(std::string_view literal);
    [[nodiscard]] result<spanned<std::string_view>> take_until(std::string_view delimiter,
                                                               size_t bound = unbounded);

    template <typename Pred> spanned<std::string_view> take_while(Pred&& pred) noexcept {
        size_t start = offset_;
        while (offset_ < bytes_.size() && pred(bytes_[offset_])) {
            ++offset_;
        }
        return consumed(start);
    }

    template <typename Pred>
    [[nodiscard]] result<spanned<std::string_view>> take_while1(Pred&& pred,
                                                                std::string_view expected = {}) {
        if (eof()) {
            return fail(error_code::unexpected_eof, position(), expected);
        }
        auto run = take_while(std::forward<Pred>(pred));
        if (run.span.empty()) {
            return fail(error_code::unexpected_token, position(), expected);
        }
        return run;
    }

private:
    spanned<std::string_view> consumed(size_t start) const noexcept {
        return spanned<std::string_view>{as_chars(bytes_.subspan(start, offset_ - start)),
                                         span_from(start)};
    }

    std::span<const uint8_t> bytes_;
    size_t base_ = 0;
    size_t offset_ = 0;
};

} // namespace spanx
