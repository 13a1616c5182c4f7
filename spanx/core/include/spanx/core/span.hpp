#pragma once

#include "result.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

namespace spanx {

// Half-open byte range [start, end) over a buffer the span does not own.
// Pairing a span with the buffer it was produced from is the caller's job.
class span {
public:
    constexpr span() noexcept = default;

    [[nodiscard]] static result<span> make(size_t start, size_t end) {
        if (start > end) {
            return fail(error_code::invalid_range, start, "start <= end");
        }
        return span(start, end);
    }

    // Empty span positioned at `offset`.
    [[nodiscard]] static constexpr span at(size_t offset) noexcept { return span(offset, offset); }

    [[nodiscard]] constexpr size_t start() const noexcept { return start_; }
    [[nodiscard]] constexpr size_t end() const noexcept { return end_; }
    [[nodiscard]] constexpr size_t len() const noexcept { return end_ - start_; }
    [[nodiscard]] constexpr bool empty() const noexcept { return start_ == end_; }

    [[nodiscard]] constexpr bool contains(span other) const noexcept {
        return start_ <= other.start_ && other.end_ <= end_;
    }

    [[nodiscard]] constexpr bool contains(size_t offset) const noexcept {
        return start_ <= offset && offset < end_;
    }

    // Empty spans never overlap anything.
    [[nodiscard]] constexpr bool disjoint(span other) const noexcept {
        return end_ <= other.start_ || other.end_ <= start_;
    }

    // Smallest span covering both. The two must overlap or touch.
    [[nodiscard]] result<span> unite(span other) const {
        const span& lo = start_ <= other.start_ ? *this : other;
        const span& hi = start_ <= other.start_ ? other : *this;
        if (lo.end_ < hi.start_) {
            return fail(error_code::non_contiguous, lo.end_, "overlapping or adjacent span");
        }
        return span(lo.start_, std::max(lo.end_, hi.end_));
    }

    [[nodiscard]] constexpr span shifted(size_t delta) const noexcept {
        return span(start_ + delta, end_ + delta);
    }

    // This span in the coordinates of `outer`, which must contain it.
    [[nodiscard]] result<span> relative_to(span outer) const {
        if (!outer.contains(*this)) {
            return fail(error_code::invalid_range, start_, "span inside outer span");
        }
        return span(start_ - outer.start_, end_ - outer.start_);
    }

    constexpr bool operator==(const span&) const noexcept = default;

private:
    constexpr span(size_t start, size_t end) noexcept : start_(start), end_(end) {}

    friend constexpr span make_span_unchecked(size_t, size_t) noexcept;

    size_t start_ = 0;
    size_t end_ = 0;
};

// Only for callers that already hold start <= end (matchers, combinators).
[[nodiscard]] constexpr span make_span_unchecked(size_t start, size_t end) noexcept {
    return span(start, end);
}

template <typename T> struct spanned {
    using value_type = T;

    T value;
    ::spanx::span span;

    [[nodiscard]] const T& operator*() const noexcept { return value; }
    [[nodiscard]] T& operator*() noexcept { return value; }
    [[nodiscard]] const T* operator->() const noexcept { return &value; }
    [[nodiscard]] T* operator->() noexcept { return &value; }

    template <typename F> [[nodiscard]] auto map(F&& f) const& {
        using U = std::invoke_result_t<F, const T&>;
        return spanned<U>{std::forward<F>(f)(value), span};
    }

    template <typename F> [[nodiscard]] auto map(F&& f) && {
        using U = std::invoke_result_t<F, T&&>;
        return spanned<U>{std::forward<F>(f)(std::move(value)), span};
    }

    [[nodiscard]] bool contains(::spanx::span other) const noexcept { return span.contains(other); }

    template <typename U> [[nodiscard]] bool contains(const spanned<U>& other) const noexcept {
        return span.contains(other.span);
    }
};

template <typename T> spanned(T, span) -> spanned<T>;

inline std::span<const uint8_t> as_bytes(std::string_view sv) noexcept {
    return std::span<const uint8_t>(
        static_cast<const uint8_t*>(static_cast<const void*>(sv.data())), sv.size());
}

inline std::string_view as_chars(std::span<const uint8_t> bytes) noexcept {
    return std::string_view(static_cast<const char*>(static_cast<const void*>(bytes.data())),
                            bytes.size());
}

// Unchecked slicing for spans produced by parsing the same buffer.
inline std::string_view slice(std::string_view buffer, span s) noexcept {
    return buffer.substr(s.start(), s.len());
}

inline std::span<const uint8_t> slice(std::span<const uint8_t> buffer, span s) noexcept {
    return buffer.subspan(s.start(), s.len());
}

[[nodiscard]] inline result<std::string_view> checked_slice(std::string_view buffer, span s) {
    if (s.end() > buffer.size()) {
        return fail(error_code::invalid_range, s.start(), "span within buffer");
    }
    return buffer.substr(s.start(), s.len());
}

} // namespace spanx
