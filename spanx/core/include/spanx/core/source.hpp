#pragma once

#include "result.hpp"
#include "span.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spanx {

// Immutable, reference-counted input buffer. Copies share the bytes, so a
// source kept next to a parsed tree guarantees every span in it stays valid.
class source {
public:
    source() = default;
    source(source&&) noexcept = default;
    source& operator=(source&&) noexcept = default;
    source(const source&) = default;
    source& operator=(const source&) = default;

    static source copy_of(std::span<const uint8_t> data);
    static source copy_of(std::string_view data);
    static source adopt(std::vector<uint8_t>&& data);

    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept;
    [[nodiscard]] std::string_view chars() const noexcept { return as_chars(bytes()); }
    [[nodiscard]] size_t size() const noexcept { return bytes_ ? bytes_->size() : 0; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
    [[nodiscard]] long use_count() const noexcept { return bytes_.use_count(); }

    [[nodiscard]] result<std::string_view> slice(span s) const;
    [[nodiscard]] result<std::span<const uint8_t>> slice_bytes(span s) const;

    template <typename T> [[nodiscard]] result<std::string_view> slice(const spanned<T>& v) const {
        return slice(v.span);
    }

private:
    explicit source(std::shared_ptr<const std::vector<uint8_t>> bytes) noexcept
        : bytes_(std::move(bytes)) {}

    std::shared_ptr<const std::vector<uint8_t>> bytes_;
};

} // namespace spanx
