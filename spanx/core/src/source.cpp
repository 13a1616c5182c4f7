#include "spanx/core/source.hpp"

namespace spanx {

source source::copy_of(std::span<const uint8_t> data) {
    return source(std::make_shared<const std::vector<uint8_t>>(data.begin(), data.end()));
}

source source::copy_of(std::string_view data) {
    return copy_of(as_bytes(data));
}

source source::adopt(std::vector<uint8_t>&& data) {
    return source(std::make_shared<const std::vector<uint8_t>>(std::move(data)));
}

std::span<const uint8_t> source::bytes() const noexcept {
    if (!bytes_) {
        return {};
    }
    return std::span<const uint8_t>(bytes_->data(), bytes_->size());
}

result<std::string_view> source::slice(span s) const {
    return checked_slice(chars(), s);
}

result<std::span<const uint8_t>> source::slice_bytes(span s) const {
    if (s.end() > size()) {
        return fail(error_code::invalid_range, s.start(), "span within buffer");
    }
    return bytes().subspan(s.start(), s.len());
}

} // namespace spanx
