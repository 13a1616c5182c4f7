#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace spanx::ascii {

// RFC 9110 tchar: "!#$%&'*+-.^_`|~" / DIGIT / ALPHA
alignas(64) inline constexpr bool TOKEN_CHARS[256] = {
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
    0,1,0,1,1,1,1,1,0,0,1,1,0,1,1,0,1,1,1,1,1,1,1,1,1,1,0,0,0,0,0,0,
    0,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,0,0,0,1,1,
    1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,0,1,0,1,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0
};

constexpr bool is_token_char(uint8_t c) noexcept {
    return TOKEN_CHARS[c];
}

constexpr bool is_digit(uint8_t c) noexcept {
    return c >= '0' && c <= '9';
}

constexpr bool is_hex_digit(uint8_t c) noexcept {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

constexpr int hex_value(uint8_t c) noexcept {
    if (is_digit(c)) {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

constexpr bool is_ows(uint8_t c) noexcept {
    return c == ' ' || c == '\t';
}

constexpr bool is_ctl(uint8_t c) noexcept {
    return c < 0x20 || c == 0x7f;
}

// Field values: VCHAR / obs-text / SP / HTAB.
constexpr bool is_field_value_char(uint8_t c) noexcept {
    return c == '\t' || !is_ctl(c);
}

// request-target: visible ASCII only.
constexpr bool is_target_char(uint8_t c) noexcept {
    return c > 0x20 && c < 0x7f;
}

constexpr uint8_t lower(uint8_t c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<uint8_t>(c | 0x20) : c;
}

inline bool ci_char_equal(char a, char b) noexcept {
    return lower(static_cast<uint8_t>(a)) == lower(static_cast<uint8_t>(b));
}

inline bool ci_equal(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), ci_char_equal);
}

inline std::string to_lower(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        result.push_back(static_cast<char>(lower(static_cast<uint8_t>(c))));
    }
    return result;
}

inline std::string_view trim_ows(std::string_view value) noexcept {
    while (!value.empty() && is_ows(static_cast<uint8_t>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && is_ows(static_cast<uint8_t>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

// Splits a comma separated list element-wise; returns the last non-empty
// element with OWS trimmed (e.g. the final transfer coding).
inline std::string_view last_list_element(std::string_view list) noexcept {
    while (!list.empty()) {
        auto comma = list.rfind(',');
        std::string_view tail =
            trim_ows(comma == std::string_view::npos ? list : list.substr(comma + 1));
        if (!tail.empty() || comma == std::string_view::npos) {
            return tail;
        }
        list = list.substr(0, comma);
    }
    return {};
}

} // namespace spanx::ascii
