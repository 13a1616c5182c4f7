#include "spanx/core/json.hpp"
#include "spanx/core/ascii.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>

namespace spanx::json {

namespace {

constexpr bool is_ws(uint8_t c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

constexpr bool is_plain_string_byte(uint8_t c) noexcept {
    return c != '"' && c != '\\' && c >= 0x20;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Position of the leading significant digit relative to the decimal point,
// e.g. 1 for "1.5", 0 for "0.5", -2 for "0.005", 401 for "1e400". Only its
// sign matters: it tells overflow from underflow for out-of-range numerals.
int64_t decimal_magnitude(std::string_view numeral) noexcept {
    constexpr int64_t EXPONENT_CAP = 1'000'000;
    size_t i = numeral.front() == '-' ? 1 : 0;

    int64_t int_digits = 0;
    bool leading = true;
    for (; i < numeral.size() && ascii::is_digit(static_cast<uint8_t>(numeral[i])); ++i) {
        if (leading && numeral[i] == '0') {
            continue;
        }
        leading = false;
        ++int_digits;
    }

    int64_t fraction_zeros = 0;
    if (i < numeral.size() && numeral[i] == '.') {
        for (++i; i < numeral.size() && ascii::is_digit(static_cast<uint8_t>(numeral[i])); ++i) {
            if (int_digits == 0 && leading) {
                if (numeral[i] == '0') {
                    ++fraction_zeros;
                } else {
                    leading = false;
                }
            }
        }
    }

    int64_t exponent = 0;
    bool exponent_negative = false;
    if (i < numeral.size() && (numeral[i] == 'e' || numeral[i] == 'E')) {
        ++i;
        if (i < numeral.size() && (numeral[i] == '+' || numeral[i] == '-')) {
            exponent_negative = numeral[i] == '-';
            ++i;
        }
        for (; i < numeral.size(); ++i) {
            exponent = std::min(exponent * 10 + (numeral[i] - '0'), EXPONENT_CAP);
        }
    }
    if (exponent_negative) {
        exponent = -exponent;
    }
    return exponent + (int_digits > 0 ? int_digits : -fraction_zeros);
}

bool has_nonzero_digit(std::string_view numeral) noexcept {
    for (char c : numeral) {
        if (c == 'e' || c == 'E') {
            break;
        }
        if (c >= '1' && c <= '9') {
            return true;
        }
    }
    return false;
}

constexpr bool is_high_surrogate(uint32_t cp) noexcept {
    return cp >= 0xD800 && cp <= 0xDBFF;
}

constexpr bool is_low_surrogate(uint32_t cp) noexcept {
    return cp >= 0xDC00 && cp <= 0xDFFF;
}

class parser {
public:
    parser(cursor& cur, const json_options& opts) noexcept : cur_(cur), opts_(opts) {}

    result<spanned<value>> parse_value(size_t depth) {
        skip_ws();
        auto next = cur_.peek_byte();
        if (!next) {
            return fail(error_code::unexpected_eof, cur_.position(), "JSON value");
        }
        switch (*next) {
            case '{':
                return parse_object(depth + 1);
            case '[':
                return parse_array(depth + 1);
            case '"': {
                auto s = parse_string();
                if (!s) {
                    return std::unexpected(s.error());
                }
                return spanned<value>{value(std::move(s->value)), s->span};
            }
            case 't':
                return parse_literal("true", value(true));
            case 'f':
                return parse_literal("false", value(false));
            case 'n':
                return parse_literal("null", value(nullptr));
            default:
                if (*next == '-' || ascii::is_digit(*next)) {
                    return parse_number();
                }
                return fail(error_code::unexpected_token, cur_.position(), "JSON value");
        }
    }

    void skip_ws() noexcept { (void)cur_.take_while(is_ws); }

private:
    result<spanned<value>> parse_literal(std::string_view word, value v) {
        auto lit = cur_.expect_literal(word);
        if (!lit) {
            return std::unexpected(lit.error());
        }
        return spanned<value>{std::move(v), lit->span};
    }

    result<size_t> enter(size_t depth) const {
        if (depth > opts_.max_depth) {
            return fail(error_code::depth_limit_exceeded, cur_.position());
        }
        return depth;
    }

    result<spanned<value>> parse_array(size_t depth) {
        if (auto d = enter(depth); !d) {
            return std::unexpected(d.error());
        }
        const size_t start = cur_.checkpoint();
        (void)cur_.take(1);

        array elements;
        skip_ws();
        if (cur_.peek_byte() == uint8_t{']'}) {
            (void)cur_.take(1);
            return spanned<value>{value(std::move(elements)), cur_.span_from(start)};
        }

        while (true) {
            auto element = parse_value(depth);
            if (!element) {
                return std::unexpected(element.error());
            }
            elements.push_back(std::move(*element));

            skip_ws();
            auto sep = cur_.expect_one_of(",]", "',' or ']'");
            if (!sep) {
                return std::unexpected(sep.error());
            }
            if (sep->value == ']') {
                break;
            }
        }
        return spanned<value>{value(std::move(elements)), cur_.span_from(start)};
    }

    result<spanned<value>> parse_object(size_t depth) {
        if (auto d = enter(depth); !d) {
            return std::unexpected(d.error());
        }
        const size_t start = cur_.checkpoint();
        (void)cur_.take(1);

        object members;
        skip_ws();
        if (cur_.peek_byte() == uint8_t{'}'}) {
            (void)cur_.take(1);
            return spanned<value>{value(std::move(members)), cur_.span_from(start)};
        }

        while (true) {
            skip_ws();
            auto quote = cur_.peek_byte();
            if (!quote) {
                return fail(error_code::unexpected_eof, cur_.position(), "object key");
            }
            if (*quote != '"') {
                return fail(error_code::unexpected_token, cur_.position(), "object key");
            }
            auto key = parse_string();
            if (!key) {
                return std::unexpected(key.error());
            }

            skip_ws();
            if (auto colon = cur_.expect_byte(':', "':'"); !colon) {
                return std::unexpected(colon.error());
            }

            auto val = parse_value(depth);
            if (!val) {
                return std::unexpected(val.error());
            }

            const span member_span = make_span_unchecked(key->span.start(), val->span.end());
            members.push_back(
                spanned<member>{member{std::move(*key), std::move(*val)}, member_span});

            skip_ws();
            auto sep = cur_.expect_one_of(",}", "',' or '}'");
            if (!sep) {
                return std::unexpected(sep.error());
            }
            if (sep->value == '}') {
                break;
            }
        }
        return spanned<value>{value(std::move(members)), cur_.span_from(start)};
    }

    result<uint32_t> parse_hex4() {
        const size_t at = cur_.position();
        auto digits = cur_.peek(4);
        if (!digits) {
            for (size_t i = 0; i < cur_.remaining(); ++i) {
                if (!ascii::is_hex_digit(cur_.rest()[i])) {
                    return fail(error_code::invalid_escape, at + i, "hex digit");
                }
            }
            return std::unexpected(digits.error());
        }
        uint32_t cp = 0;
        for (size_t i = 0; i < 4; ++i) {
            const int v = ascii::hex_value(static_cast<uint8_t>((*digits)[i]));
            if (v < 0) {
                return fail(error_code::invalid_escape, at + i, "hex digit");
            }
            cp = (cp << 4) | static_cast<uint32_t>(v);
        }
        (void)cur_.take(4);
        return cp;
    }

    // Cursor sits right after the backslash.
    result<bool> parse_escape(std::string& out, size_t escape_at) {
        auto c = cur_.peek_byte();
        if (!c) {
            return fail(error_code::unexpected_eof, cur_.position(), "escape character");
        }
        (void)cur_.take(1);
        switch (*c) {
            case '"': out.push_back('"'); return true;
            case '\\': out.push_back('\\'); return true;
            case '/': out.push_back('/'); return true;
            case 'b': out.push_back('\b'); return true;
            case 'f': out.push_back('\f'); return true;
            case 'n': out.push_back('\n'); return true;
            case 'r': out.push_back('\r'); return true;
            case 't': out.push_back('\t'); return true;
            case 'u': break;
            default:
                return fail(error_code::invalid_escape, escape_at, "valid escape");
        }

        auto cp = parse_hex4();
        if (!cp) {
            return std::unexpected(cp.error());
        }
        if (is_low_surrogate(*cp)) {
            return fail(error_code::invalid_escape, escape_at, "high surrogate first");
        }
        if (!is_high_surrogate(*cp)) {
            append_utf8(out, *cp);
            return true;
        }

        auto next = cur_.peek(2);
        if (!next) {
            if (cur_.eof() || cur_.rest()[0] == '\\') {
                return std::unexpected(next.error());
            }
            return fail(error_code::invalid_escape, escape_at, "low surrogate");
        }
        if (*next != "\\u") {
            return fail(error_code::invalid_escape, escape_at, "low surrogate");
        }
        (void)cur_.take(2);
        auto low = parse_hex4();
        if (!low) {
            return std::unexpected(low.error());
        }
        if (!is_low_surrogate(*low)) {
            return fail(error_code::invalid_escape, escape_at, "low surrogate");
        }
        append_utf8(out, 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00));
        return true;
    }

    result<spanned<string>> parse_string() {
        const size_t start = cur_.checkpoint();
        (void)cur_.take(1);

        string s;
        while (true) {
            auto run = cur_.take_while(is_plain_string_byte);
            s.decoded.append(run.value);

            auto c = cur_.peek_byte();
            if (!c) {
                return fail(error_code::unexpected_eof, cur_.position(), "closing quote");
            }
            if (*c == '"') {
                (void)cur_.take(1);
                break;
            }
            if (*c == '\\') {
                const size_t escape_at = cur_.position();
                (void)cur_.take(1);
                if (auto esc = parse_escape(s.decoded, escape_at); !esc) {
                    return std::unexpected(esc.error());
                }
                continue;
            }
            return fail(error_code::unexpected_token, cur_.position(), "escaped control character");
        }

        const span whole = cur_.span_from(start);
        s.raw = cur_.view(whole);
        return spanned<string>{std::move(s), whole};
    }

    // Requires at least one digit; reports eof or `invalid_number`.
    result<bool> digits(std::string_view what) {
        auto next = cur_.peek_byte();
        if (!next) {
            return fail(error_code::unexpected_eof, cur_.position(), what);
        }
        if (!ascii::is_digit(*next)) {
            return fail(error_code::invalid_number, cur_.position(), what);
        }
        (void)cur_.take_while(ascii::is_digit);
        return true;
    }

    result<spanned<value>> parse_number() {
        const size_t start = cur_.checkpoint();
        bool integral = true;

        if (cur_.peek_byte() == uint8_t{'-'}) {
            (void)cur_.take(1);
        }

        auto first = cur_.peek_byte();
        if (first == uint8_t{'0'}) {
            (void)cur_.take(1);
            if (auto after = cur_.peek_byte(); after && ascii::is_digit(*after)) {
                return fail(error_code::invalid_number, cur_.position(), "no leading zeros");
            }
        } else if (auto d = digits("digit"); !d) {
            return std::unexpected(d.error());
        }

        if (cur_.peek_byte() == uint8_t{'.'}) {
            integral = false;
            (void)cur_.take(1);
            if (auto d = digits("fraction digit"); !d) {
                return std::unexpected(d.error());
            }
        }

        if (auto e = cur_.peek_byte(); e && (*e == 'e' || *e == 'E')) {
            integral = false;
            (void)cur_.take(1);
            if (auto sign = cur_.peek_byte(); sign && (*sign == '+' || *sign == '-')) {
                (void)cur_.take(1);
            }
            if (auto d = digits("exponent digit"); !d) {
                return std::unexpected(d.error());
            }
        }

        const span s = cur_.span_from(start);
        number n;
        n.raw = cur_.view(s);
        const char* first_char = n.raw.data();
        const char* last_char = n.raw.data() + n.raw.size();

        auto [ptr, ec] = std::from_chars(first_char, last_char, n.real);
        if (ec == std::errc::result_out_of_range && ptr == last_char) {
            const bool negative = n.raw.front() == '-';
            n.real = decimal_magnitude(n.raw) > 0 ? HUGE_VAL : 0.0;
            if (negative) {
                n.real = -n.real;
            }
            n.clamped = true;
        } else if (ec != std::errc() || ptr != last_char) {
            return fail(error_code::invalid_number, s.start(), "JSON number");
        } else if (std::isinf(n.real) || (n.real == 0.0 && has_nonzero_digit(n.raw))) {
            n.clamped = true;
        }
        if (integral) {
            int64_t i = 0;
            auto [iptr, iec] = std::from_chars(first_char, last_char, i);
            if (iec == std::errc() && iptr == last_char) {
                n.integer = i;
            }
        }
        return spanned<value>{value(std::move(n)), s};
    }

    cursor& cur_;
    const json_options& opts_;
};

} // namespace

const spanned<value>* value::find(std::string_view key) const noexcept {
    const auto* members = as_object();
    if (!members) {
        return nullptr;
    }
    for (const auto& m : *members) {
        if (m->key->decoded == key) {
            return &m->value;
        }
    }
    return nullptr;
}

const spanned<value>* value::get(std::string_view path) const noexcept {
    if (path.empty()) {
        return nullptr;
    }
    const value* node = this;
    const spanned<value>* found = nullptr;

    while (true) {
        const size_t dot = path.find('.');
        std::string_view segment = path.substr(0, dot);
        if (segment.empty()) {
            return nullptr;
        }

        if (node->as_object()) {
            found = node->find(segment);
        } else if (const auto* elements = node->as_array()) {
            size_t index = 0;
            auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
            if (ec != std::errc() || ptr != segment.data() + segment.size() ||
                index >= elements->size()) {
                return nullptr;
            }
            found = &(*elements)[index];
        } else {
            return nullptr;
        }

        if (!found) {
            return nullptr;
        }
        if (dot == std::string_view::npos) {
            return found;
        }
        node = &found->value;
        path.remove_prefix(dot + 1);
    }
}

void value::shift(size_t delta) noexcept {
    if (auto* elements = std::get_if<array>(&data_)) {
        for (auto& e : *elements) {
            e->shift(delta);
            e.span = e.span.shifted(delta);
        }
    } else if (auto* members = std::get_if<object>(&data_)) {
        for (auto& m : *members) {
            m->key.span = m->key.span.shifted(delta);
            m->value->shift(delta);
            m->value.span = m->value.span.shifted(delta);
            m.span = m.span.shifted(delta);
        }
    }
}

void visitor::visit_value(const spanned<value>& node) {
    switch (node->type()) {
        case kind::null:
            visit_null(node.span);
            break;
        case kind::boolean:
            visit_bool(*node->as_bool(), node.span);
            break;
        case kind::number:
            visit_number(*node->as_number(), node.span);
            break;
        case kind::string:
            visit_string(*node->as_string(), node.span);
            break;
        case kind::array:
            visit_array(*node->as_array(), node.span);
            break;
        case kind::object:
            visit_object(*node->as_object(), node.span);
            break;
    }
}

void visitor::visit_array(const array& elements, span) {
    for (const auto& e : elements) {
        visit_value(e);
    }
}

void visitor::visit_object(const object& members, span) {
    for (const auto& m : members) {
        visit_member(m);
    }
}

void visitor::visit_member(const spanned<member>& m) {
    visit_key(m->key);
    visit_value(m->value);
}

result<spanned<value>> parse_json(cursor& cur, const json_options& opts) {
    const size_t start = cur.checkpoint();
    parser p(cur, opts);

    auto root = p.parse_value(0);
    if (!root) {
        cur.restore(start);
        return root;
    }

    if (opts.trailing == trailing_policy::reject) {
        p.skip_ws();
        if (!cur.eof()) {
            const size_t at = cur.position();
            cur.restore(start);
            return fail(error_code::trailing_data, at, "end of input");
        }
    }
    return root;
}

result<spanned<value>> parse_json(std::span<const uint8_t> bytes, const json_options& opts) {
    cursor cur(bytes);
    return parse_json(cur, opts);
}

result<spanned<value>> parse_json(std::string_view text, const json_options& opts) {
    return parse_json(as_bytes(text), opts);
}

std::string_view kind_to_string(kind k) noexcept {
    switch (k) {
        case kind::null: return "null";
        case kind::boolean: return "boolean";
        case kind::number: return "number";
        case kind::string: return "string";
        case kind::array: return "array";
        case kind::object: return "object";
        default: return "unknown";
    }
}

} // namespace spanx::json
