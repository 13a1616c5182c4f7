#pragma once

#include "cursor.hpp"
#include "result.hpp"
#include "span.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace spanx::json {

constexpr size_t MAX_DEPTH = 128;

enum class trailing_policy : uint8_t {
    reject, // anything but whitespace after the value is `trailing_data`
    allow,  // parsing stops right after the value
};

struct json_options {
    size_t max_depth = MAX_DEPTH;
    trailing_policy trailing = trailing_policy::reject;
};

enum class kind : uint8_t { null, boolean, number, string, array, object };

struct number {
    // The numeral exactly as written.
    std::string_view raw;
    // Nearest double. Numerals beyond its range keep their raw text and are
    // clamped to +-HUGE_VAL (overflow) or +-0.0 (underflow).
    double real = 0.0;
    bool clamped = false;
    // Set when the numeral has no fraction or exponent and fits in int64.
    std::optional<int64_t> integer;

    [[nodiscard]] bool is_integer() const noexcept { return integer.has_value(); }
};

struct string {
    std::string decoded;
    // Including the quotes, escapes untouched.
    std::string_view raw;
};

class value;
struct member;

using array = std::vector<spanned<value>>;
// Members in document order; duplicate keys are kept.
using object = std::vector<spanned<member>>;

class value {
public:
    using storage = std::variant<std::nullptr_t, bool, number, string, array, object>;

    value() noexcept = default;
    value(std::nullptr_t) noexcept {}
    value(bool b) noexcept : data_(std::in_place_type<bool>, b) {}
    value(number n) noexcept : data_(std::in_place_type<number>, std::move(n)) {}
    value(string s) noexcept : data_(std::in_place_type<string>, std::move(s)) {}
    value(array a) noexcept : data_(std::in_place_type<array>, std::move(a)) {}
    value(object o) noexcept : data_(std::in_place_type<object>, std::move(o)) {}

    [[nodiscard]] kind type() const noexcept { return static_cast<kind>(data_.index()); }
    [[nodiscard]] bool is_null() const noexcept { return type() == kind::null; }

    [[nodiscard]] const bool* as_bool() const noexcept;
    [[nodiscard]] const number* as_number() const noexcept;
    [[nodiscard]] const string* as_string() const noexcept;
    [[nodiscard]] const array* as_array() const noexcept;
    [[nodiscard]] const object* as_object() const noexcept;

    [[nodiscard]] const storage& data() const noexcept { return data_; }

    // First member whose decoded key equals `key`; null for non-objects.
    [[nodiscard]] const spanned<value>* find(std::string_view key) const noexcept;

    // Dotted path: object keys and array indices, e.g. "items.0.name".
    // Null when any step is missing or the path is empty.
    [[nodiscard]] const spanned<value>* get(std::string_view path) const noexcept;

    void shift(size_t delta) noexcept;

private:
    storage data_;
};

struct member {
    spanned<string> key;
    spanned<json::value> value;
};

inline const bool* value::as_bool() const noexcept { return std::get_if<bool>(&data_); }
inline const number* value::as_number() const noexcept { return std::get_if<number>(&data_); }
inline const string* value::as_string() const noexcept { return std::get_if<string>(&data_); }
inline const array* value::as_array() const noexcept { return std::get_if<array>(&data_); }
inline const object* value::as_object() const noexcept { return std::get_if<object>(&data_); }

// Walks a value tree. Every hook has a default: scalars are ignored,
// containers recurse into their children.
class visitor {
public:
    virtual ~visitor() = default;

    // Dispatches on the value's kind.
    virtual void visit_value(const spanned<value>& node);

    virtual void visit_null(span) {}
    virtual void visit_bool(bool, span) {}
    virtual void visit_number(const number&, span) {}
    virtual void visit_string(const string&, span) {}
    virtual void visit_key(const spanned<string>&) {}

    virtual void visit_array(const array& elements, span s);
    virtual void visit_object(const object& members, span s);
    // Key first, then value.
    virtual void visit_member(const spanned<member>& m);

protected:
    visitor() = default;
};

// Value spans never include surrounding whitespace. Arrays and objects
// span from the opening to the closing bracket.
[[nodiscard]] result<spanned<value>> parse_json(cursor& cur, const json_options& opts = {});
[[nodiscard]] result<spanned<value>> parse_json(std::span<const uint8_t> bytes,
                                                const json_options& opts = {});
[[nodiscard]] result<spanned<value>> parse_json(std::string_view text,
                                                const json_options& opts = {});

std::string_view kind_to_string(kind k) noexcept;

} // namespace spanx::json
