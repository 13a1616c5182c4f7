#pragma once

#include "cursor.hpp"
#include "result.hpp"
#include "span.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

// Parser combinators over `cursor`.
//
// A parser is any callable `cursor& -> result<spanned<T>>`. Every combinator
// returns such a callable, so they nest freely. On success the produced span
// covers exactly the consumed bytes; on failure the cursor is back where it
// started.
namespace spanx::combinators {

template <typename P> using parser_output_t = typename std::invoke_result_t<P&, cursor&>::value_type;

template <typename P> using parser_value_t = typename parser_output_t<P>::value_type;

constexpr size_t unbounded = static_cast<size_t>(-1);

// Primitive matchers lifted to parser objects.

inline auto literal(std::string_view lit) {
    return [lit](cursor& cur) { return cur.expect_literal(lit); };
}

inline auto literal_ci(std::string_view lit) {
    return [lit](cursor& cur) { return cur.expect_literal_ci(lit); };
}

inline auto byte(uint8_t b, std::string_view expected = {}) {
    return [b, expected](cursor& cur) { return cur.expect_byte(b, expected); };
}

inline auto one_of(std::string_view set, std::string_view expected = {}) {
    return [set, expected](cursor& cur) { return cur.expect_one_of(set, expected); };
}

inline auto take(size_t n) {
    return [n](cursor& cur) { return cur.take(n); };
}

inline auto until(std::string_view delimiter, size_t bound = cursor::unbounded) {
    return [delimiter, bound](cursor& cur) { return cur.take_until(delimiter, bound); };
}

template <typename Pred> auto take_while(Pred pred) {
    return [pred](cursor& cur) -> result<spanned<std::string_view>> {
        return cur.take_while(pred);
    };
}

template <typename Pred> auto take_while1(Pred pred, std::string_view expected = {}) {
    return [pred, expected](cursor& cur) { return cur.take_while1(pred, expected); };
}

// Runs the parsers in order; the value is the tuple of their results.
template <typename... Ps> auto sequence(Ps... ps) {
    return [=](cursor& cur) -> result<spanned<std::tuple<parser_output_t<Ps>...>>> {
        const size_t cp = cur.checkpoint();
        std::tuple<std::optional<parser_output_t<Ps>>...> parts;
        std::optional<parse_error> error;
        auto parsers = std::tie(ps...);

        [&]<size_t... I>(std::index_sequence<I...>) {
            (
                [&] {
                    if (error) {
                        return;
                    }
                    auto r = std::get<I>(parsers)(cur);
                    if (!r) {
                        error = std::move(r).error();
                        return;
                    }
                    std::get<I>(parts).emplace(std::move(*r));
                }(),
                ...);
        }(std::index_sequence_for<Ps...>{});

        if (error) {
            cur.restore(cp);
            return std::unexpected(std::move(*error));
        }

        auto values = [&]<size_t... I>(std::index_sequence<I...>) {
            return std::tuple<parser_output_t<Ps>...>{std::move(*std::get<I>(parts))...};
        }(std::index_sequence_for<Ps...>{});
        return spanned<std::tuple<parser_output_t<Ps>...>>{std::move(values), cur.span_from(cp)};
    };
}

// Never fails. An absent value carries an empty span at the current position.
template <typename P> auto optional(P p) {
    return [p](cursor& cur) -> result<spanned<std::optional<parser_value_t<P>>>> {
        const size_t cp = cur.checkpoint();
        auto r = p(cur);
        if (!r) {
            cur.restore(cp);
            return spanned<std::optional<parser_value_t<P>>>{std::nullopt, cur.span_from(cp)};
        }
        return spanned<std::optional<parser_value_t<P>>>{std::move(r->value), r->span};
    };
}

// Greedy repetition. A repetition that consumes nothing ends the loop.
template <typename P> auto repeat(P p, size_t min, size_t max = unbounded) {
    return [p, min, max](cursor& cur) -> result<spanned<std::vector<parser_output_t<P>>>> {
        const size_t cp = cur.checkpoint();
        std::vector<parser_output_t<P>> items;
        while (items.size() < max) {
            const size_t before = cur.checkpoint();
            auto r = p(cur);
            if (!r) {
                cur.restore(before);
                if (items.size() < min) {
                    cur.restore(cp);
                    return fail(error_code::too_few_repetitions, r.error().offset,
                                r.error().expected);
                }
                break;
            }
            items.push_back(std::move(*r));
            if (cur.checkpoint() == before) {
                break;
            }
        }
        if (items.size() < min) {
            cur.restore(cp);
            return fail(error_code::too_few_repetitions, cur.position());
        }
        return spanned<std::vector<parser_output_t<P>>>{std::move(items), cur.span_from(cp)};
    };
}

// First success wins, in declaration order. When every branch fails the
// error that got furthest into the input is reported (ties: the later one).
template <typename P, typename... Ps> auto alternation(P first, Ps... rest) {
    static_assert((std::is_same_v<parser_output_t<P>, parser_output_t<Ps>> && ...),
                  "alternation branches must produce the same type");
    return [=](cursor& cur) -> result<parser_output_t<P>> {
        const size_t cp = cur.checkpoint();
        std::optional<parse_error> furthest;
        std::optional<parser_output_t<P>> found;

        auto attempt = [&](auto& parser) {
            if (found) {
                return;
            }
            auto r = parser(cur);
            if (r) {
                found.emplace(std::move(*r));
                return;
            }
            cur.restore(cp);
            if (!furthest || r.error().offset >= furthest->offset) {
                furthest = std::move(r).error();
            }
        };

        attempt(first);
        (attempt(rest), ...);

        if (found) {
            return std::move(*found);
        }
        return std::unexpected(std::move(*furthest));
    };
}

// p (sep p)* with the usual count bounds. A separator not followed by an item
// is left unconsumed.
template <typename P, typename S>
auto separated(P p, S sep, size_t min = 0, size_t max = unbounded) {
    return [p, sep, min, max](cursor& cur) -> result<spanned<std::vector<parser_output_t<P>>>> {
        const size_t cp = cur.checkpoint();
        std::vector<parser_output_t<P>> items;
        std::optional<parse_error> last_error;

        while (items.size() < max) {
            const size_t before = cur.checkpoint();
            if (!items.empty()) {
                auto s = sep(cur);
                if (!s) {
                    cur.restore(before);
                    last_error = std::move(s).error();
                    break;
                }
            }
            auto r = p(cur);
            if (!r) {
                cur.restore(before);
                last_error = std::move(r).error();
                break;
            }
            items.push_back(std::move(*r));
        }

        if (items.size() < min) {
            cur.restore(cp);
            size_t at = last_error ? last_error->offset : cur.position();
            return fail(error_code::too_few_repetitions, at,
                        last_error ? last_error->expected : std::string_view{});
        }
        return spanned<std::vector<parser_output_t<P>>>{std::move(items), cur.span_from(cp)};
    };
}

// The raw text consumed by p.
template <typename P> auto recognize(P p) {
    return [p](cursor& cur) -> result<spanned<std::string_view>> {
        auto r = p(cur);
        if (!r) {
            return std::unexpected(std::move(r).error());
        }
        return spanned<std::string_view>{cur.view(r->span), r->span};
    };
}

// Transforms the value; the span is untouched.
template <typename P, typename F> auto map(P p, F f) {
    using U = std::invoke_result_t<F&, parser_value_t<P>&&>;
    return [p, f](cursor& cur) -> result<spanned<U>> {
        auto r = p(cur);
        if (!r) {
            return std::unexpected(std::move(r).error());
        }
        return spanned<U>{f(std::move(r->value)), r->span};
    };
}

} // namespace spanx::combinators
