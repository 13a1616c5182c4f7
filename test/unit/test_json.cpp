#include "spanx/core/json.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

using namespace spanx;
using namespace spanx::json;

namespace {

span S(size_t start, size_t end) {
    return span::make(start, end).value();
}

// Every node's span must slice back to text that parses to the same kind.
void expect_round_trip(std::string_view text, const spanned<value>& node) {
    auto again = parse_json(slice(text, node.span));
    ASSERT_TRUE(again) << slice(text, node.span);
    EXPECT_EQ(again->value.type(), node->type());
    EXPECT_EQ(again->span.len(), node.span.len());

    if (const auto* elements = node->as_array()) {
        for (const auto& e : *elements) {
            EXPECT_TRUE(node.contains(e));
            expect_round_trip(text, e);
        }
    } else if (const auto* members = node->as_object()) {
        for (const auto& m : *members) {
            EXPECT_TRUE(node.contains(m));
            EXPECT_TRUE(m.contains(m->key));
            EXPECT_TRUE(m.contains(m->value));
            expect_round_trip(text, m->value);
        }
    }
}

} // namespace

TEST(JsonParser, Scalars) {
    auto t = parse_json(std::string_view("true"));
    ASSERT_TRUE(t);
    ASSERT_NE(t->value.as_bool(), nullptr);
    EXPECT_TRUE(*t->value.as_bool());

    auto n = parse_json(std::string_view("  null  "));
    ASSERT_TRUE(n);
    EXPECT_TRUE(n->value.is_null());
    EXPECT_EQ(n->span, S(2, 6));

    auto f = parse_json(std::string_view("false"));
    ASSERT_TRUE(f);
    EXPECT_EQ(f->value.type(), kind::boolean);
    EXPECT_FALSE(*f->value.as_bool());
}

TEST(JsonParser, Numbers) {
    auto i = parse_json(std::string_view("-42"));
    ASSERT_TRUE(i);
    const auto* num = i->value.as_number();
    ASSERT_NE(num, nullptr);
    EXPECT_EQ(num->raw, "-42");
    EXPECT_TRUE(num->is_integer());
    EXPECT_EQ(*num->integer, -42);
    EXPECT_DOUBLE_EQ(num->real, -42.0);

    auto d = parse_json(std::string_view("3.25e2"));
    ASSERT_TRUE(d);
    EXPECT_FALSE(d->value.as_number()->is_integer());
    EXPECT_DOUBLE_EQ(d->value.as_number()->real, 325.0);

    auto big = parse_json(std::string_view("12345678901234567890"));
    ASSERT_TRUE(big);
    EXPECT_FALSE(big->value.as_number()->is_integer());
    EXPECT_DOUBLE_EQ(big->value.as_number()->real, 12345678901234567890.0);

    auto zero = parse_json(std::string_view("0"));
    ASSERT_TRUE(zero);
    EXPECT_EQ(*zero->value.as_number()->integer, 0);
    EXPECT_FALSE(zero->value.as_number()->clamped);
}

TEST(JsonParser, NumbersBeyondDoubleRange) {
    struct test_case {
        std::string_view text;
        double real;
    };
    std::vector<test_case> cases = {
        {"1e400", HUGE_VAL},
        {"-1e400", -HUGE_VAL},
        {"1e-400", 0.0},
        {"-1e-400", -0.0},
        {"4.9e-325", 0.0},
        {"0.0000001e-320", 0.0},
        {"123456789e999999999999999999999", HUGE_VAL},
    };
    for (const auto& tc : cases) {
        auto r = parse_json(tc.text);
        ASSERT_TRUE(r) << tc.text << ": " << r.error().describe();
        const auto* num = r->value.as_number();
        ASSERT_NE(num, nullptr);
        EXPECT_TRUE(num->clamped) << tc.text;
        EXPECT_EQ(num->real, tc.real) << tc.text;
        EXPECT_EQ(std::signbit(num->real), std::signbit(tc.real)) << tc.text;
        EXPECT_EQ(num->raw, tc.text);
        EXPECT_EQ(r->span, S(0, tc.text.size()));
    }

    std::string_view text = R"({"big": [1e400, -1e-400]})";
    auto doc = parse_json(text);
    ASSERT_TRUE(doc);
    const auto* small = doc->value.get("big.1");
    ASSERT_NE(small, nullptr);
    EXPECT_EQ(slice(text, small->span), "-1e-400");
    expect_round_trip(text, *doc);
}

TEST(JsonParser, FailureLeavesCursorInPlace) {
    for (std::string_view body : {"[1,", R"({"a":1} x)", R"({"a": [true, nul]})", "\"open"}) {
        std::string text = "> ";
        text.append(body);
        cursor cur{std::string_view(text)};
        ASSERT_TRUE(cur.expect_literal("> "));

        auto r = parse_json(cur);
        ASSERT_FALSE(r) << body;
        EXPECT_EQ(cur.offset(), 2u) << body;
    }

    cursor cur(std::string_view(R"({"a":1} x)"));
    auto allowed = parse_json(cur, json_options{MAX_DEPTH, trailing_policy::allow});
    ASSERT_TRUE(allowed);
    EXPECT_EQ(cur.offset(), 7u);
}

TEST(JsonParser, InvalidNumbers) {
    struct test_case {
        std::string_view text;
        error_code code;
        size_t offset;
    };
    std::vector<test_case> cases = {
        {"01", error_code::invalid_number, 1},
        {"-", error_code::unexpected_eof, 1},
        {"-a", error_code::invalid_number, 1},
        {"1.", error_code::unexpected_eof, 2},
        {"1.e5", error_code::invalid_number, 2},
        {"1e", error_code::unexpected_eof, 2},
        {"1e+x", error_code::invalid_number, 3},
        {"+1", error_code::unexpected_token, 0},
        {".5", error_code::unexpected_token, 0},
    };
    for (const auto& tc : cases) {
        auto r = parse_json(tc.text);
        ASSERT_FALSE(r) << tc.text;
        EXPECT_TRUE(r.error().is(tc.code)) << tc.text << ": " << r.error().describe();
        EXPECT_EQ(r.error().offset, tc.offset) << tc.text;
    }
}

TEST(JsonParser, StringEscapes) {
    std::string_view text = R"("a\n")";
    auto r = parse_json(text);
    ASSERT_TRUE(r);
    const auto* s = r->value.as_string();
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->decoded, "a\n");
    EXPECT_EQ(s->raw, text);
    EXPECT_EQ(r->span, S(0, 5));

    auto all = parse_json(std::string_view(R"("\"\\\/\b\f\n\r\t")"));
    ASSERT_TRUE(all);
    EXPECT_EQ(all->value.as_string()->decoded, "\"\\/\b\f\n\r\t");
}

TEST(JsonParser, UnicodeEscapes) {
    auto bmp = parse_json(std::string_view(R"("\u00e9\u20AC")"));
    ASSERT_TRUE(bmp);
    EXPECT_EQ(bmp->value.as_string()->decoded, "\xc3\xa9\xe2\x82\xac");

    auto pair = parse_json(std::string_view(R"("\ud83d\ude00")"));
    ASSERT_TRUE(pair);
    EXPECT_EQ(pair->value.as_string()->decoded, "\xf0\x9f\x98\x80");

    auto raw_utf8 = parse_json(std::string_view("\"caf\xc3\xa9\""));
    ASSERT_TRUE(raw_utf8);
    EXPECT_EQ(raw_utf8->value.as_string()->decoded, "caf\xc3\xa9");
}

TEST(JsonParser, InvalidEscapes) {
    struct test_case {
        std::string_view text;
        error_code code;
        size_t offset;
    };
    std::vector<test_case> cases = {
        {R"("\x")", error_code::invalid_escape, 1},
        {R"("\u12G4")", error_code::invalid_escape, 5},
        {R"("\ude00")", error_code::invalid_escape, 1},
        {R"("\ud83d")", error_code::invalid_escape, 1},
        {R"("\ud83dx")", error_code::invalid_escape, 1},
        {R"("ab\ud83dA")", error_code::invalid_escape, 3},
        {R"("\u12)", error_code::unexpected_eof, 5},
        {R"("\)", error_code::unexpected_eof, 2},
        {R"("abc)", error_code::unexpected_eof, 4},
    };
    for (const auto& tc : cases) {
        auto r = parse_json(tc.text);
        ASSERT_FALSE(r) << tc.text;
        EXPECT_TRUE(r.error().is(tc.code)) << tc.text << ": " << r.error().describe();
        EXPECT_EQ(r.error().offset, tc.offset) << tc.text;
    }
}

TEST(JsonParser, ControlCharacterInString) {
    auto r = parse_json(std::string_view("\"a\tb\""));
    ASSERT_FALSE(r);
    EXPECT_TRUE(r.error().is(error_code::unexpected_token));
    EXPECT_EQ(r.error().offset, 2u);
}

TEST(JsonParser, ObjectMembersAndSpans) {
    std::string_view text = R"({ "name" : "spanx", "tags": [1, 2] })";
    auto r = parse_json(text);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->span, S(0, text.size()));

    const auto* members = r->value.as_object();
    ASSERT_NE(members, nullptr);
    ASSERT_EQ(members->size(), 2u);

    const auto& name = (*members)[0];
    EXPECT_EQ(name->key->decoded, "name");
    EXPECT_EQ(slice(text, name->key.span), "\"name\"");
    EXPECT_EQ(slice(text, name->value.span), "\"spanx\"");
    EXPECT_EQ(slice(text, name.span), R"("name" : "spanx")");

    const auto& tags = (*members)[1];
    EXPECT_EQ(slice(text, tags->value.span), "[1, 2]");
    ASSERT_EQ(tags->value->as_array()->size(), 2u);
    EXPECT_EQ(slice(text, (*tags->value->as_array())[1].span), "2");
}

TEST(JsonParser, DuplicateKeysPreserved) {
    auto r = parse_json(std::string_view(R"({"a":1,"a":2})"));
    ASSERT_TRUE(r);
    ASSERT_EQ(r->value.as_object()->size(), 2u);
    const auto* first = r->value.find("a");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ((*first)->as_number()->raw, "1");
}

TEST(JsonParser, EmptyContainers) {
    auto r = parse_json(std::string_view("[ {}, [ ] ]"));
    ASSERT_TRUE(r);
    const auto* elements = r->value.as_array();
    ASSERT_EQ(elements->size(), 2u);
    EXPECT_TRUE((*elements)[0]->as_object()->empty());
    EXPECT_EQ((*elements)[0].span, S(2, 4));
    EXPECT_EQ((*elements)[1].span, S(6, 9));
}

TEST(JsonParser, StructuralErrors) {
    struct test_case {
        std::string_view text;
        error_code code;
        size_t offset;
    };
    std::vector<test_case> cases = {
        {"", error_code::unexpected_eof, 0},
        {"   ", error_code::unexpected_eof, 3},
        {"[1,]", error_code::unexpected_token, 3},
        {"[1 2]", error_code::unexpected_token, 3},
        {"{\"a\" 1}", error_code::unexpected_token, 5},
        {"{\"a\":1,}", error_code::unexpected_token, 7},
        {"{1:2}", error_code::unexpected_token, 1},
        {"[1,", error_code::unexpected_eof, 3},
        {"{\"a\":", error_code::unexpected_eof, 5},
        {"tru", error_code::unexpected_eof, 3},
        {"trUe", error_code::unexpected_token, 2},
        {"nul1", error_code::unexpected_token, 3},
        {"]", error_code::unexpected_token, 0},
    };
    for (const auto& tc : cases) {
        auto r = parse_json(tc.text);
        ASSERT_FALSE(r) << tc.text;
        EXPECT_TRUE(r.error().is(tc.code)) << tc.text << ": " << r.error().describe();
        EXPECT_EQ(r.error().offset, tc.offset) << tc.text;
    }
}

TEST(JsonParser, TrailingData) {
    auto rejected = parse_json(std::string_view("{} x"));
    ASSERT_FALSE(rejected);
    EXPECT_TRUE(rejected.error().is(error_code::trailing_data));
    EXPECT_EQ(rejected.error().offset, 3u);

    EXPECT_TRUE(parse_json(std::string_view("{} \r\n")));

    json_options opts;
    opts.trailing = trailing_policy::allow;
    cursor cur(std::string_view("[1] [2]"));
    auto first = parse_json(cur, opts);
    ASSERT_TRUE(first);
    EXPECT_EQ(first->span, S(0, 3));
    EXPECT_EQ(cur.offset(), 3u);

    auto second = parse_json(cur, opts);
    ASSERT_TRUE(second);
    EXPECT_EQ(second->span, S(4, 7));
}

TEST(JsonParser, DepthLimit) {
    auto nested = [](size_t depth) {
        return std::string(depth, '[') + std::string(depth, ']');
    };

    EXPECT_TRUE(parse_json(nested(MAX_DEPTH)));

    auto too_deep = parse_json(nested(MAX_DEPTH + 1));
    ASSERT_FALSE(too_deep);
    EXPECT_TRUE(too_deep.error().is(error_code::depth_limit_exceeded));
    EXPECT_EQ(too_deep.error().offset, MAX_DEPTH);

    json_options opts;
    opts.max_depth = 2;
    EXPECT_TRUE(parse_json(std::string_view(R"({"a":[1]})"), opts));
    auto r = parse_json(std::string_view(R"({"a":[{}]})"), opts);
    ASSERT_FALSE(r);
    EXPECT_TRUE(r.error().is(error_code::depth_limit_exceeded));
    EXPECT_EQ(r.error().offset, 6u);
}

TEST(JsonParser, RoundTripBySlicing) {
    std::string_view text = R"(
        {
          "id": 7,
          "items": [ {"name": "aA", "ok": true}, null, -0.5e-3 ],
          "nested": { "deep": [ [ ], { } ] }
        }
    )";
    auto r = parse_json(text);
    ASSERT_TRUE(r);
    EXPECT_EQ(slice(text, r->span).front(), '{');
    EXPECT_EQ(slice(text, r->span).back(), '}');
    expect_round_trip(text, *r);
}

TEST(JsonPath, Lookup) {
    std::string_view text = R"({"items":[{"name":"x"},{"name":"y"}],"count":2})";
    auto r = parse_json(text);
    ASSERT_TRUE(r);

    const auto* name = r->value.get("items.1.name");
    ASSERT_NE(name, nullptr);
    EXPECT_EQ((*name)->as_string()->decoded, "y");
    EXPECT_EQ(slice(text, name->span), "\"y\"");

    EXPECT_NE(r->value.get("count"), nullptr);
    EXPECT_EQ(r->value.get("items.2"), nullptr);
    EXPECT_EQ(r->value.get("items.x"), nullptr);
    EXPECT_EQ(r->value.get("count.0"), nullptr);
    EXPECT_EQ(r->value.get("items..name"), nullptr);
    EXPECT_EQ(r->value.get(""), nullptr);
    EXPECT_EQ(r->value.get("missing"), nullptr);
}

TEST(JsonShift, RelocatesNestedSpans) {
    std::string body = R"({"a":[1,{"b":"c"}]})";
    std::string envelope = "POST / HTTP/1.1\r\n\r\n" + body;
    const size_t base = envelope.size() - body.size();

    auto r = parse_json(body);
    ASSERT_TRUE(r);
    r->value.shift(base);
    r->span = r->span.shifted(base);

    EXPECT_EQ(slice(envelope, r->span), body);
    const auto* c = r->value.get("a.1.b");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(slice(envelope, c->span), "\"c\"");
    const auto& member = (*r->value.as_object())[0];
    EXPECT_EQ(slice(envelope, member->key.span), "\"a\"");
    EXPECT_EQ(slice(envelope, member.span), R"("a":[1,{"b":"c"}])");
}

TEST(JsonShift, CursorBaseGivesSameResult) {
    std::string envelope = "prefix " R"({"k": [true]})";
    cursor cur(std::string_view(envelope).substr(7), 7);
    auto r = parse_json(cur);
    ASSERT_TRUE(r);
    const auto* v = r->value.get("k.0");
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(slice(envelope, v->span), "true");
}

namespace {

class counting_visitor : public visitor {
public:
    void visit_null(span) override { ++nulls; }
    void visit_bool(bool, span) override { ++bools; }
    void visit_number(const number& n, span) override { numbers.emplace_back(n.raw); }
    void visit_string(const string& s, span) override { strings.push_back(s.decoded); }
    void visit_key(const spanned<string>& k) override { keys.push_back(k->decoded); }

    int nulls = 0;
    int bools = 0;
    std::vector<std::string> numbers;
    std::vector<std::string> strings;
    std::vector<std::string> keys;
};

class digit_masker : public visitor {
public:
    explicit digit_masker(std::string& text) : text_(text) {}

    void visit_number(const number&, span s) override {
        text_.replace(s.start(), s.len(), std::string(s.len(), '9'));
    }

private:
    std::string& text_;
};

} // namespace

TEST(JsonVisitor, DefaultTraversalReachesEveryNode) {
    auto r = parse_json(std::string_view(R"({"a":[1,null,{"b":"x"}],"c":false,"d":2.5})"));
    ASSERT_TRUE(r);

    counting_visitor v;
    v.visit_value(*r);
    EXPECT_EQ(v.nulls, 1);
    EXPECT_EQ(v.bools, 1);
    EXPECT_EQ(v.numbers, (std::vector<std::string>{"1", "2.5"}));
    EXPECT_EQ(v.strings, (std::vector<std::string>{"x"}));
    EXPECT_EQ(v.keys, (std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST(JsonVisitor, SpansDriveInPlaceRewrite) {
    std::string text = R"({"foo": [42, 69]})";
    auto r = parse_json(text);
    ASSERT_TRUE(r);

    std::string rewritten = text;
    digit_masker masker(rewritten);
    masker.visit_value(*r);
    EXPECT_EQ(rewritten, R"({"foo": [99, 99]})");
}

TEST(JsonKind, Names) {
    EXPECT_EQ(kind_to_string(kind::object), "object");
    EXPECT_EQ(kind_to_string(kind::null), "null");
}
