#include "spanx/core/json.hpp"
#include "spanx/core/source.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace spanx;

TEST(Source, CopiesAndSharesBytes) {
    std::string text = "{\"a\":1}";
    source src = source::copy_of(text);
    text.assign("garbage");

    EXPECT_EQ(src.chars(), "{\"a\":1}");
    EXPECT_EQ(src.use_count(), 1);

    source other = src;
    EXPECT_EQ(src.use_count(), 2);
    EXPECT_EQ(other.bytes().data(), src.bytes().data());
}

TEST(Source, AdoptTakesOwnership) {
    std::vector<uint8_t> bytes{'o', 'k'};
    source src = source::adopt(std::move(bytes));
    EXPECT_EQ(src.size(), 2u);
    EXPECT_EQ(src.chars(), "ok");
}

TEST(Source, DefaultIsEmpty) {
    source src;
    EXPECT_TRUE(src.empty());
    EXPECT_TRUE(src.bytes().empty());
    EXPECT_TRUE(src.slice(span::at(0)));
    EXPECT_FALSE(src.slice(span::make(0, 1).value()));
}

TEST(Source, SliceIsBoundsChecked) {
    source src = source::copy_of(std::string_view("abcdef"));
    auto mid = src.slice(span::make(2, 4).value());
    ASSERT_TRUE(mid);
    EXPECT_EQ(*mid, "cd");

    auto raw = src.slice_bytes(span::make(0, 2).value());
    ASSERT_TRUE(raw);
    EXPECT_EQ(as_chars(*raw), "ab");

    auto past = src.slice(span::make(4, 7).value());
    ASSERT_FALSE(past);
    EXPECT_TRUE(past.error().is(error_code::invalid_range));
    EXPECT_FALSE(src.slice_bytes(span::make(6, 9).value()));
}

TEST(Source, TreeOutlivesCallerBuffer) {
    source src;
    result<spanned<json::value>> root = fail(error_code::unexpected_eof, 0);
    {
        std::string text = R"({"name": "spanx"})";
        src = source::copy_of(text);
        root = json::parse_json(src.bytes());
    }
    ASSERT_TRUE(root);
    const auto* name = (*root)->get("name");
    ASSERT_NE(name, nullptr);
    auto raw = src.slice(*name);
    ASSERT_TRUE(raw);
    EXPECT_EQ(*raw, "\"spanx\"");
}
