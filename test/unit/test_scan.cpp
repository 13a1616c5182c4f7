#include "spanx/core/scan.hpp"

#include <catch2/catch_test_macros.hpp>
#include <cstring>
#include <string>

using namespace spanx::scan;

namespace {

const uint8_t* u8(const char* s) {
    return reinterpret_cast<const uint8_t*>(s);
}

} // namespace

TEST_CASE("find_crlf basic tests", "[scan]") {
    SECTION("find single CRLF") {
        const char* data = "hello\r\nworld";
        REQUIRE(find_crlf(u8(data), std::strlen(data)) == 5);
    }

    SECTION("find CRLF at start") {
        const char* data = "\r\nhello";
        REQUIRE(find_crlf(u8(data), std::strlen(data)) == 0);
    }

    SECTION("find CRLF at end") {
        const char* data = "hello\r\n";
        REQUIRE(find_crlf(u8(data), std::strlen(data)) == 5);
    }

    SECTION("no CRLF found") {
        const char* data = "hello world";
        REQUIRE(find_crlf(u8(data), std::strlen(data)) == npos);
    }

    SECTION("lone CR or LF") {
        REQUIRE(find_crlf(u8("hello\rworld"), 11) == npos);
        REQUIRE(find_crlf(u8("hello\nworld"), 11) == npos);
        REQUIRE(find_crlf(u8("\n\r"), 2) == npos);
    }

    SECTION("trailing CR only") {
        REQUIRE(find_crlf(u8("abc\r"), 4) == npos);
    }

    SECTION("empty and tiny inputs") {
        REQUIRE(find_crlf(u8(""), 0) == npos);
        REQUIRE(find_crlf(u8("\r"), 1) == npos);
    }
}

TEST_CASE("find_crlf across vector block boundaries", "[scan]") {
    // CRLF straddling every offset of a 16 and 32 byte block.
    for (size_t pos = 0; pos < 70; ++pos) {
        std::string data(pos, 'A');
        data += "\r\n";
        data += std::string(40, 'B');

        CAPTURE(pos);
        REQUIRE(find_crlf(u8(data.c_str()), data.size()) == pos);
        REQUIRE(find_crlf_scalar(u8(data.c_str()), data.size()) == pos);
    }
}

TEST_CASE("find_crlf agrees with the scalar scan", "[scan]") {
    std::string large_data(10000, 'X');
    for (size_t i = 100; i < large_data.size(); i += 997) {
        large_data[i] = '\r';
    }
    large_data += "\r\n";

    size_t scalar_result = find_crlf_scalar(u8(large_data.c_str()), large_data.size());
    size_t simd_result = find_crlf(u8(large_data.c_str()), large_data.size());

    REQUIRE(scalar_result == large_data.size() - 2);
    REQUIRE(scalar_result == simd_result);
}

TEST_CASE("find_byte", "[scan]") {
    REQUIRE(find_byte(u8("a:b"), 3, ':') == 1);
    REQUIRE(find_byte(u8("abc"), 3, ':') == npos);
    REQUIRE(find_byte(u8(""), 0, ':') == npos);
}

TEST_CASE("find_pattern tests", "[scan]") {
    SECTION("find simple pattern") {
        const char* haystack = "hello world hello";
        REQUIRE(find_pattern(u8(haystack), std::strlen(haystack), u8("world"), 5) == 6);
    }

    SECTION("pattern not found") {
        const char* haystack = "hello world";
        REQUIRE(find_pattern(u8(haystack), std::strlen(haystack), u8("xyz"), 3) == npos);
    }

    SECTION("needle longer than haystack") {
        REQUIRE(find_pattern(u8("ab"), 2, u8("abc"), 3) == npos);
    }

    SECTION("empty needle matches at start") {
        REQUIRE(find_pattern(u8("hello"), 5, u8(""), 0) == 0);
    }

    SECTION("CRLF needle takes the vector path") {
        const char* haystack = "GET / HTTP/1.1\r\n";
        REQUIRE(find_pattern(u8(haystack), std::strlen(haystack), u8("\r\n"), 2) == 14);
    }

    SECTION("multi byte delimiter") {
        const char* haystack = "head\r\n\r\nbody";
        REQUIRE(find_pattern(u8(haystack), std::strlen(haystack), u8("\r\n\r\n"), 4) == 4);
    }
}
