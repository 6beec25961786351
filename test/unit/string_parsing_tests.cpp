// Unit tests for string parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"

using namespace palm::util;

TEST_CASE("SafeParseInt - bounds and garbage", "[util][string_parsing]") {
    SECTION("Values inside the range parse") {
        REQUIRE(SafeParseInt("42", 0, 100) == 42);
        REQUIRE(SafeParseInt("-50", -100, 100) == -50);
        REQUIRE(SafeParseInt("0", 0, 100) == 0);
        REQUIRE(SafeParseInt("100", 0, 100) == 100);
    }

    SECTION("Out of range") {
        REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("999999999999999999999", 0, 100).has_value());
    }

    SECTION("Not a whole number") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("42.5", 0, 100).has_value());
    }
}

TEST_CASE("SafeParsePort", "[util][string_parsing]") {
    REQUIRE(SafeParsePort("1") == 1);
    REQUIRE(SafeParsePort("9000") == 9000);
    REQUIRE(SafeParsePort("65535") == 65535);

    REQUIRE_FALSE(SafeParsePort("0").has_value());
    REQUIRE_FALSE(SafeParsePort("65536").has_value());
    REQUIRE_FALSE(SafeParsePort("-1").has_value());
    REQUIRE_FALSE(SafeParsePort("http").has_value());
}

TEST_CASE("IsValidHex", "[util][string_parsing]") {
    REQUIRE(IsValidHex("deadBEEF"));
    REQUIRE(IsValidHex("0123456789abcdef"));

    REQUIRE_FALSE(IsValidHex(""));
    REQUIRE_FALSE(IsValidHex("DE AD"));
    REQUIRE_FALSE(IsValidHex("0x12"));
    REQUIRE_FALSE(IsValidHex("g0"));
}

TEST_CASE("ParseHexBytes - console payload syntax", "[util][string_parsing]") {
    SECTION("Pairs separated by spaces") {
        auto bytes = ParseHexBytes("DE AD BE EF");
        REQUIRE(bytes.has_value());
        REQUIRE(*bytes == std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF});
    }

    SECTION("Unseparated and mixed case") {
        auto bytes = ParseHexBytes("deADbeEF");
        REQUIRE(bytes.has_value());
        REQUIRE(*bytes == std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF});
    }

    SECTION("Any whitespace is ignored, even inside a pair") {
        auto bytes = ParseHexBytes("\t0 1\n02  ");
        REQUIRE(bytes.has_value());
        REQUIRE(*bytes == std::vector<uint8_t>{0x01, 0x02});
    }

    SECTION("Empty input is an empty payload") {
        auto bytes = ParseHexBytes("   ");
        REQUIRE(bytes.has_value());
        REQUIRE(bytes->empty());
    }

    SECTION("Odd number of digits") {
        REQUIRE_FALSE(ParseHexBytes("DE A").has_value());
        REQUIRE_FALSE(ParseHexBytes("F").has_value());
    }

    SECTION("Non-hex characters") {
        REQUIRE_FALSE(ParseHexBytes("DE AD ZZ").has_value());
        REQUIRE_FALSE(ParseHexBytes("0xDE").has_value());
        REQUIRE_FALSE(ParseHexBytes("DE,AD").has_value());
    }
}

TEST_CASE("HexEncodeFormatted", "[util][string_parsing]") {
    REQUIRE(HexEncodeFormatted({0xDE, 0xAD, 0xBE, 0xEF}) == "DE AD BE EF");
    REQUIRE(HexEncodeFormatted({0x00, 0x0a}) == "00 0A");
    REQUIRE(HexEncodeFormatted({0x7f}) == "7F");
    REQUIRE(HexEncodeFormatted({}).empty());

    // What is printed can be typed back in
    std::vector<uint8_t> data{0x01, 0x23, 0x45, 0x67, 0x89, 0xab, 0xcd, 0xef};
    REQUIRE(ParseHexBytes(HexEncodeFormatted(data)) == data);
}

TEST_CASE("Trim", "[util][string_parsing]") {
    REQUIRE(Trim("  hello  ") == "hello");
    REQUIRE(Trim("\t:quit\r\n") == ":quit");
    REQUIRE(Trim("a b") == "a b");
    REQUIRE(Trim("   ").empty());
    REQUIRE(Trim("").empty());
}
