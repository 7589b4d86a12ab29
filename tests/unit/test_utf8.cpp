#include <catch2/catch_test_macros.hpp>
#include "zkeb/utilities/utf8.hpp"
#include <vector>
using zkeb::utilities::Utf8;
namespace {
    bool Valid(std::vector<uint8_t> bytes) {
        return Utf8::IsValid(bytes);
    }
}
TEST_CASE("Utf8 - Well-formed input", "[utf8]") {
    REQUIRE(Valid({}));
    REQUIRE(Valid({'a', 'b', 'c'}));
    REQUIRE(Valid({0xC3, 0xA9}));
    REQUIRE(Valid({0xE2, 0x82, 0xAC}));
    REQUIRE(Valid({0xF0, 0x9F, 0x94, 0x91}));
    REQUIRE(Valid({0xEF, 0xBF, 0xBF}));
    REQUIRE(Valid({0xF4, 0x8F, 0xBF, 0xBF}));
    REQUIRE(Valid({0x00}));
}
TEST_CASE("Utf8 - Malformed input", "[utf8]") {
    SECTION("Stray continuation byte") {
        REQUIRE_FALSE(Valid({0x80}));
        REQUIRE_FALSE(Valid({'a', 0xBF}));
    }
    SECTION("Overlong encodings") {
        REQUIRE_FALSE(Valid({0xC0, 0xAF}));
        REQUIRE_FALSE(Valid({0xC1, 0xBF}));
        REQUIRE_FALSE(Valid({0xE0, 0x80, 0xAF}));
        REQUIRE_FALSE(Valid({0xF0, 0x80, 0x80, 0xAF}));
    }
    SECTION("UTF-16 surrogates") {
        REQUIRE_FALSE(Valid({0xED, 0xA0, 0x80}));
        REQUIRE_FALSE(Valid({0xED, 0xBF, 0xBF}));
    }
    SECTION("Beyond U+10FFFF") {
        REQUIRE_FALSE(Valid({0xF4, 0x90, 0x80, 0x80}));
        REQUIRE_FALSE(Valid({0xF5, 0x80, 0x80, 0x80}));
        REQUIRE_FALSE(Valid({0xFF}));
    }
    SECTION("Truncated sequences") {
        REQUIRE_FALSE(Valid({0xC3}));
        REQUIRE_FALSE(Valid({0xE2, 0x82}));
        REQUIRE_FALSE(Valid({0xF0, 0x9F, 0x94}));
    }
    SECTION("Bad continuation in the middle") {
        REQUIRE_FALSE(Valid({0xE2, 0x28, 0xA1}));
        REQUIRE_FALSE(Valid({0xF0, 0x9F, 0x28, 0x91}));
    }
}
