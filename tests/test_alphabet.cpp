/**
 * @file test_alphabet.cpp
 * @brief Unit tests for the base-32 alphabet tables.
 */

#include <catch2/catch_test_macros.hpp>
#include <geohash/alphabet.hpp>

#include <string>

using namespace geohash;

TEST_CASE("Alphabet size and order", "[alphabet]") {
    REQUIRE(ALPHABET_SIZE == 32);
    REQUIRE(std::string(ALPHABET) == "0123456789bcdefghjkmnpqrstuvwxyz");
    REQUIRE(symbol(0) == '0');
    REQUIRE(symbol(10) == 'b');
    REQUIRE(symbol(31) == 'z');
}

TEST_CASE("Alphabet lookups are inverse", "[alphabet]") {
    for (std::uint32_t i = 0; i < ALPHABET_SIZE; ++i) {
        INFO("index " << i);
        REQUIRE(index_of(symbol(i)) == static_cast<int>(i));
    }
}

TEST_CASE("Alphabet rejects ambiguous letters", "[alphabet]") {
    for (char c : {'a', 'i', 'l', 'o'}) {
        INFO("char " << c);
        REQUIRE_FALSE(is_symbol(c));
        REQUIRE(index_of(c) == -1);
    }
}

TEST_CASE("Alphabet rejects uppercase and punctuation", "[alphabet]") {
    for (char c = 'A'; c <= 'Z'; ++c) {
        INFO("char " << c);
        REQUIRE_FALSE(is_symbol(c));
    }
    REQUIRE_FALSE(is_symbol(' '));
    REQUIRE_FALSE(is_symbol(','));
    REQUIRE_FALSE(is_symbol('\0'));
    REQUIRE_FALSE(is_symbol(static_cast<char>(0xC3)));
}

TEST_CASE("Alphabet tables usable at compile time", "[alphabet]") {
    static_assert(index_of('u') == 26);
    static_assert(symbol(26) == 'u');
    static_assert(!is_symbol('o'));
    SUCCEED();
}
