/**
 * @file alphabet.hpp
 * @brief Base-32 geohash alphabet and its inverse table.
 *
 * The alphabet skips 'a', 'i', 'l' and 'o'. Both lookup directions are
 * derived from ALPHABET so they cannot disagree.
 */

#ifndef GEOHASH_ALPHABET_HPP
#define GEOHASH_ALPHABET_HPP

#include <array>

#include "config.hpp"

namespace geohash {

inline constexpr char ALPHABET[] = "0123456789bcdefghjkmnpqrstuvwxyz";
inline constexpr std::size_t ALPHABET_SIZE = sizeof(ALPHABET) - 1;

static_assert(ALPHABET_SIZE == (1U << BITS_PER_CHAR), "alphabet must hold 2^5 symbols");

namespace detail {

inline constexpr std::array<std::int8_t, 128> make_index_table() noexcept {
    std::array<std::int8_t, 128> table{};
    for (auto& entry : table) {
        entry = -1;
    }
    for (std::size_t i = 0; i < ALPHABET_SIZE; ++i) {
        table[static_cast<unsigned char>(ALPHABET[i])] = static_cast<std::int8_t>(i);
    }
    return table;
}

inline constexpr std::array<std::int8_t, 128> INDEX_TABLE = make_index_table();

} // namespace detail

/**
 * @brief Symbol for a 5-bit value.
 * @param index Value in 0..31 (higher bits are ignored)
 */
constexpr char symbol(std::uint32_t index) noexcept {
    return ALPHABET[index & (ALPHABET_SIZE - 1)];
}

/**
 * @brief 5-bit value of a symbol.
 * @return 0..31, or -1 if @p c is not in the alphabet
 */
constexpr int index_of(char c) noexcept {
    auto code = static_cast<unsigned char>(c);
    if (code >= detail::INDEX_TABLE.size()) {
        return -1;
    }
    return detail::INDEX_TABLE[code];
}

constexpr bool is_symbol(char c) noexcept {
    return index_of(c) >= 0;
}

} // namespace geohash

#endif // GEOHASH_ALPHABET_HPP
