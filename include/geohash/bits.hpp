/**
 * @file bits.hpp
 * @brief Interleaved subdivision bits of a geohash.
 *
 * A hash of at most MAX_PRECISION characters carries at most 60 bits, so
 * the whole bit string fits in one 64-bit word. Bits are kept right-aligned
 * with the first subdivision step as the most significant bit. Bit i
 * (counting from the first step) decides longitude when i is even and
 * latitude when i is odd. Symbol k covers bits 5k..5k+4.
 */

#ifndef GEOHASH_BITS_HPP
#define GEOHASH_BITS_HPP

#include <cstdint>

#include "config.hpp"
#include "error.hpp"

namespace geohash {

static_assert(MAX_HASH_BITS <= 64, "hash bits must fit in std::uint64_t");

class HashBits {
public:
    constexpr HashBits() noexcept = default;

    /**
     * @brief Record one subdivision step.
     * @param bit 0 for the lower half, nonzero for the upper half
     * @return Error::Ok, or Error::Overflow once MAX_HASH_BITS are held
     */
    constexpr Error push_bit(int bit) noexcept {
        if (count_ >= MAX_HASH_BITS) {
            return Error::Overflow;
        }
        bits_ = (bits_ << 1) | (bit != 0 ? 1U : 0U);
        ++count_;
        return Error::Ok;
    }

    /**
     * @brief Record the five steps carried by one alphabet symbol.
     * @param index Alphabet index, 0..31
     * @return Error::Ok, Error::InvalidArg or Error::Overflow
     */
    constexpr Error push_symbol(std::uint32_t index) noexcept {
        if (index >= (1U << BITS_PER_CHAR)) {
            return Error::InvalidArg;
        }
        if (count_ + BITS_PER_CHAR > MAX_HASH_BITS) {
            return Error::Overflow;
        }
        bits_ = (bits_ << BITS_PER_CHAR) | index;
        count_ += BITS_PER_CHAR;
        return Error::Ok;
    }

    /**
     * @brief Step @p i, counted from the first subdivision.
     * @return 0 or 1, or -1 past the end
     */
    [[nodiscard]] constexpr int bit(std::size_t i) const noexcept {
        if (i >= count_) {
            return -1;
        }
        return static_cast<int>((bits_ >> (count_ - 1 - i)) & 1U);
    }

    /**
     * @brief Alphabet index of symbol @p k.
     * @return 0..31, or 0 when fewer than 5(k+1) bits are held
     */
    [[nodiscard]] constexpr std::uint32_t symbol_index(std::size_t k) const noexcept {
        const std::size_t end = (k + 1) * BITS_PER_CHAR;
        if (end > count_) {
            return 0;
        }
        return static_cast<std::uint32_t>((bits_ >> (count_ - end)) & 0x1FU);
    }

    /// Number of whole symbols held
    [[nodiscard]] constexpr std::size_t symbols() const noexcept { return count_ / BITS_PER_CHAR; }

    [[nodiscard]] constexpr std::size_t size() const noexcept { return count_; }
    [[nodiscard]] constexpr std::uint64_t value() const noexcept { return bits_; }

    constexpr void clear() noexcept {
        bits_ = 0;
        count_ = 0;
    }

private:
    std::uint64_t bits_ = 0;
    std::size_t count_ = 0;
};

} // namespace geohash

#endif // GEOHASH_BITS_HPP
