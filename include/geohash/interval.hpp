/**
 * @file interval.hpp
 * @brief Binary subdivision state for one axis.
 *
 * Every geohash bit halves the interval of its axis. Encoding picks the
 * half containing the value; decoding replays the recorded choices.
 */

#ifndef GEOHASH_INTERVAL_HPP
#define GEOHASH_INTERVAL_HPP

#include "config.hpp"

namespace geohash {

/**
 * @brief Latitude bits in a hash of @p precision characters.
 */
constexpr std::size_t latitude_bits(std::size_t precision) noexcept {
    return (precision * BITS_PER_CHAR) / 2;
}

/**
 * @brief Longitude bits in a hash of @p precision characters.
 *
 * Longitude leads the interleave, so it takes the odd bit out.
 */
constexpr std::size_t longitude_bits(std::size_t precision) noexcept {
    return (precision * BITS_PER_CHAR + 1) / 2;
}

/**
 * @brief Axis interval as a {min, mid, max} record.
 */
struct Interval {
    double min;
    double mid;
    double max;

    static constexpr Interval latitude() noexcept {
        return {LATITUDE_MIN, 0.0, LATITUDE_MAX};
    }

    static constexpr Interval longitude() noexcept {
        return {LONGITUDE_MIN, 0.0, LONGITUDE_MAX};
    }

    /**
     * @brief Bit selecting the half that holds @p value.
     *
     * The lower half is closed on both ends, so a value equal to mid
     * yields 0.
     */
    [[nodiscard]] constexpr int bit_for(double value) const noexcept {
        return value <= mid ? 0 : 1;
    }

    /**
     * @brief Interval after one subdivision step.
     * @param bit 0 keeps the lower half, 1 the upper half
     */
    [[nodiscard]] constexpr Interval narrow(int bit) const noexcept {
        if (bit == 0) {
            return {min, (min + mid) / 2, mid};
        }
        return {mid, (mid + max) / 2, max};
    }

    [[nodiscard]] constexpr double half_width() const noexcept {
        return (max - min) / 2;
    }

    [[nodiscard]] constexpr bool contains(double value) const noexcept {
        return min <= value && value <= max;
    }

    constexpr bool operator==(const Interval& other) const noexcept {
        return min == other.min && mid == other.mid && max == other.max;
    }

    constexpr bool operator!=(const Interval& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Rectangle denoted by a geohash.
 */
struct Cell {
    Interval latitude = Interval::latitude();
    Interval longitude = Interval::longitude();
};

} // namespace geohash

#endif // GEOHASH_INTERVAL_HPP
