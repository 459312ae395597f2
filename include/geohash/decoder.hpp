/**
 * @file decoder.hpp
 * @brief Geohash to coordinate decoding.
 *
 * Decoding replays the subdivision recorded in the hash bits and reports
 * the center of the final cell. The center is rounded per axis to
 * floor(3 * bits / 10) decimal places, roughly the resolution those bits
 * carry, so short hashes do not report spurious digits.
 *
 * @see https://en.wikipedia.org/wiki/Geohash
 */

#ifndef GEOHASH_DECODER_HPP
#define GEOHASH_DECODER_HPP

#include "config.hpp"
#include "coordinate.hpp"
#include "error.hpp"
#include "hash.hpp"
#include "interval.hpp"

namespace geohash {

/**
 * @brief Decimal places reported for an axis decoded from @p axis_bits bits.
 */
constexpr std::size_t rounding_digits(std::size_t axis_bits) noexcept {
    return (axis_bits * 3) / 10;
}

/**
 * @brief Cell denoted by a hash, unrounded.
 *
 * @param hash Hash to decode
 * @param[out] out Latitude and longitude intervals of the cell
 * @return Error::Ok
 */
Error decode_cell(const GeoHash& hash, Cell& out) noexcept;

/**
 * @brief Rounded center of the cell denoted by a hash.
 *
 * Lossy: recovers the representative point of the cell, not the exact
 * coordinate that was encoded.
 *
 * @param hash Hash to decode
 * @param[out] out Cell center
 * @return Error::Ok
 */
Error decode(const GeoHash& hash, Coordinate& out) noexcept;

} // namespace geohash

#endif // GEOHASH_DECODER_HPP
