/**
 * @file encoder.hpp
 * @brief Coordinate to geohash encoding.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _____                                   ____
 * |_   _|_ _ _ __   __ _  __ _ _ __ __ _  / ___| _ __   __ _  ___ ___
 *   | |/ _` | '_ \ / _` |/ _` | '__/ _` | \___ \| '_ \ / _` |/ __/ _ \
 *   | | (_| | | | | (_| | (_| | | | (_| |  ___) | |_) | (_| | (_|  __/
 *   |_|\__,_|_| |_|\__,_|\__, |_|  \__,_| |____/| .__/ \__,_|\___\___|
 *                        |___/                  |_|
 * ============================================================================
 * @endcond
 *
 * A hash of P characters carries 5P bits. Longitude takes the even bit
 * positions and latitude the odd ones, so longitude leads and receives
 * the extra bit when 5P is odd:
 * - latitude bits  = floor(5P / 2)
 * - longitude bits = ceil(5P / 2)
 *
 * @see https://en.wikipedia.org/wiki/Geohash
 */

#ifndef GEOHASH_ENCODER_HPP
#define GEOHASH_ENCODER_HPP

#include "config.hpp"
#include "coordinate.hpp"
#include "error.hpp"
#include "hash.hpp"
#include "interval.hpp"

namespace geohash {

/**
 * @brief Encode a coordinate at a fixed precision.
 *
 * @param coordinate Point to encode
 * @param precision Hash length, MIN_PRECISION..MAX_PRECISION
 * @param[out] out Hash of the cell containing @p coordinate
 * @return Error::Ok, or Error::InvalidPrecision
 */
Error encode(const Coordinate& coordinate, std::size_t precision, GeoHash& out) noexcept;

/**
 * @brief Encode with the shortest precision that preserves the input.
 *
 * The decimal digits of each component are taken from its text form.
 * Precisions are tried from MIN_PRECISION upwards; a candidate is kept
 * when its decoded center and both bounds of its cell round back to the
 * input on each axis.
 *
 * @param coordinate Point to encode
 * @param[out] out Shortest preserving hash
 * @return Error::Ok, or Error::PrecisionUnattainable
 */
Error encode(const Coordinate& coordinate, GeoHash& out) noexcept;

} // namespace geohash

#endif // GEOHASH_ENCODER_HPP
