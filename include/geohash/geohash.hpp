/**
 * @file geohash.hpp
 * @brief High-level geohash API over text.
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
 * Provides location_to_hash() and hash_to_location() for callers holding
 * strings or raw degrees rather than model objects. Location text is
 * "lat, lon", "lat,lon" or "lat lon"; latitude always comes first.
 *
 * @see https://en.wikipedia.org/wiki/Geohash
 */

#ifndef GEOHASH_HPP
#define GEOHASH_HPP

#include <string>

#include "alphabet.hpp"
#include "bits.hpp"
#include "config.hpp"
#include "coordinate.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "hash.hpp"
#include "interval.hpp"

namespace geohash {

/**
 * @brief Encode location text with the shortest preserving precision.
 *
 * @param location Location text
 * @param[out] hash Hash string, written only on success
 * @return Error::Ok or the first error met
 */
inline Error location_to_hash(const std::string& location, std::string& hash) {
    Coordinate coordinate;
    auto result = Coordinate::parse(location, coordinate);
    if (result != Error::Ok) {
        return result;
    }

    GeoHash encoded;
    result = encode(coordinate, encoded);
    if (result != Error::Ok) {
        return result;
    }

    hash = encoded.to_string();
    return Error::Ok;
}

/**
 * @brief Encode location text at a fixed precision.
 */
inline Error location_to_hash(const std::string& location, std::size_t precision,
                              std::string& hash) {
    Coordinate coordinate;
    auto result = Coordinate::parse(location, coordinate);
    if (result != Error::Ok) {
        return result;
    }

    GeoHash encoded;
    result = encode(coordinate, precision, encoded);
    if (result != Error::Ok) {
        return result;
    }

    hash = encoded.to_string();
    return Error::Ok;
}

/**
 * @brief Encode degrees with the shortest preserving precision.
 */
inline Error location_to_hash(double latitude, double longitude, std::string& hash) {
    Coordinate coordinate;
    auto result = Coordinate::create(latitude, longitude, coordinate);
    if (result != Error::Ok) {
        return result;
    }

    GeoHash encoded;
    result = encode(coordinate, encoded);
    if (result != Error::Ok) {
        return result;
    }

    hash = encoded.to_string();
    return Error::Ok;
}

/**
 * @brief Encode degrees at a fixed precision.
 */
inline Error location_to_hash(double latitude, double longitude, std::size_t precision,
                              std::string& hash) {
    Coordinate coordinate;
    auto result = Coordinate::create(latitude, longitude, coordinate);
    if (result != Error::Ok) {
        return result;
    }

    GeoHash encoded;
    result = encode(coordinate, precision, encoded);
    if (result != Error::Ok) {
        return result;
    }

    hash = encoded.to_string();
    return Error::Ok;
}

/**
 * @brief Decode a hash string to "lat, lon" text.
 *
 * @param hash Hash string
 * @param[out] location Rendered cell center, written only on success
 * @return Error::Ok, Error::InvalidHashLength or Error::InvalidHashCharacter
 */
inline Error hash_to_location(const std::string& hash, std::string& location) {
    GeoHash parsed;
    auto result = GeoHash::create(hash, parsed);
    if (result != Error::Ok) {
        return result;
    }

    Coordinate coordinate;
    result = decode(parsed, coordinate);
    if (result != Error::Ok) {
        return result;
    }

    location = coordinate.to_string();
    return Error::Ok;
}

/**
 * @brief Decode a hash string to its unrounded cell.
 */
inline Error hash_to_bounds(const std::string& hash, Cell& bounds) {
    GeoHash parsed;
    auto result = GeoHash::create(hash, parsed);
    if (result != Error::Ok) {
        return result;
    }
    return decode_cell(parsed, bounds);
}

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "0.1.0";
}

} // namespace geohash

#endif // GEOHASH_HPP
