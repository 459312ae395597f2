/**
 * @file config.hpp
 * @brief Geohash compile-time configuration.
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
 * Geohash: interleaved binary subdivision of latitude and longitude,
 * base-32 encoded.
 *
 * @see https://en.wikipedia.org/wiki/Geohash
 */

#ifndef GEOHASH_CONFIG_HPP
#define GEOHASH_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace geohash {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 1;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Longest hash in characters (bits per axis must stay below 32)
#ifndef GEOHASH_MAX_PRECISION
#define GEOHASH_MAX_PRECISION 12U
#endif

inline constexpr std::size_t MIN_PRECISION = 1U;
inline constexpr std::size_t MAX_PRECISION = GEOHASH_MAX_PRECISION;
inline constexpr std::size_t BITS_PER_CHAR = 5U;
inline constexpr std::size_t MAX_HASH_BITS = MAX_PRECISION * BITS_PER_CHAR;

static_assert(MAX_PRECISION >= MIN_PRECISION && MAX_PRECISION <= 12U,
              "GEOHASH_MAX_PRECISION must be in 1..12");

inline constexpr double LATITUDE_MIN = -90.0;
inline constexpr double LATITUDE_MAX = 90.0;
inline constexpr double LONGITUDE_MIN = -180.0;
inline constexpr double LONGITUDE_MAX = 180.0;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define GEOHASH_NO_EXCEPTIONS=1 to compile out the throwing constructors.
 * @{
 */
#ifndef GEOHASH_NO_EXCEPTIONS
#define GEOHASH_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace geohash

#endif // GEOHASH_CONFIG_HPP
