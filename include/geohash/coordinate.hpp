/**
 * @file coordinate.hpp
 * @brief Validated latitude/longitude pair.
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
 * A Coordinate always satisfies -90 <= latitude <= 90 and
 * -180 <= longitude <= 180. Values are produced by create() or parse(),
 * which report failures through Error, or by the checked constructor.
 *
 * @par Text format
 * "<latitude>, <longitude>", each component in its shortest fixed-notation
 * form that reads back to the same double ("57.64911", "10.0").
 *
 * @see https://en.wikipedia.org/wiki/Geohash
 */

#ifndef GEOHASH_COORDINATE_HPP
#define GEOHASH_COORDINATE_HPP

#include <string>

#include "config.hpp"
#include "error.hpp"

namespace geohash {

/**
 * @brief Round to a number of decimal places, half away from zero.
 *
 * Values already exact at that scale are returned unchanged.
 */
double round_to_digits(double value, std::size_t digits) noexcept;

/**
 * @brief Digits after the decimal point in the text form of @p value.
 * @return At least 1 ("57.0" has one)
 */
std::size_t decimal_digits(double value);

/**
 * @brief Text form of one coordinate component.
 */
std::string format_degrees(double value);

/**
 * @brief Immutable (latitude, longitude) pair in degrees.
 */
class Coordinate {
public:
    /**
     * @brief The origin (0.0, 0.0).
     */
    constexpr Coordinate() noexcept : latitude_(0.0), longitude_(0.0) {}

#if !GEOHASH_NO_EXCEPTIONS
    /**
     * @brief Checked constructor.
     * @throws InvalidCoordinateException if either value is out of range
     */
    Coordinate(double latitude, double longitude);
#endif

    /**
     * @brief Validate and build a coordinate.
     *
     * @param latitude Degrees, -90..90
     * @param longitude Degrees, -180..180
     * @param[out] out Written only on success
     * @return Error::Ok, or Error::OutOfRange
     */
    static Error create(double latitude, double longitude, Coordinate& out) noexcept;

    /**
     * @brief Parse "lat, lon", "lat,lon" or "lat lon".
     *
     * The separators are tried in that order; the first one found splits
     * the text at its first occurrence. Both parts must be complete
     * floating point numbers.
     *
     * @param text Input text
     * @param[out] out Written only on success
     * @return Error::Ok, Error::InvalidCoordinateText or Error::OutOfRange
     */
    static Error parse(const std::string& text, Coordinate& out) noexcept;

    [[nodiscard]] constexpr double latitude() const noexcept { return latitude_; }
    [[nodiscard]] constexpr double longitude() const noexcept { return longitude_; }

    /**
     * @brief Render as "<latitude>, <longitude>".
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] std::size_t latitude_digits() const { return decimal_digits(latitude_); }
    [[nodiscard]] std::size_t longitude_digits() const { return decimal_digits(longitude_); }

    /**
     * @brief Copy with both components rounded.
     *
     * Rounding cannot leave the valid range since the bounds are integral.
     */
    [[nodiscard]] Coordinate rounded(std::size_t latitude_digits,
                                     std::size_t longitude_digits) const noexcept;

    constexpr bool operator==(const Coordinate& other) const noexcept {
        return latitude_ == other.latitude_ && longitude_ == other.longitude_;
    }

    constexpr bool operator!=(const Coordinate& other) const noexcept {
        return !(*this == other);
    }

private:
    double latitude_;
    double longitude_;
};

} // namespace geohash

#endif // GEOHASH_COORDINATE_HPP
