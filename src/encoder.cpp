/**
 * @file encoder.cpp
 * @brief Geohash encoding and precision search.
 */

#include <geohash/encoder.hpp>

#include <geohash/alphabet.hpp>
#include <geohash/bits.hpp>
#include <geohash/decoder.hpp>
#include <geohash/interval.hpp>

namespace geohash {

namespace {

bool rounds_to(const Interval& interval, double value, std::size_t digits) noexcept {
    return round_to_digits(interval.min, digits) == value &&
           round_to_digits(interval.max, digits) == value;
}

} // namespace

Error encode(const Coordinate& coordinate, std::size_t precision, GeoHash& out) noexcept {
    if (precision < MIN_PRECISION || precision > MAX_PRECISION) {
        return Error::InvalidPrecision;
    }

    Interval latitude = Interval::latitude();
    Interval longitude = Interval::longitude();
    HashBits bits;

    // Interleave: even steps longitude, odd steps latitude
    const std::size_t total_bits = precision * BITS_PER_CHAR;
    for (std::size_t i = 0; i < total_bits; ++i) {
        int bit;
        if ((i & 1U) == 0) {
            bit = longitude.bit_for(coordinate.longitude());
            longitude = longitude.narrow(bit);
        } else {
            bit = latitude.bit_for(coordinate.latitude());
            latitude = latitude.narrow(bit);
        }

        auto result = bits.push_bit(bit);
        if (result != Error::Ok) {
            return result;
        }
    }

    // At most MAX_PRECISION characters: stays within the small-string buffer
    std::string text;
    for (std::size_t k = 0; k < bits.symbols(); ++k) {
        text += symbol(bits.symbol_index(k));
    }

    return GeoHash::create(text, out);
}

Error encode(const Coordinate& coordinate, GeoHash& out) noexcept {
    const std::size_t lat_digits = coordinate.latitude_digits();
    const std::size_t lon_digits = coordinate.longitude_digits();

    for (std::size_t precision = MIN_PRECISION; precision <= MAX_PRECISION; ++precision) {
        GeoHash candidate;
        auto result = encode(coordinate, precision, candidate);
        if (result != Error::Ok) {
            return result;
        }

        Coordinate center;
        result = decode(candidate, center);
        if (result != Error::Ok) {
            return result;
        }
        if (center.rounded(lat_digits, lon_digits) != coordinate) {
            continue;
        }

        Cell cell;
        result = decode_cell(candidate, cell);
        if (result != Error::Ok) {
            return result;
        }
        if (rounds_to(cell.latitude, coordinate.latitude(), lat_digits) &&
            rounds_to(cell.longitude, coordinate.longitude(), lon_digits)) {
            out = candidate;
            return Error::Ok;
        }
    }

    return Error::PrecisionUnattainable;
}

} // namespace geohash
