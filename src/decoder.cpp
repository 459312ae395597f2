/**
 * @file decoder.cpp
 * @brief Geohash decoding.
 */

#include <geohash/decoder.hpp>

#include <geohash/alphabet.hpp>
#include <geohash/bits.hpp>

namespace geohash {

Error decode_cell(const GeoHash& hash, Cell& out) noexcept {
    HashBits bits;
    for (char c : hash.value()) {
        auto result = bits.push_symbol(static_cast<std::uint32_t>(index_of(c)));
        if (result != Error::Ok) {
            return result;
        }
    }

    // De-interleave: even steps longitude, odd steps latitude
    Cell cell;
    for (std::size_t i = 0; i < bits.size(); ++i) {
        const int bit = bits.bit(i);
        if ((i & 1U) == 0) {
            cell.longitude = cell.longitude.narrow(bit);
        } else {
            cell.latitude = cell.latitude.narrow(bit);
        }
    }

    out = cell;
    return Error::Ok;
}

Error decode(const GeoHash& hash, Coordinate& out) noexcept {
    Cell cell;
    auto result = decode_cell(hash, cell);
    if (result != Error::Ok) {
        return result;
    }

    const std::size_t precision = hash.length();
    const double latitude =
        round_to_digits(cell.latitude.mid, rounding_digits(latitude_bits(precision)));
    const double longitude =
        round_to_digits(cell.longitude.mid, rounding_digits(longitude_bits(precision)));

    return Coordinate::create(latitude, longitude, out);
}

} // namespace geohash
