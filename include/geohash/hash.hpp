/**
 * @file hash.hpp
 * @brief Validated geohash string.
 *
 * A GeoHash holds 1 to MAX_PRECISION characters of the base-32 alphabet.
 * Uppercase input is rejected rather than folded.
 */

#ifndef GEOHASH_HASH_HPP
#define GEOHASH_HASH_HPP

#include <string>

#include "alphabet.hpp"
#include "config.hpp"
#include "error.hpp"

namespace geohash {

class GeoHash {
public:
    /**
     * @brief The one-character cell holding the origin.
     */
    GeoHash() : value_("7") {}

#if !GEOHASH_NO_EXCEPTIONS
    /**
     * @brief Checked constructor.
     * @throws InvalidHashException carrying InvalidHashLength or
     *         InvalidHashCharacter
     */
    explicit GeoHash(const std::string& text);
#endif

    /**
     * @brief Validate and wrap a hash string.
     *
     * @param text Candidate hash
     * @param[out] out Written only on success
     * @return Error::Ok, Error::InvalidHashLength or Error::InvalidHashCharacter
     */
    static Error create(const std::string& text, GeoHash& out) noexcept;

    /**
     * @brief Check a string without building a GeoHash.
     */
    static Error validate(const std::string& text) noexcept;

    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] std::string to_string() const { return value_; }

    /// Precision of the hash (number of characters)
    [[nodiscard]] std::size_t length() const noexcept { return value_.size(); }

    bool operator==(const GeoHash& other) const noexcept { return value_ == other.value_; }
    bool operator!=(const GeoHash& other) const noexcept { return value_ != other.value_; }

private:
    std::string value_;
};

} // namespace geohash

#endif // GEOHASH_HASH_HPP
