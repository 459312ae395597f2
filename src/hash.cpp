/**
 * @file hash.cpp
 * @brief GeoHash validation.
 */

#include <geohash/hash.hpp>

#include <utility>

namespace geohash {

Error GeoHash::validate(const std::string& text) noexcept {
    if (text.empty() || text.size() > MAX_PRECISION) {
        return Error::InvalidHashLength;
    }
    for (char c : text) {
        if (!is_symbol(c)) {
            return Error::InvalidHashCharacter;
        }
    }
    return Error::Ok;
}

#if !GEOHASH_NO_EXCEPTIONS
GeoHash::GeoHash(const std::string& text) : value_(text) {
    auto result = validate(text);
    if (result != Error::Ok) {
        throw InvalidHashException(std::string(error_string(result)) + ": \"" + text + "\"",
                                   result);
    }
}
#endif

Error GeoHash::create(const std::string& text, GeoHash& out) noexcept {
    auto result = validate(text);
    if (result != Error::Ok) {
        return result;
    }

    GeoHash hash;
    hash.value_ = text;
    out = std::move(hash);
    return Error::Ok;
}

} // namespace geohash
