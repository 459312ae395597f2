/**
 * @file error.hpp
 * @brief Geohash error handling.
 *
 * Provides both exception-based and error-code-based error handling.
 * The codec itself only returns error codes; exceptions are raised by the
 * checked model constructors and can be compiled out.
 */

#ifndef GEOHASH_ERROR_HPP
#define GEOHASH_ERROR_HPP

#include "config.hpp"

#if !GEOHASH_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace geohash {

/**
 * @brief Error codes returned by every codec operation.
 */
enum class Error {
    Ok = 0,                     ///< Success
    InvalidCoordinateText = -1, ///< Text is not two fully-numeric parts
    OutOfRange = -2,            ///< Latitude or longitude outside its range
    InvalidHashCharacter = -3,  ///< Character outside the base-32 alphabet
    InvalidHashLength = -4,     ///< Empty hash or longer than MAX_PRECISION
    InvalidPrecision = -5,      ///< Precision outside MIN_PRECISION..MAX_PRECISION
    PrecisionUnattainable = -6, ///< No precision round-trips the coordinate
    Overflow = -7,              ///< Hash bits full
    InvalidArg = -8             ///< Invalid argument
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidCoordinateText:
        return "Invalid coordinate text";
    case Error::OutOfRange:
        return "Coordinate out of range";
    case Error::InvalidHashCharacter:
        return "Invalid geohash character";
    case Error::InvalidHashLength:
        return "Invalid geohash length";
    case Error::InvalidPrecision:
        return "Invalid precision";
    case Error::PrecisionUnattainable:
        return "No geohash precision reproduces the coordinate";
    case Error::Overflow:
        return "Buffer overflow";
    case Error::InvalidArg:
        return "Invalid argument";
    default:
        return "Unknown error";
    }
}

#if !GEOHASH_NO_EXCEPTIONS

/**
 * @brief Base exception for geohash errors.
 */
class GeohashException : public std::runtime_error {
public:
    explicit GeohashException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for latitude/longitude pairs outside their ranges.
 */
class InvalidCoordinateException : public GeohashException {
public:
    explicit InvalidCoordinateException(const std::string& message, Error code = Error::OutOfRange)
        : GeohashException(message, code) {}
};

/**
 * @brief Exception for strings that are not geohashes.
 */
class InvalidHashException : public GeohashException {
public:
    explicit InvalidHashException(const std::string& message,
                                  Error code = Error::InvalidHashCharacter)
        : GeohashException(message, code) {}
};

#endif // !GEOHASH_NO_EXCEPTIONS

} // namespace geohash

#endif // GEOHASH_ERROR_HPP
