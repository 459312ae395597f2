/**
 * @file coordinate.cpp
 * @brief Coordinate validation, parsing and formatting.
 */

#include <geohash/coordinate.hpp>

#include <charconv>
#include <cmath>
#include <system_error>

namespace geohash {

namespace {

// Separators in priority order
constexpr const char* SEPARATORS[] = {", ", ",", " "};

// Largest buffer fixed notation can need: denormals print ~330 digits
constexpr std::size_t FORMAT_BUFFER = 512;

bool in_range(double latitude, double longitude) noexcept {
    return latitude >= LATITUDE_MIN && latitude <= LATITUDE_MAX &&
           longitude >= LONGITUDE_MIN && longitude <= LONGITUDE_MAX;
}

// Plain decimal only: one optional sign, no inf or nan
bool parse_component(const char* first, const char* last, double& value) noexcept {
    if (first != last && *first == '+') {
        ++first;
        if (first != last && (*first == '-' || *first == '+')) {
            return false;
        }
    }
    if (first == last) {
        return false;
    }
    double parsed = 0.0;
    auto result = std::from_chars(first, last, parsed);
    if (result.ec != std::errc() || result.ptr != last || !std::isfinite(parsed)) {
        return false;
    }
    value = parsed;
    return true;
}

} // namespace

double round_to_digits(double value, std::size_t digits) noexcept {
    double scale = std::pow(10.0, static_cast<double>(digits));
    double scaled = value * scale;
    // 2^52: every double this large is already an integer
    if (!std::isfinite(scaled) || std::fabs(scaled) >= 4503599627370496.0) {
        return value;
    }
    return std::round(scaled) / scale;
}

std::string format_degrees(double value) {
    char buffer[FORMAT_BUFFER];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::fixed);
    if (result.ec != std::errc()) {
        return std::to_string(value);
    }

    std::string text(buffer, result.ptr);
    if (text.find('.') == std::string::npos && std::isfinite(value)) {
        text += ".0";
    }
    return text;
}

std::size_t decimal_digits(double value) {
    std::string text = format_degrees(value);
    std::size_t dot = text.find('.');
    if (dot == std::string::npos) {
        return 0;
    }
    return text.size() - dot - 1;
}

#if !GEOHASH_NO_EXCEPTIONS
Coordinate::Coordinate(double latitude, double longitude)
    : latitude_(latitude), longitude_(longitude) {
    if (!in_range(latitude, longitude)) {
        throw InvalidCoordinateException("Coordinate out of range: " + format_degrees(latitude) +
                                         ", " + format_degrees(longitude));
    }
}
#endif

Error Coordinate::create(double latitude, double longitude, Coordinate& out) noexcept {
    if (!in_range(latitude, longitude)) {
        return Error::OutOfRange;
    }

    Coordinate result;
    result.latitude_ = latitude;
    result.longitude_ = longitude;
    out = result;
    return Error::Ok;
}

Error Coordinate::parse(const std::string& text, Coordinate& out) noexcept {
    std::size_t split = std::string::npos;
    std::size_t separator_length = 0;

    for (const char* separator : SEPARATORS) {
        split = text.find(separator);
        if (split != std::string::npos) {
            separator_length = std::char_traits<char>::length(separator);
            break;
        }
    }

    if (split == std::string::npos) {
        return Error::InvalidCoordinateText;
    }

    const char* begin = text.data();
    const char* end = begin + text.size();

    double latitude = 0.0;
    double longitude = 0.0;
    if (!parse_component(begin, begin + split, latitude) ||
        !parse_component(begin + split + separator_length, end, longitude)) {
        return Error::InvalidCoordinateText;
    }

    return create(latitude, longitude, out);
}

std::string Coordinate::to_string() const {
    return format_degrees(latitude_) + ", " + format_degrees(longitude_);
}

Coordinate Coordinate::rounded(std::size_t latitude_digits,
                               std::size_t longitude_digits) const noexcept {
    Coordinate result;
    result.latitude_ = round_to_digits(latitude_, latitude_digits);
    result.longitude_ = round_to_digits(longitude_, longitude_digits);
    return result;
}

} // namespace geohash
