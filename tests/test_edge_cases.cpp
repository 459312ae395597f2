/**
 * @file test_edge_cases.cpp
 * @brief Edge case tests for the geohash codec.
 *
 * Tests subdivision boundaries, poles, the antimeridian, signed zero and
 * idempotent validation.
 */

#include <catch2/catch_test_macros.hpp>
#include <geohash/geohash.hpp>

#include <string>

using namespace geohash;

static Coordinate make(double latitude, double longitude) {
    Coordinate c;
    REQUIRE(Coordinate::create(latitude, longitude, c) == Error::Ok);
    return c;
}

static std::string encoded(double latitude, double longitude, std::size_t precision) {
    GeoHash h;
    REQUIRE(encode(make(latitude, longitude), precision, h) == Error::Ok);
    return h.value();
}

static std::string auto_encoded(double latitude, double longitude) {
    GeoHash h;
    REQUIRE(encode(make(latitude, longitude), h) == Error::Ok);
    return h.value();
}

// ============================================================================
// Subdivision boundaries
// ============================================================================

TEST_CASE("Values on a mid line go to the lower half", "[edge][encoder]") {
    SECTION("equator and prime meridian") {
        REQUIRE(encoded(0.0, 0.0, 3) == "7zz");
    }

    SECTION("negative zero behaves like zero") {
        REQUIRE(encoded(-0.0, -0.0, 3) == "7zz");
        REQUIRE(auto_encoded(-0.0, 0.0) == "7zzzz");
    }

    SECTION("second level mid lines") {
        REQUIRE(auto_encoded(45.0, 90.0) == "tzzzz");
    }
}

TEST_CASE("Antimeridian", "[edge][encoder]") {
    REQUIRE(encoded(0.0, 180.0, 2) == "rz");
    REQUIRE(encoded(0.0, -180.0, 2) == "2p");
    REQUIRE(auto_encoded(0.0, -180.0) == "2pbpb");
}

TEST_CASE("Poles", "[edge][encoder]") {
    REQUIRE(encoded(90.0, 0.0, 1) == "g");
    REQUIRE(encoded(-90.0, 0.0, 1) == "5");
    REQUIRE(auto_encoded(89.9, 179.9) == "zzzzm");
}

TEST_CASE("Boundary cells decode inside range", "[edge][decoder]") {
    std::string location;

    REQUIRE(hash_to_location("z", location) == Error::Ok);
    REQUIRE(location == "68.0, 158.0");

    REQUIRE(hash_to_location("0", location) == Error::Ok);
    REQUIRE(location == "-68.0, -158.0");

    REQUIRE(hash_to_location("gz", location) == Error::Ok);
    REQUIRE(location == "87.2, -5.6");
}

// ============================================================================
// Precision range
// ============================================================================

TEST_CASE("Every precision has the expected length", "[edge][encoder]") {
    Coordinate c = make(-12.345678, 98.765432);

    for (std::size_t p = MIN_PRECISION; p <= MAX_PRECISION; ++p) {
        GeoHash h;
        REQUIRE(encode(c, p, h) == Error::Ok);
        REQUIRE(h.length() == p);
    }
}

TEST_CASE("Integral coordinates auto encode", "[edge][encoder]") {
    REQUIRE(auto_encoded(45.0, -120.0) == "9rfxv");
}

TEST_CASE("Auto precision result round trips", "[edge][encoder]") {
    const double points[][2] = {
        {57.64911, 10.40744}, {42.6, -5.6}, {51.5, -0.1}, {-33.8688, 151.2093}, {45.0, -120.0},
    };

    for (const auto& p : points) {
        Coordinate c = make(p[0], p[1]);
        GeoHash h;
        REQUIRE(encode(c, h) == Error::Ok);

        Coordinate d;
        REQUIRE(decode(h, d) == Error::Ok);
        INFO("hash " << h.value());
        REQUIRE(d.rounded(c.latitude_digits(), c.longitude_digits()) == c);

        // No shorter hash reproduces the input
        if (h.length() > MIN_PRECISION) {
            GeoHash shorter;
            REQUIRE(encode(c, h.length() - 1, shorter) == Error::Ok);
            Cell cell;
            REQUIRE(decode_cell(shorter, cell) == Error::Ok);
            const bool lat_ok =
                round_to_digits(cell.latitude.min, c.latitude_digits()) == c.latitude() &&
                round_to_digits(cell.latitude.max, c.latitude_digits()) == c.latitude();
            const bool lon_ok =
                round_to_digits(cell.longitude.min, c.longitude_digits()) == c.longitude() &&
                round_to_digits(cell.longitude.max, c.longitude_digits()) == c.longitude();
            REQUIRE_FALSE((lat_ok && lon_ok));
        }
    }
}

// ============================================================================
// Idempotent validation
// ============================================================================

TEST_CASE("Repeated construction gives equal values", "[edge]") {
    Coordinate a;
    Coordinate b;
    REQUIRE(Coordinate::parse("57.64911, 10.40744", a) == Error::Ok);
    REQUIRE(Coordinate::parse("57.64911, 10.40744", b) == Error::Ok);
    REQUIRE(a == b);

    GeoHash x;
    GeoHash y;
    REQUIRE(GeoHash::create("u4pruydqqvj", x) == Error::Ok);
    REQUIRE(GeoHash::create("u4pruydqqvj", y) == Error::Ok);
    REQUIRE(x == y);
}

TEST_CASE("Decode is deterministic", "[edge][decoder]") {
    GeoHash h;
    REQUIRE(GeoHash::create("u4pruydqqvj", h) == Error::Ok);

    Coordinate first;
    Coordinate second;
    REQUIRE(decode(h, first) == Error::Ok);
    REQUIRE(decode(h, second) == Error::Ok);
    REQUIRE(first == second);
}

// ============================================================================
// Error strings
// ============================================================================

TEST_CASE("Every error code has a message", "[edge][error]") {
    const Error codes[] = {Error::Ok,
                           Error::InvalidCoordinateText,
                           Error::OutOfRange,
                           Error::InvalidHashCharacter,
                           Error::InvalidHashLength,
                           Error::InvalidPrecision,
                           Error::PrecisionUnattainable,
                           Error::Overflow,
                           Error::InvalidArg};

    for (Error code : codes) {
        std::string message = error_string(code);
        REQUIRE_FALSE(message.empty());
        REQUIRE(message != "Unknown error");
    }
    REQUIRE(std::string(error_string(static_cast<Error>(-100))) == "Unknown error");
}
