/**
 * @file test_api.cpp
 * @brief Tests for the text-level location_to_hash / hash_to_location API.
 */

#include <catch2/catch_test_macros.hpp>
#include <geohash/geohash.hpp>

#include <string>

using namespace geohash;

TEST_CASE("location_to_hash from text", "[api]") {
    std::string hash;

    SECTION("auto precision") {
        REQUIRE(location_to_hash("57.64911, 10.40744", hash) == Error::Ok);
        REQUIRE(hash == "u4pruydqqvj");
    }

    SECTION("every separator") {
        REQUIRE(location_to_hash("57.64911,10.40744", hash) == Error::Ok);
        REQUIRE(hash == "u4pruydqqvj");
        REQUIRE(location_to_hash("57.64911 10.40744", hash) == Error::Ok);
        REQUIRE(hash == "u4pruydqqvj");
    }

    SECTION("fixed precision") {
        REQUIRE(location_to_hash("57.64911, 10.40744", 5, hash) == Error::Ok);
        REQUIRE(hash == "u4pru");
    }

    SECTION("out of range") {
        REQUIRE(location_to_hash("91.0, 10.0", hash) == Error::OutOfRange);
    }

    SECTION("not a location") {
        REQUIRE(location_to_hash("not,a,location,string", hash) ==
                Error::InvalidCoordinateText);
    }

    SECTION("bad precision") {
        REQUIRE(location_to_hash("57.64911, 10.40744", 0, hash) == Error::InvalidPrecision);
        REQUIRE(location_to_hash("57.64911, 10.40744", 13, hash) == Error::InvalidPrecision);
    }

    SECTION("failure leaves output untouched") {
        hash = "unchanged";
        REQUIRE(location_to_hash("91.0, 10.0", hash) != Error::Ok);
        REQUIRE(hash == "unchanged");
    }
}

TEST_CASE("location_to_hash from degrees", "[api]") {
    std::string hash;

    REQUIRE(location_to_hash(57.64911, 10.40744, hash) == Error::Ok);
    REQUIRE(hash == "u4pruydqqvj");

    REQUIRE(location_to_hash(57.64911, 10.40744, 11, hash) == Error::Ok);
    REQUIRE(hash == "u4pruydqqvj");

    REQUIRE(location_to_hash(42.6, -5.6, hash) == Error::Ok);
    REQUIRE(hash == "ezs42");

    REQUIRE(location_to_hash(-90.5, 0.0, hash) == Error::OutOfRange);
    REQUIRE(location_to_hash(0.0, 181.0, 5, hash) == Error::OutOfRange);
}

TEST_CASE("hash_to_location", "[api]") {
    std::string location;

    SECTION("reference hash") {
        REQUIRE(hash_to_location("u4pruydqqvj", location) == Error::Ok);
        REQUIRE(location == "57.64911063, 10.40743969");
    }

    SECTION("whole degree result keeps a fractional digit") {
        REQUIRE(hash_to_location("s", location) == Error::Ok);
        REQUIRE(location == "23.0, 23.0");
    }

    SECTION("uppercase rejected") {
        REQUIRE(hash_to_location("u4pruydqqvA", location) == Error::InvalidHashCharacter);
    }

    SECTION("empty and too long rejected") {
        REQUIRE(hash_to_location("", location) == Error::InvalidHashLength);
        REQUIRE(hash_to_location("u4pruydqqvj80", location) == Error::InvalidHashLength);
    }
}

TEST_CASE("hash_to_bounds", "[api]") {
    Cell cell;

    REQUIRE(hash_to_bounds("ezs42", cell) == Error::Ok);
    REQUIRE(cell.latitude.min == 42.5830078125);
    REQUIRE(cell.latitude.max == 42.626953125);
    REQUIRE(cell.longitude.min == -5.625);
    REQUIRE(cell.longitude.max == -5.5810546875);

    REQUIRE(hash_to_bounds("ezs4i", cell) == Error::InvalidHashCharacter);
}

TEST_CASE("Text round trip", "[api]") {
    std::string hash;
    std::string location;

    REQUIRE(location_to_hash("-33.8688, 151.2093", hash) == Error::Ok);
    REQUIRE(hash_to_location(hash, location) == Error::Ok);

    Coordinate original;
    Coordinate decoded;
    REQUIRE(Coordinate::parse("-33.8688, 151.2093", original) == Error::Ok);
    REQUIRE(Coordinate::parse(location, decoded) == Error::Ok);
    REQUIRE(decoded.rounded(4, 4) == original);
}

TEST_CASE("Library version", "[api]") {
    REQUIRE(std::string(version()) == "0.1.0");
}
