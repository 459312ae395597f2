/**
 * @file cli.cpp
 * @brief Geohash command line interface.
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
 * Encodes "lat, lon" text to a geohash and decodes geohashes back to
 * coordinates or cell bounds.
 *
 * @see https://en.wikipedia.org/wiki/Geohash
 */

#include <geohash/geohash.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace geohash;

static constexpr const char* BANNER = "                   _               _      \n"
                                      "   __ _  ___  ___ | |__   __ _ ___| |__   \n"
                                      "  / _` |/ _ \\/ _ \\| '_ \\ / _` / __| '_ \\  \n"
                                      " | (_| |  __/ (_) | | | | (_| \\__ \\ | | | \n"
                                      "  \\__, |\\___|\\___/|_| |_|\\__,_|___/_| |_| \n"
                                      "  |___/                                   \n"
                                      "                                          \n"
                                      "       by  T A N A G R A  S P A C E       \n";

static void print_version() {
    std::printf("geohash %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\n%s\n", BANNER);
    std::printf("Geohash Coordinate Codec (v%s C++)\n", version());
    std::printf("==================================\n\n");
    std::printf("References:\n");
    std::printf("  Geohash: https://en.wikipedia.org/wiki/Geohash\n\n");
    std::printf("Usage:\n");
    std::printf("  %s <location> [precision]\n", prog_name);
    std::printf("  %s -d <hash>\n", prog_name);
    std::printf("  %s -b <hash>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -d             Decode hash to a location\n");
    std::printf("  -b             Print the cell bounds of a hash\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Encode arguments:\n");
    std::printf("  location       \"lat, lon\", \"lat,lon\" or \"lat lon\"\n");
    std::printf("  precision      Hash length %zu-%zu (default: shortest hash that\n",
                MIN_PRECISION, MAX_PRECISION);
    std::printf("                 reproduces the location's decimal digits)\n\n");
    std::printf("Examples:\n");
    std::printf("  %s \"57.64911, 10.40744\"       # u4pruydqqvj\n", prog_name);
    std::printf("  %s \"57.64911, 10.40744\" 5     # u4pru\n", prog_name);
    std::printf("  %s -d u4pruydqqvj              # 57.64911063, 10.40743969\n\n", prog_name);
}

static bool parse_precision(const char* text, std::size_t& precision) {
    char* end = nullptr;
    errno = 0;
    unsigned long value = std::strtoul(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || text[0] == '-') {
        return false;
    }
    precision = static_cast<std::size_t>(value);
    return true;
}

static int do_encode(const char* location, const char* precision_arg) {
    std::string hash;
    Error result;

    if (precision_arg != nullptr) {
        std::size_t precision = 0;
        if (!parse_precision(precision_arg, precision)) {
            std::fprintf(stderr, "Error: precision must be a number (%zu-%zu)\n", MIN_PRECISION,
                         MAX_PRECISION);
            return 1;
        }
        result = location_to_hash(location, precision, hash);
    } else {
        result = location_to_hash(location, hash);
    }

    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s: \"%s\"\n", error_string(result), location);
        return 1;
    }

    std::printf("%s\n", hash.c_str());
    return 0;
}

static int do_decode(const char* hash) {
    std::string location;
    auto result = hash_to_location(hash, location);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s: \"%s\"\n", error_string(result), hash);
        return 1;
    }

    std::printf("%s\n", location.c_str());
    return 0;
}

static int do_bounds(const char* hash) {
    Cell cell;
    auto result = hash_to_bounds(hash, cell);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s: \"%s\"\n", error_string(result), hash);
        return 1;
    }

    std::printf("Latitude:    %s .. %s\n", format_degrees(cell.latitude.min).c_str(),
                format_degrees(cell.latitude.max).c_str());
    std::printf("Longitude:   %s .. %s\n", format_degrees(cell.longitude.min).c_str(),
                format_degrees(cell.longitude.max).c_str());
    std::printf("Center:      %s, %s\n", format_degrees(cell.latitude.mid).c_str(),
                format_degrees(cell.longitude.mid).c_str());
    std::printf("Error:       +/- %s, %s\n", format_degrees(cell.latitude.half_width()).c_str(),
                format_degrees(cell.longitude.half_width()).c_str());

    return 0;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    bool decode_mode = std::strcmp(argv[1], "-d") == 0;
    bool bounds_mode = std::strcmp(argv[1], "-b") == 0;

    if (decode_mode || bounds_mode) {
        if (argc != 3) {
            std::fprintf(stderr, "Error: %s requires 1 argument\n", argv[1]);
            std::fprintf(stderr, "Usage: %s %s <hash>\n", argv[0], argv[1]);
            return 1;
        }
        return decode_mode ? do_decode(argv[2]) : do_bounds(argv[2]);
    }

    // Encode mode: <location> [precision]
    if (argc > 3) {
        std::fprintf(stderr, "Error: Encode takes a location and an optional precision\n");
        std::fprintf(stderr, "Usage: %s \"<lat>, <lon>\" [precision]\n", argv[0]);
        return 1;
    }

    return do_encode(argv[1], argc == 3 ? argv[2] : nullptr);
}
