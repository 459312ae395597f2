/**
 * @file bench.cpp
 * @brief Performance benchmarks for geohash encoding and decoding.
 *
 * Measures codec throughput over a fixed coordinate grid for regression
 * testing during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/geohash_bench           # Run with default 100 iterations
 *   ./build/geohash_bench 1000      # Run with custom iteration count
 */

#include <geohash/geohash.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <vector>

using namespace geohash;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr int GRID_STEPS = 64;

// Grid of points with 5 decimal digits covering the whole globe
static std::vector<Coordinate> make_grid() {
    std::vector<Coordinate> grid;
    grid.reserve(GRID_STEPS * GRID_STEPS);

    for (int i = 0; i < GRID_STEPS; ++i) {
        for (int j = 0; j < GRID_STEPS; ++j) {
            double lat = round_to_digits(-89.5 + (179.0 * i) / (GRID_STEPS - 1) + 0.000013, 5);
            double lon = round_to_digits(-179.5 + (359.0 * j) / (GRID_STEPS - 1) + 0.000071, 5);
            Coordinate c;
            if (Coordinate::create(lat, lon, c) == Error::Ok) {
                grid.push_back(c);
            }
        }
    }

    return grid;
}

static void report(const char* name, std::chrono::high_resolution_clock::time_point start,
                   std::chrono::high_resolution_clock::time_point end, std::size_t points,
                   int iterations, std::size_t failures) {
    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_point_ns = (per_iter_us * 1000.0) / static_cast<double>(points);
    double throughput = (static_cast<double>(points) * 1e6) / per_iter_us;

    std::printf("%-20s %10.2f µs/iter  %8.1f ns/op  %12.0f ops/s  (%zu failed)\n", name,
                per_iter_us, per_point_ns, throughput, failures);
}

static void bench_encode(const char* name, const std::vector<Coordinate>& grid,
                         std::size_t precision, int iterations) {
    GeoHash hash;
    std::size_t failures = 0;

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; ++i) {
        for (const auto& c : grid) {
            if (encode(c, precision, hash) != Error::Ok) {
                ++failures;
            }
        }
    }
    auto end = std::chrono::high_resolution_clock::now();

    report(name, start, end, grid.size(), iterations,
           failures / static_cast<std::size_t>(iterations));
}

static void bench_encode_auto(const char* name, const std::vector<Coordinate>& grid,
                              int iterations) {
    GeoHash hash;
    std::size_t failures = 0;

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; ++i) {
        for (const auto& c : grid) {
            if (encode(c, hash) != Error::Ok) {
                ++failures;
            }
        }
    }
    auto end = std::chrono::high_resolution_clock::now();

    report(name, start, end, grid.size(), iterations,
           failures / static_cast<std::size_t>(iterations));
}

static void bench_decode(const char* name, const std::vector<Coordinate>& grid,
                         std::size_t precision, int iterations) {
    std::vector<GeoHash> hashes;
    hashes.reserve(grid.size());
    for (const auto& c : grid) {
        GeoHash hash;
        if (encode(c, precision, hash) == Error::Ok) {
            hashes.push_back(hash);
        }
    }

    Coordinate decoded;
    std::size_t failures = 0;

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; ++i) {
        for (const auto& h : hashes) {
            if (decode(h, decoded) != Error::Ok) {
                ++failures;
            }
        }
    }
    auto end = std::chrono::high_resolution_clock::now();

    report(name, start, end, hashes.size(), iterations,
           failures / static_cast<std::size_t>(iterations) + grid.size() - hashes.size());
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    auto grid = make_grid();

    std::printf("Geohash Benchmarks (C++ Implementation)\n");
    std::printf("=======================================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Grid: %zu points\n\n", grid.size());

    std::printf("%-20s %16s  %13s  %18s\n", "Test", "Time", "Per-Op", "Throughput");
    std::printf("%-20s %16s  %13s  %18s\n", "----", "----", "------", "----------");

    std::printf("\nEncode:\n");
    bench_encode("precision 5", grid, 5, iterations);
    bench_encode("precision 11", grid, 11, iterations);
    bench_encode("max precision", grid, MAX_PRECISION, iterations);
    bench_encode_auto("auto precision", grid, iterations);

    std::printf("\nDecode:\n");
    bench_decode("precision 5", grid, 5, iterations);
    bench_decode("precision 11", grid, 11, iterations);
    bench_decode("max precision", grid, MAX_PRECISION, iterations);

    std::printf("\nNote: Use these results for relative comparisons only.\n");

    return 0;
}
